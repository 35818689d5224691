#include "core/unit_handler.h"

namespace stagehand::core {

namespace {

class FunctionHandler final : public IUnitHandler {
public:
  FunctionHandler(std::string kind, HandlerRegistry::HandlerFn fn)
      : kind_(std::move(kind)), fn_(std::move(fn)) {}

  [[nodiscard]] std::string name() const override { return "fn:" + kind_; }

  Result<void, StageError> execute(const WorkUnit &unit,
                                   UnitContext &ctx) override {
    return fn_(unit, ctx);
  }

private:
  std::string kind_;
  HandlerRegistry::HandlerFn fn_;
};

} // namespace

void HandlerRegistry::register_handler(const std::string &kind,
                                       std::shared_ptr<IUnitHandler> handler) {
  handlers_[kind] = std::move(handler);
}

void HandlerRegistry::register_function(const std::string &kind, HandlerFn fn) {
  handlers_[kind] = std::make_shared<FunctionHandler>(kind, std::move(fn));
}

std::shared_ptr<IUnitHandler>
HandlerRegistry::find(const std::string &kind) const {
  auto it = handlers_.find(kind);
  return it == handlers_.end() ? nullptr : it->second;
}

} // namespace stagehand::core
