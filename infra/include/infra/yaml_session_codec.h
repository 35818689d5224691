#pragma once

#include "core/session.h"

namespace stagehand::infra {

/// Session <-> YAML document (yaml-cpp). Statuses, error kinds and
/// categories are stored by name so the files stay readable.
class YamlSessionCodec final : public core::ISessionCodec {
public:
  [[nodiscard]] std::string encode(const core::Session &session) const override;

  /// Fails with ErrorKind::Store on malformed documents or unknown statuses.
  core::Result<core::Session, core::StageError>
  decode(const std::string &payload) const override;
};

} // namespace stagehand::infra
