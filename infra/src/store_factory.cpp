#include "infra/store_factory.h"

#include "infra/file_store.h"
#include "infra/memory_store.h"
#include "infra/sqlite_store.h"

#include <stdexcept>

namespace stagehand::infra {

using core::Result;
using core::StageError;

Result<std::shared_ptr<core::IDurableStore>, StageError>
create_store(const StoreConfig &config) {
  using StoreResult = Result<std::shared_ptr<core::IDurableStore>, StageError>;

  if (config.backend == "memory") {
    return StoreResult::Ok(std::make_shared<MemoryStore>());
  }

  try {
    if (config.backend == "file") {
      const std::filesystem::path root =
          config.path.empty() ? XdgPaths::get_data_dir() / "store"
                              : std::filesystem::path(config.path);
      return StoreResult::Ok(std::make_shared<FileStore>(root));
    }
    if (config.backend == "sqlite") {
      const std::filesystem::path db =
          config.path.empty() ? XdgPaths::get_data_dir() / "stagehand.db"
                              : std::filesystem::path(config.path);
      return StoreResult::Ok(std::make_shared<SqliteStore>(db.string()));
    }
  } catch (const std::exception &e) {
    return StoreResult::Err(StageError::Store(
        "Cannot open " + config.backend + " store: " + e.what()));
  }

  return StoreResult::Err(StageError::Validation(
      "Unknown store backend '" + config.backend +
      "' (expected memory, file or sqlite)"));
}

} // namespace stagehand::infra
