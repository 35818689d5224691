#pragma once

#include "core/durable_store.h"
#include "core/result.h"
#include "core/stage_error.h"
#include "infra/config.h"

#include <memory>

namespace stagehand::infra {

/// Build the IDurableStore selected by `config.backend`.
/// file and sqlite default to locations under XdgPaths::get_data_dir().
/// Errors: ErrorKind::Validation for an unknown backend, ErrorKind::Store
/// when the backing directory or database cannot be opened.
core::Result<std::shared_ptr<core::IDurableStore>, core::StageError>
create_store(const StoreConfig &config);

} // namespace stagehand::infra
