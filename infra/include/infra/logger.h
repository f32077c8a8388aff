#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace dsa::infra {

/// spdlog-backed console logger.
/// Format: [ts] [level] [trace_id] [component] event: msg
///
/// `level` is one of trace/debug/info/warn/error/critical/off
/// (DSA_LOG_LEVEL). Unknown names fall back to info.
std::unique_ptr<dsa::core::ILogger>
create_console_logger(const std::string &level = "info");

} // namespace dsa::infra
