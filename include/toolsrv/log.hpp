#pragma once
#include <string>

namespace toolsrv {

/// Route all diagnostics to a stderr logger named "toolsrv" and make it the
/// spdlog default. `level` is an spdlog level name; SPDLOG_LEVEL in the
/// environment takes precedence.
void init_logging(const std::string& level);

} // namespace toolsrv
