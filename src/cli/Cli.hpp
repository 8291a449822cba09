#pragma once
#include <ostream>
#include <string>

#include <spdlog/common.h>

namespace premis::cli {

// Unknown names fall back to fallback instead of spdlog's "off".
spdlog::level::level_enum parseLogLevel(const std::string& name,
                                        spdlog::level::level_enum fallback = spdlog::level::warn);

// Sets the global level from PREMIS_LOG_LEVEL.
void configureLogging();

// premis-tool command dispatch. Exit codes: 0 ok, 1 usage, 2 fatal error,
// 3 --validate found errors.
int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace premis::cli
