#ifndef CLINK_LOG_HPP
#define CLINK_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace clink::log {

// The "clink" logger. Writes to stderr so it never interleaves with rendered stdout.
// Level comes from CLINK_LOG_LEVEL (trace, debug, info, warn, error, critical, off); default warn.
std::shared_ptr<spdlog::logger> logger();

// Level named by `name`. Unrecognised names give warn; only "off" turns logging off.
spdlog::level::level_enum parseLevel(std::string_view name);

} // namespace clink::log

#endif // CLINK_LOG_HPP
