#ifndef DIFFTREE_CORE_LOGGING_HPP
#define DIFFTREE_CORE_LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

namespace difftree {

// Get the "difftree" logger.
// If the application hasn't registered a logger by that name, one that writes
// to stdout is created and registered.
std::shared_ptr<spdlog::logger>
get_logger();

} // namespace difftree

#endif
