#include <difftree/core/logging.hpp>

#include <vector>

#ifdef _WIN32
#include <spdlog/sinks/wincolor_sink.h>
#else
#include <spdlog/sinks/ansicolor_sink.h>
#endif

namespace difftree {

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto logger = spdlog::get("difftree");
    if (logger)
        return logger;

    std::vector<spdlog::sink_ptr> sinks;
#ifdef _WIN32
    sinks.push_back(
        std::make_shared<spdlog::sinks::wincolor_stdout_sink_mt>());
#else
    sinks.push_back(
        std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>());
#endif
    logger = std::make_shared<spdlog::logger>(
        "difftree", begin(sinks), end(sinks));
    try
    {
        spdlog::register_logger(logger);
    }
    catch (spdlog::spdlog_ex&)
    {
        // Another thread registered one first, so use that.
        return spdlog::get("difftree");
    }
    return logger;
}

} // namespace difftree
