#include "logging.H"

#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace tickpipe {

std::shared_ptr<spdlog::logger> make_process_logger(const std::string& name, const std::string& file_prefix) {
    if (!spdlog::thread_pool()) {
        spdlog::init_thread_pool(8192, 1);
    }

    std::vector<spdlog::sink_ptr> sinks{
        std::make_shared<spdlog::sinks::daily_file_sink_mt>(file_prefix, 0, 0),
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};

    auto logger = std::make_shared<spdlog::async_logger>(name, sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace tickpipe
