#include "logging.hpp"

#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"

void init_logger(int verbose, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!log_file.empty()) {
        std::filesystem::path parent = std::filesystem::path(log_file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
    }

    auto console = std::make_shared<spdlog::logger>("console", sinks.begin(), sinks.end());
    spdlog::set_default_logger(console);

    if (verbose == 0) {
        spdlog::set_level(spdlog::level::info);
    } else if (verbose == 1) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::trace);
    }
}
