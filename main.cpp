#include <iostream>
#include <thread>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <unistd.h>

#include <spdlog/spdlog.h>      // spdlog for logging

#include "cameras/camera_errors.hpp"
#include "cameras/camera_fleet.hpp"
#include "service/capture_coordinator.hpp"
#include "service/http_server.hpp"
#include "service/image_storage.hpp"
#include "service/logging.hpp"
#include "service/retention_sweeper.hpp"
#include "service/service_config.hpp"
#include "service/service_errors.hpp"

static std::atomic<bool> g_stop(false);

static void handle_signal(int) {
    g_stop = true;
}

static void parse_args(int argc, char* argv[], int& verbose) {
    int opt;
    while ((opt = getopt(argc, argv, "v:h")) != -1) {
        switch (opt) {
            case 'v':
                verbose = std::stoi(optarg);
                break;
            case 'h':
                printf("Usage: %s [-v level]\n"
                       "Configuration is read from the environment, e.g.\n"
                       "  MAIN_CAMERA_SOURCE=/dev/video0 EXTRA_CAMERA_SOURCES=1,2 SERVICE_PORT=8200 %s -v 1\n",
                       argv[0], argv[0]);
                exit(0);
                break;
            case '?':
                exit(1);
                break;
        }
    }
}

int main(int argc, char* argv[]) {
    int verbose = 0;

    // Parse command line arguments
    parse_args(argc, argv, verbose);

    service_config config;
    try {
        config = load_service_config();
        init_logger(verbose, config.log_file);
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("Starting camera service");

    // The fleet must be fully up before any request is accepted
    std::unique_ptr<camera_fleet> fleet;
    try {
        fleet = camera_fleet::initialize(config.cameras);
    } catch (const camera_error& e) {
        spdlog::critical("Camera startup failed: {}", e.what());
        return 1;
    }

    std::unique_ptr<image_storage> storage;
    try {
        storage = std::make_unique<image_storage>(config.storage_dir);
    } catch (const service_error& e) {
        spdlog::critical("{}", e.what());
        fleet->stop_all();
        return 1;
    }

    retention_sweeper sweeper(config.storage_dir, config.retention, config.cleanup_interval);
    sweeper.start();

    capture_defaults defaults;
    defaults.resolution = config.default_resolution;
    defaults.format = config.default_format;
    defaults.quality = config.default_quality;
    capture_coordinator coordinator(*fleet, *storage, defaults);

    http_server server(coordinator, *storage, config.worker_threads);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // HTTP thread
    std::atomic<bool> listen_done(false);
    std::atomic<bool> listen_ok(true);
    std::thread http_thread([&] {
        if (!server.listen(config.host, config.port)) {
            spdlog::error("Cannot listen on {}:{}", config.host, config.port);
            listen_ok = false;
        }
        listen_done = true;
    });

    while (!g_stop && !listen_done) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutting down camera service");
    // stop() is a no-op until the listen loop is up
    while (!listen_done && !server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    server.stop();
    http_thread.join();

    // sweeper first, then every camera
    sweeper.stop();
    fleet->stop_all();

    spdlog::info("Exiting camera service");

    return listen_ok ? 0 : 1;
}
