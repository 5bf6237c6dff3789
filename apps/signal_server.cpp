// apps/signal_server.cpp
//
// JSON-lines server: one request envelope per stdin line, one response per
// stdout line. Logs never go to stdout.

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

#include "signal_ngin/core/engine_config.hpp"
#include "signal_ngin/core/env_loader.hpp"
#include "signal_ngin/core/logger.hpp"
#include "signal_ngin/service/signal_engine.hpp"
#include "signal_ngin/service/signal_service.hpp"

using namespace signal_ngin;

namespace {

std::atomic<bool> g_shutdown_requested{false};

void handle_signal(int) {
    g_shutdown_requested.store(true);
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <file>] [--env <file>]" << std::endl;
    std::cerr << "Example: " << program << " --config config/signal_ngin.json --env .env"
              << std::endl;
}

void write_response(const nlohmann::json& response) {
    std::cout << response.dump() << std::endl;
}

void process_line(SignalService& service, const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return;
    }

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        write_response({{"id", nullptr},
                        {"status", "error"},
                        {"kind", error_code_to_string(ErrorCode::JSON_PARSE_ERROR)},
                        {"message", e.what()}});
        return;
    }
    write_response(service.handle_request(request));
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string env_path = ".env";
    bool env_explicit = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--env" && i + 1 < argc) {
            env_path = argv[++i];
            env_explicit = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Invalid argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    auto env_result = EnvLoader::load(env_path);
    if (env_result.is_error() && env_explicit) {
        std::cerr << env_result.error()->to_string() << std::endl;
        return 1;
    }

    auto config_result = ConfigLoader::load(config_path);
    if (config_result.is_error()) {
        std::cerr << "Failed to load configuration: " << config_result.error()->to_string()
                  << std::endl;
        return 1;
    }
    EngineConfig config = config_result.take_value();

    // stdout carries responses
    if (config.logging.destination != LogDestination::FILE) {
        std::cerr << "Console logging would interleave with responses, logging to "
                  << config.logging.log_directory << " instead" << std::endl;
        config.logging.destination = LogDestination::FILE;
    }

    try {
        Logger::instance().initialize(config.logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return 1;
    }
    Logger::register_component("SignalServer");

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    SignalEngine engine(config);
    auto init_result = engine.initialize();
    if (init_result.is_error()) {
        ERROR("Failed to initialize engine: " << init_result.error()->to_string());
        std::cerr << init_result.error()->to_string() << std::endl;
        return 1;
    }
    auto start_result = engine.start();
    if (start_result.is_error()) {
        ERROR("Failed to start engine: " << start_result.error()->to_string());
        std::cerr << start_result.error()->to_string() << std::endl;
        return 1;
    }

    SignalService service(engine);
    INFO("Signal server ready, serving " << SignalService::operations().size()
                                         << " operations on stdio");

    std::string pending;
    char buffer[4096];
    while (!g_shutdown_requested.load()) {
        pollfd fd{STDIN_FILENO, POLLIN, 0};
        int ready = ::poll(&fd, 1, 250);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ERROR("poll on stdin failed: " << std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ERROR("read on stdin failed: " << std::strerror(errno));
            break;
        }
        if (n == 0) {
            if (!pending.empty()) {
                process_line(service, pending);
            }
            INFO("stdin closed");
            break;
        }

        pending.append(buffer, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            process_line(service, line);
        }
    }

    INFO("Shutting down signal server");
    engine.stop();
    return 0;
}
