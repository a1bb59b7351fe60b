/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file app.cpp
 * @brief Command-line front end for the sandbox tier chain
 */

#include "config/sandbox_config.hpp"
#include "logging/logging.hpp"
#include "sandbox/sandbox_service.hpp"

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;
using namespace jailchain;

namespace {

std::atomic<bool> g_interrupted{false};

void signalHandler(int) { g_interrupted.store(true); }

struct CliOptions {
    std::optional<std::string> configPath;
    std::string language{"python"};
    std::optional<std::string> code;
    std::optional<std::string> file;
    std::optional<std::string> logLevel;
    bool preferLocal{false};
    bool allowInstalls{false};
    bool noAutoExec{false};
    bool raw{false};
    bool json{false};
    bool status{false};
    bool refresh{false};
};

void printUsage(const char* program) {
    std::cout
        << "Usage: " << program << " [options] [FILE]\n"
        << "Runs code in the most isolated sandbox available.\n"
        << "Code is read from --code, FILE, or standard input.\n\n"
        << "Options:\n"
        << "  --config <path>       JSON configuration file\n"
        << "  --language <tag>      python, bash, sh, ... (default: python)\n"
        << "  --code <text>         Code to execute\n"
        << "  --prefer-local        Skip every sandbox and run locally\n"
        << "  --allow-installs      Install missing Python modules once\n"
        << "  --no-auto-exec        Never re-run code automatically\n"
        << "  --raw                 Append raw process output\n"
        << "  --json                Print the outcome as JSON\n"
        << "  --status              Print tier availability and exit\n"
        << "  --refresh             Re-probe tiers before running\n"
        << "  --log-level <level>   trace, debug, info, warn, error\n"
        << "  --help, -h            Show this help message\n";
}

auto readAll(std::istream& in) -> std::string {
    return {std::istreambuf_iterator<char>(in),
            std::istreambuf_iterator<char>()};
}

auto exitStatus(const sandbox::ExecutionOutcome& outcome) -> int {
    switch (outcome.errorKind) {
        case sandbox::ErrorKind::None:
            return outcome.exitCode == 0 ? 0 : 1;
        case sandbox::ErrorKind::Timeout:
            return 124;
        case sandbox::ErrorKind::Cancelled:
            return 130;
        case sandbox::ErrorKind::Unavailable:
            return 3;
        default:
            return 1;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cli.configPath = argv[++i];
        } else if (arg == "--language" && i + 1 < argc) {
            cli.language = argv[++i];
        } else if (arg == "--code" && i + 1 < argc) {
            cli.code = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            cli.logLevel = argv[++i];
        } else if (arg == "--prefer-local") {
            cli.preferLocal = true;
        } else if (arg == "--allow-installs") {
            cli.allowInstalls = true;
        } else if (arg == "--no-auto-exec") {
            cli.noAutoExec = true;
        } else if (arg == "--raw") {
            cli.raw = true;
        } else if (arg == "--json") {
            cli.json = true;
        } else if (arg == "--status") {
            cli.status = true;
        } else if (arg == "--refresh") {
            cli.refresh = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && !cli.file) {
            cli.file = arg;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    config::SandboxConfig settings;
    if (cli.configPath) {
        auto loaded = config::SandboxConfig::load(*cli.configPath);
        if (!loaded) {
            std::cerr << "Failed to load " << *cli.configPath << ": "
                      << config::configErrorToString(loaded.error()) << "\n";
            return 2;
        }
        settings = std::move(*loaded);
    }

    if (cli.logLevel) {
        settings.logging.level = logging::levelFromString(*cli.logLevel);
    }
    if (cli.preferLocal) {
        settings.policy.preferLocal = true;
    }
    if (cli.allowInstalls) {
        settings.policy.allowAutoInstalls = true;
    }
    if (cli.noAutoExec) {
        settings.policy.allowAutoExec = false;
    }
    if (cli.raw) {
        settings.policy.showRawOutput = true;
    }

    logging::init(settings.logging);

    try {
        py::scoped_interpreter interpreter;
        py::gil_scoped_release release;

        auto service = sandbox::SandboxService::create(settings);

        if (cli.refresh) {
            service->refreshAvailability();
        }
        if (cli.status) {
            std::cout << service->getTierStatusJson().dump(2) << std::endl;
            return 0;
        }

        std::string code;
        if (cli.code) {
            code = *cli.code;
        } else if (cli.file) {
            std::ifstream in(*cli.file, std::ios::binary);
            if (!in) {
                spdlog::error("Cannot open {}", *cli.file);
                return 2;
            }
            code = readAll(in);
        } else {
            code = readAll(std::cin);
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::jthread watcher([&service](std::stop_token token) {
            while (!token.stop_requested()) {
                if (g_interrupted.exchange(false)) {
                    spdlog::warn("Interrupted; cancelling execution");
                    service->cancel();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        auto outcome = service->executeCode(code, cli.language);
        watcher.request_stop();

        if (cli.json) {
            std::cout << outcome.toJson().dump(2) << std::endl;
        } else {
            std::cout << outcome.text << std::endl;
        }
        return exitStatus(outcome);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
