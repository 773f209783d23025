// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitdl/cli/commands.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace splitdl::cli;

// Report whatever escaped a noexcept boundary before dying
static void splitdl_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

// Diagnostics go to stderr so stdout stays clean for --json
static void setup_logging(const CliArgs& args) {
    auto logger = spdlog::stderr_color_mt("splitdl");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet || args.json) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

int main(int argc, char* argv[]) {
    std::set_terminate(splitdl_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    if (args.url.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    setup_logging(args);

    auto result = args.info ? info(args) : download(args);
    return result ? *result : 1;
}
