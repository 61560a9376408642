// Copyright (c) 2026 changcheng967. All rights reserved.

#include <shelf/cli/commands.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace shelf::cli;

// Report exceptions that escape a noexcept function before aborting
static void shelf_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called" << std::endl;
    if (auto ex = std::current_exception()) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(shelf_terminate_handler);

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
        std::cerr << "Use -h for help" << std::endl;
        return 2;
    }

    if (args.purge) {
        auto result = purge(std::cout);
        if (!result) {
            std::cerr << "Error: " << result.error().message() << std::endl;
            return 1;
        }
        if (args.urls.empty() && !args.list) {
            return *result;
        }
    }

    if (args.list) {
        auto result = list(std::cout);
        if (!result) {
            std::cerr << "Error: " << result.error().message() << std::endl;
            return 1;
        }
        if (args.urls.empty()) {
            return *result;
        }
    }

    // With no URL this resumes whatever is still unfinished
    auto result = download(args);
    if (!result) {
        return 1;
    }
    return *result;
}
