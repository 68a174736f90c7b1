/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Application Entry Point for the `swissuid` tool.
 *
 * @details
 * This file contains the `main` function which orchestrates:
 * 1. Argument Parsing.
 * 2. Logger Configuration.
 * 3. Mode Selection (validate arguments, generate, or JSON requests on stdin).
 */

#include "swissuid/core/error.hpp"
#include "swissuid/core/uid.hpp"
#include "swissuid/infra/logger.hpp"
#include "swissuid/infra/string.hpp"
#include "swissuid/tool/handler.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using swissuid::infra::Logger;
using swissuid::infra::LogLevel;

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS] [UID ...]\n"
              << "Options:\n"
              << "  UID                 Validate and print the canonical form of each UID\n"
              << "  --generate N        Print N random valid UIDs\n"
              << "  --log-level LEVEL   trace|debug|info|warn|error|fatal (Default: warn)\n"
              << "  --help              Show this help message\n"
              << "Without UID or --generate, JSON requests are read from stdin, one per line.\n";
}

/**
 * @brief Validates every argument; invalid ones are reported on stderr.
 *
 * @return 0 if all are valid, 1 otherwise.
 */
int validate_all(const std::vector<std::string>& inputs)
{
    int status = 0;
    for (const auto& input : inputs) {
        try {
            std::cout << swissuid::core::Uid::parse(input) << std::endl;
        } catch (const swissuid::core::UidError& e) {
            std::cerr << input << ": " << e.what() << std::endl;
            status = 1;
        }
    }
    return status;
}

/**
 * @brief Reads JSON requests from stdin until EOF and answers each on stdout.
 */
void serve_stdin()
{
    Logger::log(LogLevel::INFO, "System: Reading JSON requests from stdin");

    std::string line;
    std::size_t served = 0;
    while (std::getline(std::cin, line)) {
        if (swissuid::infra::String::trim(line).empty()) {
            continue;
        }
        std::cout << swissuid::tool::Handler::process(line) << std::endl;
        served++;
    }

    Logger::log(LogLevel::INFO, "System: Served " + std::to_string(served) + " request(s)");
}

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    // 1. Configuration Defaults
    int generate = 0;
    std::vector<std::string> inputs;

    try {
        // 2. Parse Command Line Arguments
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];

            if (arg == "--help") {
                print_help(argv[0]);
                return 0;
            } else if (arg == "--log-level" && i + 1 < argc) {
                LogLevel level = LogLevel::WARN;
                if (!Logger::parse_level(argv[++i], level)) {
                    std::cerr << "Unknown log level: " << argv[i] << "\n";
                    return 2;
                }
                Logger::set_level(level);
            } else if (arg == "--generate" && i + 1 < argc) {
                generate = std::stoi(argv[++i]);
                if (generate < 1) {
                    std::cerr << "--generate expects a positive count\n";
                    return 2;
                }
            } else if (arg == "--log-level" || arg == "--generate") {
                std::cerr << arg << " expects a value\n";
                return 2;
            } else if (arg.rfind("--", 0) == 0) {
                std::cerr << "Unknown option: " << arg << "\n";
                print_help(argv[0]);
                return 2;
            } else {
                inputs.push_back(arg);
            }
        }

        Logger::log(LogLevel::INFO, "Config: " + std::to_string(inputs.size()) +
                                        " UID argument(s), generate=" + std::to_string(generate));

        // 3. Mode Selection
        if (generate > 0) {
            for (int i = 0; i < generate; ++i) {
                std::cout << swissuid::core::Uid::generate() << std::endl;
            }
        }
        if (!inputs.empty()) {
            return validate_all(inputs);
        }
        if (generate == 0) {
            serve_stdin();
        }

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
