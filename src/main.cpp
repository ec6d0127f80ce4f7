/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/application.hpp"
#include "core/argument_parser.hpp"
#include "core/logger.hpp"

#include <print>

int main(int argc, char* argv[]) {
    // Parse arguments (this automatically initializes the logger based on --log-level flag)
    auto params_result = sc::args::parse_args_and_params(argc, argv);
    if (!params_result) {
        LOG_ERROR("Failed to parse arguments: {}", params_result.error());
        std::println(stderr, "Error: {}", params_result.error());
        return -1;
    }

    LOG_INFO("========================================");
    LOG_INFO("SplatCraft");
    LOG_INFO("========================================");

    auto params = std::move(*params_result);
    if (!params->config_path.empty()) {
        LOG_INFO("Configuration: {}", params->config_path.string());
    }

    sc::Application app;
    return app.run(std::move(params));
}
