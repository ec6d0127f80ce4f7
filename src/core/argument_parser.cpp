/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/argument_parser.hpp"
#include "core/logger.hpp"
#include "core/parameters.hpp"
#include <args.hxx>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <print>
#ifdef _WIN32
#include <Windows.h>
#endif

namespace {

    constexpr const char* CONFIG_FILENAME = "splatcraft_config.json";

    /**
     * @brief Get the path to a configuration file
     * @param filename Name of the configuration file
     * @return std::filesystem::path Full path to the configuration file
     */
    std::filesystem::path get_config_path(const std::string& filename) {
#ifdef _WIN32
        char executablePathWindows[MAX_PATH];
        GetModuleFileNameA(nullptr, executablePathWindows, MAX_PATH);
        std::filesystem::path searchDir = std::filesystem::path(executablePathWindows).parent_path();
        while (!searchDir.empty() && !std::filesystem::exists(searchDir / "parameter" / filename)) {
            auto parent = searchDir.parent_path();
            if (parent == searchDir) {
                break;
            }
            searchDir = parent;
        }
#else
        std::filesystem::path executablePath = std::filesystem::canonical("/proc/self/exe");
        std::filesystem::path searchDir = executablePath.parent_path().parent_path();
#endif
        return searchDir / "parameter" / filename;
    }

    enum class ParseResult {
        Success,
        Help
    };

    // Parse log level from string
    sc::core::LogLevel parse_log_level(const std::string& level_str) {
        if (level_str == "trace")
            return sc::core::LogLevel::Trace;
        if (level_str == "debug")
            return sc::core::LogLevel::Debug;
        if (level_str == "info")
            return sc::core::LogLevel::Info;
        if (level_str == "warn" || level_str == "warning")
            return sc::core::LogLevel::Warn;
        if (level_str == "error")
            return sc::core::LogLevel::Error;
        if (level_str == "critical")
            return sc::core::LogLevel::Critical;
        if (level_str == "off")
            return sc::core::LogLevel::Off;
        return sc::core::LogLevel::Info; // Default
    }

    std::expected<std::tuple<ParseResult, std::function<void()>>, std::string> parse_arguments(
        const std::vector<std::string>& args,
        sc::param::RunParameters& params) {

        try {
            ::args::ArgumentParser parser(
                "SplatCraft: Gaussian splat import, preview decimation and scene transport.\n",
                "Usage:\n"
                "  splatcraft -i <file.ply> [-i <file.pkl> ...] [--export scene.json] [--preview preview.json] [options]\n");

            ::args::HelpFlag help(parser, "help", "Display help menu", {'h', "help"});

            ::args::ValueFlagList<std::string> inputs(parser, "file", "PLY or pickle file to import (repeatable)", {'i', "input"});
            ::args::ValueFlag<std::string> config_file(parser, "config_file", "SplatCraft config file (json)", {"config"});

            ::args::ValueFlag<float> lod(parser, "lod", "Preview fraction in [0.01, 1] for every object (default: by count)", {"lod"});
            ::args::ValueFlag<int64_t> cap(parser, "cap", "Max preview points per object (default: 20000)", {"cap"});
            ::args::ValueFlag<float> point_size(parser, "point_size", "Preview point size in [0.1, 20] (default: 2)", {"point-size"});

            ::args::ValueFlag<std::string> export_path(parser, "scene_json", "Write the full-resolution scene payload", {"export"});
            ::args::ValueFlag<std::string> preview_path(parser, "preview_json", "Write the decimated preview points", {"preview"});

            // Logging options
            ::args::ValueFlag<std::string> log_level(parser, "level", "Log level: trace, debug, info, warn, error, critical, off (default: info)", {"log-level"});
            ::args::ValueFlag<std::string> log_file(parser, "file", "Optional log file path", {"log-file"});

            ::args::Flag info(parser, "info", "Print a summary of every imported object", {"info"});
            ::args::Flag no_clamp(parser, "no_clamp", "Send scales unclamped to the renderer", {"no-clamp"});

            // Parse arguments
            try {
                parser.Prog(args.front());
                parser.ParseArgs(std::vector<std::string>(args.begin() + 1, args.end()));
            } catch (const ::args::Help&) {
                std::print("{}", parser.Help());
                return std::make_tuple(ParseResult::Help, std::function<void()>{});
            } catch (const ::args::ParseError& e) {
                return std::unexpected(std::format("Parse error: {}\n{}", e.what(), parser.Help()));
            } catch (const ::args::ValidationError& e) {
                return std::unexpected(std::format("Invalid argument: {}\n{}", e.what(), parser.Help()));
            }

            // Initialize logger based on command line arguments
            {
                auto level = sc::core::LogLevel::Info; // Default level
                std::string log_file_path;

                if (log_level) {
                    level = parse_log_level(::args::get(log_level));
                }

                if (log_file) {
                    log_file_path = ::args::get(log_file);
                }

                sc::core::Logger::get().init(level, log_file_path);

                LOG_DEBUG("Logger initialized with level: {}", static_cast<int>(level));
                if (!log_file_path.empty()) {
                    LOG_DEBUG("Logging to file: {}", log_file_path);
                }
            }

            if (help) {
                return std::make_tuple(ParseResult::Help, std::function<void()>{});
            }

            if (!inputs || ::args::get(inputs).empty()) {
                return std::unexpected(std::format("ERROR: at least one --input is required\n\n{}", parser.Help()));
            }

            for (const auto& input : ::args::get(inputs)) {
                params.inputs.emplace_back(std::filesystem::u8path(input));
            }

            if (config_file) {
                params.config_path = std::filesystem::u8path(::args::get(config_file));
            }

            if (cap && ::args::get(cap) < 1) {
                return std::unexpected(std::format("--cap must be at least 1, got {}", ::args::get(cap)));
            }

            // Values that live in the config are applied after it is read
            auto apply_overrides = [&params,
                                    lod_val = lod ? std::optional<float>(::args::get(lod)) : std::optional<float>(),
                                    cap_val = cap ? std::optional<int64_t>(::args::get(cap)) : std::optional<int64_t>(),
                                    point_size_val = point_size ? std::optional<float>(::args::get(point_size)) : std::optional<float>(),
                                    export_val = export_path ? std::optional<std::string>(::args::get(export_path)) : std::optional<std::string>(),
                                    preview_val = preview_path ? std::optional<std::string>(::args::get(preview_path)) : std::optional<std::string>(),
                                    info_flag = bool(info),
                                    no_clamp_flag = bool(no_clamp)]() {
                params.lod = lod_val;
                params.point_size = point_size_val;
                if (cap_val) {
                    params.config.preview.max_display_points = *cap_val;
                }
                if (export_val) {
                    params.export_path = std::filesystem::u8path(*export_val);
                }
                if (preview_val) {
                    params.preview_path = std::filesystem::u8path(*preview_val);
                }
                params.print_info = info_flag;
                if (no_clamp_flag) {
                    params.config.transport.clamp_scales = false;
                }
            };

            return std::make_tuple(ParseResult::Success, std::function<void()>{apply_overrides});

        } catch (const std::exception& e) {
            return std::unexpected(std::format("Unexpected error during argument parsing: {}", e.what()));
        }
    }

    std::vector<std::string> convert_args(int argc, const char* const argv[]) {
        return std::vector<std::string>(argv, argv + argc);
    }
} // anonymous namespace

// Public interface
std::expected<std::unique_ptr<sc::param::RunParameters>, std::string>
sc::args::parse_args_and_params(int argc, const char* const argv[]) {

    auto params = std::make_unique<sc::param::RunParameters>();

    auto parse_result = parse_arguments(convert_args(argc, argv), *params);
    if (!parse_result) {
        return std::unexpected(parse_result.error());
    }

    auto [result, apply_overrides] = *parse_result;

    // Handle help case
    if (result == ParseResult::Help) {
        std::exit(0);
    }

    // An explicit --config must exist; the installed default is optional
    if (!params->config_path.empty()) {
        auto config_result = sc::param::read_config_from_json(params->config_path);
        if (!config_result) {
            return std::unexpected(std::format("Failed to load configuration: {}", config_result.error()));
        }
        params->config = *config_result;
    } else {
        const auto default_config = get_config_path(CONFIG_FILENAME);
        if (std::filesystem::exists(default_config)) {
            auto config_result = sc::param::read_config_from_json(default_config);
            if (!config_result) {
                return std::unexpected(std::format("Failed to load configuration: {}", config_result.error()));
            }
            params->config = *config_result;
            params->config_path = default_config;
        } else {
            LOG_DEBUG("No {} found, using built-in defaults", CONFIG_FILENAME);
        }
    }

    // Apply command line overrides
    if (apply_overrides) {
        apply_overrides();
    }

    return params;
}
