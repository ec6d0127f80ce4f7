/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/parameters.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace sc {
    namespace param {
        namespace {

            /**
             * @brief Read and parse a JSON configuration file
             * @param path Path to the JSON file
             * @return Expected JSON object or error message
             */
            std::expected<nlohmann::json, std::string> read_json_file(const std::filesystem::path& path) {
                if (!std::filesystem::exists(path)) {
                    return std::unexpected(std::format("Configuration file does not exist: {}", path.string()));
                }

                std::ifstream file(path);
                if (!file.is_open()) {
                    return std::unexpected(std::format("Could not open configuration file: {}", path.string()));
                }

                try {
                    std::stringstream buffer;
                    buffer << file.rdbuf();
                    return nlohmann::json::parse(buffer.str());
                } catch (const nlohmann::json::parse_error& e) {
                    return std::unexpected(std::format("JSON parsing error in {}: {}", path.string(), e.what()));
                }
            }

            /**
             * @brief Warn about keys in a config section that no parameter reads
             * @return Number of unknown keys
             */
            size_t warn_unknown_keys(const nlohmann::json& section,
                                     std::string_view section_name,
                                     const std::vector<std::string>& known) {
                if (!section.is_object()) {
                    return 0;
                }

                size_t unknown = 0;
                for (const auto& [key, value] : section.items()) {
                    if (std::ranges::find(known, key) == known.end()) {
                        LOG_WARN("Unknown parameter '{}.{}' in config (will be ignored)", section_name, key);
                        ++unknown;
                    }
                }
                return unknown;
            }

            template <typename T>
            void read_if_present(const nlohmann::json& j, const char* key, T& target) {
                if (j.contains(key)) {
                    target = j[key].get<T>();
                }
            }
        } // namespace

        nlohmann::json LodTiers::to_json() const {
            nlohmann::json json;
            json["dense_count"] = dense_count;
            json["dense_lod"] = dense_lod;
            json["large_count"] = large_count;
            json["large_lod"] = large_lod;
            json["small_count"] = small_count;
            json["small_lod"] = small_lod;
            json["default_lod"] = default_lod;
            return json;
        }

        LodTiers LodTiers::from_json(const nlohmann::json& j) {
            LodTiers tiers;
            read_if_present(j, "dense_count", tiers.dense_count);
            read_if_present(j, "dense_lod", tiers.dense_lod);
            read_if_present(j, "large_count", tiers.large_count);
            read_if_present(j, "large_lod", tiers.large_lod);
            read_if_present(j, "small_count", tiers.small_count);
            read_if_present(j, "small_lod", tiers.small_lod);
            read_if_present(j, "default_lod", tiers.default_lod);
            return tiers;
        }

        nlohmann::json PreviewParameters::to_json() const {
            nlohmann::json json;
            json["max_display_points"] = max_display_points;
            json["default_point_size"] = default_point_size;
            json["min_point_size"] = min_point_size;
            json["max_point_size"] = max_point_size;
            json["lod_tiers"] = lod_tiers.to_json();
            return json;
        }

        PreviewParameters PreviewParameters::from_json(const nlohmann::json& j) {
            PreviewParameters params;
            read_if_present(j, "max_display_points", params.max_display_points);
            read_if_present(j, "default_point_size", params.default_point_size);
            read_if_present(j, "min_point_size", params.min_point_size);
            read_if_present(j, "max_point_size", params.max_point_size);
            if (j.contains("lod_tiers")) {
                params.lod_tiers = LodTiers::from_json(j["lod_tiers"]);
            }
            return params;
        }

        nlohmann::json TransportParameters::to_json() const {
            nlohmann::json json;
            json["clamp_scales"] = clamp_scales;
            json["min_scale"] = min_scale;
            json["max_scale"] = max_scale;
            json["camera_distance_factor"] = camera_distance_factor;
            return json;
        }

        TransportParameters TransportParameters::from_json(const nlohmann::json& j) {
            TransportParameters params;
            read_if_present(j, "clamp_scales", params.clamp_scales);
            read_if_present(j, "min_scale", params.min_scale);
            read_if_present(j, "max_scale", params.max_scale);
            read_if_present(j, "camera_distance_factor", params.camera_distance_factor);
            return params;
        }

        nlohmann::json SyncParameters::to_json() const {
            nlohmann::json json;
            json["poll_interval_ms"] = poll_interval_ms;
            return json;
        }

        SyncParameters SyncParameters::from_json(const nlohmann::json& j) {
            SyncParameters params;
            read_if_present(j, "poll_interval_ms", params.poll_interval_ms);
            return params;
        }

        nlohmann::json SplatCraftParameters::to_json() const {
            nlohmann::json json;
            json["preview"] = preview.to_json();
            json["transport"] = transport.to_json();
            json["sync"] = sync.to_json();
            return json;
        }

        SplatCraftParameters SplatCraftParameters::from_json(const nlohmann::json& j) {
            SplatCraftParameters params;
            if (j.contains("preview")) {
                params.preview = PreviewParameters::from_json(j["preview"]);
            }
            if (j.contains("transport")) {
                params.transport = TransportParameters::from_json(j["transport"]);
            }
            if (j.contains("sync")) {
                params.sync = SyncParameters::from_json(j["sync"]);
            }
            return params;
        }

        /**
         * @brief Read the SplatCraft configuration from a JSON file
         * @param path file to load
         * @return Expected parameters or error message
         */
        std::expected<SplatCraftParameters, std::string> read_config_from_json(const std::filesystem::path& path) {
            auto json_result = read_json_file(path);
            if (!json_result) {
                return std::unexpected(json_result.error());
            }

            const auto& json = *json_result;
            if (!json.is_object()) {
                return std::unexpected(std::format("Configuration root in {} must be an object", path.string()));
            }

            // Unknown keys are reported, never fatal
            const SplatCraftParameters defaults;
            warn_unknown_keys(json, "root", {"preview", "transport", "sync"});
            if (json.contains("preview")) {
                std::vector<std::string> known;
                for (const auto& [key, _] : defaults.preview.to_json().items()) {
                    known.push_back(key);
                }
                warn_unknown_keys(json["preview"], "preview", known);
            }
            if (json.contains("transport")) {
                std::vector<std::string> known;
                for (const auto& [key, _] : defaults.transport.to_json().items()) {
                    known.push_back(key);
                }
                warn_unknown_keys(json["transport"], "transport", known);
            }

            try {
                auto params = SplatCraftParameters::from_json(json);

                if (params.preview.max_display_points < 1) {
                    return std::unexpected("preview.max_display_points must be at least 1");
                }
                if (params.transport.min_scale > params.transport.max_scale) {
                    return std::unexpected("transport.min_scale must not exceed transport.max_scale");
                }
                if (params.sync.poll_interval_ms <= 0) {
                    return std::unexpected("sync.poll_interval_ms must be positive");
                }

                LOG_DEBUG("Loaded configuration from {}", path.string());
                return params;

            } catch (const nlohmann::json::exception& e) {
                return std::unexpected(std::format("Error parsing configuration {}: {}", path.string(), e.what()));
            }
        }

        /**
         * @brief Save the SplatCraft configuration to JSON
         * @param params The parameters to write
         * @param path Output file
         * @return Expected void or error message
         */
        std::expected<void, std::string> save_config_to_json(const SplatCraftParameters& params,
                                                             const std::filesystem::path& path) {
            try {
                if (path.has_parent_path()) {
                    std::filesystem::create_directories(path.parent_path());
                }

                std::ofstream file(path);
                if (!file.is_open()) {
                    return std::unexpected(std::format("Could not open file for writing: {}", path.string()));
                }

                file << params.to_json().dump(4); // Pretty print with 4 spaces
                file.close();

                LOG_INFO("Saved configuration to: {}", path.string());
                return {};

            } catch (const std::exception& e) {
                return std::unexpected(std::format("Error saving configuration: {}", e.what()));
            }
        }

    } // namespace param
} // namespace sc
