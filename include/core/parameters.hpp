/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace sc {
    namespace param {

        // Starting LOD by Gaussian count, checked from the densest tier down
        struct LodTiers {
            int64_t dense_count = 2'000'000; // above: dense_lod
            float dense_lod = 0.01f;
            int64_t large_count = 500'000; // above: large_lod
            float large_lod = 0.02f;
            int64_t small_count = 10'000; // below: small_lod
            float small_lod = 1.0f;
            float default_lod = 0.1f;

            nlohmann::json to_json() const;
            static LodTiers from_json(const nlohmann::json& j);
        };

        struct PreviewParameters {
            int64_t max_display_points = 20'000; // hard cap on viewport points per object
            float default_point_size = 2.0f;
            float min_point_size = 0.1f;
            float max_point_size = 20.0f;
            LodTiers lod_tiers;

            nlohmann::json to_json() const;
            static PreviewParameters from_json(const nlohmann::json& j);
        };

        struct TransportParameters {
            bool clamp_scales = true; // clamp scales for the external renderer only
            float min_scale = 1e-3f;
            float max_scale = 1e3f;
            float camera_distance_factor = 5.0f;

            nlohmann::json to_json() const;
            static TransportParameters from_json(const nlohmann::json& j);
        };

        struct SyncParameters {
            int poll_interval_ms = 100; // transform/camera polling period of external pollers

            nlohmann::json to_json() const;
            static SyncParameters from_json(const nlohmann::json& j);
        };

        struct SplatCraftParameters {
            PreviewParameters preview;
            TransportParameters transport;
            SyncParameters sync;

            nlohmann::json to_json() const;
            static SplatCraftParameters from_json(const nlohmann::json& j);
        };

        // Everything one CLI run needs
        struct RunParameters {
            SplatCraftParameters config;
            std::filesystem::path config_path = "";

            std::vector<std::filesystem::path> inputs;
            std::optional<float> lod = std::nullopt; // overrides the auto LOD for every object
            std::optional<float> point_size = std::nullopt;
            std::filesystem::path export_path = "";  // full-resolution transport payload
            std::filesystem::path preview_path = ""; // decimated viewport points
            bool print_info = false;
        };

        std::expected<SplatCraftParameters, std::string> read_config_from_json(const std::filesystem::path& path);

        std::expected<void, std::string> save_config_to_json(const SplatCraftParameters& params,
                                                             const std::filesystem::path& path);
    } // namespace param
} // namespace sc
