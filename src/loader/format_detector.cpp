/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "loader/format_detector.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <format>
#include <unordered_set>

namespace sc::loader {

    namespace {
        std::string join(const std::vector<std::string>& items) {
            std::string out;
            for (const auto& item : items) {
                if (!out.empty())
                    out += ", ";
                out += item;
            }
            return out;
        }
    } // namespace

    std::string_view to_string(PlySchema schema) {
        switch (schema) {
        case PlySchema::FormatA: return "Format A (RGB, linear scale)";
        case PlySchema::FormatB: return "Format B (SH DC, log scale)";
        case PlySchema::Mixed: return "Mixed";
        }
        return "Unknown";
    }

    Result<PlyLayout> detect_format(std::span<const std::string> field_names) {
        const std::unordered_set<std::string_view> fields(field_names.begin(), field_names.end());
        const auto has = [&fields](std::string_view name) { return fields.contains(name); };

        std::vector<std::string> missing;
        for (const auto name : ply_fields::REQUIRED_BASE) {
            if (!has(name)) {
                missing.emplace_back(name);
            }
        }

        const bool has_rgb = has(ply_fields::COLOR_RGB[0]);
        const bool has_sh = has(ply_fields::COLOR_SH_DC[0]);
        const bool has_scale_xyz = has(ply_fields::SCALE_XYZ[0]);
        const bool has_scale_log = has(ply_fields::SCALE_LOG[0]);

        if (!has_rgb && !has_sh) {
            missing.push_back(std::format("{}|{}", ply_fields::COLOR_RGB[0], ply_fields::COLOR_SH_DC[0]));
        }
        if (!has_scale_xyz && !has_scale_log) {
            missing.push_back(std::format("{}|{}", ply_fields::SCALE_XYZ[0], ply_fields::SCALE_LOG[0]));
        }

        if (!missing.empty()) {
            const size_t sample = std::min(field_names.size(), ply_fields::AVAILABLE_SAMPLE);
            Error error{ErrorCode::INVALID_FORMAT,
                        std::format("Unsupported Gaussian PLY layout, missing fields: {}", join(missing))};
            error.missing_fields = std::move(missing);
            error.available_fields.assign(field_names.begin(), field_names.begin() + sample);
            LOG_DEBUG("Available fields: {}", join(error.available_fields));
            return std::unexpected(std::move(error));
        }

        PlyLayout layout;
        layout.color = has_rgb ? ColorEncoding::DirectRgb : ColorEncoding::ShDc;
        layout.scale = has_scale_xyz ? ScaleEncoding::Linear : ScaleEncoding::Log;

        while (has(std::format("{}{}", ply_fields::REST_PREFIX, layout.sh_rest_count))) {
            ++layout.sh_rest_count;
        }

        if (has_rgb && has_sh) {
            LOG_DEBUG("Both RGB and SH DC colours present, using RGB");
        }
        if (has_scale_xyz && has_scale_log) {
            LOG_DEBUG("Both linear and log scales present, using linear");
        }
        LOG_DEBUG("Detected {} with {} SH rest coefficients",
                  to_string(layout.schema()), layout.sh_rest_count);
        return layout;
    }

    Result<PlyLayout> detect_format(const PropertyTable& table) {
        return detect_format(std::span<const std::string>(table.names()));
    }

} // namespace sc::loader
