/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "loader/property_table.hpp"
#include <array>
#include <span>
#include <string>
#include <string_view>

namespace sc::loader {

    namespace ply_fields {
        using namespace std::string_view_literals;

        constexpr std::array<std::string_view, 8> REQUIRED_BASE = {
            "x"sv, "y"sv, "z"sv, "opacity"sv, "rot_0"sv, "rot_1"sv, "rot_2"sv, "rot_3"sv};

        constexpr std::array<std::string_view, 3> POSITION = {"x"sv, "y"sv, "z"sv};
        constexpr std::array<std::string_view, 3> COLOR_RGB = {"red"sv, "green"sv, "blue"sv};
        constexpr std::array<std::string_view, 3> COLOR_SH_DC = {"f_dc_0"sv, "f_dc_1"sv, "f_dc_2"sv};
        constexpr std::array<std::string_view, 3> SCALE_XYZ = {"scale_x"sv, "scale_y"sv, "scale_z"sv};
        constexpr std::array<std::string_view, 3> SCALE_LOG = {"scale_0"sv, "scale_1"sv, "scale_2"sv};
        constexpr std::array<std::string_view, 4> ROTATION = {"rot_0"sv, "rot_1"sv, "rot_2"sv, "rot_3"sv};

        constexpr auto OPACITY = "opacity"sv;
        constexpr auto REST_PREFIX = "f_rest_"sv;

        // Number of available field names quoted in a detection error
        constexpr size_t AVAILABLE_SAMPLE = 20;
    } // namespace ply_fields

    enum class ColorEncoding {
        DirectRgb, // red/green/blue, 0..255
        ShDc       // f_dc_0..2, degree-0 SH coefficients
    };

    enum class ScaleEncoding {
        Linear, // scale_x/y/z
        Log     // scale_0/1/2
    };

    enum class PlySchema {
        FormatA, // direct RGB + linear scale
        FormatB, // SH DC + log scale
        Mixed
    };

    struct PlyLayout {
        ColorEncoding color = ColorEncoding::ShDc;
        ScaleEncoding scale = ScaleEncoding::Log;
        int sh_rest_count = 0; // contiguous f_rest_0..f_rest_{n-1}

        [[nodiscard]] PlySchema schema() const {
            if (color == ColorEncoding::DirectRgb && scale == ScaleEncoding::Linear)
                return PlySchema::FormatA;
            if (color == ColorEncoding::ShDc && scale == ScaleEncoding::Log)
                return PlySchema::FormatB;
            return PlySchema::Mixed;
        }
    };

    std::string_view to_string(PlySchema schema);

    /**
     * @brief Classify a PLY vertex layout from its property names
     *
     * Colour and scale encodings are chosen independently: `red` wins over
     * `f_dc_0` and `scale_x` wins over `scale_0` when both are present.
     * @return INVALID_FORMAT listing missing fields and a sample of the available ones
     */
    [[nodiscard]] Result<PlyLayout> detect_format(std::span<const std::string> field_names);

    [[nodiscard]] Result<PlyLayout> detect_format(const PropertyTable& table);

} // namespace sc::loader
