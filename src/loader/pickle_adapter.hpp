/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/gaussian_set.hpp"
#include <array>
#include <map>
#include <string>
#include <string_view>
#include <torch/torch.h>

namespace sc::loader {

    // Key -> tensor mapping produced by the inference pipeline
    using TensorMap = std::map<std::string, torch::Tensor>;

    namespace pickle_keys {
        using namespace std::string_view_literals;

        constexpr auto POSITIONS = "xyz"sv;
        constexpr auto SH_DC = "f_dc"sv;
        constexpr auto SH_REST = "f_rest"sv;
        constexpr auto OPACITY = "opacity"sv;
        constexpr auto SCALING = "scaling"sv;

        constexpr std::array<std::string_view, 4> REQUIRED = {POSITIONS, SH_DC, OPACITY, SCALING};
        constexpr std::array<std::string_view, 4> ROTATION_ALIASES = {
            "rotation"sv, "rotations"sv, "quat"sv, "quaternion"sv};
        constexpr std::array<std::string_view, 4> ROTATION_COMPONENTS = {
            "rot_0"sv, "rot_1"sv, "rot_2"sv, "rot_3"sv};
    } // namespace pickle_keys

    // Keys missing from the mapping, in REQUIRED order
    [[nodiscard]] std::vector<std::string> missing_pickle_keys(const TensorMap& data);

    /**
     * @brief Convert an inference-pipeline tensor mapping into a canonical set
     *
     * Values follow PLY Format B semantics: `f_dc` holds SH DC terms,
     * `scaling` log scales and `opacity` logits. Rotations come from the
     * first alias present, else from `rot_0..rot_3`, else identity (0,0,0,1).
     * @return INVALID_FORMAT when a required key is missing,
     *         INTERNAL_ERROR when attribute lengths disagree
     */
    [[nodiscard]] Result<GaussianSet> adapt_pickle(const TensorMap& data);

} // namespace sc::loader
