/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include "core/gaussian_set.hpp"
#include "loader/format_detector.hpp"
#include "loader/property_table.hpp"
#include <torch/torch.h>

namespace sc::loader {

    namespace decode_constants {
        constexpr double SH_C0 = 0.28209479177387814;
        constexpr float RGB_SCALE = 255.0f;
        constexpr float QUATERNION_EPS = 1e-8f;

        // Component 0 is taken as w when its mean magnitude beats component 3 by this factor
        constexpr double W_FIRST_RATIO = 1.5;
    } // namespace decode_constants

    /**
     * @brief Decide whether quaternions are stored (w,x,y,z)
     *
     * Unit quaternions of small rotations carry most of their magnitude in w,
     * so a first column that dominates the last one marks a w-first layout.
     * @param mean_abs_first mean |q[0]| over the set
     * @param mean_abs_last mean |q[3]| over the set
     */
    [[nodiscard]] bool is_w_first(double mean_abs_first, double mean_abs_last);

    // [N,4] raw quaternions to unit (x,y,z,w); reorders when is_w_first holds
    [[nodiscard]] torch::Tensor canonicalize_rotations(torch::Tensor raw);

    // clip(f_dc * SH_C0 + 0.5, 0, 1)
    [[nodiscard]] torch::Tensor sh_dc_to_rgb(const torch::Tensor& f_dc);

    /**
     * @brief Turn raw PLY columns into a canonical Gaussian set
     *
     * Pure function of its inputs. A column that the layout promises but the
     * table lacks is a contract violation and yields INTERNAL_ERROR.
     */
    [[nodiscard]] Result<GaussianSet> decode_attributes(const PropertyTable& table, const PlyLayout& layout);

    // Debug-level summary of ranges, as printed after each import
    void log_decode_statistics(const GaussianSet& set);

} // namespace sc::loader
