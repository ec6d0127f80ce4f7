/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include <cstdint>
#include <string_view>
#include <torch/torch.h>

namespace sc {

    /**
     * @brief Canonical, immutable set of decoded Gaussians
     *
     * All tensors live on the CPU as float32 and share the leading dimension N:
     *  - positions  [N,3]  world space
     *  - opacities  [N]    post-sigmoid, in [0,1]
     *  - scales     [N,3]  linear
     *  - rotations  [N,4]  unit quaternions, (x,y,z,w)
     *  - colors_dc  [N,3]  RGB in [0,1]
     *  - colors_sh  [N,3K] optional higher-order SH coefficients, channel-major:
 *                      K red coefficients, then K green, then K blue (PLY f_rest_* order)
     *
     * Instances are only produced by create(), which validates the shapes.
     * Sets are shared read-only through std::shared_ptr<const GaussianSet>.
     */
    class GaussianSet {
    public:
        GaussianSet() = default;
        ~GaussianSet() = default;

        // Delete copy operations
        GaussianSet(const GaussianSet&) = delete;
        GaussianSet& operator=(const GaussianSet&) = delete;

        GaussianSet(GaussianSet&& other) noexcept = default;
        GaussianSet& operator=(GaussianSet&& other) noexcept = default;

        /**
         * @brief Validate shapes and build a set
         * @return The set, or INTERNAL_ERROR when shapes or lengths disagree
         */
        static Result<GaussianSet> create(torch::Tensor positions,
                                          torch::Tensor opacities,
                                          torch::Tensor scales,
                                          torch::Tensor rotations,
                                          torch::Tensor colors_dc,
                                          torch::Tensor colors_sh = {});

        int64_t size() const { return _positions.defined() ? _positions.size(0) : 0; }
        bool empty() const { return size() == 0; }

        const torch::Tensor& positions() const { return _positions; }
        const torch::Tensor& opacities() const { return _opacities; }
        const torch::Tensor& scales() const { return _scales; }
        const torch::Tensor& rotations() const { return _rotations; }
        const torch::Tensor& colors_dc() const { return _colors_dc; }
        const torch::Tensor& colors_sh() const { return _colors_sh; }

        bool has_sh_rest() const { return _colors_sh.defined() && _colors_sh.size(1) > 0; }
        int64_t sh_rest_count() const { return has_sh_rest() ? _colors_sh.size(1) : 0; }

    private:
        GaussianSet(torch::Tensor positions,
                    torch::Tensor opacities,
                    torch::Tensor scales,
                    torch::Tensor rotations,
                    torch::Tensor colors_dc,
                    torch::Tensor colors_sh);

        torch::Tensor _positions;
        torch::Tensor _opacities;
        torch::Tensor _scales;
        torch::Tensor _rotations;
        torch::Tensor _colors_dc;
        torch::Tensor _colors_sh;
    };

    // Counts of values that break the soft invariants of a set
    struct DegenerateReport {
        int64_t nonfinite_scales = 0;
        int64_t nonpositive_scales = 0;
        int64_t opacity_out_of_range = 0;
        int64_t color_out_of_range = 0;
        int64_t zero_rotations = 0;

        bool any() const {
            return nonfinite_scales > 0 || nonpositive_scales > 0 ||
                   opacity_out_of_range > 0 || color_out_of_range > 0 ||
                   zero_rotations > 0;
        }
    };

    DegenerateReport audit(const GaussianSet& set);

    /**
     * @brief Audit a set and emit a warning when it holds degenerate values
     *
     * Degenerate data never fails an import.
     * @return true when the set is clean
     */
    bool report_degenerate(const GaussianSet& set, std::string_view source);

} // namespace sc
