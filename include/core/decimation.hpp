/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/gaussian_set.hpp"
#include "core/parameters.hpp"
#include <cstdint>
#include <torch/torch.h>

namespace sc {

    namespace decimation {
        constexpr float MIN_LOD = 0.01f;
        constexpr float MAX_LOD = 1.0f;
        constexpr int64_t DEFAULT_CAP = 20'000;
        constexpr uint64_t SAMPLE_SEED = 42;
    } // namespace decimation

    // Preview subsample handed to the host viewport
    struct DecimatedPoints {
        torch::Tensor positions; // [k,3]
        torch::Tensor colors;    // [k,3], RGB in [0,1]
        torch::Tensor indices;   // [k] int64 rows of the source set
        bool is_full_set = false;

        int64_t size() const { return positions.defined() ? positions.size(0) : 0; }
    };

    [[nodiscard]] float clamp_lod(float lod);

    // clamp(round(total * lod), 1, min(total, cap)); 0 for an empty set
    [[nodiscard]] int64_t display_count(int64_t total, float lod, int64_t cap = decimation::DEFAULT_CAP);

    /**
     * @brief Deterministic preview subsample of a Gaussian set
     *
     * Draws display_count() rows without replacement from a generator seeded
     * with SAMPLE_SEED on every call, so equal (N, k) give equal rows. When
     * every point fits, the set's own tensors are returned without copying.
     */
    [[nodiscard]] DecimatedPoints decimate(const GaussianSet& set, float lod,
                                           int64_t cap = decimation::DEFAULT_CAP);

    // Map colours given as 0-255 or [-1,1] back into [0,1]; in-range input is returned as is
    [[nodiscard]] torch::Tensor normalize_display_colors(const torch::Tensor& colors);

    // Starting LOD for a newly imported object of the given size
    [[nodiscard]] float initial_lod_for(int64_t count, const param::LodTiers& tiers = {});

} // namespace sc
