/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/decimation.hpp"
#include "core/logger.hpp"
#include <ATen/CPUGeneratorImpl.h>
#include <algorithm>
#include <cmath>

namespace sc {

    float clamp_lod(float lod) {
        if (std::isnan(lod)) {
            return decimation::MAX_LOD;
        }
        return std::clamp(lod, decimation::MIN_LOD, decimation::MAX_LOD);
    }

    int64_t display_count(int64_t total, float lod, int64_t cap) {
        if (total <= 0) {
            return 0;
        }
        const int64_t upper = std::max<int64_t>(1, std::min(total, cap));
        const int64_t wanted = std::llround(static_cast<double>(total) * clamp_lod(lod));
        return std::clamp<int64_t>(wanted, 1, upper);
    }

    torch::Tensor normalize_display_colors(const torch::Tensor& colors) {
        if (!colors.defined() || colors.numel() == 0) {
            return colors;
        }

        if (colors.max().item<float>() > 1.0f) {
            return colors / 255.0f;
        }
        if (colors.min().item<float>() < 0.0f) {
            return torch::clamp((colors + 1.0f) / 2.0f, 0.0f, 1.0f);
        }
        return colors;
    }

    DecimatedPoints decimate(const GaussianSet& set, float lod, int64_t cap) {
        const int64_t total = set.size();
        DecimatedPoints result;

        if (total == 0) {
            result.positions = torch::zeros({0, 3}, torch::kFloat32);
            result.colors = torch::zeros({0, 3}, torch::kFloat32);
            result.indices = torch::zeros({0}, torch::kInt64);
            result.is_full_set = true;
            return result;
        }

        const int64_t k = display_count(total, lod, cap);

        if (k >= total) {
            result.positions = set.positions();
            result.colors = normalize_display_colors(set.colors_dc());
            result.indices = torch::arange(total, torch::kInt64);
            result.is_full_set = true;
            LOG_TRACE("Decimation pass-through: {} points", total);
            return result;
        }

        auto generator = at::make_generator<at::CPUGeneratorImpl>(decimation::SAMPLE_SEED);
        auto indices = torch::randperm(total, generator, torch::TensorOptions().dtype(torch::kInt64))
                           .slice(0, 0, k)
                           .contiguous();

        result.positions = set.positions().index_select(0, indices);
        result.colors = normalize_display_colors(set.colors_dc().index_select(0, indices));
        result.indices = std::move(indices);
        result.is_full_set = false;

        LOG_DEBUG("Decimated {} -> {} points (lod {:.3f}, cap {})", total, k, clamp_lod(lod), cap);
        return result;
    }

    float initial_lod_for(int64_t count, const param::LodTiers& tiers) {
        if (count > tiers.dense_count) {
            return tiers.dense_lod;
        }
        if (count > tiers.large_count) {
            return tiers.large_lod;
        }
        if (count < tiers.small_count) {
            return tiers.small_lod;
        }
        return tiers.default_lod;
    }

} // namespace sc
