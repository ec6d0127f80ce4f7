/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "loader/attribute_decoder.hpp"
#include "core/logger.hpp"
#include <format>
#include <span>
#include <vector>

namespace sc::loader {

    namespace {

        Result<torch::Tensor> stack_columns(const PropertyTable& table, std::span<const std::string_view> names) {
            std::vector<torch::Tensor> columns;
            columns.reserve(names.size());
            for (const auto name : names) {
                const auto* column = table.column(name);
                if (!column) {
                    return make_error(ErrorCode::INTERNAL_ERROR,
                                      std::format("Column '{}' expected by the detected layout is missing", name));
                }
                columns.push_back(*column);
            }
            return torch::stack(columns, 1);
        }

        Result<torch::Tensor> stack_sh_rest(const PropertyTable& table, int count) {
            std::vector<std::string> names;
            names.reserve(count);
            for (int i = 0; i < count; ++i) {
                names.push_back(std::format("{}{}", ply_fields::REST_PREFIX, i));
            }
            std::vector<std::string_view> views(names.begin(), names.end());
            return stack_columns(table, views);
        }

    } // namespace

    bool is_w_first(double mean_abs_first, double mean_abs_last) {
        return mean_abs_first > decode_constants::W_FIRST_RATIO * mean_abs_last;
    }

    torch::Tensor canonicalize_rotations(torch::Tensor raw) {
        raw = raw.to(torch::kFloat32);
        if (raw.size(0) > 0) {
            const auto magnitude = raw.abs().mean(0);
            const double mean_first = magnitude[0].item<double>();
            const double mean_last = magnitude[3].item<double>();

            if (is_w_first(mean_first, mean_last)) {
                LOG_DEBUG("Quaternions look w-first (mean |q0| {:.4f} vs |q3| {:.4f}), reordering to xyzw",
                          mean_first, mean_last);
                raw = raw.index_select(1, torch::tensor({1, 2, 3, 0}, torch::kLong));
            }
        }

        const auto norms = raw.norm(2, 1, /*keepdim=*/true);
        return raw / (norms + decode_constants::QUATERNION_EPS);
    }

    torch::Tensor sh_dc_to_rgb(const torch::Tensor& f_dc) {
        return torch::clamp(f_dc.to(torch::kFloat32) * decode_constants::SH_C0 + 0.5, 0.0, 1.0);
    }

    Result<GaussianSet> decode_attributes(const PropertyTable& table, const PlyLayout& layout) {
        LOG_TIMER_TRACE("Attribute decoding");
        torch::NoGradGuard no_grad;

        auto positions = stack_columns(table, ply_fields::POSITION);
        if (!positions)
            return std::unexpected(positions.error());

        const auto color_names = layout.color == ColorEncoding::DirectRgb
                                     ? std::span<const std::string_view>(ply_fields::COLOR_RGB)
                                     : std::span<const std::string_view>(ply_fields::COLOR_SH_DC);
        auto raw_colors = stack_columns(table, color_names);
        if (!raw_colors)
            return std::unexpected(raw_colors.error());

        const auto scale_names = layout.scale == ScaleEncoding::Linear
                                     ? std::span<const std::string_view>(ply_fields::SCALE_XYZ)
                                     : std::span<const std::string_view>(ply_fields::SCALE_LOG);
        auto raw_scales = stack_columns(table, scale_names);
        if (!raw_scales)
            return std::unexpected(raw_scales.error());

        auto raw_rotations = stack_columns(table, ply_fields::ROTATION);
        if (!raw_rotations)
            return std::unexpected(raw_rotations.error());

        const auto* opacity_logits = table.column(ply_fields::OPACITY);
        if (!opacity_logits) {
            return make_error(ErrorCode::INTERNAL_ERROR, "Column 'opacity' expected by the detected layout is missing");
        }

        torch::Tensor sh_rest;
        if (layout.sh_rest_count > 0) {
            auto rest = stack_sh_rest(table, layout.sh_rest_count);
            if (!rest)
                return std::unexpected(rest.error());
            sh_rest = std::move(*rest);
        }

        auto colors = layout.color == ColorEncoding::DirectRgb
                          ? *raw_colors / decode_constants::RGB_SCALE
                          : sh_dc_to_rgb(*raw_colors);
        auto scales = layout.scale == ScaleEncoding::Linear ? *raw_scales : torch::exp(*raw_scales);
        auto rotations = canonicalize_rotations(*raw_rotations);
        auto opacities = torch::sigmoid(*opacity_logits).reshape({-1});

        auto set = GaussianSet::create(std::move(*positions),
                                       std::move(opacities),
                                       std::move(scales),
                                       std::move(rotations),
                                       std::move(colors),
                                       std::move(sh_rest));
        if (set) {
            log_decode_statistics(*set);
        }
        return set;
    }

    void log_decode_statistics(const GaussianSet& set) {
        if (set.empty()) {
            LOG_DEBUG("Decoded an empty Gaussian set");
            return;
        }

        const auto& positions = set.positions();
        const auto& colors = set.colors_dc();
        const auto& scales = set.scales();
        LOG_DEBUG("Decoded {} Gaussians", set.size());
        LOG_DEBUG("  position range [{:.3f}, {:.3f}]",
                  positions.min().item<float>(), positions.max().item<float>());
        LOG_DEBUG("  colour range [{:.3f}, {:.3f}]",
                  colors.min().item<float>(), colors.max().item<float>());
        LOG_DEBUG("  scale range [{:.6f}, {:.6f}]",
                  scales.min().item<float>(), scales.max().item<float>());
        LOG_DEBUG("  mean |w| {:.4f}, SH rest coefficients {}",
                  set.rotations().select(1, 3).abs().mean().item<float>(), set.sh_rest_count());
    }

} // namespace sc::loader
