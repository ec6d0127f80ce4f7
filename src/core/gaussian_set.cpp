/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/gaussian_set.hpp"
#include "core/logger.hpp"
#include <format>

namespace sc {

    namespace {
        constexpr float ZERO_ROTATION_NORM = 1e-6f;

        torch::Tensor to_canonical(const torch::Tensor& t) {
            return t.to(torch::kCPU, torch::kFloat32).contiguous();
        }

        std::string shape_of(const torch::Tensor& t) {
            if (!t.defined()) {
                return "undefined";
            }
            std::string out = "[";
            for (int64_t d = 0; d < t.dim(); ++d) {
                out += std::format("{}{}", d == 0 ? "" : ",", t.size(d));
            }
            return out + "]";
        }

        bool has_shape(const torch::Tensor& t, int64_t n, int64_t width) {
            if (width == 0) {
                return t.dim() == 1 && t.size(0) == n;
            }
            return t.dim() == 2 && t.size(0) == n && t.size(1) == width;
        }
    } // namespace

    GaussianSet::GaussianSet(torch::Tensor positions,
                             torch::Tensor opacities,
                             torch::Tensor scales,
                             torch::Tensor rotations,
                             torch::Tensor colors_dc,
                             torch::Tensor colors_sh)
        : _positions(std::move(positions)),
          _opacities(std::move(opacities)),
          _scales(std::move(scales)),
          _rotations(std::move(rotations)),
          _colors_dc(std::move(colors_dc)),
          _colors_sh(std::move(colors_sh)) {}

    Result<GaussianSet> GaussianSet::create(torch::Tensor positions,
                                            torch::Tensor opacities,
                                            torch::Tensor scales,
                                            torch::Tensor rotations,
                                            torch::Tensor colors_dc,
                                            torch::Tensor colors_sh) {
        if (!positions.defined() || !opacities.defined() || !scales.defined() ||
            !rotations.defined() || !colors_dc.defined()) {
            return make_error(ErrorCode::INTERNAL_ERROR, "Gaussian set is missing a required attribute");
        }

        if (positions.dim() != 2 || positions.size(1) != 3) {
            return make_error(ErrorCode::INTERNAL_ERROR,
                              std::format("Positions must be [N,3], got {}", shape_of(positions)));
        }

        const int64_t n = positions.size(0);
        const auto mismatch = [n](std::string_view attribute, const torch::Tensor& t) {
            return make_error(ErrorCode::INTERNAL_ERROR,
                              std::format("Length mismatch: {} has shape {} for {} positions",
                                          attribute, shape_of(t), n));
        };

        if (!has_shape(opacities, n, 0)) {
            return mismatch("opacities", opacities);
        }
        if (!has_shape(scales, n, 3)) {
            return mismatch("scales", scales);
        }
        if (!has_shape(rotations, n, 4)) {
            return mismatch("rotations", rotations);
        }
        if (!has_shape(colors_dc, n, 3)) {
            return mismatch("colors_dc", colors_dc);
        }
        if (colors_sh.defined() && (colors_sh.dim() != 2 || colors_sh.size(0) != n)) {
            return mismatch("colors_sh", colors_sh);
        }

        return GaussianSet(to_canonical(positions),
                           to_canonical(opacities),
                           to_canonical(scales),
                           to_canonical(rotations),
                           to_canonical(colors_dc),
                           colors_sh.defined() ? to_canonical(colors_sh) : torch::Tensor{});
    }

    DegenerateReport audit(const GaussianSet& set) {
        DegenerateReport report;
        if (set.empty()) {
            return report;
        }

        torch::NoGradGuard no_grad;
        const auto& scales = set.scales();
        report.nonfinite_scales = (~torch::isfinite(scales)).any(1).sum().item<int64_t>();
        report.nonpositive_scales = (scales <= 0).any(1).sum().item<int64_t>();

        const auto& opacities = set.opacities();
        report.opacity_out_of_range = ((opacities < 0) | (opacities > 1)).sum().item<int64_t>();

        const auto& colors = set.colors_dc();
        report.color_out_of_range = ((colors < 0) | (colors > 1)).any(1).sum().item<int64_t>();

        report.zero_rotations = (set.rotations().norm(2, 1) < ZERO_ROTATION_NORM).sum().item<int64_t>();
        return report;
    }

    bool report_degenerate(const GaussianSet& set, std::string_view source) {
        const auto report = audit(set);
        if (!report.any()) {
            return true;
        }

        LOG_WARN("Degenerate data in {} ({} Gaussians): {} non-finite scales, {} non-positive scales, "
                 "{} opacities and {} colours out of range, {} zero quaternions",
                 source, set.size(),
                 report.nonfinite_scales, report.nonpositive_scales,
                 report.opacity_out_of_range, report.color_out_of_range,
                 report.zero_rotations);
        return false;
    }

} // namespace sc
