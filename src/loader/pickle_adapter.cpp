/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "loader/pickle_adapter.hpp"
#include "core/logger.hpp"
#include "loader/attribute_decoder.hpp"
#include <algorithm>
#include <format>

namespace sc::loader {

    namespace {

        const torch::Tensor* find_key(const TensorMap& data, std::string_view key) {
            auto it = data.find(std::string(key));
            return it != data.end() ? &it->second : nullptr;
        }

        // Reshape to [n, width]; INTERNAL_ERROR when the element count disagrees
        Result<torch::Tensor> as_rows(const torch::Tensor& t, int64_t n, int64_t width, std::string_view key) {
            if (t.numel() != n * width) {
                return make_error(ErrorCode::INTERNAL_ERROR,
                                  std::format("Length mismatch: '{}' has {} values, expected {} x {}",
                                              key, t.numel(), n, width));
            }
            return t.to(torch::kCPU, torch::kFloat32).reshape({n, width});
        }

        Result<torch::Tensor> raw_rotations(const TensorMap& data, int64_t n) {
            for (const auto alias : pickle_keys::ROTATION_ALIASES) {
                if (const auto* rot = find_key(data, alias)) {
                    LOG_DEBUG("Using rotation key '{}'", alias);
                    return as_rows(*rot, n, 4, alias);
                }
            }

            const bool has_components = std::ranges::all_of(pickle_keys::ROTATION_COMPONENTS,
                                                            [&data](std::string_view key) {
                                                                return find_key(data, key) != nullptr;
                                                            });
            if (has_components) {
                std::vector<torch::Tensor> columns;
                for (const auto key : pickle_keys::ROTATION_COMPONENTS) {
                    auto column = as_rows(*find_key(data, key), n, 1, key);
                    if (!column)
                        return std::unexpected(column.error());
                    columns.push_back(std::move(*column));
                }
                LOG_DEBUG("Using rotation components rot_0..rot_3");
                return torch::cat(columns, 1);
            }

            return torch::Tensor{};
        }

        // f_rest may be [N,K,3], [N,3,K] or already flat; output is channel-major like PLY f_rest_*
        Result<torch::Tensor> sh_rest(const TensorMap& data, int64_t n) {
            const auto* rest = find_key(data, pickle_keys::SH_REST);
            if (!rest || n == 0) {
                return torch::Tensor{};
            }
            if (rest->numel() % n != 0) {
                return make_error(ErrorCode::INTERNAL_ERROR,
                                  std::format("Length mismatch: 'f_rest' has {} values for {} points",
                                              rest->numel(), n));
            }

            auto coefficients = rest->to(torch::kCPU, torch::kFloat32);
            if (coefficients.dim() == 3 && coefficients.size(0) == n && coefficients.size(2) == 3) {
                // [N,K,3] -> [N,3,K]; a square [N,3,3] is read as [N,K,3] too
                coefficients = coefficients.transpose(1, 2);
            }
            return coefficients.contiguous().reshape({n, rest->numel() / n});
        }

    } // namespace

    std::vector<std::string> missing_pickle_keys(const TensorMap& data) {
        std::vector<std::string> missing;
        for (const auto key : pickle_keys::REQUIRED) {
            if (!find_key(data, key)) {
                missing.emplace_back(key);
            }
        }
        return missing;
    }

    Result<GaussianSet> adapt_pickle(const TensorMap& data) {
        LOG_TIMER_TRACE("Pickle adaptation");
        torch::NoGradGuard no_grad;

        auto missing = missing_pickle_keys(data);
        if (!missing.empty()) {
            std::string joined;
            for (const auto& key : missing) {
                joined += joined.empty() ? key : ", " + key;
            }
            Error error{ErrorCode::INVALID_FORMAT, std::format("Pickle is missing required keys: {}", joined)};
            error.missing_fields = std::move(missing);
            for (const auto& [key, _] : data) {
                if (error.available_fields.size() >= ply_fields::AVAILABLE_SAMPLE)
                    break;
                error.available_fields.push_back(key);
            }
            return std::unexpected(std::move(error));
        }

        const auto& xyz = *find_key(data, pickle_keys::POSITIONS);
        if (xyz.numel() % 3 != 0) {
            return make_error(ErrorCode::INTERNAL_ERROR,
                              std::format("'xyz' has {} values, not a multiple of 3", xyz.numel()));
        }
        const int64_t n = xyz.numel() / 3;

        auto positions = as_rows(xyz, n, 3, pickle_keys::POSITIONS);
        if (!positions)
            return std::unexpected(positions.error());

        auto f_dc = as_rows(*find_key(data, pickle_keys::SH_DC), n, 3, pickle_keys::SH_DC);
        if (!f_dc)
            return std::unexpected(f_dc.error());

        auto logits = as_rows(*find_key(data, pickle_keys::OPACITY), n, 1, pickle_keys::OPACITY);
        if (!logits)
            return std::unexpected(logits.error());

        auto log_scales = as_rows(*find_key(data, pickle_keys::SCALING), n, 3, pickle_keys::SCALING);
        if (!log_scales)
            return std::unexpected(log_scales.error());

        auto rotations = raw_rotations(data, n);
        if (!rotations)
            return std::unexpected(rotations.error());

        torch::Tensor unit_rotations;
        if (rotations->defined()) {
            unit_rotations = canonicalize_rotations(std::move(*rotations));
        } else {
            LOG_WARN("Pickle has no rotation data, using identity quaternions for {} points", n);
            unit_rotations = torch::zeros({n, 4}, torch::kFloat32);
            unit_rotations.select(1, 3).fill_(1.0f);
        }

        auto rest = sh_rest(data, n);
        if (!rest)
            return std::unexpected(rest.error());

        auto set = GaussianSet::create(std::move(*positions),
                                       torch::sigmoid(*logits).reshape({-1}),
                                       torch::exp(*log_scales),
                                       std::move(unit_rotations),
                                       sh_dc_to_rgb(*f_dc),
                                       std::move(*rest));
        if (set) {
            log_decode_statistics(*set);
        }
        return set;
    }

} // namespace sc::loader
