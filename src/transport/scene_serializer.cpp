/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "transport/scene_serializer.hpp"
#include "core/logger.hpp"
#include <format>
#include <fstream>
#include <string_view>

namespace sc::transport {

    namespace {
        template <typename T>
        std::vector<T> flatten(const torch::Tensor& t) {
            const auto dtype = std::is_same_v<T, double> ? torch::kFloat64 : torch::kFloat32;
            auto flat = t.to(torch::kCPU, dtype).contiguous().view({-1});
            const T* data = flat.data_ptr<T>();
            return std::vector<T>(data, data + flat.numel());
        }

        // JSON has no NaN/Inf (nlohmann writes null); such entries are sent as 0
        torch::Tensor finite_values(const torch::Tensor& t, std::string_view field) {
            const auto non_finite = (~torch::isfinite(t)).sum().item<int64_t>();
            if (non_finite == 0) {
                return t;
            }
            LOG_WARN("{} non-finite {} values sent as 0", non_finite, field);
            return torch::nan_to_num(t, 0.0, 0.0, 0.0);
        }

        nlohmann::json vec3_to_json(const glm::vec3& v) {
            return nlohmann::json::array({v.x, v.y, v.z});
        }
    } // namespace

    TransportOptions TransportOptions::from_parameters(const param::TransportParameters& params) {
        return TransportOptions{
            .clamp_scales = params.clamp_scales,
            .min_scale = params.min_scale,
            .max_scale = params.max_scale,
            .camera_distance_factor = params.camera_distance_factor};
    }

    nlohmann::json serialize_object(const GaussianSet& set, const TransportOptions& options) {
        auto scales = set.scales();
        if (options.clamp_scales && set.size() > 0) {
            scales = torch::clamp(scales, options.min_scale, options.max_scale);
        }

        nlohmann::json data;
        data["positions"] = flatten<float>(finite_values(set.positions(), "position"));
        data["colors"] = flatten<float>(finite_values(set.colors_dc(), "colour"));
        data["opacities"] = flatten<float>(finite_values(set.opacities(), "opacity"));
        data["scales"] = flatten<float>(finite_values(scales, "scale"));
        data["rotations"] = flatten<float>(finite_values(set.rotations(), "rotation"));
        data["count"] = set.size();
        return data;
    }

    geometry::SceneBounds compute_scene_bounds(const std::vector<TransportObject>& objects) {
        geometry::SceneBounds bounds;
        for (const auto& object : objects) {
            if (!object.set || object.set->empty()) {
                continue;
            }
            const geometry::ObjectTransform transform(object.transform);
            bounds.expand(transform.transformPoints(object.set->positions()));
        }
        return bounds;
    }

    nlohmann::json bounds_to_json(const geometry::SceneBounds& bounds) {
        nlohmann::json json;
        json["center"] = vec3_to_json(bounds.getCenter());
        json["min"] = vec3_to_json(bounds.getMinBounds());
        json["max"] = vec3_to_json(bounds.getMaxBounds());
        json["size"] = bounds.getSize();
        return json;
    }

    nlohmann::json initial_camera(const geometry::SceneBounds& bounds, float distance_factor) {
        const float distance = bounds.getSize() * distance_factor;

        nlohmann::json camera;
        camera["position"] = nlohmann::json::array({0.0f, 0.0f, distance});
        camera["target"] = vec3_to_json(bounds.getCenter());
        camera["up"] = nlohmann::json::array({0.0f, 1.0f, 0.0f});
        camera["distance"] = distance;
        return camera;
    }

    nlohmann::json serialize_single(const GaussianSet& set, const TransportOptions& options) {
        auto payload = serialize_object(set, options);

        geometry::SceneBounds bounds;
        if (!set.empty()) {
            bounds.expand(set.positions());
        }
        payload["bounds"] = bounds_to_json(bounds);
        payload["camera"] = initial_camera(bounds, options.camera_distance_factor);
        return payload;
    }

    nlohmann::json serialize_scene(const std::vector<TransportObject>& objects,
                                   const TransportOptions& options) {
        LOG_TIMER_TRACE("serialize_scene");

        std::vector<TransportObject> present;
        present.reserve(objects.size());
        for (const auto& object : objects) {
            if (!object.set) {
                LOG_WARN("Skipping '{}' in scene payload: no Gaussian data", object.name);
                continue;
            }
            present.push_back(object);
        }

        if (present.size() == 1) {
            const auto& only = present.front();
            if (!geometry::ObjectTransform(only.transform).isIdentity()) {
                LOG_DEBUG("'{}' is sent without its transform, the host keeps it in sync", only.name);
            }
            LOG_DEBUG("Serialized '{}', {} Gaussians", only.name, only.set->size());
            return serialize_single(*only.set, options);
        }

        nlohmann::json payload;
        payload["objects"] = nlohmann::json::array();

        int64_t total = 0;
        for (const auto& object : present) {
            nlohmann::json entry;
            entry["node_name"] = object.name;
            entry["data"] = serialize_object(*object.set, options);
            entry["transform"] = object.transform;
            payload["objects"].push_back(std::move(entry));
            total += object.set->size();
        }

        const auto bounds = compute_scene_bounds(present);
        payload["bounds"] = bounds_to_json(bounds);
        payload["camera"] = initial_camera(bounds, options.camera_distance_factor);

        LOG_DEBUG("Serialized {} objects, {} Gaussians", present.size(), total);
        return payload;
    }

    nlohmann::json serialize_preview(const std::string& name,
                                     const DecimatedPoints& points,
                                     int64_t total_count,
                                     float lod,
                                     float point_size) {
        nlohmann::json json;
        json["node_name"] = name;
        json["count"] = total_count;
        json["displayed"] = points.size();
        json["lod"] = lod;
        json["point_size"] = point_size;
        json["positions"] = points.size() > 0 ? flatten<float>(finite_values(points.positions, "position"))
                                              : std::vector<float>{};
        json["colors"] = points.size() > 0 ? flatten<float>(finite_values(points.colors, "colour"))
                                           : std::vector<float>{};
        return json;
    }

    std::expected<size_t, std::string> write_payload(const nlohmann::json& payload,
                                                     const std::filesystem::path& path) {
        try {
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }

            std::ofstream file(path, std::ios::binary);
            if (!file.is_open()) {
                return std::unexpected(std::format("Could not open file for writing: {}", path.string()));
            }

            const std::string text = payload.dump();
            file.write(text.data(), static_cast<std::streamsize>(text.size()));
            if (!file) {
                return std::unexpected(std::format("Failed to write payload: {}", path.string()));
            }

            LOG_INFO("Wrote {} ({:.2f} MB)", path.string(),
                     static_cast<double>(text.size()) / (1024.0 * 1024.0));
            return text.size();

        } catch (const std::exception& e) {
            return std::unexpected(std::format("Error writing payload: {}", e.what()));
        }
    }

} // namespace sc::transport
