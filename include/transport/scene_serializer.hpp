/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/decimation.hpp"
#include "core/gaussian_set.hpp"
#include "core/parameters.hpp"
#include "geometry/object_transform.hpp"
#include "geometry/scene_bounds.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sc::transport {

    struct TransportOptions {
        bool clamp_scales = true;
        float min_scale = 1e-3f;
        float max_scale = 1e3f;
        float camera_distance_factor = 5.0f;

        static TransportOptions from_parameters(const param::TransportParameters& params);
    };

    // One named object of a multi-object payload
    struct TransportObject {
        std::string name;
        std::shared_ptr<const GaussianSet> set;
        geometry::Matrix4 transform = geometry::identity_matrix();
    };

    /**
     * @brief Flatten one set into the renderer payload
     *
     * {positions:[3N], colors:[3N], opacities:[N], scales:[3N], rotations:[4N], count:N}
     * Full resolution. Scales are clamped only when options.clamp_scales is set.
     */
    nlohmann::json serialize_object(const GaussianSet& set, const TransportOptions& options = {});

    // Bounds over all object positions, each mapped through its transform
    geometry::SceneBounds compute_scene_bounds(const std::vector<TransportObject>& objects);

    nlohmann::json bounds_to_json(const geometry::SceneBounds& bounds);

    // Far camera on +Z looking at the scene center, distance = size * distance_factor
    nlohmann::json initial_camera(const geometry::SceneBounds& bounds, float distance_factor = 5.0f);

    /**
     * @brief Single-object payload
     *
     * The object fields at the top level plus bounds and camera, no transform (implicit identity).
     */
    nlohmann::json serialize_single(const GaussianSet& set, const TransportOptions& options = {});

    /**
     * @brief Scene payload
     *
     * Exactly one object with data: serialize_single(). Otherwise
     * {objects:[{node_name, data, transform:[16]}], bounds:{center,min,max,size}, camera:{...}}
     */
    nlohmann::json serialize_scene(const std::vector<TransportObject>& objects,
                                   const TransportOptions& options = {});

    // Decimated viewport points of one object
    nlohmann::json serialize_preview(const std::string& name,
                                     const DecimatedPoints& points,
                                     int64_t total_count,
                                     float lod,
                                     float point_size);

    // Write a payload, returns the number of bytes written
    std::expected<size_t, std::string> write_payload(const nlohmann::json& payload,
                                                     const std::filesystem::path& path);

} // namespace sc::transport
