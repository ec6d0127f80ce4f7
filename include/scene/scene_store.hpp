/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/decimation.hpp"
#include "core/error.hpp"
#include "core/gaussian_set.hpp"
#include "core/parameters.hpp"
#include "geometry/object_transform.hpp"
#include "scene/transform_tracker.hpp"
#include "transport/scene_serializer.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace sc::loader {
    class Loader;
}

namespace sc::scene {

    // Snapshot of one named object
    struct SceneObject {
        std::string name;
        std::shared_ptr<const GaussianSet> data;
        std::filesystem::path source_path; // empty for objects added from memory
        geometry::Matrix4 transform = geometry::identity_matrix();
        float lod = 1.0f;
        float point_size = 2.0f;
        bool enable_render = true;
    };

    // What --info prints per object
    struct ObjectSummary {
        std::string name;
        int64_t count = 0;
        float lod = 1.0f;
        int64_t displayed = 0;
        float point_size = 2.0f;
        bool enable_render = true;
        std::filesystem::path source_path;
    };

    /**
     * @brief Owns the current Gaussian set of every named object
     *
     * Each object holds exactly one immutable set. Replacing it swaps the
     * pointer under the exclusive lock, so readers holding the previous
     * shared_ptr keep a consistent set. Decoding always happens outside the
     * lock. Operations on an unknown name fail with UNKNOWN_OBJECT.
     */
    class SceneStore {
    public:
        using DecodeFunction =
            std::function<Result<std::shared_ptr<const GaussianSet>>(const std::filesystem::path&)>;

        static constexpr const char* NAME_PREFIX = "splatCraftNode";

        explicit SceneStore(DecodeFunction decode, param::PreviewParameters preview = {});

        // Delete copy operations
        SceneStore(const SceneStore&) = delete;
        SceneStore& operator=(const SceneStore&) = delete;

        /**
         * @brief Decode a file into a new object
         * @param name Object name; generated as splatCraftNode<N> when absent
         * @return The object name
         */
        Result<std::string> importFile(const std::filesystem::path& path,
                                       std::optional<std::string> name = std::nullopt);

        // Imports what it can and returns the names that succeeded
        std::vector<std::string> importFiles(std::span<const std::filesystem::path> paths);

        Result<std::string> addObject(std::shared_ptr<const GaussianSet> data,
                                      std::optional<std::string> name = std::nullopt,
                                      std::filesystem::path source_path = {});

        // Re-decode from the stored source; on failure the current set stays
        Result<void> refresh(const std::string& name);

        Result<void> replace(const std::string& name, std::shared_ptr<const GaussianSet> data);

        Result<void> remove(const std::string& name);

        Result<SceneObject> getObject(const std::string& name) const;
        bool contains(const std::string& name) const;
        std::vector<std::string> names() const;
        size_t size() const;

        // Values are clamped to the node attribute ranges
        Result<void> setLod(const std::string& name, float lod);
        Result<void> setPointSize(const std::string& name, float point_size);
        Result<void> setEnableRender(const std::string& name, bool enable);
        Result<void> setTransform(const std::string& name, const geometry::Matrix4& transform);

        /**
         * @brief Poll-and-diff against the host's current world matrix
         *
         * Stores the matrix as the object's transform when it changed.
         */
        Result<bool> hasChanged(const std::string& name, const geometry::Matrix4& current);

        // Drop every object whose name is not in live; returns the removed names
        std::vector<std::string> pruneMissing(std::span<const std::string> live);

        Result<DecimatedPoints> preview(const std::string& name) const;
        Result<ObjectSummary> summary(const std::string& name) const;

        // All objects, sorted by name, ready for serialize_scene
        std::vector<transport::TransportObject> transportObjects() const;

        const param::PreviewParameters& previewParameters() const { return preview_; }

    private:
        std::string nextGeneratedName();
        std::unexpected<Error> unknownObject(const std::string& name) const;

        DecodeFunction decode_;
        param::PreviewParameters preview_;

        std::map<std::string, SceneObject> objects_;
        int next_index_ = 1;
        mutable std::shared_mutex mutex_;

        TransformTracker tracker_;
    };

    // Decode through the format loaders, for use as a SceneStore::DecodeFunction
    SceneStore::DecodeFunction make_loader_decoder(std::shared_ptr<loader::Loader> loader);

} // namespace sc::scene
