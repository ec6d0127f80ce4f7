/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/scene_store.hpp"
#include "core/logger.hpp"
#include "loader/loader.hpp"
#include <algorithm>
#include <format>
#include <mutex>
#include <unordered_set>

namespace sc::scene {

    SceneStore::SceneStore(DecodeFunction decode, param::PreviewParameters preview)
        : decode_(std::move(decode)),
          preview_(std::move(preview)) {
        LOG_DEBUG("SceneStore created (display cap {})", preview_.max_display_points);
    }

    std::string SceneStore::nextGeneratedName() {
        std::string name;
        do {
            name = std::format("{}{}", NAME_PREFIX, next_index_++);
        } while (objects_.contains(name));
        return name;
    }

    std::unexpected<Error> SceneStore::unknownObject(const std::string& name) const {
        return make_error(ErrorCode::UNKNOWN_OBJECT, std::format("No scene object named '{}'", name));
    }

    Result<std::string> SceneStore::importFile(const std::filesystem::path& path,
                                               std::optional<std::string> name) {
        if (!decode_) {
            return make_error(ErrorCode::INTERNAL_ERROR, "SceneStore has no decoder", path);
        }

        // Fail fast before decoding a file whose name is already taken
        if (name && contains(*name)) {
            return make_error(ErrorCode::DUPLICATE_OBJECT,
                              std::format("Scene object '{}' already exists", *name));
        }

        auto decoded = decode_(path);
        if (!decoded) {
            return std::unexpected(decoded.error());
        }

        return addObject(std::move(*decoded), std::move(name), path);
    }

    std::vector<std::string> SceneStore::importFiles(std::span<const std::filesystem::path> paths) {
        std::vector<std::string> imported;
        imported.reserve(paths.size());

        for (const auto& path : paths) {
            auto result = importFile(path);
            if (!result) {
                LOG_ERROR("Failed to import {}: {}", path.string(), result.error().format());
                continue;
            }
            imported.push_back(std::move(*result));
        }

        LOG_INFO("Imported {}/{}", imported.size(), paths.size());
        return imported;
    }

    Result<std::string> SceneStore::addObject(std::shared_ptr<const GaussianSet> data,
                                              std::optional<std::string> name,
                                              std::filesystem::path source_path) {
        if (!data) {
            return make_error(ErrorCode::INTERNAL_ERROR, "Cannot add a scene object without data");
        }
        if (name && name->empty()) {
            return make_error(ErrorCode::INTERNAL_ERROR, "Scene object names must not be empty");
        }

        SceneObject object;
        object.lod = initial_lod_for(data->size(), preview_.lod_tiers);
        object.point_size = std::clamp(preview_.default_point_size,
                                       preview_.min_point_size, preview_.max_point_size);
        object.source_path = std::move(source_path);
        object.data = std::move(data);

        std::string object_name;
        {
            std::unique_lock lock(mutex_);
            if (name) {
                if (objects_.contains(*name)) {
                    return make_error(ErrorCode::DUPLICATE_OBJECT,
                                      std::format("Scene object '{}' already exists", *name));
                }
                object_name = std::move(*name);
            } else {
                object_name = nextGeneratedName();
            }

            object.name = object_name;
            tracker_.reset(object_name, object.transform);
            LOG_INFO("Added '{}': {} Gaussians, lod {:.2f} ({} displayed)",
                     object_name, object.data->size(), object.lod,
                     display_count(object.data->size(), object.lod, preview_.max_display_points));
            objects_.emplace(object_name, std::move(object));
        }
        return object_name;
    }

    Result<void> SceneStore::refresh(const std::string& name) {
        std::filesystem::path source;
        {
            std::shared_lock lock(mutex_);
            auto it = objects_.find(name);
            if (it == objects_.end()) {
                return unknownObject(name);
            }
            source = it->second.source_path;
        }

        if (source.empty()) {
            return make_error(ErrorCode::FILE_NOT_FOUND,
                              std::format("Scene object '{}' has no source file to refresh from", name));
        }
        if (!decode_) {
            return make_error(ErrorCode::INTERNAL_ERROR, "SceneStore has no decoder", source);
        }

        auto decoded = decode_(source);
        if (!decoded) {
            LOG_WARN("Refresh of '{}' failed, keeping previous data: {}", name, decoded.error().format());
            return std::unexpected(decoded.error());
        }

        if (auto result = replace(name, std::move(*decoded)); !result) {
            return result;
        }
        LOG_INFO("Refreshed '{}' from {}", name, source.string());
        return {};
    }

    Result<void> SceneStore::replace(const std::string& name, std::shared_ptr<const GaussianSet> data) {
        if (!data) {
            return make_error(ErrorCode::INTERNAL_ERROR, "Cannot replace scene data with nothing");
        }

        std::unique_lock lock(mutex_);
        auto it = objects_.find(name);
        if (it == objects_.end()) {
            return unknownObject(name);
        }
        it->second.data = std::move(data);
        return {};
    }

    Result<void> SceneStore::remove(const std::string& name) {
        std::unique_lock lock(mutex_);
        if (objects_.erase(name) == 0) {
            return unknownObject(name);
        }
        tracker_.forget(name);
        LOG_DEBUG("Removed '{}'", name);
        return {};
    }

    Result<SceneObject> SceneStore::getObject(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = objects_.find(name);
        if (it == objects_.end()) {
            return unknownObject(name);
        }
        return it->second;
    }

    bool SceneStore::contains(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return objects_.contains(name);
    }

    std::vector<std::string> SceneStore::names() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> result;
        result.reserve(objects_.size());
        for (const auto& [name, _] : objects_) {
            result.push_back(name);
        }
        return result;
    }

    size_t SceneStore::size() const {
        std::shared_lock lock(mutex_);
        return objects_.size();
    }

    Result<void> SceneStore::setLod(const std::string& name, float lod) {
        std::unique_lock lock(mutex_);
        auto it = objects_.find(name);
        if (it == objects_.end()) {
            return unknownObject(name);
        }
        it->second.lod = clamp_lod(lod);
        LOG_DEBUG("'{}' lod set to {:.3f}", name, it->second.lod);
        return {};
    }

    Result<void> SceneStore::setPointSize(const std::string& name, float point_size) {
        std::unique_lock lock(mutex_);
        auto it = objects_.find(name);
        if (it == objects_.end()) {
            return unknownObject(name);
        }
        it->second.point_size = std::clamp(point_size, preview_.min_point_size, preview_.max_point_size);
        return {};
    }

    Result<void> SceneStore::setEnableRender(const std::string& name, bool enable) {
        std::unique_lock lock(mutex_);
        auto it = objects_.find(name);
        if (it == objects_.end()) {
            return unknownObject(name);
        }
        it->second.enable_render = enable;
        return {};
    }

    Result<void> SceneStore::setTransform(const std::string& name, const geometry::Matrix4& transform) {
        std::unique_lock lock(mutex_);
        auto it = objects_.find(name);
        if (it == objects_.end()) {
            return unknownObject(name);
        }
        it->second.transform = transform;
        tracker_.reset(name, transform);
        return {};
    }

    Result<bool> SceneStore::hasChanged(const std::string& name, const geometry::Matrix4& current) {
        std::unique_lock lock(mutex_);
        auto it = objects_.find(name);
        if (it == objects_.end()) {
            return unknownObject(name);
        }

        if (!tracker_.hasChanged(name, current)) {
            return false;
        }
        it->second.transform = current;
        return true;
    }

    std::vector<std::string> SceneStore::pruneMissing(std::span<const std::string> live) {
        const std::unordered_set<std::string> alive(live.begin(), live.end());
        std::vector<std::string> removed;

        std::unique_lock lock(mutex_);
        for (auto it = objects_.begin(); it != objects_.end();) {
            if (alive.contains(it->first)) {
                ++it;
                continue;
            }
            removed.push_back(it->first);
            tracker_.forget(it->first);
            it = objects_.erase(it);
        }

        if (!removed.empty()) {
            LOG_INFO("Pruned {} deleted objects", removed.size());
        }
        return removed;
    }

    Result<DecimatedPoints> SceneStore::preview(const std::string& name) const {
        std::shared_ptr<const GaussianSet> data;
        float lod = 1.0f;
        {
            std::shared_lock lock(mutex_);
            auto it = objects_.find(name);
            if (it == objects_.end()) {
                return unknownObject(name);
            }
            data = it->second.data;
            lod = it->second.lod;
        }
        return decimate(*data, lod, preview_.max_display_points);
    }

    Result<ObjectSummary> SceneStore::summary(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = objects_.find(name);
        if (it == objects_.end()) {
            return unknownObject(name);
        }

        const auto& object = it->second;
        return ObjectSummary{
            .name = object.name,
            .count = object.data->size(),
            .lod = object.lod,
            .displayed = display_count(object.data->size(), object.lod, preview_.max_display_points),
            .point_size = object.point_size,
            .enable_render = object.enable_render,
            .source_path = object.source_path};
    }

    std::vector<transport::TransportObject> SceneStore::transportObjects() const {
        std::shared_lock lock(mutex_);
        std::vector<transport::TransportObject> result;
        result.reserve(objects_.size());
        for (const auto& [name, object] : objects_) {
            result.push_back({.name = name, .set = object.data, .transform = object.transform});
        }
        return result;
    }

    SceneStore::DecodeFunction make_loader_decoder(std::shared_ptr<loader::Loader> loader) {
        return [loader = std::move(loader)](const std::filesystem::path& path)
                   -> Result<std::shared_ptr<const GaussianSet>> {
            auto result = loader->load(path);
            if (!result) {
                return std::unexpected(result.error());
            }
            if (!result->data) {
                return make_error(ErrorCode::INTERNAL_ERROR, "Loader returned no Gaussian data", path);
            }
            for (const auto& warning : result->warnings) {
                LOG_WARN("{}: {}", path.filename().string(), warning);
            }
            return result->data;
        };
    }

} // namespace sc::scene
