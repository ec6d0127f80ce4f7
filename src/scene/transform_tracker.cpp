/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "scene/transform_tracker.hpp"
#include "core/logger.hpp"

namespace sc::scene {

    TransformTracker::TransformTracker(double tolerance)
        : tolerance_(tolerance < 0.0 ? 0.0 : tolerance) {}

    bool TransformTracker::hasChanged(const std::string& key, const geometry::Matrix4& current) {
        std::lock_guard<std::mutex> lock(mutex_);

        const geometry::ObjectTransform transform(current);
        auto it = last_seen_.find(key);
        if (it == last_seen_.end()) {
            last_seen_.emplace(key, transform);
            return true;
        }

        if (it->second.maxDifference(transform) <= tolerance_) {
            return false;
        }

        it->second = transform;
        LOG_TRACE("Transform of '{}' changed", key);
        return true;
    }

    void TransformTracker::reset(const std::string& key, const geometry::Matrix4& current) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_seen_.insert_or_assign(key, geometry::ObjectTransform(current));
    }

    void TransformTracker::forget(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_seen_.erase(key);
    }

    size_t TransformTracker::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_seen_.size();
    }

} // namespace sc::scene
