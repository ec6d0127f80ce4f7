/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "geometry/object_transform.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

namespace sc::scene {

    /**
     * @brief Poll-and-diff for host transforms
     *
     * An external poller reports the current matrix for a key at whatever
     * rate it likes. hasChanged() answers whether it differs from the last
     * reported matrix by more than the tolerance and remembers the new one.
     * The first report for a key counts as a change.
     */
    class TransformTracker {
    public:
        explicit TransformTracker(double tolerance = 0.0);

        bool hasChanged(const std::string& key, const geometry::Matrix4& current);

        // Record a matrix without reporting a change
        void reset(const std::string& key, const geometry::Matrix4& current);

        void forget(const std::string& key);
        size_t size() const;

    private:
        double tolerance_;
        std::unordered_map<std::string, geometry::ObjectTransform> last_seen_;
        mutable std::mutex mutex_;
    };

} // namespace sc::scene
