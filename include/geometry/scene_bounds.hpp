/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <torch/torch.h>

namespace sc {
    namespace geometry {
        /**
         * @brief Axis-aligned bounds of everything sent to the external renderer
         *
         * The center is the mean of the accumulated points, not the box
         * midpoint. Bounds that never saw a point are all zero.
         */
        class SceneBounds {
        public:
            SceneBounds();

            static SceneBounds fromPoints(const torch::Tensor& points);

            // Accumulate [N,3] points, rows with non-finite values are skipped
            void expand(const torch::Tensor& points);

            bool empty() const { return point_count_ == 0; }
            int64_t getPointCount() const { return point_count_; }

            glm::vec3 getMinBounds() const { return min_bounds_; }
            glm::vec3 getMaxBounds() const { return max_bounds_; }
            glm::vec3 getCenter() const;
            glm::vec3 getExtent() const { return max_bounds_ - min_bounds_; }
            // Length of the extent diagonal
            float getSize() const { return glm::length(getExtent()); }

        private:
            glm::vec3 min_bounds_;
            glm::vec3 max_bounds_;
            glm::dvec3 sum_;
            int64_t point_count_ = 0;
        };
    } // namespace geometry
} // namespace sc
