#include "geometry/scene_bounds.hpp"

#include <stdexcept>

namespace sc {
    namespace geometry {

        SceneBounds::SceneBounds()
            : min_bounds_(0.0f, 0.0f, 0.0f),
              max_bounds_(0.0f, 0.0f, 0.0f),
              sum_(0.0, 0.0, 0.0) {}

        SceneBounds SceneBounds::fromPoints(const torch::Tensor& points) {
            SceneBounds bounds;
            bounds.expand(points);
            return bounds;
        }

        void SceneBounds::expand(const torch::Tensor& points) {
            if (!points.defined() || points.size(0) == 0) {
                return;
            }
            if (points.dim() != 2 || points.size(1) != 3) {
                throw std::invalid_argument("Scene bounds expect [N,3] points");
            }

            // Rows with NaN/Inf would poison min, max and mean
            auto p = points.to(torch::kCPU, torch::kFloat64);
            const auto finite_rows = torch::isfinite(p).all(1);
            if (!finite_rows.all().item<bool>()) {
                p = p.index({finite_rows});
                if (p.size(0) == 0) {
                    return;
                }
            }
            const auto lo = std::get<0>(p.min(0));
            const auto hi = std::get<0>(p.max(0));
            const auto total = p.sum(0);

            const glm::vec3 batch_min(lo[0].item<double>(), lo[1].item<double>(), lo[2].item<double>());
            const glm::vec3 batch_max(hi[0].item<double>(), hi[1].item<double>(), hi[2].item<double>());

            if (point_count_ == 0) {
                min_bounds_ = batch_min;
                max_bounds_ = batch_max;
            } else {
                min_bounds_ = glm::min(min_bounds_, batch_min);
                max_bounds_ = glm::max(max_bounds_, batch_max);
            }

            sum_ += glm::dvec3(total[0].item<double>(), total[1].item<double>(), total[2].item<double>());
            point_count_ += p.size(0);
        }

        glm::vec3 SceneBounds::getCenter() const {
            if (point_count_ == 0) {
                return glm::vec3(0.0f);
            }
            return glm::vec3(sum_ / static_cast<double>(point_count_));
        }

    } // namespace geometry
} // namespace sc
