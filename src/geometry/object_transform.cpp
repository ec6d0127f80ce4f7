#include "geometry/object_transform.hpp"

#include <algorithm>
#include <cmath>
#include <glm/gtc/type_ptr.hpp>

namespace sc {
    namespace geometry {

        Matrix4 identity_matrix() {
            return {1.0, 0.0, 0.0, 0.0,
                    0.0, 1.0, 0.0, 0.0,
                    0.0, 0.0, 1.0, 0.0,
                    0.0, 0.0, 0.0, 1.0};
        }

        ObjectTransform::ObjectTransform()
            : m_rows(identity_matrix()) {}

        ObjectTransform::ObjectTransform(const Matrix4& row_major)
            : m_rows(row_major) {}

        ObjectTransform ObjectTransform::fromTranslation(const glm::dvec3& translation) {
            Matrix4 rows = identity_matrix();
            rows[12] = translation.x;
            rows[13] = translation.y;
            rows[14] = translation.z;
            return ObjectTransform(rows);
        }

        glm::dmat4 ObjectTransform::toMat4() const {
            // glm reads column-major, so the host rows become glm columns: the
            // transpose, which is exactly the column-vector form
            return glm::make_mat4(m_rows.data());
        }

        bool ObjectTransform::isIdentity(double eps) const {
            return maxDifference(ObjectTransform()) <= eps;
        }

        double ObjectTransform::maxDifference(const ObjectTransform& other) const {
            double diff = 0.0;
            for (size_t i = 0; i < m_rows.size(); ++i) {
                diff = std::max(diff, std::abs(m_rows[i] - other.m_rows[i]));
            }
            return diff;
        }

        glm::dvec3 ObjectTransform::transformPoint(const glm::dvec3& point) const {
            const glm::dvec4 p = toMat4() * glm::dvec4(point, 1.0);
            if (p.w != 0.0 && p.w != 1.0) {
                return glm::dvec3(p) / p.w;
            }
            return glm::dvec3(p);
        }

        torch::Tensor ObjectTransform::transformPoints(const torch::Tensor& positions) const {
            if (positions.size(0) == 0 || isIdentity(0.0)) {
                return positions.to(torch::kFloat32);
            }

            auto matrix = torch::tensor(std::vector<double>(m_rows.begin(), m_rows.end()),
                                        torch::kFloat64)
                              .view({4, 4});

            auto homogeneous = torch::cat(
                {positions.to(torch::kFloat64),
                 torch::ones({positions.size(0), 1}, torch::kFloat64)},
                1);

            auto transformed = torch::matmul(homogeneous, matrix);
            auto w = transformed.slice(1, 3, 4);
            auto xyz = transformed.slice(1, 0, 3);

            // Affine host matrices keep w at 1; divide only for projective ones
            if (!torch::allclose(w, torch::ones_like(w))) {
                xyz = xyz / w;
            }
            return xyz.to(torch::kFloat32).contiguous();
        }

    } // namespace geometry
} // namespace sc
