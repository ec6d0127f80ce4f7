/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <array>
#include <glm/glm.hpp>
#include <torch/torch.h>

namespace sc {
    namespace geometry {

        // 16 values, row-major, row-vector convention (p' = [p 1] * M, translation in 12..14)
        using Matrix4 = std::array<double, 16>;

        Matrix4 identity_matrix();

        class ObjectTransform {
        private:
            Matrix4 m_rows; // as delivered by the host

        public:
            // Default constructor - identity transformation
            ObjectTransform();

            explicit ObjectTransform(const Matrix4& row_major);

            static ObjectTransform fromTranslation(const glm::dvec3& translation);

            const Matrix4& rowMajor() const { return m_rows; }

            // Column-vector form, p' = M * p
            glm::dmat4 toMat4() const;

            glm::dvec3 getTranslation() const { return {m_rows[12], m_rows[13], m_rows[14]}; }

            // Check if transform is identity within epsilon tolerance
            bool isIdentity(double eps = 1e-9) const;

            // Largest element-wise difference to another transform
            double maxDifference(const ObjectTransform& other) const;

            glm::dvec3 transformPoint(const glm::dvec3& point) const;

            // [N,3] float positions through the matrix, returned as [N,3] float32
            torch::Tensor transformPoints(const torch::Tensor& positions) const;

            bool operator==(const ObjectTransform& other) const { return m_rows == other.m_rows; }
        };
    } // namespace geometry
} // namespace sc
