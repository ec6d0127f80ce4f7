/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <torch/torch.h>
#include <unordered_map>
#include <vector>

namespace sc::loader {

    /**
     * @brief Named per-vertex columns read from a file, in declaration order
     *
     * Every column is a float32 CPU tensor of shape [N].
     */
    class PropertyTable {
    public:
        PropertyTable() = default;
        explicit PropertyTable(int64_t rows) : rows_(rows) {}

        // Returns false when the name is taken or the length differs
        bool add(std::string name, torch::Tensor column) {
            if (columns_.contains(name) || column.dim() != 1 || column.size(0) != rows_) {
                return false;
            }
            names_.push_back(name);
            columns_.emplace(std::move(name), std::move(column));
            return true;
        }

        bool contains(std::string_view name) const {
            return columns_.contains(std::string(name));
        }

        // nullptr when absent
        const torch::Tensor* column(std::string_view name) const {
            auto it = columns_.find(std::string(name));
            return it != columns_.end() ? &it->second : nullptr;
        }

        const std::vector<std::string>& names() const { return names_; }
        int64_t rows() const { return rows_; }
        size_t column_count() const { return names_.size(); }

    private:
        int64_t rows_ = 0;
        std::vector<std::string> names_;
        std::unordered_map<std::string, torch::Tensor> columns_;
    };

} // namespace sc::loader
