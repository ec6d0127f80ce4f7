/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "pickle.hpp"
#include "core/logger.hpp"
#include <format>
#include <fstream>
#include <torch/torch.h>

namespace sc::loader {

    Result<TensorMap> unpickle_tensor_map(const std::vector<char>& buffer) {
        c10::IValue root;
        try {
            root = torch::pickle_load(buffer);
        } catch (const std::exception& e) {
            return make_error(ErrorCode::INVALID_FORMAT, std::format("Not a readable tensor pickle: {}", e.what()));
        }

        if (!root.isGenericDict()) {
            return make_error(ErrorCode::INVALID_FORMAT,
                              std::format("Pickle root is a {}, expected a dictionary", root.tagKind()));
        }

        TensorMap tensors;
        size_t skipped = 0;
        for (const auto& entry : root.toGenericDict()) {
            if (!entry.key().isString() || !entry.value().isTensor()) {
                ++skipped;
                continue;
            }
            tensors.emplace(entry.key().toStringRef(), entry.value().toTensor());
        }

        if (skipped > 0) {
            LOG_DEBUG("Ignored {} non-tensor pickle entries", skipped);
        }
        return tensors;
    }

    Result<TensorMap> read_pickle_tensors(const std::filesystem::path& filepath) {
        LOG_TIMER("Pickle File Loading");

        if (!std::filesystem::exists(filepath)) {
            return make_error(ErrorCode::FILE_NOT_FOUND, "Pickle file does not exist", filepath);
        }

        std::ifstream file(filepath, std::ios::binary);
        if (!file) {
            return make_error(ErrorCode::READ_FAILURE, "Cannot open pickle file for reading", filepath);
        }

        file.seekg(0, std::ios::end);
        const auto file_size = file.tellg();
        if (file_size < 0) {
            return make_error(ErrorCode::READ_FAILURE, "Cannot determine pickle file size", filepath);
        }
        file.seekg(0, std::ios::beg);

        std::vector<char> buffer(static_cast<size_t>(file_size));
        if (!file.read(buffer.data(), file_size)) {
            return make_error(ErrorCode::READ_FAILURE, "Failed to read pickle file", filepath);
        }

        auto tensors = unpickle_tensor_map(buffer);
        if (!tensors) {
            auto error = tensors.error();
            error.with_path(filepath);
            LOG_ERROR("Failed to read pickle: {}", error.format());
            return std::unexpected(std::move(error));
        }

        LOG_INFO("Pickle read: {:.2f} MB, {} tensors",
                 static_cast<double>(buffer.size()) / (1024.0 * 1024.0), tensors->size());
        return tensors;
    }

} // namespace sc::loader
