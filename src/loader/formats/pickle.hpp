#pragma once

#include "core/error.hpp"
#include "loader/pickle_adapter.hpp"
#include <filesystem>
#include <vector>

namespace sc::loader {

    // Unpickle a torch.save'd dictionary; non-tensor values are dropped
    [[nodiscard]] Result<TensorMap> unpickle_tensor_map(const std::vector<char>& buffer);

    [[nodiscard]] Result<TensorMap> read_pickle_tensors(const std::filesystem::path& filepath);

} // namespace sc::loader
