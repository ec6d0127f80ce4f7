#pragma once

#include "loader/pickle_adapter.hpp"
#include <filesystem>
#include <fstream>
#include <torch/torch.h>

namespace sc::test {

    // Inference-pipeline style tensors: f_dc [N,1,3], f_rest [N,15,3], wxyz rotations
    inline loader::TensorMap make_pickle_tensors(int64_t n, bool with_rotation = true) {
        torch::manual_seed(496);
        loader::TensorMap data;
        data["xyz"] = torch::randn({n, 3});
        data["f_dc"] = torch::randn({n, 1, 3});
        data["f_rest"] = torch::randn({n, 15, 3}) * 0.1f;
        data["opacity"] = torch::randn({n, 1});
        data["scaling"] = torch::randn({n, 3}) - 3.0f;
        if (with_rotation) {
            auto rotation = torch::randn({n, 4}) * 0.1f;
            rotation.select(1, 0).fill_(1.0f);
            data["rotation"] = rotation;
        }
        return data;
    }

    inline std::vector<char> pickle_bytes(const loader::TensorMap& data) {
        c10::Dict<std::string, at::Tensor> dict;
        for (const auto& [key, value] : data) {
            dict.insert(key, value);
        }
        return torch::pickle_save(c10::IValue(dict));
    }

    inline void write_pickle(const std::filesystem::path& path, const loader::TensorMap& data) {
        const auto bytes = pickle_bytes(data);
        std::ofstream file(path, std::ios::binary);
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

} // namespace sc::test
