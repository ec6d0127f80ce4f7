#pragma once

#include "core/gaussian_set.hpp"
#include <cstdint>
#include <memory>
#include <torch/torch.h>

namespace sc::test {

    // Valid canonical set with reproducible contents
    inline GaussianSet make_set(int64_t n, uint64_t seed = 8128) {
        torch::manual_seed(seed);
        auto positions = torch::randn({n, 3}) * 4.0f;
        auto opacities = torch::rand({n});
        auto scales = torch::rand({n, 3}) * 0.5f + 0.01f;
        auto rotations = torch::randn({n, 4});
        rotations = rotations / (rotations.norm(2, 1, true) + 1e-8f);
        auto colors = torch::rand({n, 3});

        auto set = GaussianSet::create(positions, opacities, scales, rotations, colors);
        return std::move(*set);
    }

    inline std::shared_ptr<const GaussianSet> make_shared_set(int64_t n, uint64_t seed = 8128) {
        return std::make_shared<const GaussianSet>(make_set(n, seed));
    }

} // namespace sc::test
