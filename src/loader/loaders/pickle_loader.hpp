#pragma once

#include "loader/loader_interface.hpp"

namespace sc::loader {

    /**
     * @brief Loader for pickled inference outputs (torch.save dictionaries)
     */
    class PickleLoader : public IDataLoader {
    public:
        PickleLoader() = default;
        ~PickleLoader() override = default;

        Result<LoadResult> load(
            const std::filesystem::path& path,
            const LoadOptions& options = {}) override;

        bool canLoad(const std::filesystem::path& path) const override;
        std::string name() const override;
        std::vector<std::string> supportedExtensions() const override;
        int priority() const override;
    };

} // namespace sc::loader
