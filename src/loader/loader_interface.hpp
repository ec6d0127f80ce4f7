#pragma once

#include "loader/loader.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace sc::loader {

    /**
     * @brief One on-disk Gaussian format
     *
     * load() turns a file into a GaussianSet, or into a header/key check
     * when options.validate_only is set. Errors are returned, not thrown.
     */
    class IDataLoader {
    public:
        virtual ~IDataLoader() = default;

        virtual Result<LoadResult> load(const std::filesystem::path& path,
                                        const LoadOptions& options = {}) = 0;

        // Existing regular file with one of supportedExtensions()
        virtual bool canLoad(const std::filesystem::path& path) const = 0;

        virtual std::string name() const = 0;

        // With the leading dot, matched case-insensitively
        virtual std::vector<std::string> supportedExtensions() const = 0;

        // Consulted first when several loaders accept a path
        virtual int priority() const { return 0; }
    };

} // namespace sc::loader
