#pragma once

#include "loader/loader_interface.hpp"
#include "loader/loader_registry.hpp"
#include <memory>
#include <vector>

namespace sc::loader {

    /**
     * @brief Simple service for loading Gaussian files
     *
     * Resolves the loader for a path and normalises every failure into an sc::Error.
     */
    class LoaderService {
    public:
        LoaderService();
        ~LoaderService() = default;

        // Delete copy operations
        LoaderService(const LoaderService&) = delete;
        LoaderService& operator=(const LoaderService&) = delete;

        /**
         * @brief Load a file in any supported format
         * @param path File to load
         * @param options Loading options
         * @return LoadResult on success, typed error on failure
         */
        Result<LoadResult> load(
            const std::filesystem::path& path,
            const LoadOptions& options = {});

        bool canLoad(const std::filesystem::path& path) const;

        std::vector<std::string> getAvailableLoaders() const;

        std::vector<std::string> getSupportedExtensions() const;

    private:
        std::unique_ptr<DataLoaderRegistry> registry_;
    };

} // namespace sc::loader
