#pragma once

#include "loader/filesystem_utils.hpp"
#include "loader/loader_interface.hpp"
#include <algorithm>
#include <functional>
#include <memory>
#include <ranges>
#include <vector>

namespace sc::loader {

    /**
     * @brief Fixed set of format loaders, highest priority first
     *
     * Built once and never modified afterwards, so lookups need no locking.
     */
    class DataLoaderRegistry {
    public:
        explicit DataLoaderRegistry(std::vector<std::unique_ptr<IDataLoader>> loaders)
            : loaders_(std::move(loaders)) {
            std::erase(loaders_, nullptr);
            std::ranges::stable_sort(loaders_, std::ranges::greater{},
                                     [](const auto& loader) { return loader->priority(); });
        }

        DataLoaderRegistry(const DataLoaderRegistry&) = delete;
        DataLoaderRegistry& operator=(const DataLoaderRegistry&) = delete;

        // First loader claiming the path, nullptr when none does
        IDataLoader* findLoader(const std::filesystem::path& path) const {
            auto it = std::ranges::find_if(loaders_, [&path](const auto& loader) {
                return loader->canLoad(path);
            });
            return it != loaders_.end() ? it->get() : nullptr;
        }

        std::vector<std::string> loaderNames() const {
            std::vector<std::string> names;
            names.reserve(loaders_.size());
            for (const auto& loader : loaders_) {
                names.push_back(loader->name());
            }
            return names;
        }

        // Lowercase, sorted, unique
        std::vector<std::string> supportedExtensions() const {
            std::vector<std::string> extensions;
            for (const auto& loader : loaders_) {
                for (const auto& ext : loader->supportedExtensions()) {
                    extensions.push_back(to_lower(ext));
                }
            }
            std::ranges::sort(extensions);
            auto [first, last] = std::ranges::unique(extensions);
            extensions.erase(first, last);
            return extensions;
        }

        size_t size() const { return loaders_.size(); }

    private:
        std::vector<std::unique_ptr<IDataLoader>> loaders_;
    };

} // namespace sc::loader
