#include "loader/loader_service.hpp"
#include "core/logger.hpp"
#include "loader/loaders/pickle_loader.hpp"
#include "loader/loaders/ply_loader.hpp"
#include <format>

namespace sc::loader {

    namespace {
        std::vector<std::unique_ptr<IDataLoader>> default_loaders() {
            std::vector<std::unique_ptr<IDataLoader>> loaders;
            loaders.push_back(std::make_unique<PLYLoader>());
            loaders.push_back(std::make_unique<PickleLoader>());
            return loaders;
        }
    } // namespace

    LoaderService::LoaderService()
        : registry_(std::make_unique<DataLoaderRegistry>(default_loaders())) {
        LOG_DEBUG("LoaderService initialized with {} loaders", registry_->size());
    }

    Result<LoadResult> LoaderService::load(
        const std::filesystem::path& path,
        const LoadOptions& options) {

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            LOG_ERROR("File does not exist: {}", path.string());
            return make_error(ErrorCode::FILE_NOT_FOUND, "File does not exist", path);
        }
        if (!std::filesystem::is_regular_file(path, ec)) {
            LOG_ERROR("Path is not a regular file: {}", path.string());
            return make_error(ErrorCode::READ_FAILURE, "Path is not a regular file", path);
        }

        // Find appropriate loader
        auto* loader = registry_->findLoader(path);
        if (!loader) {
            std::string supported;
            for (const auto& ext : registry_->supportedExtensions()) {
                supported += std::format(" {}", ext);
            }

            auto error_msg = std::format("No loader for extension '{}' (supported:{})",
                                         path.extension().string(), supported);
            LOG_ERROR("{}", error_msg);
            return make_error(ErrorCode::INVALID_FORMAT, std::move(error_msg), path);
        }

        LOG_INFO("Using {} loader for: {}", loader->name(), path.string());

        // Anything a loader throws is a defect, never a user-facing failure
        try {
            return loader->load(path, options);
        } catch (const std::exception& e) {
            auto error_msg = std::format("{} loader failed: {}", loader->name(), e.what());
            LOG_ERROR("{}", error_msg);
            return make_error(ErrorCode::INTERNAL_ERROR, std::move(error_msg), path);
        }
    }

    bool LoaderService::canLoad(const std::filesystem::path& path) const {
        return registry_->findLoader(path) != nullptr;
    }

    std::vector<std::string> LoaderService::getAvailableLoaders() const {
        return registry_->loaderNames();
    }

    std::vector<std::string> LoaderService::getSupportedExtensions() const {
        return registry_->supportedExtensions();
    }

} // namespace sc::loader
