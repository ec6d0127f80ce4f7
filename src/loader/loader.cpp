/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "loader/loader.hpp"
#include "core/logger.hpp"
#include "loader/filesystem_utils.hpp"
#include "loader/loader_service.hpp"
#include <memory>

namespace sc::loader {

    namespace {
        // Implementation class that hides all internal details
        class LoaderImpl : public Loader {
        public:
            LoaderImpl() : service_(std::make_unique<LoaderService>()) {
                LOG_TRACE("LoaderImpl created");
            }

            Result<LoadResult> load(
                const std::filesystem::path& path,
                const LoadOptions& options) override {

                LOG_DEBUG("Loading from path: {}", path.string());
                return service_->load(path, options);
            }

            bool canLoad(const std::filesystem::path& path) const override {
                if (!safe_exists(path)) {
                    LOG_TRACE("Path does not exist: {}", path.string());
                    return false;
                }

                const bool supported = service_->canLoad(path);
                if (!supported) {
                    LOG_TRACE("No compatible loader found for: {}", path.string());
                }
                return supported;
            }

            std::vector<std::string> getSupportedFormats() const override {
                return service_->getAvailableLoaders();
            }

            std::vector<std::string> getSupportedExtensions() const override {
                return service_->getSupportedExtensions();
            }

        private:
            std::unique_ptr<LoaderService> service_;
        };
    } // namespace

    // Factory method implementation
    std::unique_ptr<Loader> Loader::create() {
        LOG_DEBUG("Creating Loader instance");
        return std::make_unique<LoaderImpl>();
    }

} // namespace sc::loader
