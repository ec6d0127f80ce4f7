/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/error.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sc {
    class GaussianSet;
} // namespace sc

namespace sc::loader {

    // Progress callback type
    using ProgressCallback = std::function<void(float percentage, const std::string& message)>;

    struct LoadOptions {
        bool validate_only = false; // Header/key checks only, no decode
        ProgressCallback progress = nullptr;
    };

    struct LoadResult {
        std::shared_ptr<const GaussianSet> data; // null for validate_only
        std::string loader_used;
        std::string format_description;
        std::chrono::milliseconds load_time{0};
        std::vector<std::string> warnings;
    };

    /**
     * @brief Main loader interface - the ONLY public API for the loader module
     *
     * Picks a format-specific loader by extension and decodes the file into a
     * canonical Gaussian set. Every failure is reported as an sc::Error.
     */
    class Loader {
    public:
        /**
         * @brief Create a loader instance with the PLY and pickle loaders registered
         */
        static std::unique_ptr<Loader> create();

        /**
         * @brief Decode a file into a canonical Gaussian set
         * @param path File to load
         * @param options Loading options
         * @return LoadResult on success; FILE_NOT_FOUND, INVALID_FORMAT,
         *         READ_FAILURE or INTERNAL_ERROR on failure
         */
        virtual Result<LoadResult> load(
            const std::filesystem::path& path,
            const LoadOptions& options = {}) = 0;

        /**
         * @brief Check if a path can be loaded
         * @param path File to check
         * @return true if the file exists and a loader handles its extension
         */
        virtual bool canLoad(const std::filesystem::path& path) const = 0;

        /**
         * @brief Get list of supported formats
         * @return Human-readable list of supported formats
         */
        virtual std::vector<std::string> getSupportedFormats() const = 0;

        /**
         * @brief Get list of supported file extensions
         * @return List of extensions (e.g., ".ply", ".pkl")
         */
        virtual std::vector<std::string> getSupportedExtensions() const = 0;

        virtual ~Loader() = default;
    };

} // namespace sc::loader
