#include "ply_loader.hpp"
#include "core/gaussian_set.hpp"
#include "core/logger.hpp"
#include "loader/formats/ply.hpp"
#include "loader/attribute_decoder.hpp"
#include "loader/filesystem_utils.hpp"
#include "loader/format_detector.hpp"
#include <chrono>
#include <format>

namespace sc::loader {

    Result<LoadResult> PLYLoader::load(
        const std::filesystem::path& path,
        const LoadOptions& options) {

        LOG_TIMER("PLY Loading");
        auto start_time = std::chrono::high_resolution_clock::now();

        // Report progress if callback provided
        if (options.progress) {
            options.progress(0.0f, "Loading PLY file...");
        }

        // Validation only mode: header and field layout, no body
        if (options.validate_only) {
            LOG_DEBUG("Validation only mode for PLY: {}", path.string());
            auto header = read_ply_header(path);
            if (!header) {
                return std::unexpected(header.error());
            }

            const auto names = header->vertex_property_names();
            auto layout = detect_format(names);
            if (!layout) {
                auto error = layout.error();
                error.with_path(path);
                return std::unexpected(std::move(error));
            }

            if (options.progress) {
                options.progress(100.0f, "PLY validation complete");
            }

            LOG_DEBUG("PLY validation successful");
            return LoadResult{
                .data = nullptr,
                .loader_used = name(),
                .format_description = std::string(to_string(layout->schema())),
                .load_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::high_resolution_clock::now() - start_time),
                .warnings = {}};
        }

        LOG_INFO("Loading PLY file: {}", path.string());
        auto table = read_ply_properties(path);
        if (!table) {
            return std::unexpected(table.error());
        }

        if (options.progress) {
            options.progress(50.0f, "Decoding Gaussian attributes...");
        }

        auto layout = detect_format(*table);
        if (!layout) {
            auto error = layout.error();
            error.with_path(path);
            LOG_ERROR("Unsupported PLY layout: {}", error.format());
            return std::unexpected(std::move(error));
        }
        LOG_INFO("Detected {}", to_string(layout->schema()));

        auto set = decode_attributes(*table, *layout);
        if (!set) {
            auto error = set.error();
            error.with_path(path);
            LOG_ERROR("Failed to decode PLY: {}", error.format());
            return std::unexpected(std::move(error));
        }

        std::vector<std::string> warnings;
        if (!report_degenerate(*set, path.filename().string())) {
            warnings.push_back("Degenerate Gaussian data (see log)");
        }
        if (layout->schema() == PlySchema::Mixed) {
            warnings.push_back("Mixed colour/scale encodings");
        }

        if (options.progress) {
            options.progress(100.0f, "PLY loading complete");
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto load_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        LoadResult result{
            .data = std::make_shared<const GaussianSet>(std::move(*set)),
            .loader_used = name(),
            .format_description = std::string(to_string(layout->schema())),
            .load_time = load_time,
            .warnings = std::move(warnings)};

        LOG_INFO("PLY loaded: {} Gaussians in {}ms", result.data->size(), load_time.count());

        return result;
    }

    bool PLYLoader::canLoad(const std::filesystem::path& path) const {
        return is_file_with_extension(path, supportedExtensions());
    }

    std::string PLYLoader::name() const {
        return "PLY";
    }

    std::vector<std::string> PLYLoader::supportedExtensions() const {
        return {".ply"};
    }

    int PLYLoader::priority() const {
        return 10; // Higher priority for PLY files
    }

} // namespace sc::loader
