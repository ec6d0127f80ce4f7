#include "pickle_loader.hpp"
#include "core/gaussian_set.hpp"
#include "core/logger.hpp"
#include "loader/formats/pickle.hpp"
#include "loader/filesystem_utils.hpp"
#include "loader/pickle_adapter.hpp"
#include <chrono>
#include <format>

namespace sc::loader {

    Result<LoadResult> PickleLoader::load(
        const std::filesystem::path& path,
        const LoadOptions& options) {

        LOG_TIMER("Pickle Loading");
        auto start_time = std::chrono::high_resolution_clock::now();

        if (options.progress) {
            options.progress(0.0f, "Loading pickle file...");
        }

        auto tensors = read_pickle_tensors(path);
        if (!tensors) {
            return std::unexpected(tensors.error());
        }

        // Validation only mode: key presence, no activations
        if (options.validate_only) {
            if (auto missing = missing_pickle_keys(*tensors); !missing.empty()) {
                Error error{ErrorCode::INVALID_FORMAT,
                            std::format("Pickle is missing {} required keys", missing.size()), path};
                error.missing_fields = std::move(missing);
                return std::unexpected(std::move(error));
            }

            if (options.progress) {
                options.progress(100.0f, "Pickle validation complete");
            }
            return LoadResult{
                .data = nullptr,
                .loader_used = name(),
                .format_description = "Pickled tensor dictionary",
                .load_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::high_resolution_clock::now() - start_time),
                .warnings = {}};
        }

        if (options.progress) {
            options.progress(50.0f, "Converting tensors...");
        }

        auto set = adapt_pickle(*tensors);
        if (!set) {
            auto error = set.error();
            error.with_path(path);
            LOG_ERROR("Failed to convert pickle: {}", error.format());
            return std::unexpected(std::move(error));
        }

        std::vector<std::string> warnings;
        if (!report_degenerate(*set, path.filename().string())) {
            warnings.push_back("Degenerate Gaussian data (see log)");
        }

        if (options.progress) {
            options.progress(100.0f, "Pickle loading complete");
        }

        auto load_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time);

        LoadResult result{
            .data = std::make_shared<const GaussianSet>(std::move(*set)),
            .loader_used = name(),
            .format_description = "Pickled tensor dictionary",
            .load_time = load_time,
            .warnings = std::move(warnings)};

        LOG_INFO("Pickle loaded: {} Gaussians in {}ms", result.data->size(), load_time.count());
        return result;
    }

    bool PickleLoader::canLoad(const std::filesystem::path& path) const {
        return is_file_with_extension(path, supportedExtensions());
    }

    std::string PickleLoader::name() const {
        return "Pickle";
    }

    std::vector<std::string> PickleLoader::supportedExtensions() const {
        return {".pkl", ".pickle", ".pt"};
    }

    int PickleLoader::priority() const {
        return 5;
    }

} // namespace sc::loader
