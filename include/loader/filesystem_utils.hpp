/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <span>
#include <string>
#include <system_error>

namespace sc::loader {

    namespace fs = std::filesystem;

    // Safe filesystem operations that don't throw
    inline bool safe_exists(const fs::path& path) {
        std::error_code ec;
        return fs::exists(path, ec);
    }

    inline bool safe_is_regular_file(const fs::path& path) {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }

    inline std::string to_lower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    inline std::string lowercase_extension(const fs::path& path) {
        return to_lower(path.extension().string());
    }

    // Existing regular file whose extension (case-insensitive) is in the list
    inline bool is_file_with_extension(const fs::path& path, std::span<const std::string> extensions) {
        if (!safe_is_regular_file(path)) {
            return false;
        }
        const auto ext = lowercase_extension(path);
        return std::ranges::any_of(extensions, [&ext](const std::string& candidate) {
            return to_lower(candidate) == ext;
        });
    }

} // namespace sc::loader
