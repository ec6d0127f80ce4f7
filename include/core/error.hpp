/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <expected>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace sc {

    /// Error codes for decode and import operations
    enum class ErrorCode {
        SUCCESS = 0,

        // Filesystem (100-199)
        FILE_NOT_FOUND = 100,

        // Validation (200-299)
        INVALID_FORMAT = 200,

        // Load/Import (400-499)
        READ_FAILURE = 400,

        // Operation (500-599)
        UNKNOWN_OBJECT = 501,
        INTERNAL_ERROR = 502,
        DUPLICATE_OBJECT = 503,
    };

    constexpr std::string_view error_code_to_string(ErrorCode code) {
        switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::INVALID_FORMAT: return "Invalid format";
        case ErrorCode::READ_FAILURE: return "Read failed";
        case ErrorCode::UNKNOWN_OBJECT: return "Unknown object";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        case ErrorCode::DUPLICATE_OBJECT: return "Object already exists";
        default: return "Unknown error";
        }
    }

    /// Structured error with code, message, optional path and field diagnostics
    struct Error {
        ErrorCode code;
        std::string message;
        std::filesystem::path path;
        std::vector<std::string> missing_fields;
        std::vector<std::string> available_fields;

        Error(ErrorCode c, std::string msg)
            : code(c),
              message(std::move(msg)) {}

        Error(ErrorCode c, std::string msg, std::filesystem::path p)
            : code(c),
              message(std::move(msg)),
              path(std::move(p)) {}

        [[nodiscard]] std::string format() const {
            if (path.empty()) {
                return std::format("[{}] {}", error_code_to_string(code), message);
            }
            return std::format("[{}] {}: {}", error_code_to_string(code), message, path.string());
        }

        [[nodiscard]] bool is(ErrorCode c) const { return code == c; }

        [[nodiscard]] bool is_user_facing() const {
            return code == ErrorCode::FILE_NOT_FOUND ||
                   code == ErrorCode::INVALID_FORMAT ||
                   code == ErrorCode::READ_FAILURE;
        }

        // Attach the path once it is known; decoders work on in-memory tables
        Error& with_path(const std::filesystem::path& p) {
            if (path.empty()) {
                path = p;
            }
            return *this;
        }
    };

    template <typename T>
    using Result = std::expected<T, Error>;

    inline std::unexpected<Error> make_error(ErrorCode code, std::string message) {
        return std::unexpected(Error{code, std::move(message)});
    }

    inline std::unexpected<Error> make_error(ErrorCode code, std::string message,
                                             const std::filesystem::path& path) {
        return std::unexpected(Error{code, std::move(message), path});
    }

} // namespace sc
