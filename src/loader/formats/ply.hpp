#pragma once

#include "core/error.hpp"
#include "loader/property_table.hpp"
#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace sc::loader {

    enum class PlyEncoding {
        Ascii,
        BinaryLittleEndian,
        BinaryBigEndian
    };

    enum class PlyScalar : uint8_t {
        Int8,
        UInt8,
        Int16,
        UInt16,
        Int32,
        UInt32,
        Float32,
        Float64
    };

    struct PlyProperty {
        std::string name;
        PlyScalar type = PlyScalar::Float32;
        size_t offset = 0; // byte offset inside a fixed-size binary row
        bool is_list = false;
        PlyScalar count_type = PlyScalar::UInt8;
    };

    struct PlyElement {
        std::string name;
        size_t count = 0;
        size_t stride = 0; // valid only when has_lists() is false
        std::vector<PlyProperty> properties;

        [[nodiscard]] bool has_lists() const;
    };

    struct PlyHeader {
        PlyEncoding encoding = PlyEncoding::Ascii;
        std::vector<PlyElement> elements;
        size_t body_offset = 0;

        [[nodiscard]] const PlyElement* vertex_element() const;
        [[nodiscard]] std::vector<std::string> vertex_property_names() const;
    };

    [[nodiscard]] size_t scalar_size(PlyScalar type);

    // Header only; INVALID_FORMAT on malformed text
    [[nodiscard]] Result<PlyHeader> parse_ply_header(std::span<const char> data);

    // Header + vertex columns from an in-memory file image
    [[nodiscard]] Result<PropertyTable> parse_ply(std::span<const char> data);

    // Memory maps the file, then parse_ply
    [[nodiscard]] Result<PropertyTable> read_ply_properties(const std::filesystem::path& filepath);

    [[nodiscard]] Result<PlyHeader> read_ply_header(const std::filesystem::path& filepath);

} // namespace sc::loader
