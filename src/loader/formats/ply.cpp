/* SPDX-FileCopyrightText: 2025 SplatCraft Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "ply.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <atomic>
#include <bit>
#include <charconv>
#include <cmath>
#include <cstring>
#include <format>
#include <optional>
#include <string_view>
#include <vector>

// TBB includes
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

// Platform-specific includes
#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace sc::loader {

    namespace ply_constants {
        // Block sizes for parallel processing
        constexpr size_t BLOCK_SIZE_SMALL = 256;
        constexpr size_t BLOCK_SIZE_LARGE = 2048;
        constexpr size_t PLY_MIN_SIZE = 10;
        constexpr size_t FILE_SIZE_THRESHOLD_MB = 50;
        constexpr size_t MAX_HEADER_LINES = 10000;

        using namespace std::string_view_literals;
        constexpr auto VERTEX_ELEMENT = "vertex"sv;
        constexpr auto FORMAT_ASCII = "ascii"sv;
        constexpr auto FORMAT_BINARY_LE = "binary_little_endian"sv;
        constexpr auto FORMAT_BINARY_BE = "binary_big_endian"sv;
    } // namespace ply_constants

    namespace {

        struct MMappedFile {
            void* data = nullptr;
            size_t size = 0;

#ifdef _WIN32
            HANDLE file_handle = INVALID_HANDLE_VALUE;
            HANDLE mapping_handle = INVALID_HANDLE_VALUE;

            ~MMappedFile() {
                if (data)
                    UnmapViewOfFile(data);
                if (mapping_handle != INVALID_HANDLE_VALUE && mapping_handle != nullptr)
                    CloseHandle(mapping_handle);
                if (file_handle != INVALID_HANDLE_VALUE)
                    CloseHandle(file_handle);
            }

            [[nodiscard]] bool map(const std::filesystem::path& filepath) {
                auto wide_path = filepath.wstring();
                file_handle = CreateFileW(wide_path.c_str(), GENERIC_READ, FILE_SHARE_READ,
                                          nullptr, OPEN_EXISTING, FILE_FLAG_SEQUENTIAL_SCAN, nullptr);
                if (file_handle == INVALID_HANDLE_VALUE) {
                    LOG_ERROR("Failed to open file for mapping: {}", filepath.string());
                    return false;
                }

                LARGE_INTEGER file_size_li;
                if (!GetFileSizeEx(file_handle, &file_size_li)) {
                    LOG_ERROR("Failed to get file size: {}", filepath.string());
                    return false;
                }
                size = static_cast<size_t>(file_size_li.QuadPart);
                if (size == 0) {
                    return true;
                }

                mapping_handle = CreateFileMappingW(file_handle, nullptr, PAGE_READONLY, 0, 0, nullptr);
                if (!mapping_handle) {
                    LOG_ERROR("Failed to create file mapping: {}", filepath.string());
                    return false;
                }

                data = MapViewOfFile(mapping_handle, FILE_MAP_READ, 0, 0, 0);
                if (!data) {
                    LOG_ERROR("Failed to map view of file: {}", filepath.string());
                }
                return data != nullptr;
            }
#else
            int fd = -1;

            ~MMappedFile() {
                if (data && data != MAP_FAILED)
                    munmap(data, size);
                if (fd >= 0)
                    close(fd);
            }

            [[nodiscard]] bool map(const std::filesystem::path& filepath) {
                fd = open(filepath.c_str(), O_RDONLY);
                if (fd < 0) {
                    LOG_ERROR("Failed to open file for mapping: {}", filepath.string());
                    return false;
                }

                struct stat st {};
                if (fstat(fd, &st) < 0) {
                    LOG_ERROR("Failed to stat file: {}", filepath.string());
                    return false;
                }
                size = static_cast<size_t>(st.st_size);
                if (size == 0) {
                    // mmap rejects empty mappings; the parser reports the file as too small
                    return true;
                }

                data = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
                if (data == MAP_FAILED) {
                    data = nullptr;
                    LOG_ERROR("Failed to mmap file: {}", filepath.string());
                    return false;
                }

                if (size > ply_constants::FILE_SIZE_THRESHOLD_MB * 1024 * 1024) {
                    if (madvise(data, size, MADV_SEQUENTIAL) == 0) {
                        LOG_DEBUG("Applied sequential access optimization for large file");
                    }
                }

                return true;
            }
#endif

            [[nodiscard]] std::span<const char> as_span() const {
                return std::span{static_cast<const char*>(data), data ? size : 0};
            }
        };

        bool is_blank(char c) {
            return c == ' ' || c == '\t' || c == '\r';
        }

        std::vector<std::string_view> split_tokens(std::string_view line) {
            std::vector<std::string_view> tokens;
            size_t pos = 0;
            while (pos < line.size()) {
                while (pos < line.size() && is_blank(line[pos]))
                    ++pos;
                const size_t start = pos;
                while (pos < line.size() && !is_blank(line[pos]))
                    ++pos;
                if (pos > start)
                    tokens.push_back(line.substr(start, pos - start));
            }
            return tokens;
        }

        // Next line without its terminator; handles both \n and \r\n
        std::optional<std::string_view> next_line(const char*& ptr, const char* end) {
            if (ptr >= end)
                return std::nullopt;

            const char* line_start = ptr;
            const char* p = static_cast<const char*>(std::memchr(ptr, '\n', static_cast<size_t>(end - ptr)));
            if (!p) {
                ptr = end;
                return std::string_view(line_start, static_cast<size_t>(end - line_start));
            }
            ptr = p + 1;
            const char* line_end = (p > line_start && *(p - 1) == '\r') ? p - 1 : p;
            return std::string_view(line_start, static_cast<size_t>(line_end - line_start));
        }

        bool is_blank_line(std::string_view line) {
            return std::ranges::all_of(line, is_blank);
        }

        std::optional<PlyScalar> parse_scalar(std::string_view name) {
            if (name == "char" || name == "int8")
                return PlyScalar::Int8;
            if (name == "uchar" || name == "uint8")
                return PlyScalar::UInt8;
            if (name == "short" || name == "int16")
                return PlyScalar::Int16;
            if (name == "ushort" || name == "uint16")
                return PlyScalar::UInt16;
            if (name == "int" || name == "int32")
                return PlyScalar::Int32;
            if (name == "uint" || name == "uint32")
                return PlyScalar::UInt32;
            if (name == "float" || name == "float32")
                return PlyScalar::Float32;
            if (name == "double" || name == "float64")
                return PlyScalar::Float64;
            return std::nullopt;
        }

        template <typename T>
        T load_scalar(const char* src, bool swap) {
            if constexpr (sizeof(T) == 1) {
                T value;
                std::memcpy(&value, src, 1);
                return value;
            } else {
                using Raw = std::conditional_t<sizeof(T) == 2, uint16_t,
                                               std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>;
                Raw raw;
                std::memcpy(&raw, src, sizeof(Raw));
                if (swap)
                    raw = std::byteswap(raw);
                return std::bit_cast<T>(raw);
            }
        }

        double read_binary_value(const char* src, PlyScalar type, bool swap) {
            switch (type) {
            case PlyScalar::Int8: return load_scalar<int8_t>(src, swap);
            case PlyScalar::UInt8: return load_scalar<uint8_t>(src, swap);
            case PlyScalar::Int16: return load_scalar<int16_t>(src, swap);
            case PlyScalar::UInt16: return load_scalar<uint16_t>(src, swap);
            case PlyScalar::Int32: return load_scalar<int32_t>(src, swap);
            case PlyScalar::UInt32: return load_scalar<uint32_t>(src, swap);
            case PlyScalar::Float32: return load_scalar<float>(src, swap);
            case PlyScalar::Float64: return load_scalar<double>(src, swap);
            }
            return 0.0;
        }

        bool needs_swap(PlyEncoding encoding) {
            if (encoding == PlyEncoding::Ascii)
                return false;
            const bool file_big = encoding == PlyEncoding::BinaryBigEndian;
            const bool host_big = std::endian::native == std::endian::big;
            return file_big != host_big;
        }

        std::string_view encoding_name(PlyEncoding encoding) {
            switch (encoding) {
            case PlyEncoding::Ascii: return ply_constants::FORMAT_ASCII;
            case PlyEncoding::BinaryLittleEndian: return ply_constants::FORMAT_BINARY_LE;
            case PlyEncoding::BinaryBigEndian: return ply_constants::FORMAT_BINARY_BE;
            }
            return "unknown";
        }

        // Advance past one element of a binary body; nullptr when the body is too short
        // or a list length is negative
        const char* skip_binary_element(const char* ptr, const char* end, const PlyElement& element, bool swap) {
            if (!element.has_lists()) {
                const size_t available = static_cast<size_t>(end - ptr);
                if (element.stride > 0 && element.count > available / element.stride)
                    return nullptr;
                return ptr + element.count * element.stride;
            }

            for (size_t row = 0; row < element.count; ++row) {
                for (const auto& prop : element.properties) {
                    if (!prop.is_list) {
                        const size_t bytes = scalar_size(prop.type);
                        if (static_cast<size_t>(end - ptr) < bytes)
                            return nullptr;
                        ptr += bytes;
                        continue;
                    }

                    const size_t count_bytes = scalar_size(prop.count_type);
                    if (static_cast<size_t>(end - ptr) < count_bytes)
                        return nullptr;
                    const double items = read_binary_value(ptr, prop.count_type, swap);
                    ptr += count_bytes;

                    // Signed count types can hold negative lengths
                    const size_t item_bytes = scalar_size(prop.type);
                    const size_t available = static_cast<size_t>(end - ptr);
                    if (!std::isfinite(items) || items < 0.0 ||
                        items > static_cast<double>(available / item_bytes))
                        return nullptr;
                    ptr += static_cast<size_t>(items) * item_bytes;
                }
            }
            return ptr;
        }

        // ASCII rows are one line each; blank lines are not rows
        const char* skip_ascii_rows(const char* ptr, const char* end, size_t count) {
            size_t skipped = 0;
            while (skipped < count) {
                auto line = next_line(ptr, end);
                if (!line)
                    return nullptr;
                if (!is_blank_line(*line))
                    ++skipped;
            }
            return ptr;
        }

        Result<PropertyTable> extract_binary_columns(const char* vertex_data, const char* end,
                                                     const PlyElement& vertex, bool swap) {
            const size_t count = vertex.count;
            const size_t stride = vertex.stride;
            const size_t available = static_cast<size_t>(end - vertex_data);

            if (stride > 0 && count > available / stride) {
                return make_error(ErrorCode::READ_FAILURE,
                                  std::format("PLY body truncated: {} vertices of {} bytes need {} bytes, {} available",
                                              count, stride, count * stride, available));
            }

            PropertyTable table(static_cast<int64_t>(count));
            for (const auto& prop : vertex.properties) {
                auto column = torch::empty({static_cast<int64_t>(count)}, torch::kFloat32);
                float* output = column.data_ptr<float>();

                tbb::parallel_for(tbb::blocked_range<size_t>(0, count, ply_constants::BLOCK_SIZE_LARGE),
                                  [&](const tbb::blocked_range<size_t>& range) {
                                      for (size_t i = range.begin(); i < range.end(); ++i) {
                                          output[i] = static_cast<float>(
                                              read_binary_value(vertex_data + i * stride + prop.offset, prop.type, swap));
                                      }
                                  });

                if (!table.add(prop.name, std::move(column))) {
                    return make_error(ErrorCode::INVALID_FORMAT,
                                      std::format("Duplicate vertex property '{}'", prop.name));
                }
            }
            return table;
        }

        Result<PropertyTable> extract_ascii_columns(const char* ptr, const char* end, const PlyElement& vertex) {
            const size_t count = vertex.count;

            std::vector<std::string_view> rows;
            rows.reserve(count);
            while (rows.size() < count) {
                auto line = next_line(ptr, end);
                if (!line)
                    break;
                if (!is_blank_line(*line))
                    rows.push_back(*line);
            }

            if (rows.size() < count) {
                return make_error(ErrorCode::READ_FAILURE,
                                  std::format("PLY body truncated: expected {} vertex rows, found {}",
                                              count, rows.size()));
            }

            const size_t prop_count = vertex.properties.size();
            std::vector<torch::Tensor> columns;
            std::vector<float*> outputs;
            columns.reserve(prop_count);
            outputs.reserve(prop_count);
            for (size_t j = 0; j < prop_count; ++j) {
                columns.push_back(torch::empty({static_cast<int64_t>(count)}, torch::kFloat32));
                outputs.push_back(columns.back().data_ptr<float>());
            }

            std::atomic<size_t> first_bad_row{SIZE_MAX};
            tbb::parallel_for(tbb::blocked_range<size_t>(0, count, ply_constants::BLOCK_SIZE_SMALL),
                              [&](const tbb::blocked_range<size_t>& range) {
                                  for (size_t i = range.begin(); i < range.end(); ++i) {
                                      const char* p = rows[i].data();
                                      const char* e = p + rows[i].size();

                                      for (size_t j = 0; j < prop_count; ++j) {
                                          while (p < e && is_blank(*p))
                                              ++p;
                                          if (p < e && *p == '+')
                                              ++p;

                                          double value = 0.0;
                                          auto [next, ec] = std::from_chars(p, e, value);
                                          if (ec != std::errc{}) {
                                              size_t seen = first_bad_row.load();
                                              while (i < seen && !first_bad_row.compare_exchange_weak(seen, i)) {
                                              }
                                              break;
                                          }
                                          outputs[j][i] = static_cast<float>(value);
                                          p = next;
                                      }
                                  }
                              });

            if (const size_t bad = first_bad_row.load(); bad != SIZE_MAX) {
                return make_error(ErrorCode::INVALID_FORMAT,
                                  std::format("Malformed ASCII vertex row {}: '{}'", bad, rows[bad]));
            }

            PropertyTable table(static_cast<int64_t>(count));
            for (size_t j = 0; j < prop_count; ++j) {
                if (!table.add(vertex.properties[j].name, std::move(columns[j]))) {
                    return make_error(ErrorCode::INVALID_FORMAT,
                                      std::format("Duplicate vertex property '{}'", vertex.properties[j].name));
                }
            }
            return table;
        }

    } // namespace

    bool PlyElement::has_lists() const {
        return std::ranges::any_of(properties, &PlyProperty::is_list);
    }

    const PlyElement* PlyHeader::vertex_element() const {
        auto it = std::ranges::find(elements, ply_constants::VERTEX_ELEMENT, &PlyElement::name);
        return it != elements.end() ? &*it : nullptr;
    }

    std::vector<std::string> PlyHeader::vertex_property_names() const {
        std::vector<std::string> names;
        if (const auto* vertex = vertex_element()) {
            names.reserve(vertex->properties.size());
            for (const auto& prop : vertex->properties) {
                names.push_back(prop.name);
            }
        }
        return names;
    }

    size_t scalar_size(PlyScalar type) {
        switch (type) {
        case PlyScalar::Int8:
        case PlyScalar::UInt8: return 1;
        case PlyScalar::Int16:
        case PlyScalar::UInt16: return 2;
        case PlyScalar::Int32:
        case PlyScalar::UInt32:
        case PlyScalar::Float32: return 4;
        case PlyScalar::Float64: return 8;
        }
        return 0;
    }

    Result<PlyHeader> parse_ply_header(std::span<const char> data) {
        LOG_TIMER_TRACE("PLY header parsing");

        const size_t file_size = data.size();
        if (file_size < ply_constants::PLY_MIN_SIZE) {
            return make_error(ErrorCode::INVALID_FORMAT,
                              std::format("File too small to be valid PLY: {} bytes", file_size));
        }

        const char* ptr = data.data();
        const char* end = ptr + file_size;

        // Magic line, Unix or Windows line endings
        auto magic = next_line(ptr, end);
        if (!magic || *magic != "ply") {
            return make_error(ErrorCode::INVALID_FORMAT, "Invalid PLY file - missing PLY header");
        }

        PlyHeader header;
        bool found_format = false;
        size_t lines_parsed = 0;

        while (lines_parsed < ply_constants::MAX_HEADER_LINES) {
            auto line = next_line(ptr, end);
            if (!line) {
                break;
            }
            lines_parsed++;

            // Skip empty lines and comments
            if (line->empty() || (*line)[0] == '#')
                continue;

            const auto tokens = split_tokens(*line);
            if (tokens.empty())
                continue;

            const auto keyword = tokens[0];
            if (keyword == "comment" || keyword == "obj_info") {
                continue;
            }

            if (keyword == "format") {
                if (tokens.size() < 2) {
                    return make_error(ErrorCode::INVALID_FORMAT, "Malformed PLY format line");
                }
                if (tokens[1] == ply_constants::FORMAT_ASCII) {
                    header.encoding = PlyEncoding::Ascii;
                } else if (tokens[1] == ply_constants::FORMAT_BINARY_LE) {
                    header.encoding = PlyEncoding::BinaryLittleEndian;
                } else if (tokens[1] == ply_constants::FORMAT_BINARY_BE) {
                    header.encoding = PlyEncoding::BinaryBigEndian;
                } else {
                    return make_error(ErrorCode::INVALID_FORMAT,
                                      std::format("Unsupported PLY format '{}'", tokens[1]));
                }
                found_format = true;
            } else if (keyword == "element") {
                if (tokens.size() < 3) {
                    return make_error(ErrorCode::INVALID_FORMAT, std::format("Malformed PLY element line '{}'", *line));
                }
                PlyElement element;
                element.name = std::string(tokens[1]);
                auto [_, ec] = std::from_chars(tokens[2].data(), tokens[2].data() + tokens[2].size(), element.count);
                if (ec != std::errc{}) {
                    return make_error(ErrorCode::INVALID_FORMAT,
                                      std::format("Invalid element count '{}' for '{}'", tokens[2], tokens[1]));
                }
                header.elements.push_back(std::move(element));
            } else if (keyword == "property") {
                if (header.elements.empty()) {
                    return make_error(ErrorCode::INVALID_FORMAT, "PLY property declared before any element");
                }
                auto& element = header.elements.back();
                PlyProperty prop;

                if (tokens.size() >= 2 && tokens[1] == "list") {
                    if (tokens.size() < 5) {
                        return make_error(ErrorCode::INVALID_FORMAT, std::format("Malformed PLY list property '{}'", *line));
                    }
                    auto count_type = parse_scalar(tokens[2]);
                    auto item_type = parse_scalar(tokens[3]);
                    if (!count_type || !item_type) {
                        return make_error(ErrorCode::INVALID_FORMAT, std::format("Unknown PLY type in '{}'", *line));
                    }
                    prop.is_list = true;
                    prop.count_type = *count_type;
                    prop.type = *item_type;
                    prop.name = std::string(tokens[4]);
                } else {
                    if (tokens.size() < 3) {
                        return make_error(ErrorCode::INVALID_FORMAT, std::format("Malformed PLY property '{}'", *line));
                    }
                    auto type = parse_scalar(tokens[1]);
                    if (!type) {
                        return make_error(ErrorCode::INVALID_FORMAT, std::format("Unknown PLY type '{}'", tokens[1]));
                    }
                    prop.type = *type;
                    prop.name = std::string(tokens[2]);
                    prop.offset = element.stride;
                    element.stride += scalar_size(prop.type);
                }
                element.properties.push_back(std::move(prop));
            } else if (keyword == "end_header") {
                if (!found_format) {
                    return make_error(ErrorCode::INVALID_FORMAT, "PLY header has no format line");
                }
                header.body_offset = static_cast<size_t>(ptr - data.data());
                LOG_DEBUG("Header parsed - {} lines, {} elements, encoding: {}",
                          lines_parsed, header.elements.size(), encoding_name(header.encoding));
                return header;
            } else {
                return make_error(ErrorCode::INVALID_FORMAT,
                                  std::format("Unknown PLY header keyword '{}'", keyword));
            }
        }

        if (lines_parsed >= ply_constants::MAX_HEADER_LINES) {
            return make_error(ErrorCode::INVALID_FORMAT,
                              std::format("Header too large - exceeded {} lines", ply_constants::MAX_HEADER_LINES));
        }
        return make_error(ErrorCode::INVALID_FORMAT, "No end_header found in PLY file");
    }

    Result<PropertyTable> parse_ply(std::span<const char> data) {
        auto header = parse_ply_header(data);
        if (!header) {
            return std::unexpected(header.error());
        }

        const PlyElement* vertex = header->vertex_element();
        if (!vertex) {
            return make_error(ErrorCode::INVALID_FORMAT, "PLY file has no vertex element");
        }
        for (const auto& prop : vertex->properties) {
            if (prop.is_list) {
                return make_error(ErrorCode::INVALID_FORMAT,
                                  std::format("List property '{}' in vertex element is not supported", prop.name));
            }
        }

        const char* ptr = data.data() + header->body_offset;
        const char* end = data.data() + data.size();
        const bool ascii = header->encoding == PlyEncoding::Ascii;
        const bool swap = needs_swap(header->encoding);

        for (const auto& element : header->elements) {
            if (&element == vertex)
                break;
            LOG_TRACE("Skipping element '{}' ({} rows)", element.name, element.count);
            ptr = ascii ? skip_ascii_rows(ptr, end, element.count)
                        : skip_binary_element(ptr, end, element, swap);
            if (!ptr) {
                return make_error(ErrorCode::READ_FAILURE,
                                  std::format("PLY body truncated or malformed in element '{}'", element.name));
            }
        }

        LOG_DEBUG("Extracting {} vertices with {} properties ({})",
                  vertex->count, vertex->properties.size(), encoding_name(header->encoding));

        return ascii ? extract_ascii_columns(ptr, end, *vertex)
                     : extract_binary_columns(ptr, end, *vertex, swap);
    }

    Result<PlyHeader> read_ply_header(const std::filesystem::path& filepath) {
        if (!std::filesystem::exists(filepath)) {
            return make_error(ErrorCode::FILE_NOT_FOUND, "PLY file does not exist", filepath);
        }

        MMappedFile mapped_file;
        if (!mapped_file.map(filepath)) {
            return make_error(ErrorCode::READ_FAILURE, "Failed to memory map PLY file", filepath);
        }

        auto header = parse_ply_header(mapped_file.as_span());
        if (!header) {
            auto error = header.error();
            error.with_path(filepath);
            return std::unexpected(std::move(error));
        }
        return header;
    }

    Result<PropertyTable> read_ply_properties(const std::filesystem::path& filepath) {
        LOG_TIMER("PLY File Loading");

        if (!std::filesystem::exists(filepath)) {
            return make_error(ErrorCode::FILE_NOT_FOUND, "PLY file does not exist", filepath);
        }

        MMappedFile mapped_file;
        if (!mapped_file.map(filepath)) {
            return make_error(ErrorCode::READ_FAILURE, "Failed to memory map PLY file", filepath);
        }

        auto table = parse_ply(mapped_file.as_span());
        if (!table) {
            auto error = table.error();
            error.with_path(filepath);
            LOG_ERROR("Failed to read PLY: {}", error.format());
            return std::unexpected(std::move(error));
        }

        LOG_INFO("PLY read: {:.2f} MB, {} vertices, {} properties",
                 static_cast<double>(mapped_file.size) / (1024.0 * 1024.0),
                 table->rows(), table->column_count());
        return table;
    }

} // namespace sc::loader
