#pragma once

#include "loader/property_table.hpp"
#include <bit>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <vector>

namespace sc::test {

    using Rows = std::vector<std::vector<float>>;

    // Format A: direct RGB + linear scales, quaternions stored x,y,z,w
    inline const std::vector<std::string> FORMAT_A_FIELDS = {
        "x", "y", "z", "red", "green", "blue", "scale_x", "scale_y", "scale_z",
        "opacity", "rot_0", "rot_1", "rot_2", "rot_3"};

    // Format B: SH DC + log scales
    inline const std::vector<std::string> FORMAT_B_FIELDS = {
        "x", "y", "z", "f_dc_0", "f_dc_1", "f_dc_2", "scale_0", "scale_1", "scale_2",
        "opacity", "rot_0", "rot_1", "rot_2", "rot_3"};

    inline std::string ply_header(const std::string& format,
                                  const std::vector<std::string>& names,
                                  size_t vertex_count,
                                  const std::string& extra_elements = "") {
        std::string header = std::format("ply\nformat {} 1.0\ncomment written by splatcraft tests\n", format);
        header += extra_elements;
        header += std::format("element vertex {}\n", vertex_count);
        for (const auto& name : names) {
            header += std::format("property float {}\n", name);
        }
        header += "end_header\n";
        return header;
    }

    inline std::string make_ascii_ply(const std::vector<std::string>& names, const Rows& rows) {
        std::string text = ply_header("ascii", names, rows.size());
        for (const auto& row : rows) {
            std::string line;
            for (const float value : row) {
                line += line.empty() ? std::format("{}", value) : std::format(" {}", value);
            }
            text += line + "\n";
        }
        return text;
    }

    inline std::string make_binary_ply(const std::vector<std::string>& names, const Rows& rows,
                                       bool big_endian = false,
                                       const std::string& extra_elements = "",
                                       const std::string& extra_body = "") {
        std::string bytes = ply_header(big_endian ? "binary_big_endian" : "binary_little_endian",
                                       names, rows.size(), extra_elements);
        bytes += extra_body;
        for (const auto& row : rows) {
            for (const float value : row) {
                auto bits = std::bit_cast<uint32_t>(value);
                if (big_endian != (std::endian::native == std::endian::big)) {
                    bits = std::byteswap(bits);
                }
                char raw[4];
                std::memcpy(raw, &bits, sizeof(raw));
                bytes.append(raw, sizeof(raw));
            }
        }
        return bytes;
    }

    inline void write_file(const std::filesystem::path& path, const std::string& contents) {
        std::ofstream file(path, std::ios::binary);
        file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }

    inline loader::PropertyTable make_table(const std::vector<std::string>& names, const Rows& rows) {
        loader::PropertyTable table(static_cast<int64_t>(rows.size()));
        for (size_t c = 0; c < names.size(); ++c) {
            std::vector<float> column;
            column.reserve(rows.size());
            for (const auto& row : rows) {
                column.push_back(row[c]);
            }
            table.add(names[c], torch::tensor(column, torch::kFloat32));
        }
        return table;
    }

    // Two Format A rows with xyzw quaternions
    inline Rows format_a_rows() {
        return {
            {0.0f, 1.0f, 2.0f, 255.0f, 0.0f, 51.0f, 0.5f, 1.0f, 2.0f, 0.0f, 0.0f, 0.0f, 0.0f, 1.0f},
            {3.0f, 4.0f, 5.0f, 128.0f, 64.0f, 32.0f, 0.1f, 0.2f, 0.3f, 2.0f, 0.0f, 0.0f, 0.6f, 0.8f}};
    }

    // Two Format B rows with wxyz quaternions
    inline Rows format_b_rows() {
        return {
            {1.0f, 0.0f, 0.0f, 0.0f, 1.0f, -1.0f, 0.0f, -1.0f, 1.0f, -2.0f, 1.0f, 0.0f, 0.0f, 0.0f},
            {0.0f, 1.0f, 0.0f, 3.0f, -3.0f, 0.5f, -2.0f, 0.0f, 0.5f, 0.0f, 0.9f, 0.1f, 0.0f, 0.0f}};
    }

} // namespace sc::test
