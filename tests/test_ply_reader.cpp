#include "loader/formats/ply.hpp"
#include "ply_test_utils.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <gtest/gtest.h>

using namespace sc;
using namespace sc::loader;

class PlyReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "splatcraft_ply_reader_test";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_dir_)) {
            std::filesystem::remove_all(temp_dir_);
        }
    }

    static Result<PropertyTable> parse(const std::string& bytes) {
        return parse_ply(std::span<const char>(bytes.data(), bytes.size()));
    }

    static void expect_matches_rows(const PropertyTable& table,
                                    const std::vector<std::string>& names,
                                    const test::Rows& rows) {
        ASSERT_EQ(table.rows(), static_cast<int64_t>(rows.size()));
        ASSERT_EQ(table.column_count(), names.size());
        for (size_t c = 0; c < names.size(); ++c) {
            const auto* column = table.column(names[c]);
            ASSERT_NE(column, nullptr) << names[c];
            for (size_t r = 0; r < rows.size(); ++r) {
                EXPECT_FLOAT_EQ((*column)[r].item<float>(), rows[r][c]) << names[c] << " row " << r;
            }
        }
    }

    template <typename T>
    static void append_le(std::string& out, T value) {
        char raw[sizeof(T)];
        std::memcpy(raw, &value, sizeof(T));
        if constexpr (std::endian::native == std::endian::big) {
            std::reverse(raw, raw + sizeof(T));
        }
        out.append(raw, sizeof(T));
    }

    std::filesystem::path temp_dir_;
};

TEST_F(PlyReaderTest, ParsesAsciiBody) {
    const auto rows = test::format_a_rows();
    auto table = parse(test::make_ascii_ply(test::FORMAT_A_FIELDS, rows));
    ASSERT_TRUE(table.has_value()) << table.error().format();
    expect_matches_rows(*table, test::FORMAT_A_FIELDS, rows);
    EXPECT_EQ(table->names(), test::FORMAT_A_FIELDS);
}

TEST_F(PlyReaderTest, ParsesBinaryLittleEndian) {
    const auto rows = test::format_b_rows();
    auto table = parse(test::make_binary_ply(test::FORMAT_B_FIELDS, rows));
    ASSERT_TRUE(table.has_value()) << table.error().format();
    expect_matches_rows(*table, test::FORMAT_B_FIELDS, rows);
}

TEST_F(PlyReaderTest, ParsesBinaryBigEndian) {
    const auto rows = test::format_b_rows();
    auto table = parse(test::make_binary_ply(test::FORMAT_B_FIELDS, rows, /*big_endian=*/true));
    ASSERT_TRUE(table.has_value()) << table.error().format();
    expect_matches_rows(*table, test::FORMAT_B_FIELDS, rows);
}

TEST_F(PlyReaderTest, ConvertsMixedScalarTypes) {
    std::string bytes =
        "ply\n"
        "format binary_little_endian 1.0\n"
        "element vertex 2\n"
        "property float x\n"
        "property uchar red\n"
        "property short s\n"
        "property double d\n"
        "end_header\n";
    append_le<float>(bytes, 1.5f);
    append_le<uint8_t>(bytes, 200);
    append_le<int16_t>(bytes, -7);
    append_le<double>(bytes, 0.25);
    append_le<float>(bytes, -2.0f);
    append_le<uint8_t>(bytes, 3);
    append_le<int16_t>(bytes, 300);
    append_le<double>(bytes, -8.0);

    auto table = parse(bytes);
    ASSERT_TRUE(table.has_value()) << table.error().format();
    EXPECT_FLOAT_EQ((*table->column("x"))[1].item<float>(), -2.0f);
    EXPECT_FLOAT_EQ((*table->column("red"))[0].item<float>(), 200.0f);
    EXPECT_FLOAT_EQ((*table->column("s"))[0].item<float>(), -7.0f);
    EXPECT_FLOAT_EQ((*table->column("s"))[1].item<float>(), 300.0f);
    EXPECT_FLOAT_EQ((*table->column("d"))[0].item<float>(), 0.25f);
}

TEST_F(PlyReaderTest, SkipsElementsBeforeVertex) {
    const auto rows = test::format_a_rows();
    const std::string extra =
        "element camera 2\n"
        "property list uchar float k\n";

    std::string body;
    append_le<uint8_t>(body, 2);
    append_le<float>(body, 1.0f);
    append_le<float>(body, 2.0f);
    append_le<uint8_t>(body, 0);

    auto table = parse(test::make_binary_ply(test::FORMAT_A_FIELDS, rows, false, extra, body));
    ASSERT_TRUE(table.has_value()) << table.error().format();
    expect_matches_rows(*table, test::FORMAT_A_FIELDS, rows);
}

TEST_F(PlyReaderTest, HandlesWindowsLineEndings) {
    std::string text = test::make_ascii_ply(test::FORMAT_A_FIELDS, test::format_a_rows());
    std::string crlf;
    for (const char c : text) {
        if (c == '\n')
            crlf += '\r';
        crlf += c;
    }

    auto table = parse(crlf);
    ASSERT_TRUE(table.has_value()) << table.error().format();
    EXPECT_EQ(table->rows(), 2);
}

TEST_F(PlyReaderTest, HeaderExposesVertexProperties) {
    const auto bytes = test::make_binary_ply(test::FORMAT_B_FIELDS, test::format_b_rows());
    auto header = parse_ply_header(std::span<const char>(bytes.data(), bytes.size()));
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->encoding, PlyEncoding::BinaryLittleEndian);
    ASSERT_NE(header->vertex_element(), nullptr);
    EXPECT_EQ(header->vertex_element()->count, 2u);
    EXPECT_EQ(header->vertex_element()->stride, test::FORMAT_B_FIELDS.size() * 4);
    EXPECT_EQ(header->vertex_property_names(), test::FORMAT_B_FIELDS);
}

TEST_F(PlyReaderTest, TruncatedBinaryBodyIsReadFailure) {
    auto bytes = test::make_binary_ply(test::FORMAT_B_FIELDS, test::format_b_rows());
    bytes.resize(bytes.size() - 5);
    auto table = parse(bytes);
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ErrorCode::READ_FAILURE);
}

TEST_F(PlyReaderTest, TruncatedAsciiBodyIsReadFailure) {
    auto text = test::ply_header("ascii", {"x", "y", "z"}, 3) + "1 2 3\n4 5 6\n";
    auto table = parse(text);
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ErrorCode::READ_FAILURE);
}

TEST_F(PlyReaderTest, MalformedAsciiRowIsInvalidFormat) {
    auto text = test::ply_header("ascii", {"x", "y", "z"}, 2) + "1 2 3\n4 five 6\n";
    auto table = parse(text);
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ErrorCode::INVALID_FORMAT);
}

TEST_F(PlyReaderTest, RejectsMissingMagic) {
    auto table = parse("not a ply file at all\n");
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ErrorCode::INVALID_FORMAT);
}

TEST_F(PlyReaderTest, RejectsUnknownFormat) {
    auto table = parse("ply\nformat binary_middle_endian 1.0\nelement vertex 0\nend_header\n");
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ErrorCode::INVALID_FORMAT);
}

TEST_F(PlyReaderTest, RejectsMissingEndHeader) {
    auto table = parse("ply\nformat ascii 1.0\nelement vertex 1\nproperty float x\n");
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ErrorCode::INVALID_FORMAT);
}

TEST_F(PlyReaderTest, RejectsListPropertyInVertex) {
    auto table = parse("ply\nformat ascii 1.0\nelement vertex 1\nproperty list uchar int idx\nend_header\n1 0\n");
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ErrorCode::INVALID_FORMAT);
}

TEST_F(PlyReaderTest, RejectsFileWithoutVertexElement) {
    auto table = parse("ply\nformat ascii 1.0\nelement face 0\nproperty list uchar int idx\nend_header\n");
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ErrorCode::INVALID_FORMAT);
}

TEST_F(PlyReaderTest, ReadsFromDisk) {
    const auto path = temp_dir_ / "scene.ply";
    const auto rows = test::format_a_rows();
    test::write_file(path, test::make_binary_ply(test::FORMAT_A_FIELDS, rows));

    auto table = read_ply_properties(path);
    ASSERT_TRUE(table.has_value()) << table.error().format();
    expect_matches_rows(*table, test::FORMAT_A_FIELDS, rows);

    auto header = read_ply_header(path);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->vertex_property_names().size(), test::FORMAT_A_FIELDS.size());
}

TEST_F(PlyReaderTest, MissingFileIsFileNotFound) {
    auto table = read_ply_properties(temp_dir_ / "missing.ply");
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(table.error().path, temp_dir_ / "missing.ply");
}

TEST_F(PlyReaderTest, EmptyFileIsInvalidFormat) {
    const auto path = temp_dir_ / "empty.ply";
    test::write_file(path, "");
    auto table = read_ply_properties(path);
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ErrorCode::INVALID_FORMAT);
}

TEST_F(PlyReaderTest, NegativeListLengthIsReadFailure) {
    const std::string extra =
        "element face 1\n"
        "property list char float k\n";

    std::string body;
    append_le<int8_t>(body, -1);
    append_le<float>(body, 1.0f);

    auto table = parse(test::make_binary_ply(test::FORMAT_A_FIELDS, test::format_a_rows(), false, extra, body));
    ASSERT_FALSE(table.has_value());
    EXPECT_EQ(table.error().code, ErrorCode::READ_FAILURE);
    EXPECT_NE(table.error().message.find("face"), std::string::npos);
}
