#include "core/gaussian_set.hpp"
#include "loader/loader.hpp"
#include "pickle_test_utils.hpp"
#include "ply_test_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <gtest/gtest.h>

using namespace sc;
using namespace sc::loader;

class LoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "splatcraft_loader_test";
        std::filesystem::create_directories(temp_dir_);
        loader_ = Loader::create();
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_dir_)) {
            std::filesystem::remove_all(temp_dir_);
        }
    }

    std::filesystem::path temp_dir_;
    std::unique_ptr<Loader> loader_;
};

TEST_F(LoaderTest, ReportsSupportedExtensions) {
    const auto extensions = loader_->getSupportedExtensions();
    EXPECT_NE(std::ranges::find(extensions, ".ply"), extensions.end());
    EXPECT_NE(std::ranges::find(extensions, ".pkl"), extensions.end());

    const auto formats = loader_->getSupportedFormats();
    ASSERT_EQ(formats.size(), 2u);
    EXPECT_EQ(formats.front(), "PLY"); // highest priority first
}

TEST_F(LoaderTest, LoadsAsciiFormatA) {
    const auto path = temp_dir_ / "format_a.ply";
    test::write_file(path, test::make_ascii_ply(test::FORMAT_A_FIELDS, test::format_a_rows()));

    ASSERT_TRUE(loader_->canLoad(path));
    auto result = loader_->load(path);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    ASSERT_NE(result->data, nullptr);
    EXPECT_EQ(result->data->size(), 2);
    EXPECT_EQ(result->loader_used, "PLY");
    EXPECT_NE(result->format_description.find("Format A"), std::string::npos);
    EXPECT_FLOAT_EQ(result->data->colors_dc()[0][0].item<float>(), 1.0f);
}

TEST_F(LoaderTest, LoadsBigEndianFormatB) {
    const auto path = temp_dir_ / "format_b.ply";
    test::write_file(path, test::make_binary_ply(test::FORMAT_B_FIELDS, test::format_b_rows(), true));

    auto result = loader_->load(path);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    EXPECT_NE(result->format_description.find("Format B"), std::string::npos);
    EXPECT_NEAR(result->data->rotations()[0][3].item<float>(), 1.0f, 1e-6);
}

TEST_F(LoaderTest, LittleAndBigEndianDecodeIdentically) {
    const auto le_path = temp_dir_ / "le.ply";
    const auto be_path = temp_dir_ / "be.ply";
    test::write_file(le_path, test::make_binary_ply(test::FORMAT_B_FIELDS, test::format_b_rows(), false));
    test::write_file(be_path, test::make_binary_ply(test::FORMAT_B_FIELDS, test::format_b_rows(), true));

    auto le = loader_->load(le_path);
    auto be = loader_->load(be_path);
    ASSERT_TRUE(le.has_value());
    ASSERT_TRUE(be.has_value());
    EXPECT_TRUE(torch::equal(le->data->positions(), be->data->positions()));
    EXPECT_TRUE(torch::equal(le->data->scales(), be->data->scales()));
    EXPECT_TRUE(torch::equal(le->data->rotations(), be->data->rotations()));
}

TEST_F(LoaderTest, MissingOpacityNamesTheField) {
    auto fields = test::FORMAT_B_FIELDS;
    auto rows = test::format_b_rows();
    const auto index = std::ranges::find(fields, "opacity") - fields.begin();
    fields.erase(fields.begin() + index);
    for (auto& row : rows) {
        row.erase(row.begin() + index);
    }

    const auto path = temp_dir_ / "no_opacity.ply";
    test::write_file(path, test::make_binary_ply(fields, rows));

    auto result = loader_->load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_FORMAT);
    EXPECT_EQ(result.error().path, path);
    const auto& missing = result.error().missing_fields;
    EXPECT_NE(std::ranges::find(missing, "opacity"), missing.end());
}

TEST_F(LoaderTest, ValidateOnlySkipsDecode) {
    const auto path = temp_dir_ / "validate.ply";
    test::write_file(path, test::make_binary_ply(test::FORMAT_A_FIELDS, test::format_a_rows()));

    auto result = loader_->load(path, {.validate_only = true});
    ASSERT_TRUE(result.has_value()) << result.error().format();
    EXPECT_EQ(result->data, nullptr);
    EXPECT_NE(result->format_description.find("Format A"), std::string::npos);
}

TEST_F(LoaderTest, ReportsProgress) {
    const auto path = temp_dir_ / "progress.ply";
    test::write_file(path, test::make_binary_ply(test::FORMAT_A_FIELDS, test::format_a_rows()));

    std::vector<float> reported;
    LoadOptions options;
    options.progress = [&reported](float percentage, const std::string&) {
        reported.push_back(percentage);
    };

    auto result = loader_->load(path, options);
    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(reported.empty());
    EXPECT_FLOAT_EQ(reported.front(), 0.0f);
    EXPECT_FLOAT_EQ(reported.back(), 100.0f);
}

TEST_F(LoaderTest, LoadsPickle) {
    const auto path = temp_dir_ / "gaussians.pkl";
    test::write_pickle(path, test::make_pickle_tensors(24));

    auto result = loader_->load(path);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    EXPECT_EQ(result->loader_used, "Pickle");
    EXPECT_EQ(result->data->size(), 24);
    EXPECT_EQ(result->data->sh_rest_count(), 45);
}

TEST_F(LoaderTest, PickleValidateOnlyReportsMissingKeys) {
    auto data = test::make_pickle_tensors(8);
    data.erase("f_dc");
    const auto path = temp_dir_ / "incomplete.pkl";
    test::write_pickle(path, data);

    auto result = loader_->load(path, {.validate_only = true});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_FORMAT);
    ASSERT_EQ(result.error().missing_fields.size(), 1u);
    EXPECT_EQ(result.error().missing_fields.front(), "f_dc");
}

TEST_F(LoaderTest, MissingFileIsFileNotFound) {
    const auto path = temp_dir_ / "nowhere.ply";
    EXPECT_FALSE(loader_->canLoad(path));

    auto result = loader_->load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::FILE_NOT_FOUND);
    EXPECT_TRUE(result.error().is_user_facing());
}

TEST_F(LoaderTest, UnknownExtensionIsInvalidFormat) {
    const auto path = temp_dir_ / "points.xyz";
    test::write_file(path, "1 2 3\n");

    auto result = loader_->load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::INVALID_FORMAT);
    EXPECT_NE(result.error().message.find(".ply"), std::string::npos);
}

TEST_F(LoaderTest, DirectoryIsReadFailure) {
    auto result = loader_->load(temp_dir_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::READ_FAILURE);
}

TEST_F(LoaderTest, ShRestOrderMatchesAcrossFormats) {
    constexpr int64_t n = 6;
    constexpr int64_t k = 15;
    const auto data = test::make_pickle_tensors(n);
    const auto pickle_path = temp_dir_ / "same.pkl";
    test::write_pickle(pickle_path, data);

    // Same Gaussians as a PLY file, f_rest_* stored channel-major
    auto fields = test::FORMAT_B_FIELDS;
    for (int64_t i = 0; i < 3 * k; ++i) {
        fields.push_back(std::format("f_rest_{}", i));
    }
    test::Rows rows;
    for (int64_t i = 0; i < n; ++i) {
        std::vector<float> row;
        for (int c = 0; c < 3; ++c)
            row.push_back(data.at("xyz")[i][c].item<float>());
        for (int c = 0; c < 3; ++c)
            row.push_back(data.at("f_dc")[i][0][c].item<float>());
        for (int c = 0; c < 3; ++c)
            row.push_back(data.at("scaling")[i][c].item<float>());
        row.push_back(data.at("opacity")[i][0].item<float>());
        for (int c = 0; c < 4; ++c)
            row.push_back(data.at("rotation")[i][c].item<float>());
        for (int c = 0; c < 3; ++c) {
            for (int64_t j = 0; j < k; ++j) {
                row.push_back(data.at("f_rest")[i][j][c].item<float>());
            }
        }
        rows.push_back(std::move(row));
    }
    const auto ply_path = temp_dir_ / "same.ply";
    test::write_file(ply_path, test::make_binary_ply(fields, rows));

    auto from_pickle = loader_->load(pickle_path);
    auto from_ply = loader_->load(ply_path);
    ASSERT_TRUE(from_pickle.has_value()) << from_pickle.error().format();
    ASSERT_TRUE(from_ply.has_value()) << from_ply.error().format();

    ASSERT_EQ(from_ply->data->sh_rest_count(), 3 * k);
    ASSERT_EQ(from_pickle->data->sh_rest_count(), 3 * k);
    EXPECT_TRUE(torch::equal(from_pickle->data->colors_sh(), from_ply->data->colors_sh()));
    // coefficient 0 of the green channel sits at column k
    EXPECT_FLOAT_EQ(from_pickle->data->colors_sh()[0][k].item<float>(),
                    data.at("f_rest")[0][0][1].item<float>());
}

TEST_F(LoaderTest, ExtensionsMatchCaseInsensitively) {
    const auto extensions = loader_->getSupportedExtensions();
    EXPECT_EQ(std::ranges::count(extensions, ".ply"), 1);
    EXPECT_EQ(std::ranges::find(extensions, ".PLY"), extensions.end());

    const auto path = temp_dir_ / "UPPER.PLY";
    test::write_file(path, test::make_binary_ply(test::FORMAT_A_FIELDS, test::format_a_rows()));
    ASSERT_TRUE(loader_->canLoad(path));

    auto result = loader_->load(path);
    ASSERT_TRUE(result.has_value()) << result.error().format();
    EXPECT_EQ(result->loader_used, "PLY");
}
