#include "gaussian_test_utils.hpp"
#include "transport/scene_serializer.hpp"
#include <filesystem>
#include <fstream>
#include <limits>
#include <gtest/gtest.h>

using namespace sc;
using namespace sc::transport;

class SceneSerializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "splatcraft_serializer_test";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        if (std::filesystem::exists(temp_dir_)) {
            std::filesystem::remove_all(temp_dir_);
        }
    }

    static void expect_array_matches(const nlohmann::json& array, const torch::Tensor& tensor) {
        const auto flat = tensor.contiguous().view({-1});
        ASSERT_EQ(array.size(), static_cast<size_t>(flat.numel()));
        for (int64_t i = 0; i < flat.numel(); ++i) {
            EXPECT_EQ(array[i].get<float>(), flat[i].item<float>()) << "index " << i;
        }
    }

    // Single point set at the given position
    static std::shared_ptr<const GaussianSet> point_at(float x, float y, float z) {
        auto set = GaussianSet::create(torch::tensor({x, y, z}).view({1, 3}),
                                       torch::full({1}, 0.5f),
                                       torch::full({1, 3}, 0.1f),
                                       torch::tensor({0.0f, 0.0f, 0.0f, 1.0f}).view({1, 4}),
                                       torch::full({1, 3}, 0.5f));
        return std::make_shared<const GaussianSet>(std::move(*set));
    }

    std::filesystem::path temp_dir_;
};

TEST_F(SceneSerializerTest, ObjectKeepsEveryGaussian) {
    const auto set = test::make_set(5);
    const auto json = serialize_object(set, {.clamp_scales = false});

    EXPECT_EQ(json["count"].get<int64_t>(), 5);
    expect_array_matches(json["positions"], set.positions());
    expect_array_matches(json["colors"], set.colors_dc());
    expect_array_matches(json["opacities"], set.opacities());
    expect_array_matches(json["scales"], set.scales());
    expect_array_matches(json["rotations"], set.rotations());
    EXPECT_EQ(json["rotations"].size(), 20u);
}

TEST_F(SceneSerializerTest, ClampsScalesWhenEnabled) {
    auto set = GaussianSet::create(torch::zeros({3, 3}),
                                   torch::ones({3}),
                                   torch::tensor({1e-6f, 1.0f, 5e4f,
                                                  0.5f, 0.5f, 0.5f,
                                                  2e3f, 1e-4f, 10.0f})
                                       .view({3, 3}),
                                   torch::tensor({0.0f, 0.0f, 0.0f, 1.0f}).repeat({3, 1}),
                                   torch::zeros({3, 3}));
    ASSERT_TRUE(set.has_value()) << set.error().format();

    const auto clamped = serialize_object(*set);
    EXPECT_FLOAT_EQ(clamped["scales"][0].get<float>(), 1e-3f);
    EXPECT_FLOAT_EQ(clamped["scales"][1].get<float>(), 1.0f);
    EXPECT_FLOAT_EQ(clamped["scales"][2].get<float>(), 1e3f);
    EXPECT_FLOAT_EQ(clamped["scales"][6].get<float>(), 1e3f);
    EXPECT_FLOAT_EQ(clamped["scales"][7].get<float>(), 1e-3f);

    const auto raw = serialize_object(*set, {.clamp_scales = false});
    EXPECT_FLOAT_EQ(raw["scales"][0].get<float>(), 1e-6f);
    EXPECT_FLOAT_EQ(raw["scales"][2].get<float>(), 5e4f);
}

TEST_F(SceneSerializerTest, ClampOptionsComeFromParameters) {
    param::TransportParameters params;
    params.clamp_scales = false;
    params.min_scale = 0.01f;
    params.max_scale = 100.0f;
    params.camera_distance_factor = 3.0f;

    const auto options = TransportOptions::from_parameters(params);
    EXPECT_FALSE(options.clamp_scales);
    EXPECT_FLOAT_EQ(options.min_scale, 0.01f);
    EXPECT_FLOAT_EQ(options.max_scale, 100.0f);
    EXPECT_FLOAT_EQ(options.camera_distance_factor, 3.0f);
}

TEST_F(SceneSerializerTest, BoundsAndCameraFollowPositions) {
    std::vector<TransportObject> objects = {
        {.name = "a", .set = point_at(0.0f, 0.0f, 0.0f)},
        {.name = "b", .set = point_at(2.0f, 0.0f, 0.0f)},
        {.name = "c", .set = point_at(4.0f, 3.0f, 0.0f)}};

    const auto payload = serialize_scene(objects);
    ASSERT_EQ(payload["objects"].size(), 3u);
    EXPECT_EQ(payload["objects"][1]["node_name"].get<std::string>(), "b");

    const auto& bounds = payload["bounds"];
    EXPECT_FLOAT_EQ(bounds["center"][0].get<float>(), 2.0f);
    EXPECT_FLOAT_EQ(bounds["center"][1].get<float>(), 1.0f);
    EXPECT_FLOAT_EQ(bounds["min"][0].get<float>(), 0.0f);
    EXPECT_FLOAT_EQ(bounds["max"][0].get<float>(), 4.0f);
    EXPECT_FLOAT_EQ(bounds["max"][1].get<float>(), 3.0f);
    EXPECT_FLOAT_EQ(bounds["size"].get<float>(), 5.0f);

    const auto& camera = payload["camera"];
    EXPECT_FLOAT_EQ(camera["distance"].get<float>(), 25.0f);
    EXPECT_FLOAT_EQ(camera["position"][2].get<float>(), 25.0f);
    EXPECT_FLOAT_EQ(camera["target"][0].get<float>(), 2.0f);
    EXPECT_FLOAT_EQ(camera["up"][1].get<float>(), 1.0f);
}

TEST_F(SceneSerializerTest, TransformsMoveObjectsInBounds) {
    TransportObject fixed{.name = "fixed", .set = point_at(1.0f, 1.0f, 1.0f)};
    TransportObject moved{.name = "moved", .set = point_at(1.0f, 1.0f, 1.0f)};
    moved.transform = geometry::ObjectTransform::fromTranslation({10.0, 0.0, 0.0}).rowMajor();

    const auto payload = serialize_scene({fixed, moved});
    EXPECT_FLOAT_EQ(payload["bounds"]["center"][0].get<float>(), 6.0f);
    EXPECT_FLOAT_EQ(payload["bounds"]["max"][0].get<float>(), 11.0f);

    // Data stays in object space, the matrix travels alongside
    const auto& entry = payload["objects"][1];
    EXPECT_FLOAT_EQ(entry["data"]["positions"][0].get<float>(), 1.0f);
    const auto transform = entry["transform"];
    ASSERT_EQ(transform.size(), 16u);
    EXPECT_DOUBLE_EQ(transform[12].get<double>(), 10.0);
    EXPECT_DOUBLE_EQ(transform[15].get<double>(), 1.0);
    EXPECT_DOUBLE_EQ(payload["objects"][0]["transform"][12].get<double>(), 0.0);
}

TEST_F(SceneSerializerTest, SingleObjectIsSentBare) {
    const auto set = test::make_shared_set(5);
    const auto payload = serialize_scene({{.name = "only", .set = set}});

    EXPECT_FALSE(payload.contains("objects"));
    EXPECT_FALSE(payload.contains("transform"));
    EXPECT_EQ(payload["count"].get<int64_t>(), 5);
    expect_array_matches(payload["positions"], set->positions());
    EXPECT_TRUE(payload.contains("bounds"));
    EXPECT_TRUE(payload.contains("camera"));
    EXPECT_EQ(payload, serialize_single(*set));
}

TEST_F(SceneSerializerTest, SingleObjectBoundsIgnoreTransform) {
    TransportObject moved{.name = "moved", .set = point_at(1.0f, 2.0f, 3.0f)};
    moved.transform = geometry::ObjectTransform::fromTranslation({10.0, 0.0, 0.0}).rowMajor();

    const auto payload = serialize_scene({moved});
    EXPECT_FLOAT_EQ(payload["bounds"]["center"][0].get<float>(), 1.0f);
    EXPECT_FLOAT_EQ(payload["camera"]["target"][2].get<float>(), 3.0f);
}

TEST_F(SceneSerializerTest, EmptySceneHasZeroBounds) {
    const auto payload = serialize_scene({});
    EXPECT_TRUE(payload["objects"].empty());
    EXPECT_FLOAT_EQ(payload["bounds"]["size"].get<float>(), 0.0f);
    EXPECT_FLOAT_EQ(payload["camera"]["distance"].get<float>(), 0.0f);
}

TEST_F(SceneSerializerTest, SkipsObjectsWithoutData) {
    std::vector<TransportObject> objects = {
        {.name = "ghost", .set = nullptr},
        {.name = "first", .set = test::make_shared_set(4)},
        {.name = "second", .set = test::make_shared_set(2)}};

    const auto payload = serialize_scene(objects);
    ASSERT_EQ(payload["objects"].size(), 2u);
    EXPECT_EQ(payload["objects"][0]["node_name"].get<std::string>(), "first");
    EXPECT_EQ(payload["objects"][0]["data"]["count"].get<int64_t>(), 4);

    // One object left after skipping: bare form
    const auto single = serialize_scene({objects[0], objects[1]});
    EXPECT_EQ(single["count"].get<int64_t>(), 4);
}

TEST_F(SceneSerializerTest, PreviewCarriesDisplayMetadata) {
    const auto set = test::make_set(10);
    const auto points = decimate(set, 0.5f, 100);

    const auto json = serialize_preview("splatCraftNode1", points, set.size(), 0.5f, 2.0f);
    EXPECT_EQ(json["node_name"].get<std::string>(), "splatCraftNode1");
    EXPECT_EQ(json["count"].get<int64_t>(), 10);
    EXPECT_EQ(json["displayed"].get<int64_t>(), 5);
    EXPECT_EQ(json["positions"].size(), 15u);
    EXPECT_EQ(json["colors"].size(), 15u);
    EXPECT_FLOAT_EQ(json["point_size"].get<float>(), 2.0f);
}

TEST_F(SceneSerializerTest, WritesPayloadToDisk) {
    const auto payload = serialize_scene({{.name = "only", .set = test::make_shared_set(3)}});
    const auto path = temp_dir_ / "nested" / "scene.json";

    auto written = write_payload(payload, path);
    ASSERT_TRUE(written.has_value()) << written.error();
    EXPECT_EQ(*written, std::filesystem::file_size(path));

    std::ifstream file(path);
    const auto reloaded = nlohmann::json::parse(file);
    EXPECT_EQ(reloaded, payload);
}

TEST_F(SceneSerializerTest, NonFiniteValuesStayNumeric) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    auto set = GaussianSet::create(torch::tensor({nan, 1.0f, 2.0f, 3.0f, 4.0f, 5.0f}).view({2, 3}),
                                   torch::tensor({0.5f, nan}),
                                   torch::tensor({inf, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f}).view({2, 3}),
                                   torch::tensor({0.0f, 0.0f, 0.0f, 1.0f}).repeat({2, 1}),
                                   torch::full({2, 3}, 0.5f));
    ASSERT_TRUE(set.has_value()) << set.error().format();

    const auto json = serialize_object(*set, {.clamp_scales = false});
    EXPECT_TRUE(json["positions"][0].is_number());
    EXPECT_FLOAT_EQ(json["positions"][0].get<float>(), 0.0f);
    EXPECT_FLOAT_EQ(json["positions"][1].get<float>(), 1.0f);
    EXPECT_FLOAT_EQ(json["opacities"][1].get<float>(), 0.0f);
    EXPECT_FLOAT_EQ(json["scales"][0].get<float>(), 0.0f);
    EXPECT_EQ(json.dump().find("null"), std::string::npos);

    // The non-finite point does not count toward the bounds
    const auto payload = serialize_single(*set);
    EXPECT_FLOAT_EQ(payload["bounds"]["center"][0].get<float>(), 3.0f);
    EXPECT_EQ(payload.dump().find("null"), std::string::npos);
}
