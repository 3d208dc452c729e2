#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "image.h"
#include "metadata.h"
#include "thermal_stats.h"
#include "thermal_fixtures.h"

using namespace thermal_test;
namespace fs = std::filesystem;

namespace {

void expectSameRecord(const ParameterRecord &a, const ParameterRecord &b)
{
    for (int i = 0; i <= static_cast<int>(ParameterField::AtmosphericX); ++i)
    {
        const ParameterField field = static_cast<ParameterField>(i);
        EXPECT_NEAR(a.get(field), b.get(field), 1e-9) << parameterFieldName(field);
    }
}

ThermalImage loadJson(const json &doc)
{
    std::vector<ThermalImage> images;
    ThermalError error;
    EXPECT_TRUE(ThermalImage::fromExiftoolJsonText(doc.dump(), images, error)) << error.describe();
    return images.empty() ? ThermalImage() : images.front();
}

} // namespace

TEST(PipelineTest, BinaryAndJsonSourcesAgree)
{
    CameraParams params;
    params.object_distance = 4.5f;
    params.relative_humidity = 0.62f;
    params.atmospheric_temperature = 288.15f;
    const cv::Mat raw = makeRawGrid(16, 12, 12000, 53);

    ThermalImage binary;
    ASSERT_TRUE(binary.fromRJpegBytes(wrapInJpeg(makeStandardBlock(raw, params, Exiv2::bigEndian), 500),
                                      "flir_0001.jpg"));
    ThermalImage fromJson = loadJson(makeExiftoolDocument(params, raw));

    EXPECT_EQ(binary.encoding, SourceEncoding::BinaryBlock);
    EXPECT_EQ(fromJson.encoding, SourceEncoding::JsonDocument);
    EXPECT_EQ(fromJson.image_path, "flir_0001.jpg");
    EXPECT_EQ(binary.camera_info.at("camera_model"), "FLIR T640");
    EXPECT_EQ(cv::countNonZero(binary.raw != fromJson.raw), 0);
    expectSameRecord(binary.params, fromJson.params);

    cv::Mat a, b;
    ASSERT_TRUE(binary.temperatures(a));
    ASSERT_TRUE(fromJson.temperatures(b));
    ASSERT_EQ(a.size(), b.size());
    for (int row = 0; row < a.rows; ++row)
    {
        for (int col = 0; col < a.cols; ++col)
        {
            EXPECT_NEAR(a.at<double>(row, col), b.at<double>(row, col), 1e-9);
        }
    }
}

TEST(PipelineTest, ReferenceTemperatureFromJson)
{
    json doc;
    doc["SourceFile"] = "reference.jpg";
    doc["Emissivity"] = 0.95;
    doc["ObjectDistance"] = "1.00 m";
    doc["ReflectedApparentTemperature"] = "20.0 C";
    doc["AtmosphericTemperature"] = "20.0 C";
    doc["RelativeHumidity"] = "50.0 %";
    doc["PlanckR1"] = 21106.77;
    doc["PlanckR2"] = 0.012545258;
    doc["PlanckB"] = 1501;
    doc["PlanckF"] = 1;
    doc["PlanckO"] = -7340;
    doc["RawThermalImage"] = json::array({json::array({18000, 16000}), json::array({13000, 20000})});

    ThermalImage image = loadJson(doc);
    cv::Mat grid;
    ASSERT_TRUE(image.temperatures(grid));
    EXPECT_NEAR(grid.at<double>(0, 0), 296.366261847373, 1e-6);
    EXPECT_NEAR(grid.at<double>(0, 1), 284.02353252221627, 1e-6);
    EXPECT_NEAR(grid.at<double>(1, 0), 261.15575733483263, 1e-6);
    EXPECT_NEAR(grid.at<double>(1, 1), 307.27916820126944, 1e-6);

    const TemperatureStats stats = computeStatistics(grid, TemperatureUnit::Kelvin, {50.0});
    EXPECT_EQ(stats.valid_count, 4u);
    EXPECT_NEAR(stats.max, 307.27916820126944, 1e-6);

    const json report = build_stats_json(image.image_path, image.width(), image.height(), stats,
                                         image.camera_info, nullptr);
    EXPECT_EQ(report.at("path"), "reference.jpg");
    EXPECT_EQ(report.at("width"), 2);
    EXPECT_TRUE(report.at("location").is_null());
}

TEST(PipelineTest, ObjectDistanceOverride)
{
    CameraParams params;
    const cv::Mat raw = makeRawGrid(4, 4, 20000, 400);

    ThermalImage image;
    ASSERT_TRUE(image.fromRJpegBytes(makeStandardBlock(raw, params, Exiv2::littleEndian)));
    cv::Mat near_grid;
    ASSERT_TRUE(image.temperatures(near_grid));

    ASSERT_TRUE(image.setObjectDistance(50.0));
    EXPECT_DOUBLE_EQ(image.params.object_distance, 50.0);
    cv::Mat far_grid;
    ASSERT_TRUE(image.temperatures(far_grid));
    // 更长的大气路径，更强的衰减补偿
    EXPECT_GT(far_grid.at<double>(3, 3), near_grid.at<double>(3, 3));

    EXPECT_FALSE(image.setObjectDistance(-1.0));
    EXPECT_EQ(image.last_error.kind(), ErrorKind::InvalidParameter);
    EXPECT_DOUBLE_EQ(image.params.object_distance, 50.0);
}

TEST(PipelineTest, OutOfDomainPixelsAreNaN)
{
    CameraParams params;
    cv::Mat raw = makeRawGrid(3, 1, 16000, 1000);
    raw.at<uint16_t>(0, 0) = 0;

    ThermalImage image;
    ASSERT_TRUE(image.fromRJpegBytes(makeStandardBlock(raw, params, Exiv2::littleEndian)));
    cv::Mat grid;
    ASSERT_TRUE(image.temperatures(grid));
    EXPECT_TRUE(std::isnan(grid.at<double>(0, 0)));
    EXPECT_FALSE(std::isnan(grid.at<double>(0, 1)));

    const TemperatureStats stats = computeStatistics(grid);
    EXPECT_EQ(stats.invalid_count, 1u);
    EXPECT_EQ(stats.valid_count, 2u);
}

TEST(PipelineTest, FailuresLeaveNoPartialState)
{
    CameraParams params;
    ThermalImage image;
    ASSERT_TRUE(image.fromRJpegBytes(makeStandardBlock(makeRawGrid(4, 3), params, Exiv2::littleEndian)));

    std::vector<uint8_t> jpeg = wrapInJpeg(makeStandardBlock(makeRawGrid(8, 8), params, Exiv2::littleEndian));
    jpeg.resize(jpeg.size() - 100);
    EXPECT_FALSE(image.fromRJpegBytes(jpeg, "truncated.jpg"));
    EXPECT_EQ(image.last_error.kind(), ErrorKind::MalformedBlock);
    EXPECT_EQ(image.width(), 4);

    json doc = makeExiftoolDocument(params, makeRawGrid(2, 2));
    doc.erase("PlanckB");
    std::vector<ThermalImage> images;
    ThermalError error;
    EXPECT_FALSE(ThermalImage::fromExiftoolJsonText(json::array({makeExiftoolDocument(params, makeRawGrid(2, 2)), doc}).dump(),
                                                    images, error));
    EXPECT_EQ(error.kind(), ErrorKind::MissingField);
    EXPECT_EQ(error.field(), "PlanckB");
    EXPECT_TRUE(images.empty());

    // 参数字段存在但取值非法
    doc = makeExiftoolDocument(params, makeRawGrid(2, 2));
    doc["Emissivity"] = 1.5;
    ThermalImage invalid;
    EXPECT_FALSE(invalid.fromExiftoolDocument(parseExiftoolDocument(doc)));
    EXPECT_EQ(invalid.last_error.kind(), ErrorKind::InvalidParameter);
    EXPECT_TRUE(invalid.empty());

    ThermalImage blank;
    cv::Mat grid;
    EXPECT_FALSE(blank.temperatures(grid));
}

TEST(PipelineTest, FilesOnDisk)
{
    const fs::path dir = fs::temp_directory_path() / "thermal_pipeline_files";
    fs::create_directories(dir);

    CameraParams params;
    const cv::Mat raw = makeRawGrid(8, 6);
    const std::vector<uint8_t> jpeg = wrapInJpeg(makeStandardBlock(raw, params, Exiv2::littleEndian));
    const std::string jpeg_path = (dir / "flir_0001.jpg").string();
    {
        std::ofstream out(jpeg_path, std::ios::binary);
        out.write(reinterpret_cast<const char *>(jpeg.data()), static_cast<std::streamsize>(jpeg.size()));
    }
    const std::string json_path = (dir / "flir.json").string();
    {
        std::ofstream out(json_path);
        out << json::array({makeExiftoolDocument(params, raw)}).dump(2);
    }

    ThermalImage image;
    EXPECT_TRUE(image.readRJpeg(jpeg_path));
    EXPECT_EQ(image.image_path, jpeg_path);
    EXPECT_EQ(image.height(), 6);

    std::vector<ThermalImage> images;
    ThermalError error;
    EXPECT_TRUE(ThermalImage::readExiftoolJson(json_path, images, error));
    ASSERT_EQ(images.size(), 1u);
    EXPECT_EQ(images[0].width(), 8);

    ThermalImage missing;
    EXPECT_FALSE(missing.readRJpeg((dir / "no_such.jpg").string()));
    EXPECT_EQ(missing.last_error.kind(), ErrorKind::Io);
    EXPECT_FALSE(ThermalImage::readExiftoolJson((dir / "no_such.json").string(), images, error));
    EXPECT_EQ(error.kind(), ErrorKind::Io);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
