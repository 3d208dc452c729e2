#include <cmath>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <gdal_priv.h>
#include <opencv2/imgcodecs.hpp>

#include "raster.h"
#include "thermal_error.h"

namespace fs = std::filesystem;

namespace {

cv::Mat celsiusRow(const std::vector<double> &celsius)
{
    cv::Mat grid(1, static_cast<int>(celsius.size()), CV_64FC1);
    for (std::size_t i = 0; i < celsius.size(); ++i)
    {
        grid.at<double>(0, static_cast<int>(i)) = celsius[i] + kCelsiusOffset;
    }
    return grid;
}

const double kNaN = std::numeric_limits<double>::quiet_NaN();

} // namespace

class RasterFileTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() /
               ("thermal_raster_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

TEST(NormalizationTest, Coefficients)
{
    NormalizationRange range;
    range.min = 10.0;
    range.max = 60.0;

    const auto eq16 = range.coefficients(16);
    EXPECT_DOUBLE_EQ(eq16.first.slope, 65535.0 / 50.0);
    EXPECT_DOUBLE_EQ(eq16.first.apply(10.0), 0.0);
    EXPECT_NEAR(eq16.first.apply(60.0), 65535.0, 1e-9);
    EXPECT_NEAR(eq16.second.apply(65535.0), 60.0, 1e-9);
    EXPECT_DOUBLE_EQ(eq16.second.intercept, 10.0);

    const auto eq8 = range.coefficients(8);
    EXPECT_DOUBLE_EQ(eq8.first.slope, 255.0 / 50.0);

    EXPECT_EQ(eq8.first.toString("V", "C"), "V = -51 + 5.1 * C");
}

TEST(NormalizationTest, InvalidRangeOrDepth)
{
    NormalizationRange range;
    range.min = 50.0;
    range.max = 50.0;
    EXPECT_THROW(range.validate(), ThermalError);

    range.max = 10.0;
    try
    {
        range.coefficients();
        FAIL() << "expected InvalidParameter";
    }
    catch (const ThermalError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidParameter);
        EXPECT_EQ(e.field(), "range");
    }

    range.max = kNaN;
    EXPECT_THROW(range.validate(), ThermalError);

    range.max = 100.0;
    try
    {
        range.coefficients(12);
        FAIL() << "expected InvalidParameter";
    }
    catch (const ThermalError &e)
    {
        EXPECT_EQ(e.field(), "depth");
    }
}

TEST(NormalizationTest, MapsRangeEndsAndClamps)
{
    NormalizationRange range;
    range.min = 0.0;
    range.max = 100.0;

    const cv::Mat raster = normalizeTemperatures(celsiusRow({0.0, 100.0, 25.0, -40.0, 250.0, kNaN}), range);
    ASSERT_EQ(raster.type(), CV_16UC1);
    EXPECT_EQ(raster.at<uint16_t>(0, 0), 0);
    EXPECT_EQ(raster.at<uint16_t>(0, 1), 65535);
    EXPECT_EQ(raster.at<uint16_t>(0, 2), 16384);
    EXPECT_EQ(raster.at<uint16_t>(0, 3), 0);
    EXPECT_EQ(raster.at<uint16_t>(0, 4), 65535);
    EXPECT_EQ(raster.at<uint16_t>(0, 5), 0);
}

TEST(NormalizationTest, EightBitAndOtherUnits)
{
    NormalizationRange range;
    range.min = 273.15;
    range.max = 373.15;
    range.unit = TemperatureUnit::Kelvin;

    const cv::Mat raster = normalizeTemperatures(celsiusRow({0.0, 20.0, 100.0}), range, 8);
    ASSERT_EQ(raster.type(), CV_8UC1);
    EXPECT_EQ(raster.at<uint8_t>(0, 0), 0);
    EXPECT_EQ(raster.at<uint8_t>(0, 1), 51);
    EXPECT_EQ(raster.at<uint8_t>(0, 2), 255);

    EXPECT_THROW(normalizeTemperatures(celsiusRow({0.0}), range, 10), ThermalError);
    EXPECT_THROW(normalizeTemperatures(cv::Mat(2, 2, CV_32FC1), range), ThermalError);
}

TEST_F(RasterFileTest, PngKeepsSixteenBits)
{
    NormalizationRange range;
    const cv::Mat raster = normalizeTemperatures(celsiusRow({0.0, 25.0, 100.0, kNaN}), range);
    const std::string path = (dir_ / "out.png").string();

    ASSERT_TRUE(saveRasterAsPNG(raster, path));
    const cv::Mat back = cv::imread(path, cv::IMREAD_UNCHANGED);
    ASSERT_EQ(back.type(), CV_16UC1);
    EXPECT_EQ(cv::countNonZero(back != raster), 0);
}

TEST_F(RasterFileTest, TiffWithEquationMetadata)
{
    NormalizationRange range;
    range.min = -10.0;
    range.max = 40.0;
    const cv::Mat raster = normalizeTemperatures(celsiusRow({-10.0, 0.0, 15.0, 40.0}), range);
    const std::string path = (dir_ / "out.tif").string();

    ASSERT_TRUE(saveRasterAsTIFF(raster, path, range));

    GDALAllRegister();
    GDALDataset *dataset = static_cast<GDALDataset *>(GDALOpen(path.c_str(), GA_ReadOnly));
    ASSERT_NE(dataset, nullptr);
    EXPECT_EQ(dataset->GetRasterXSize(), 4);
    EXPECT_EQ(dataset->GetRasterYSize(), 1);
    EXPECT_EQ(dataset->GetRasterCount(), 1);

    const char *unit = dataset->GetMetadataItem("TEMPERATURE_UNIT");
    ASSERT_NE(unit, nullptr);
    EXPECT_STREQ(unit, "C");
    const char *inverse = dataset->GetMetadataItem("INVERSE_EQUATION");
    ASSERT_NE(inverse, nullptr);
    EXPECT_EQ(std::string(inverse), range.coefficients().second.toString("C", "V"));

    GDALRasterBand *band = dataset->GetRasterBand(1);
    EXPECT_EQ(band->GetRasterDataType(), GDT_UInt16);
    std::vector<uint16_t> values(4, 0);
    ASSERT_EQ(band->RasterIO(GF_Read, 0, 0, 4, 1, values.data(), 4, 1, GDT_UInt16, 0, 0), CE_None);
    GDALClose(dataset);

    for (int col = 0; col < 4; ++col)
    {
        EXPECT_EQ(values[col], raster.at<uint16_t>(0, col)) << col;
    }
    EXPECT_EQ(values[3], 65535);
}

TEST_F(RasterFileTest, WriteFailuresReturnFalse)
{
    NormalizationRange range;
    const cv::Mat raster = normalizeTemperatures(celsiusRow({0.0, 50.0}), range);
    const std::string missing_dir = (dir_ / "no_such_dir" / "out.tif").string();

    EXPECT_FALSE(saveRasterAsTIFF(raster, missing_dir, range));
    EXPECT_FALSE(saveRasterAsTIFF(cv::Mat(2, 2, CV_32FC1), (dir_ / "f.tif").string(), range));
    EXPECT_FALSE(saveRasterAsPNG(cv::Mat(), (dir_ / "empty.png").string()));
}
