#include <filesystem>
#include <string>

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include "metadata.h"
#include "raster.h"
#include "thermal_stats.h"

namespace fs = std::filesystem;

class MetadataTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path() /
               ("thermal_metadata_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    // 带 EXIF 的小 JPEG，模拟 R-JPEG 的可见光部分
    std::string writeJpeg(const std::string &name, const Exiv2::ExifData &exif,
                          const Exiv2::XmpData &xmp = Exiv2::XmpData())
    {
        const std::string path = (dir_ / name).string();
        cv::Mat image(48, 64, CV_8UC3, cv::Scalar(40, 80, 120));
        EXPECT_TRUE(cv::imwrite(path, image));

        auto file = Exiv2::ImageFactory::open(path);
        file->readMetadata();
        file->setExifData(exif);
        file->setXmpData(xmp);
        file->writeMetadata();
        return path;
    }

    static Exiv2::ExifData cameraExif()
    {
        Exiv2::ExifData exif;
        exif["Exif.Image.Make"] = "FLIR Systems AB";
        exif["Exif.Image.Model"] = "FLIR T640";
        exif["Exif.Photo.DateTimeOriginal"] = "2023:06:14 10:21:33";
        exif["Exif.Photo.PixelXDimension"] = uint32_t(640);
        exif["Exif.Photo.PixelYDimension"] = uint32_t(480);
        return exif;
    }

    fs::path dir_;
};

TEST_F(MetadataTest, CameraAndGpsFromExif)
{
    Exiv2::ExifData exif = cameraExif();
    exif["Exif.GPSInfo.GPSLatitudeRef"] = "N";
    exif["Exif.GPSInfo.GPSLatitude"] = "39/1 54/1 3600/100";
    exif["Exif.GPSInfo.GPSLongitudeRef"] = "E";
    exif["Exif.GPSInfo.GPSLongitude"] = "116/1 23/1 2400/100";
    exif["Exif.GPSInfo.GPSAltitude"] = "5050/100";
    const std::string path = writeJpeg("gps.jpg", exif);

    Metadata meta;
    ASSERT_TRUE(meta.extract(path));
    EXPECT_EQ(meta.make, "FLIR Systems AB");
    EXPECT_EQ(meta.model, "FLIR T640");
    EXPECT_EQ(meta.capture_time, "2023:06:14 10:21:33");
    EXPECT_EQ(meta.image_width, 640);
    EXPECT_EQ(meta.image_height, 480);

    ASSERT_TRUE(meta.has_gps);
    EXPECT_NEAR(meta.lat, 39.91, 1e-9);
    EXPECT_NEAR(meta.lon, 116.39, 1e-9);
    EXPECT_NEAR(meta.alt, 50.5, 1e-9);

    // 116.39E -> UTM 50N
    EXPECT_EQ(meta.epsg, 32650);
    EXPECT_GT(meta.utm_x, 400000.0);
    EXPECT_LT(meta.utm_x, 500000.0);
    EXPECT_GT(meta.utm_y, 4400000.0);
    EXPECT_LT(meta.utm_y, 4430000.0);
}

TEST_F(MetadataTest, SouthernWesternHemisphere)
{
    Exiv2::ExifData exif = cameraExif();
    exif["Exif.GPSInfo.GPSLatitudeRef"] = "S";
    exif["Exif.GPSInfo.GPSLatitude"] = "33/1 52/1 0/1";
    exif["Exif.GPSInfo.GPSLongitudeRef"] = "W";
    exif["Exif.GPSInfo.GPSLongitude"] = "70/1 30/1 0/1";
    const std::string path = writeJpeg("south.jpg", exif);

    Metadata meta;
    ASSERT_TRUE(meta.extract(path));
    EXPECT_NEAR(meta.lat, -33.0 - 52.0 / 60.0, 1e-9);
    EXPECT_NEAR(meta.lon, -70.5, 1e-9);
    EXPECT_EQ(meta.epsg, 32719);
}

TEST_F(MetadataTest, GpsFromDroneXmp)
{
    Exiv2::XmpProperties::registerNs("http://www.dji.com/drone-dji/1.0/", "drone-dji");
    Exiv2::XmpData xmp;
    xmp["Xmp.drone-dji.GpsLatitude"] = "22.5";
    xmp["Xmp.drone-dji.GpsLongitude"] = "114.0";
    xmp["Xmp.drone-dji.AbsoluteAltitude"] = "120.0";
    const std::string path = writeJpeg("xmp.jpg", cameraExif(), xmp);

    Metadata meta;
    ASSERT_TRUE(meta.extract(path));
    ASSERT_TRUE(meta.has_gps);
    EXPECT_NEAR(meta.lat, 22.5, 1e-5);
    EXPECT_NEAR(meta.lon, 114.0, 1e-5);
    EXPECT_NEAR(meta.alt, 120.0, 1e-5);
    EXPECT_EQ(meta.epsg, 32650);
}

TEST_F(MetadataTest, NoGps)
{
    const std::string path = writeJpeg("plain.jpg", cameraExif());

    Metadata meta;
    ASSERT_TRUE(meta.extract(path));
    EXPECT_FALSE(meta.has_gps);

    TemperatureStats stats;
    const json report = build_stats_json(path, 64, 48, stats, {{"camera_serial_number", "62101234"}}, &meta);
    EXPECT_TRUE(report.at("location").is_null());
    EXPECT_EQ(report.at("camera").at("model"), "FLIR T640");
    EXPECT_EQ(report.at("camera").at("camera_serial_number"), "62101234");
}

TEST_F(MetadataTest, MissingFile)
{
    Metadata meta;
    EXPECT_FALSE(meta.extract((dir_ / "no_such.jpg").string()));
}

TEST_F(MetadataTest, CopyExifToRaster)
{
    Exiv2::ExifData exif = cameraExif();
    exif["Exif.GPSInfo.GPSLatitudeRef"] = "N";
    exif["Exif.GPSInfo.GPSLatitude"] = "39/1 54/1 3600/100";
    exif["Exif.GPSInfo.GPSLongitudeRef"] = "E";
    exif["Exif.GPSInfo.GPSLongitude"] = "116/1 23/1 2400/100";
    const std::string src = writeJpeg("src.jpg", exif);

    const std::string dst = (dir_ / "raster.png").string();
    ASSERT_TRUE(saveRasterAsPNG(cv::Mat(48, 64, CV_16UC1, cv::Scalar(1000)), dst));
    ASSERT_TRUE(copyExifAndXmp(src, dst));

    Metadata meta;
    ASSERT_TRUE(meta.extract(dst));
    EXPECT_EQ(meta.model, "FLIR T640");
    ASSERT_TRUE(meta.has_gps);
    EXPECT_NEAR(meta.lat, 39.91, 1e-9);

    EXPECT_FALSE(copyExifAndXmp((dir_ / "missing.jpg").string(), dst));
}
