#include <iostream>
#include <cmath>
#include <cctype>
#include <algorithm>

#include "metadata.h"
#include "debug_utils.h"

Metadata::Metadata() = default;

Metadata::~Metadata() = default;

bool Metadata::extract(const std::string &image_path)
{
    this->image_path = image_path;

    try
    {
        // 读取图像元数据
        auto image = Exiv2::ImageFactory::open(image_path);

        image->readMetadata();
        Exiv2::ExifData &exifData = image->exifData();
        Exiv2::XmpData &xmpData = image->xmpData();

        parseExifData(exifData, xmpData);
        if (has_gps)
        {
            convertToUTM();
        }

        // 打印metadata信息
        printMetadata();

        return true;
    }
    catch (const Exiv2::Error &e)
    {
        LOG_ERROR("Exiv2 error: " + std::string(e.what()));
        return false;
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("Metadata error: " + std::string(e.what()));
        return false;
    }
}

// 解析函数
void Metadata::parseExifData(const Exiv2::ExifData &exifData, const Exiv2::XmpData &xmpData)
{
    auto getExifString = [&](const std::string &key) -> std::string
    {
        auto pos = exifData.findKey(Exiv2::ExifKey(key));
        if (pos == exifData.end())
            return "";
        std::string value = pos->toString();
        while (!value.empty() && (value.back() == '\0' || std::isspace(static_cast<unsigned char>(value.back()))))
            value.pop_back();
        return value;
    };

    // 辅助lambda：安全获取值
    auto getXmpValue = [&](const std::string &key, double default_val = 0.0) -> double
    {
        auto pos = xmpData.findKey(Exiv2::XmpKey(key));
        return (pos != xmpData.end()) ? parseRational(pos->toRational()) : default_val;
    };

    make = getExifString("Exif.Image.Make");
    model = getExifString("Exif.Image.Model");
    capture_time = getExifString("Exif.Photo.DateTimeOriginal");
    if (capture_time.empty())
        capture_time = getExifString("Exif.Image.DateTime");

    // 注册命名空间，避免 Exiv2 报错
    Exiv2::XmpProperties::registerNs("http://www.dji.com/drone-dji/1.0/", "drone-dji");

    // 解析GPS数据：优先EXIF，其次无人机XMP
    auto lat_pos = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLatitude"));
    auto lon_pos = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSLongitude"));
    if (lat_pos != exifData.end() && lon_pos != exifData.end() &&
        lat_pos->count() >= 3 && lon_pos->count() >= 3)
    {
        lat = convertGPSCoordinate(*lat_pos, getExifString("Exif.GPSInfo.GPSLatitudeRef"));
        lon = convertGPSCoordinate(*lon_pos, getExifString("Exif.GPSInfo.GPSLongitudeRef"));
        has_gps = true;

        auto alt_pos = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSAltitude"));
        if (alt_pos != exifData.end())
        {
            alt = parseRational(alt_pos->toRational());
            // GPSAltitudeRef = 1 表示海平面以下
            auto ref_pos = exifData.findKey(Exiv2::ExifKey("Exif.GPSInfo.GPSAltitudeRef"));
            if (ref_pos != exifData.end() && ref_pos->toLong() == 1)
                alt = -alt;
        }
    }
    else if (xmpData.findKey(Exiv2::XmpKey("Xmp.drone-dji.GpsLongitude")) != xmpData.end())
    {
        lon = getXmpValue("Xmp.drone-dji.GpsLongitude");
        lat = getXmpValue("Xmp.drone-dji.GpsLatitude");
        alt = getXmpValue("Xmp.drone-dji.AbsoluteAltitude");
        has_gps = true;
    }

    // 解析图像尺寸
    const std::vector<std::string> widthKeys = {
        "Exif.Photo.PixelXDimension",
        "Exif.Image.ImageWidth"};
    const std::vector<std::string> heightKeys = {
        "Exif.Photo.PixelYDimension",
        "Exif.Image.ImageLength"};

    for (const auto &key : widthKeys)
    {
        auto pos = exifData.findKey(Exiv2::ExifKey(key));
        if (pos != exifData.end())
        {
            image_width = static_cast<int>(pos->toLong());
            break;
        }
    }
    for (const auto &key : heightKeys)
    {
        auto pos = exifData.findKey(Exiv2::ExifKey(key));
        if (pos != exifData.end())
        {
            image_height = static_cast<int>(pos->toLong());
            break;
        }
    }
}

// 转换为UTM坐标系
void Metadata::convertToUTM()
{
    // 自动计算UTM带号
    int zone = static_cast<int>((lon + 180.0) / 6) + 1;
    if (zone > 60) zone = 60;
    bool is_north = lat >= 0;
    epsg = is_north ? 32600 + zone : 32700 + zone;

    PJ_CONTEXT *ctx = proj_context_create();
    const char* src_crs = "+proj=longlat +datum=WGS84 +no_defs +type=crs";
    PJ *utm_converter = proj_create_crs_to_crs(
        ctx,
        src_crs,
        ("EPSG:" + std::to_string(epsg)).c_str(),
        nullptr);

    if (!utm_converter)
    {
        proj_context_destroy(ctx);
        throw std::runtime_error("Failed to create UTM converter");
    }

    PJ_COORD coord = proj_coord(lon, lat, alt, 0);
    PJ_COORD result = proj_trans(utm_converter, PJ_FWD, coord);

    utm_x = result.xyz.x;
    utm_y = result.xyz.y;

    proj_destroy(utm_converter);
    proj_context_destroy(ctx);

    if (!std::isfinite(utm_x) || !std::isfinite(utm_y))
    {
        throw std::runtime_error("[PROJ] transform to EPSG:" + std::to_string(epsg) + " failed");
    }
}

// 辅助函数：解析有理数
double Metadata::parseRational(const Exiv2::Rational &rational) const
{
    if (rational.second == 0)
        return 0.0;
    return static_cast<double>(rational.first) / rational.second;
}

// 度/分/秒三个有理数 + 方向
double Metadata::convertGPSCoordinate(const Exiv2::Exifdatum &coordinate, const std::string &ref) const
{
    double degrees = parseRational(coordinate.toRational(0));
    double minutes = parseRational(coordinate.toRational(1));
    double seconds = parseRational(coordinate.toRational(2));

    double decimal = degrees + minutes / 60.0 + seconds / 3600.0;

    // 处理方向
    if (!ref.empty() && (ref[0] == 'S' || ref[0] == 'W'))
    {
        decimal = -decimal;
    }

    return decimal;
}

void Metadata::printMetadata() const
{
    LOG_INFO("Metadata: " + image_path);
    LOG_INFO("  Camera: " + make + " " + model);
    LOG_INFO("  Capture Time: " + capture_time);
    LOG_INFO("  Image Width: " + std::to_string(image_width));
    LOG_INFO("  Image Height: " + std::to_string(image_height));
    if (has_gps)
    {
        LOG_INFO("  Latitude: " + std::to_string(lat));
        LOG_INFO("  Longitude: " + std::to_string(lon));
        LOG_INFO("  Altitude: " + std::to_string(alt));
        LOG_INFO("  EPSG Code: " + std::to_string(epsg));
        LOG_INFO("  UTM X: " + std::to_string(utm_x));
        LOG_INFO("  UTM Y: " + std::to_string(utm_y));
    }
}

// ----------------------------------------------------------------
bool copyExifAndXmp(const std::string &src_path, const std::string &dst_path)
{
    try
    {
        auto src = Exiv2::ImageFactory::open(src_path);
        src->readMetadata();

        auto dst = Exiv2::ImageFactory::open(dst_path);
        dst->readMetadata();

        // 缩略图不属于输出栅格
        Exiv2::ExifData exifData = src->exifData();
        Exiv2::ExifThumb thumb(exifData);
        thumb.erase();

        dst->setExifData(exifData);
        dst->setXmpData(src->xmpData());
        dst->writeMetadata();
        return true;
    }
    catch (const Exiv2::Error &e)
    {
        LOG_ERROR("Failed to copy EXIF/XMP from " + src_path + " to " + dst_path + ": " + e.what());
        return false;
    }
}

json build_stats_json(const std::string &image_path,
                      int width,
                      int height,
                      const TemperatureStats &stats,
                      const std::map<std::string, std::string> &camera_info,
                      const Metadata *metadata)
{
    json j = statsToJson(stats);
    j["path"] = image_path;
    j["width"] = width;
    j["height"] = height;

    json camera = json::object();
    for (const auto &entry : camera_info)
    {
        camera[entry.first] = entry.second;
    }
    if (metadata != nullptr)
    {
        if (!metadata->make.empty())
            camera["make"] = metadata->make;
        if (!metadata->model.empty())
            camera["model"] = metadata->model;
        if (!metadata->capture_time.empty())
            camera["capture_time"] = metadata->capture_time;
    }
    j["camera"] = camera;

    if (metadata != nullptr && metadata->has_gps)
    {
        json location;
        location["lat"] = metadata->lat;
        location["lon"] = metadata->lon;
        location["alt"] = metadata->alt;
        location["epsg"] = metadata->epsg;
        location["utm_x"] = metadata->utm_x;
        location["utm_y"] = metadata->utm_y;
        j["location"] = location;
    }
    else
    {
        j["location"] = nullptr;
    }
    return j;
}
