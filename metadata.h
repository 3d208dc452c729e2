#ifndef METADATA_H
#define METADATA_H

#include <string>
#include <map>
#include <vector>
#include <exiv2/exiv2.hpp>
#include <proj.h>
#include <nlohmann/json.hpp>

#include "thermal_stats.h"

using json = nlohmann::json;

// 源图像的标准 EXIF/XMP 信息（与辐射参数无关）
class Metadata {
public:
    Metadata();
    ~Metadata();

    Metadata(const Metadata&) = default;
    Metadata& operator=(const Metadata&) = default;

    // 主提取函数
    bool extract(const std::string& image_path);

    // 调试输出
    void printMetadata() const;

    // 元数据存储
    std::string image_path;
    std::string make;
    std::string model;
    std::string capture_time;   // "YYYY:MM:DD HH:MM:SS"
    bool has_gps = false;
    double lon = 0.0;
    double lat = 0.0;
    double alt = 0.0;
    int epsg = 0;
    double utm_x = 0.0;
    double utm_y = 0.0;
    int image_width = 0;
    int image_height = 0;

    void parseExifData(const Exiv2::ExifData& exifData, const Exiv2::XmpData& xmpData);
    void convertToUTM();

    // 辅助函数
    double parseRational(const Exiv2::Rational& rational) const;
    double convertGPSCoordinate(const Exiv2::Exifdatum& coordinate, const std::string& ref) const;
};

// 把源图像的 EXIF 与 XMP 写入输出栅格
bool copyExifAndXmp(const std::string& src_path, const std::string& dst_path);

// 每张图像输出的统计 json；metadata 可为空
json build_stats_json(const std::string& image_path,
                      int width,
                      int height,
                      const TemperatureStats& stats,
                      const std::map<std::string, std::string>& camera_info,
                      const Metadata* metadata);

#endif // METADATA_H
