#ifndef IMAGE_H
#define IMAGE_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "exiftool_json.h"
#include "parameter_record.h"
#include "radiometry.h"
#include "thermal_error.h"

// 参数与原始数据的来源，仅用于日志
enum class SourceEncoding { BinaryBlock, JsonDocument };

const char *sourceEncodingName(SourceEncoding encoding);

/*
 * 一张热成像图像：原始计数 + 已校验的辐射参数。
 *
 * 所有 read/from 函数在失败时记录日志、把错误保存在 last_error 并返回 false，
 * 不会留下部分解析的结果。
 */
class ThermalImage
{
public:
    ThermalImage() = default;

    // FLIR R-JPEG 文件
    bool readRJpeg(const std::string &path);
    // R-JPEG 字节流或裸 FFF 数据块
    bool fromRJpegBytes(const std::vector<uint8_t> &bytes, const std::string &name = "");

    bool fromExiftoolDocument(const ExiftoolDocument &doc);

    // `exiftool -j -b` 的输出，每个文档对应一张图像；任一文档失败则整体失败
    static bool fromExiftoolJsonText(const std::string &text, std::vector<ThermalImage> &images,
                                     ThermalError &error);
    static bool readExiftoolJson(const std::string &path, std::vector<ThermalImage> &images,
                                 ThermalError &error);

    // 以新的目标距离重新校验参数
    bool setObjectDistance(double distance);

    // CV_64FC1 温度图(K)，非物理像素为 NaN
    bool temperatures(cv::Mat &grid, const AtmosphereConstants &atmosphere = AtmosphereConstants());

    bool empty() const
    {
        return raw.empty();
    }

    int width() const { return raw.cols; }
    int height() const { return raw.rows; }

public:
    std::string image_path;
    SourceEncoding encoding = SourceEncoding::BinaryBlock;
    cv::Mat raw;                                      // CV_16UC1
    ParameterRecord params;
    std::map<std::string, std::string> camera_info;   // 型号、序列号等
    ThermalError last_error;

private:
    bool fail(const ThermalError &error);
};

// 整个文件读入内存，失败时抛出 ThermalError(Io)
std::vector<uint8_t> readFileBytes(const std::string &path);

#endif // IMAGE_H
