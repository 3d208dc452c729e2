#ifndef EXIFTOOL_JSON_H
#define EXIFTOOL_JSON_H

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>

#include "parameter_record.h"

using json = nlohmann::json;

// `exiftool -j -b` 输出中的一张图像
struct ExiftoolDocument {
    std::string source_file;        // SourceFile，可能为空
    std::string raw_image_type;     // "TIFF" / "PNG" / "array"
    ParameterFields fields;         // 文档中出现的参数字段
    cv::Mat raw;                    // CV_16UC1
};

// 解析单个 JSON 对象；错误以 ThermalError 抛出
ExiftoolDocument parseExiftoolDocument(const json &doc);

// 文本可以是单个对象，也可以是 exiftool 默认输出的对象数组
std::vector<ExiftoolDocument> parseExiftoolJson(const std::string &text);

// 标准 base64（允许空白和 '=' 填充）
std::vector<uint8_t> decodeBase64(const std::string &text);

#endif // EXIFTOOL_JSON_H
