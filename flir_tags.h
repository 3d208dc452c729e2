#ifndef FLIR_TAGS_H
#define FLIR_TAGS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <exiv2/exiv2.hpp>

#include "parameter_record.h"

// FFF 记录内字段的存储类型
enum class TagType {
    U16,
    I16,
    U32,
    I32,
    F32,
    F64,
    Fixed16_16   // 有符号 Q16.16 定点数
};

std::size_t tagTypeSize(TagType type);

// 按给定字节序读取一个字段并转成 double；越界返回 false
bool readTagValue(const uint8_t *data, std::size_t size, std::size_t offset,
                  TagType type, Exiv2::ByteOrder order, double &value);

enum class TagConversion {
    None,
    PercentOrFraction   // 部分固件以百分比存储湿度：值 > 2 时除以 100
};

struct TagSpec {
    ParameterField field;
    uint32_t offset;
    TagType type;
    TagConversion conversion;
};

// 定长 ASCII 字段（相机型号、序列号等）
struct StringTagSpec {
    const char *name;
    uint32_t offset;
    uint32_t length;
};

// 一种固件布局；超出记录长度的字段视为该固件不提供
struct TagTable {
    const char *name;
    std::vector<TagSpec> tags;
    std::vector<StringTagSpec> strings;
};

// 按 CameraInfo 记录版本查表，未知版本返回 nullptr
const TagTable *findCameraInfoTable(uint32_t record_version);

std::vector<uint32_t> supportedCameraInfoVersions();

// 读取定长字符串，截断到第一个 '\0' 并去掉尾部空白
std::string readFixedString(const uint8_t *data, std::size_t size,
                            std::size_t offset, std::size_t length);

#endif // FLIR_TAGS_H
