#include "flir_tags.h"

#include <algorithm>
#include <map>

namespace {

// FLIR CameraInfo 记录布局（偏移相对记录起点）
// 0x20 起为温度参数，0x58 起为 Planck 常数，0x70 起为大气衰减系数，
// 0xd4 起为相机/镜头信息，0x308 起为 PlanckO / PlanckR2
const TagTable kCameraInfoTable = {
    "camera-info",
    {
        {ParameterField::Emissivity,             0x20,  TagType::F32, TagConversion::None},
        {ParameterField::ObjectDistance,         0x24,  TagType::F32, TagConversion::None},
        {ParameterField::ReflectedTemperature,   0x28,  TagType::F32, TagConversion::None},
        {ParameterField::AtmosphericTemperature, 0x2c,  TagType::F32, TagConversion::None},
        {ParameterField::IRWindowTemperature,    0x30,  TagType::F32, TagConversion::None},
        {ParameterField::IRWindowTransmission,   0x34,  TagType::F32, TagConversion::None},
        {ParameterField::RelativeHumidity,       0x3c,  TagType::F32, TagConversion::PercentOrFraction},
        {ParameterField::PlanckR1,               0x58,  TagType::F32, TagConversion::None},
        {ParameterField::PlanckB,                0x5c,  TagType::F32, TagConversion::None},
        {ParameterField::PlanckF,                0x60,  TagType::F32, TagConversion::None},
        {ParameterField::AtmosphericAlpha1,      0x70,  TagType::F32, TagConversion::None},
        {ParameterField::AtmosphericAlpha2,      0x74,  TagType::F32, TagConversion::None},
        {ParameterField::AtmosphericBeta1,       0x78,  TagType::F32, TagConversion::None},
        {ParameterField::AtmosphericBeta2,       0x7c,  TagType::F32, TagConversion::None},
        {ParameterField::AtmosphericX,           0x80,  TagType::F32, TagConversion::None},
        {ParameterField::PlanckO,                0x308, TagType::I32, TagConversion::None},
        {ParameterField::PlanckR2,               0x30c, TagType::F32, TagConversion::None},
    },
    {
        {"camera_model",         0xd4,  32},
        {"camera_part_number",   0xf4,  16},
        {"camera_serial_number", 0x104, 16},
        {"camera_software",      0x114, 16},
        {"lens_model",           0x170, 32},
        {"lens_part_number",     0x190, 16},
        {"lens_serial_number",   0x1a0, 16},
    },
};

// 记录版本 -> 布局；新增机型只需在此登记
const std::map<uint32_t, const TagTable *> &cameraInfoTables()
{
    static const std::map<uint32_t, const TagTable *> tables = {
        {0x64,  &kCameraInfoTable},
        {0x66,  &kCameraInfoTable},
        {0x67,  &kCameraInfoTable},
        {0x68,  &kCameraInfoTable},
        {0x6f,  &kCameraInfoTable},
        {0x104, &kCameraInfoTable},
    };
    return tables;
}

} // namespace

std::size_t tagTypeSize(TagType type)
{
    switch (type)
    {
    case TagType::U16:
    case TagType::I16:
        return 2;
    case TagType::U32:
    case TagType::I32:
    case TagType::F32:
    case TagType::Fixed16_16:
        return 4;
    case TagType::F64:
        return 8;
    }
    return 0;
}

bool readTagValue(const uint8_t *data, std::size_t size, std::size_t offset,
                  TagType type, Exiv2::ByteOrder order, double &value)
{
    const std::size_t width = tagTypeSize(type);
    if (data == nullptr || width == 0 || offset > size || width > size - offset)
    {
        return false;
    }

    const Exiv2::byte *p = data + offset;
    switch (type)
    {
    case TagType::U16:
        value = Exiv2::getUShort(p, order);
        break;
    case TagType::I16:
        value = Exiv2::getShort(p, order);
        break;
    case TagType::U32:
        value = Exiv2::getULong(p, order);
        break;
    case TagType::I32:
        value = Exiv2::getLong(p, order);
        break;
    case TagType::F32:
        value = Exiv2::getFloat(p, order);
        break;
    case TagType::F64:
        value = Exiv2::getDouble(p, order);
        break;
    case TagType::Fixed16_16:
        value = static_cast<double>(static_cast<int32_t>(Exiv2::getLong(p, order))) / 65536.0;
        break;
    }
    return true;
}

const TagTable *findCameraInfoTable(uint32_t record_version)
{
    const auto &tables = cameraInfoTables();
    auto it = tables.find(record_version);
    return it == tables.end() ? nullptr : it->second;
}

std::vector<uint32_t> supportedCameraInfoVersions()
{
    std::vector<uint32_t> versions;
    for (const auto &entry : cameraInfoTables())
    {
        versions.push_back(entry.first);
    }
    return versions;
}

std::string readFixedString(const uint8_t *data, std::size_t size,
                            std::size_t offset, std::size_t length)
{
    if (data == nullptr || offset >= size)
    {
        return "";
    }
    const std::size_t available = std::min(length, size - offset);

    std::string text;
    for (std::size_t i = 0; i < available; ++i)
    {
        const char c = static_cast<char>(data[offset + i]);
        if (c == '\0')
            break;
        text.push_back(c);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
    {
        text.pop_back();
    }
    return text;
}
