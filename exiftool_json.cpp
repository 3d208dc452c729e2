#include "exiftool_json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cstring>

#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <opencv2/imgcodecs.hpp>

#include "radiometry.h"
#include "thermal_error.h"
#include "debug_utils.h"

namespace {

// 值的书写形式
enum class ValueKind {
    Number,        // 纯数字
    Temperature,   // 数字为 ℃，字符串带 C/K/F 后缀
    Distance,      // 数字为 m，或 "1.00 m"
    Humidity       // 数字为比例，或 "50.0 %"
};

struct KeySpec {
    const char *key;
    ParameterField field;
    ValueKind kind;
};

const KeySpec kKeySpecs[] = {
    {"Emissivity",                   ParameterField::Emissivity,             ValueKind::Number},
    {"ObjectDistance",               ParameterField::ObjectDistance,         ValueKind::Distance},
    {"ReflectedApparentTemperature", ParameterField::ReflectedTemperature,   ValueKind::Temperature},
    {"AtmosphericTemperature",       ParameterField::AtmosphericTemperature, ValueKind::Temperature},
    {"IRWindowTemperature",          ParameterField::IRWindowTemperature,    ValueKind::Temperature},
    {"IRWindowTransmission",         ParameterField::IRWindowTransmission,   ValueKind::Number},
    {"RelativeHumidity",             ParameterField::RelativeHumidity,       ValueKind::Humidity},
    {"PlanckR1",                     ParameterField::PlanckR1,               ValueKind::Number},
    {"PlanckR2",                     ParameterField::PlanckR2,               ValueKind::Number},
    {"PlanckB",                      ParameterField::PlanckB,                ValueKind::Number},
    {"PlanckF",                      ParameterField::PlanckF,                ValueKind::Number},
    {"PlanckO",                      ParameterField::PlanckO,                ValueKind::Number},
    {"AtmosphericTransAlpha1",       ParameterField::AtmosphericAlpha1,      ValueKind::Number},
    {"AtmosphericTransAlpha2",       ParameterField::AtmosphericAlpha2,      ValueKind::Number},
    {"AtmosphericTransBeta1",        ParameterField::AtmosphericBeta1,       ValueKind::Number},
    {"AtmosphericTransBeta2",        ParameterField::AtmosphericBeta2,       ValueKind::Number},
    {"AtmosphericTransX",            ParameterField::AtmosphericX,           ValueKind::Number},
};

const char *kRawImageKey = "RawThermalImage";
const char *kRawTypeKey = "RawThermalImageType";
const char *kBase64Prefix = "base64:";

[[noreturn]] void missing(const std::string &key, const std::string &reason)
{
    throw ThermalError(ErrorKind::MissingField, "key `" + key + "` " + reason, key);
}

std::string trim(const std::string &text)
{
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    return text.substr(begin, end - begin);
}

// "20.0 C" -> (20.0, "C")；数字部分不可解析时返回 false
bool splitNumberAndSuffix(const std::string &text, double &number, std::string &suffix)
{
    const std::string s = trim(text);
    if (s.empty())
        return false;

    char *end = nullptr;
    number = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || !std::isfinite(number))
        return false;
    suffix = trim(std::string(end));
    return true;
}

double readFieldValue(const json &value, const KeySpec &spec)
{
    const std::string key = spec.key;

    if (value.is_number())
    {
        const double number = value.get<double>();
        if (!std::isfinite(number))
            missing(key, "is not a finite number");
        switch (spec.kind)
        {
        case ValueKind::Temperature:
            return number + kCelsiusOffset;
        case ValueKind::Number:
        case ValueKind::Distance:
        case ValueKind::Humidity:
            return number;
        }
        return number;
    }

    if (!value.is_string() || spec.kind == ValueKind::Number)
    {
        missing(key, std::string("has unexpected type ") + value.type_name());
    }

    const std::string text = value.get<std::string>();
    double number = 0.0;
    std::string suffix;
    if (!splitNumberAndSuffix(text, number, suffix))
    {
        missing(key, "has unparsable value \"" + text + "\"");
    }

    switch (spec.kind)
    {
    case ValueKind::Temperature:
    {
        TemperatureUnit unit;
        if (!parseTemperatureUnit(suffix, unit))
            missing(key, "has unknown temperature unit \"" + suffix + "\"");
        return toKelvin(unit, number);
    }
    case ValueKind::Distance:
        if (!suffix.empty() && suffix != "m")
            missing(key, "has unknown distance unit \"" + suffix + "\"");
        return number;
    case ValueKind::Humidity:
        if (suffix == "%")
            return number / 100.0;
        if (suffix.empty())
            return number;
        missing(key, "has unknown humidity unit \"" + suffix + "\"");
    case ValueKind::Number:
        break;
    }
    missing(key, "has unexpected type string");
}

// FLIR 的 PNG 数据以交换后的字节序存储
void swapBytes(cv::Mat &grid)
{
    for (int row = 0; row < grid.rows; ++row)
    {
        uint16_t *p = grid.ptr<uint16_t>(row);
        for (int col = 0; col < grid.cols; ++col)
        {
            p[col] = static_cast<uint16_t>((p[col] >> 8) | (p[col] << 8));
        }
    }
}

cv::Mat decodeEmbeddedImage(const std::vector<uint8_t> &bytes, const std::string &type)
{
    if (type != "TIFF" && type != "PNG")
    {
        throw ThermalError(ErrorKind::MalformedBlock,
                           "unsupported raw thermal image type \"" + type + "\"", kRawTypeKey);
    }
    if (bytes.empty())
    {
        throw ThermalError(ErrorKind::MalformedBlock, "raw thermal image is empty", kRawImageKey);
    }

    cv::Mat decoded;
    try
    {
        decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception &e)
    {
        throw ThermalError(ErrorKind::MalformedBlock,
                           "raw thermal " + type + " could not be decoded: " + e.what(), kRawImageKey);
    }
    if (decoded.empty() || decoded.channels() != 1)
    {
        throw ThermalError(ErrorKind::MalformedBlock,
                           "raw thermal " + type + " is not a single-channel image", kRawImageKey);
    }

    if (decoded.depth() == CV_8U)
    {
        decoded.convertTo(decoded, CV_16U);
    }
    else if (decoded.depth() != CV_16U)
    {
        throw ThermalError(ErrorKind::MalformedBlock,
                           "raw thermal " + type + " has unsupported sample depth", kRawImageKey);
    }
    else if (type == "PNG")
    {
        swapBytes(decoded);
    }
    return decoded;
}

// [[r0c0, r0c1, ...], [r1c0, ...], ...]
cv::Mat decodeRowArrays(const json &rows)
{
    if (rows.empty() || !rows.front().is_array() || rows.front().empty())
    {
        throw ThermalError(ErrorKind::MalformedBlock,
                           "raw thermal array must be a non-empty array of rows", kRawImageKey);
    }

    const int height = static_cast<int>(rows.size());
    const int width = static_cast<int>(rows.front().size());
    cv::Mat grid(height, width, CV_16UC1);

    for (int row = 0; row < height; ++row)
    {
        const json &values = rows[row];
        if (!values.is_array() || static_cast<int>(values.size()) != width)
        {
            throw ThermalError(ErrorKind::MalformedBlock,
                               "raw thermal array row " + std::to_string(row) +
                                   " does not have " + std::to_string(width) + " samples",
                               kRawImageKey);
        }

        uint16_t *out = grid.ptr<uint16_t>(row);
        for (int col = 0; col < width; ++col)
        {
            const json &v = values[col];
            if (!v.is_number_integer() || v.get<int64_t>() < 0 || v.get<int64_t>() > 65535)
            {
                throw ThermalError(ErrorKind::MalformedBlock,
                                   "raw thermal sample at (" + std::to_string(row) + ", " +
                                       std::to_string(col) + ") is not an integer in [0, 65535]",
                                   kRawImageKey);
            }
            out[col] = static_cast<uint16_t>(v.get<int64_t>());
        }
    }
    return grid;
}

void checkDimension(const json &doc, const char *key, int actual)
{
    auto it = doc.find(key);
    if (it == doc.end())
        return;
    if (!it->is_number_integer())
        missing(key, std::string("has unexpected type ") + it->type_name());
    if (it->get<int64_t>() != actual)
    {
        throw ThermalError(ErrorKind::MalformedBlock,
                           std::string(key) + " = " + std::to_string(it->get<int64_t>()) +
                               " does not match decoded raw image (" + std::to_string(actual) + ")",
                           key);
    }
}

} // namespace

std::vector<uint8_t> decodeBase64(const std::string &text)
{
    using namespace boost::archive::iterators;
    using Base64Decoder = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

    std::string clean;
    clean.reserve(text.size());
    for (char c : text)
    {
        if (!std::isspace(static_cast<unsigned char>(c)))
            clean.push_back(c);
    }
    if (clean.size() % 4 != 0)
    {
        throw ThermalError(ErrorKind::MalformedBlock,
                           "base64 payload length " + std::to_string(clean.size()) +
                               " is not a multiple of 4");
    }

    std::size_t padding = 0;
    while (!clean.empty() && clean.back() == '=' && padding < 2)
    {
        clean.pop_back();
        ++padding;
    }
    // binary_from_base64 不识别 '='，以 'A'(0) 占位后再截掉
    clean.append(padding, 'A');

    std::vector<uint8_t> bytes;
    try
    {
        bytes.assign(Base64Decoder(clean.begin()), Base64Decoder(clean.end()));
    }
    catch (const dataflow_exception &e)
    {
        throw ThermalError(ErrorKind::MalformedBlock, std::string("invalid base64 payload: ") + e.what());
    }
    bytes.resize(bytes.size() - std::min(padding, bytes.size()));
    return bytes;
}

ExiftoolDocument parseExiftoolDocument(const json &doc)
{
    if (!doc.is_object())
    {
        throw ThermalError(ErrorKind::MalformedBlock,
                           std::string("exiftool document must be an object, got ") + doc.type_name());
    }

    ExiftoolDocument result;

    auto source = doc.find("SourceFile");
    if (source != doc.end())
    {
        if (!source->is_string())
            missing("SourceFile", std::string("has unexpected type ") + source->type_name());
        result.source_file = source->get<std::string>();
    }

    for (const auto &spec : kKeySpecs)
    {
        auto it = doc.find(spec.key);
        if (it == doc.end() || it->is_null())
        {
            if (isRequiredField(spec.field))
                missing(spec.key, "not found");
            continue;
        }
        result.fields[spec.field] = readFieldValue(*it, spec);
    }

    auto raw = doc.find(kRawImageKey);
    if (raw == doc.end() || raw->is_null())
    {
        missing(kRawImageKey, "not found");
    }

    if (raw->is_array())
    {
        result.raw_image_type = "array";
        result.raw = decodeRowArrays(*raw);
    }
    else if (raw->is_string())
    {
        auto type = doc.find(kRawTypeKey);
        if (type == doc.end())
            missing(kRawTypeKey, "not found");
        if (!type->is_string())
            missing(kRawTypeKey, std::string("has unexpected type ") + type->type_name());
        result.raw_image_type = type->get<std::string>();

        const std::string &payload = raw->get_ref<const std::string &>();
        if (payload.compare(0, std::strlen(kBase64Prefix), kBase64Prefix) != 0)
        {
            throw ThermalError(ErrorKind::MalformedBlock,
                               "raw thermal image must begin with `base64:`", kRawImageKey);
        }
        result.raw = decodeEmbeddedImage(decodeBase64(payload.substr(std::strlen(kBase64Prefix))),
                                         result.raw_image_type);
    }
    else
    {
        missing(kRawImageKey, std::string("has unexpected type ") + raw->type_name());
    }

    checkDimension(doc, "RawThermalImageWidth", result.raw.cols);
    checkDimension(doc, "RawThermalImageHeight", result.raw.rows);

    LOG_DEBUG("Exiftool document '" + result.source_file + "': " +
              std::to_string(result.fields.size()) + " fields, " + result.raw_image_type + " " +
              std::to_string(result.raw.cols) + "x" + std::to_string(result.raw.rows));
    return result;
}

std::vector<ExiftoolDocument> parseExiftoolJson(const std::string &text)
{
    json root;
    try
    {
        root = json::parse(text);
    }
    catch (const json::parse_error &e)
    {
        throw ThermalError(ErrorKind::MalformedBlock, std::string("invalid JSON: ") + e.what());
    }

    std::vector<ExiftoolDocument> documents;
    if (root.is_array())
    {
        if (root.empty())
            throw ThermalError(ErrorKind::MalformedBlock, "exiftool output holds no documents");
        for (const auto &doc : root)
        {
            documents.push_back(parseExiftoolDocument(doc));
        }
    }
    else
    {
        documents.push_back(parseExiftoolDocument(root));
    }
    return documents;
}
