#include "flir_segment.h"

#include <cstring>
#include <sstream>

#include <opencv2/imgcodecs.hpp>

#include "flir_tags.h"
#include "thermal_error.h"
#include "debug_utils.h"

namespace {

const std::size_t kFlirHeaderSize = 0x40;
const std::size_t kFlirDirEntrySize = 0x20;
const std::size_t kRawDataHeaderSize = 0x20;
const std::size_t kApp1HeaderSize = 8;   // "FLIR\0" + 1 + 段号 + 末段号

std::string toHex(uint32_t value)
{
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

[[noreturn]] void malformed(const std::string &message, const std::string &field = "")
{
    throw ThermalError(ErrorKind::MalformedBlock, message, field);
}

bool matchBytes(const std::vector<uint8_t> &bytes, std::size_t offset, const char *magic, std::size_t n)
{
    return bytes.size() >= offset + n && std::memcmp(bytes.data() + offset, magic, n) == 0;
}

bool isFffSignature(const std::vector<uint8_t> &bytes)
{
    return matchBytes(bytes, 0, "FFF\0", 4) || matchBytes(bytes, 0, "AFF\0", 4);
}

uint16_t readU16(const std::vector<uint8_t> &bytes, std::size_t offset, Exiv2::ByteOrder order)
{
    if (offset + 2 > bytes.size())
        malformed("unexpected end of data at offset " + std::to_string(offset));
    return Exiv2::getUShort(bytes.data() + offset, order);
}

uint32_t readU32(const std::vector<uint8_t> &bytes, std::size_t offset, Exiv2::ByteOrder order)
{
    if (offset + 4 > bytes.size())
        malformed("unexpected end of data at offset " + std::to_string(offset));
    return Exiv2::getULong(bytes.data() + offset, order);
}

bool inVersionRange(uint32_t version)
{
    return version >= 100 && version < 200;
}

} // namespace

FlirSegment FlirSegment::fromBytes(const std::vector<uint8_t> &bytes)
{
    if (bytes.size() >= 2 && bytes[0] == 0xFF && bytes[1] == 0xD8)
    {
        return fromJpeg(bytes);
    }
    if (isFffSignature(bytes))
    {
        return fromBlock(bytes);
    }
    throw ThermalError(ErrorKind::UnsupportedVersion,
                       "input is neither a JPEG nor an FFF block");
}

FlirSegment FlirSegment::fromJpeg(const std::vector<uint8_t> &jpeg)
{
    return fromBlock(collectFromJpeg(jpeg));
}

FlirSegment FlirSegment::fromBlock(std::vector<uint8_t> block)
{
    FlirSegment segment;
    segment.data_ = std::move(block);
    segment.parseHeader();
    return segment;
}

std::vector<uint8_t> FlirSegment::collectFromJpeg(const std::vector<uint8_t> &jpeg)
{
    if (jpeg.size() < 4 || jpeg[0] != 0xFF || jpeg[1] != 0xD8)
    {
        throw ThermalError(ErrorKind::UnsupportedVersion, "missing JPEG SOI marker");
    }

    std::vector<std::vector<uint8_t>> pieces;
    std::size_t num_copied = 0;
    std::size_t total_len = 0;

    std::size_t pos = 2;
    while (pos + 1 < jpeg.size())
    {
        if (jpeg[pos] != 0xFF)
        {
            malformed("invalid JPEG marker at offset " + std::to_string(pos));
        }
        // 跳过填充字节 0xFF
        while (pos + 1 < jpeg.size() && jpeg[pos + 1] == 0xFF)
        {
            ++pos;
        }
        if (pos + 1 >= jpeg.size())
            break;

        const uint8_t marker = jpeg[pos + 1];
        pos += 2;

        // APP 段都在扫描数据之前
        if (marker == 0xD9 || marker == 0xDA)
            break;
        // 无长度字段的标记
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7))
            continue;

        const std::size_t length = readU16(jpeg, pos, Exiv2::bigEndian);
        if (length < 2 || pos + length > jpeg.size())
        {
            malformed("truncated JPEG segment at offset " + std::to_string(pos));
        }

        const uint8_t *contents = jpeg.data() + pos + 2;
        const std::size_t contents_len = length - 2;
        pos += length;

        if (marker != 0xE1 || contents_len < kApp1HeaderSize ||
            std::memcmp(contents, "FLIR\0", 5) != 0)
        {
            continue;
        }

        const std::size_t current = contents[6];
        const std::size_t total = static_cast<std::size_t>(contents[7]) + 1;

        if (pieces.empty())
        {
            pieces.resize(total);
        }
        else if (pieces.size() != total)
        {
            malformed("inconsistent count of total FLIR segments: " +
                      std::to_string(pieces.size()) + " != " + std::to_string(total));
        }
        if (current >= pieces.size())
        {
            malformed("FLIR segment index out of bounds: " + std::to_string(current) +
                      " >= " + std::to_string(pieces.size()));
        }
        if (!pieces[current].empty())
        {
            malformed("duplicate FLIR segment: index = " + std::to_string(current));
        }

        pieces[current].assign(contents + kApp1HeaderSize, contents + contents_len);
        ++num_copied;
        total_len += pieces[current].size();
    }

    if (pieces.empty())
    {
        throw ThermalError(ErrorKind::UnsupportedVersion, "no FLIR APP1 segment found");
    }
    if (num_copied != pieces.size())
    {
        malformed("expected " + std::to_string(pieces.size()) + " FLIR segments, found only " +
                  std::to_string(num_copied));
    }

    std::vector<uint8_t> block;
    block.reserve(total_len);
    for (const auto &piece : pieces)
    {
        block.insert(block.end(), piece.begin(), piece.end());
    }
    LOG_DEBUG("Collected " + std::to_string(pieces.size()) + " FLIR segments, " +
              std::to_string(block.size()) + " bytes");
    return block;
}

void FlirSegment::parseHeader()
{
    if (!isFffSignature(data_))
    {
        throw ThermalError(ErrorKind::UnsupportedVersion, "unexpected FFF signature");
    }
    if (data_.size() < kFlirHeaderSize)
    {
        malformed("FFF header truncated: " + std::to_string(data_.size()) + " bytes");
    }

    creator_ = readFixedString(data_.data(), data_.size(), 0x04, 16);

    // 版本号落在 [100, 200) 的字节序即整个数据块的字节序
    const uint32_t ver_be = readU32(data_, 0x14, Exiv2::bigEndian);
    const uint32_t ver_le = readU32(data_, 0x14, Exiv2::littleEndian);
    if (inVersionRange(ver_be))
    {
        order_ = Exiv2::bigEndian;
        version_ = ver_be;
    }
    else if (inVersionRange(ver_le))
    {
        order_ = Exiv2::littleEndian;
        version_ = ver_le;
    }
    else
    {
        throw ThermalError(ErrorKind::UnsupportedVersion,
                           "unsupported FFF format version " + toHex(ver_le));
    }

    const uint32_t dir_offset = readU32(data_, 0x18, order_);
    const uint32_t dir_count = readU32(data_, 0x1c, order_);

    if (dir_offset > data_.size() ||
        static_cast<uint64_t>(dir_count) * kFlirDirEntrySize > data_.size() - dir_offset)
    {
        malformed("FFF record directory (" + std::to_string(dir_count) + " entries at " +
                  toHex(dir_offset) + ") exceeds block size " + std::to_string(data_.size()));
    }

    dir_.clear();
    dir_.reserve(dir_count);
    for (uint32_t i = 0; i < dir_count; ++i)
    {
        const std::size_t base = dir_offset + static_cast<std::size_t>(i) * kFlirDirEntrySize;

        FlirRecordEntry entry;
        entry.type = readU16(data_, base + 0x00, order_);
        entry.sub_type = readU16(data_, base + 0x02, order_);
        entry.version = readU32(data_, base + 0x04, order_);
        entry.id = readU32(data_, base + 0x08, order_);
        entry.offset = readU32(data_, base + 0x0c, order_);
        entry.length = readU32(data_, base + 0x10, order_);
        entry.parent = readU32(data_, base + 0x14, order_);
        entry.object_number = readU32(data_, base + 0x18, order_);
        entry.checksum = readU32(data_, base + 0x1c, order_);

        // 空目录项
        if (entry.type == 0)
            continue;
        dir_.push_back(entry);
    }

    LOG_DEBUG("FFF block: creator '" + creator_ + "', version " + std::to_string(version_) +
              ", " + std::to_string(dir_.size()) + " records");
}

const FlirRecordEntry *FlirSegment::findRecord(uint16_t type) const
{
    for (const auto &entry : dir_)
    {
        if (entry.type != type)
            continue;
        if (entry.offset > data_.size() || entry.length > data_.size() - entry.offset)
        {
            malformed("record " + toHex(type) + " [" + toHex(entry.offset) + ", +" +
                      std::to_string(entry.length) + ") exceeds block size " +
                      std::to_string(data_.size()));
        }
        return &entry;
    }
    return nullptr;
}

Exiv2::ByteOrder FlirSegment::recordByteOrder(const FlirRecordEntry &entry) const
{
    if (entry.length < 2)
        return order_;

    const uint8_t *p = data_.data() + entry.offset;
    if (Exiv2::getUShort(p, Exiv2::littleEndian) == 2)
        return Exiv2::littleEndian;
    if (Exiv2::getUShort(p, Exiv2::bigEndian) == 2)
        return Exiv2::bigEndian;
    return order_;
}

cv::Mat FlirSegment::parseRawData() const
{
    const FlirRecordEntry *entry = findRecord(kFlirRecordRawData);
    if (entry == nullptr)
    {
        malformed("no raw data record found");
    }
    if (entry->length < kRawDataHeaderSize)
    {
        malformed("raw data record too short: " + std::to_string(entry->length) + " bytes");
    }

    const Exiv2::ByteOrder order = recordByteOrder(*entry);
    const uint8_t *record = data_.data() + entry->offset;
    const int width = Exiv2::getUShort(record + 0x02, order);
    const int height = Exiv2::getUShort(record + 0x04, order);
    if (width == 0 || height == 0)
    {
        malformed("raw data record declares an empty image");
    }

    const uint8_t *pixels = record + kRawDataHeaderSize;
    const std::size_t pixel_bytes = entry->length - kRawDataHeaderSize;

    if (entry->sub_type == 3)
    {
        // PNG 中的 16 位数据字节序是反的
        cv::Mat encoded(1, static_cast<int>(pixel_bytes), CV_8UC1, const_cast<uint8_t *>(pixels));
        cv::Mat decoded = cv::imdecode(encoded, cv::IMREAD_UNCHANGED);
        if (decoded.empty() || decoded.type() != CV_16UC1)
        {
            malformed("embedded PNG raw data could not be decoded as 16-bit grayscale");
        }
        if (decoded.cols != width || decoded.rows != height)
        {
            malformed("embedded PNG is " + std::to_string(decoded.cols) + "x" +
                      std::to_string(decoded.rows) + ", header declares " +
                      std::to_string(width) + "x" + std::to_string(height));
        }
        for (int row = 0; row < decoded.rows; ++row)
        {
            uint16_t *p = decoded.ptr<uint16_t>(row);
            for (int col = 0; col < decoded.cols; ++col)
            {
                p[col] = static_cast<uint16_t>((p[col] >> 8) | (p[col] << 8));
            }
        }
        return decoded;
    }

    if (entry->sub_type != 1 && entry->sub_type != 2)
    {
        throw ThermalError(ErrorKind::UnsupportedVersion,
                           "unsupported raw data sub-type " + std::to_string(entry->sub_type));
    }

    const std::size_t expected = static_cast<std::size_t>(width) * height * 2;
    if (pixel_bytes != expected)
    {
        malformed("raw data size mismatch: " + std::to_string(width) + "x" + std::to_string(height) +
                  " samples need " + std::to_string(expected) + " bytes, record holds " +
                  std::to_string(pixel_bytes));
    }

    cv::Mat raw(height, width, CV_16UC1);
    for (int row = 0; row < height; ++row)
    {
        uint16_t *out = raw.ptr<uint16_t>(row);
        const uint8_t *in = pixels + static_cast<std::size_t>(row) * width * 2;
        for (int col = 0; col < width; ++col)
        {
            out[col] = Exiv2::getUShort(in + col * 2, order);
        }
    }
    return raw;
}

ParameterFields FlirSegment::parseCameraParameters(std::map<std::string, std::string> *camera_info) const
{
    const FlirRecordEntry *entry = findRecord(kFlirRecordCameraInfo);
    if (entry == nullptr)
    {
        malformed("no camera info record found");
    }

    const TagTable *table = findCameraInfoTable(entry->version);
    if (table == nullptr)
    {
        throw ThermalError(ErrorKind::UnsupportedVersion,
                           "unsupported camera info record version " + toHex(entry->version));
    }

    const Exiv2::ByteOrder order = recordByteOrder(*entry);
    const uint8_t *record = data_.data() + entry->offset;

    ParameterFields fields;
    for (const auto &tag : table->tags)
    {
        double value = 0.0;
        if (!readTagValue(record, entry->length, tag.offset, tag.type, order, value))
        {
            // 该固件未提供此字段
            if (isRequiredField(tag.field))
            {
                malformed("camera info record (" + std::to_string(entry->length) +
                              " bytes) ends before required field `" +
                              parameterFieldName(tag.field) + "` at " + toHex(tag.offset),
                          parameterFieldName(tag.field));
            }
            LOG_DEBUG(std::string("Field absent in this firmware: ") + parameterFieldName(tag.field));
            continue;
        }

        if (tag.conversion == TagConversion::PercentOrFraction && value > 2.0)
        {
            value /= 100.0;
        }
        fields[tag.field] = value;
    }

    if (camera_info != nullptr)
    {
        for (const auto &str : table->strings)
        {
            const std::string text = readFixedString(record, entry->length, str.offset, str.length);
            if (!text.empty())
                (*camera_info)[str.name] = text;
        }
    }
    return fields;
}
