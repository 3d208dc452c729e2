#ifndef FLIR_SEGMENT_H
#define FLIR_SEGMENT_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <exiv2/exiv2.hpp>
#include <opencv2/core.hpp>

#include "parameter_record.h"

// FFF 记录目录项，每项 0x20 字节
struct FlirRecordEntry {
    uint16_t type = 0;        // 0x01 原始数据, 0x20 相机参数
    uint16_t sub_type = 0;    // 原始数据：1=BE, 2=LE, 3=PNG
    uint32_t version = 0;
    uint32_t id = 0;
    uint32_t offset = 0;      // 相对 FFF 数据起点
    uint32_t length = 0;
    uint32_t parent = 0;
    uint32_t object_number = 0;
    uint32_t checksum = 0;
};

const uint16_t kFlirRecordRawData = 0x01;
const uint16_t kFlirRecordCameraInfo = 0x20;

/*
 * FLIR R-JPEG 中的 FFF 数据块。
 *
 * 头部格式（字节序由版本号推断）：
 *   0x00 string[4]  "FFF\0"
 *   0x04 string[16] 生成者
 *   0x14 int32u     格式版本，[100, 200)
 *   0x18 int32u     记录目录偏移
 *   0x1c int32u     记录数
 *
 * 所有解析错误以 ThermalError 抛出。
 */
class FlirSegment {
public:
    // R-JPEG 字节流或裸 FFF 数据
    static FlirSegment fromBytes(const std::vector<uint8_t> &bytes);
    static FlirSegment fromJpeg(const std::vector<uint8_t> &jpeg);
    static FlirSegment fromBlock(std::vector<uint8_t> block);

    // 拼接 JPEG 中所有 "FLIR\0" APP1 段的数据
    static std::vector<uint8_t> collectFromJpeg(const std::vector<uint8_t> &jpeg);

    // 原始传感器值，CV_16UC1
    cv::Mat parseRawData() const;

    // 相机参数记录中出现的字段；camera_info 可选，接收型号、序列号等字符串
    ParameterFields parseCameraParameters(std::map<std::string, std::string> *camera_info = nullptr) const;

    Exiv2::ByteOrder byteOrder() const { return order_; }
    uint32_t version() const { return version_; }
    const std::string &creator() const { return creator_; }
    const std::vector<FlirRecordEntry> &records() const { return dir_; }
    std::size_t size() const { return data_.size(); }

private:
    FlirSegment() = default;

    void parseHeader();
    const FlirRecordEntry *findRecord(uint16_t type) const;
    // 记录内 u16 标志位为 2 时所用的字节序
    Exiv2::ByteOrder recordByteOrder(const FlirRecordEntry &entry) const;

    std::vector<uint8_t> data_;
    std::vector<FlirRecordEntry> dir_;
    Exiv2::ByteOrder order_ = Exiv2::littleEndian;
    uint32_t version_ = 0;
    std::string creator_;
};

#endif // FLIR_SEGMENT_H
