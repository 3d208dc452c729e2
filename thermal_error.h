#ifndef THERMAL_ERROR_H
#define THERMAL_ERROR_H

#include <stdexcept>
#include <string>

// 错误类别：解码、校验、数值计算
enum class ErrorKind {
    None,
    UnsupportedVersion,   // 未知签名或版本
    MalformedBlock,       // 长度/偏移不一致，数据截断
    MissingField,         // JSON 缺少字段或类型错误
    InvalidParameter,     // 参数不满足取值范围
    NumericDomainError,   // Planck 反演得到非物理结果
    Io                    // 文件读写失败
};

const char* errorKindName(ErrorKind kind);

class ThermalError : public std::runtime_error {
public:
    ThermalError() : std::runtime_error(""), kind_(ErrorKind::None) {}

    ThermalError(ErrorKind kind, const std::string& message, const std::string& field = "")
        : std::runtime_error(message), kind_(kind), field_(field) {}

    ErrorKind kind() const { return kind_; }

    // 出错的字段名（JSON key 或参数名），可能为空
    const std::string& field() const { return field_; }

    // "MissingField: key `Emissivity` not found"
    std::string describe() const;

private:
    ErrorKind kind_;
    std::string field_;
};

#endif // THERMAL_ERROR_H
