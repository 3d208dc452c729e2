#ifndef PARAMETER_RECORD_H
#define PARAMETER_RECORD_H

#include <map>
#include <string>

// ParameterRecord 中的各个字段，解码器按此枚举填写
enum class ParameterField {
    Emissivity,
    ObjectDistance,
    ReflectedTemperature,
    AtmosphericTemperature,
    RelativeHumidity,
    IRWindowTemperature,
    IRWindowTransmission,
    PlanckR1,
    PlanckR2,
    PlanckB,
    PlanckF,
    PlanckO,
    AtmosphericAlpha1,
    AtmosphericAlpha2,
    AtmosphericBeta1,
    AtmosphericBeta2,
    AtmosphericX
};

const char* parameterFieldName(ParameterField field);

// 必填字段没有默认值，缺失即解码失败
bool isRequiredField(ParameterField field);

// 可选字段的默认值（raw2temp 的默认参数）；必填字段返回 NaN
double defaultFieldValue(ParameterField field);

// 解码器输出：只包含源数据中实际出现的字段
using ParameterFields = std::map<ParameterField, double>;

// 温度单位为 K，距离为 m，湿度为 [0,1] 的比例
struct ParameterRecord {
    double emissivity = 1.0;
    double object_distance = 1.0;
    double reflected_temperature = 293.15;
    double atmospheric_temperature = 293.15;
    double relative_humidity = 0.5;
    double ir_window_temperature = 293.15;
    double ir_window_transmission = 1.0;

    double planck_r1 = 21106.77;
    double planck_r2 = 0.012545258;
    double planck_b = 1501.0;
    double planck_f = 1.0;
    double planck_o = -7340.0;

    double atmospheric_alpha1 = 0.006569;
    double atmospheric_alpha2 = 0.01262;
    double atmospheric_beta1 = -0.002276;
    double atmospheric_beta2 = -0.00667;
    double atmospheric_x = 1.9;

    double get(ParameterField field) const;
    void set(ParameterField field, double value);

    // 检查取值范围，不满足时抛出 ThermalError(InvalidParameter)
    void validate() const;

    // 以新的目标距离返回一份已校验的副本
    ParameterRecord withObjectDistance(double distance) const;

    void printParameters() const;
};

// 唯一的校验入口：补默认值、检查字段间一致性与取值范围
ParameterRecord buildParameterRecord(const ParameterFields& fields);

#endif // PARAMETER_RECORD_H
