#ifndef RADIOMETRY_H
#define RADIOMETRY_H

#include <array>
#include <string>

#include <opencv2/core.hpp>

#include "parameter_record.h"

const double kCelsiusOffset = 273.15;

enum class TemperatureUnit { Kelvin, Celsius, Fahrenheit };

const char* temperatureUnitName(TemperatureUnit unit);
// "K"/"kelvin", "C"/"celsius", "F"/"fahrenheit"
bool parseTemperatureUnit(const std::string& text, TemperatureUnit& unit);

double kelvinTo(TemperatureUnit unit, double kelvin);
double toKelvin(TemperatureUnit unit, double value);

// 大气透过率模型中与相机型号相关的常数
struct AtmosphereConstants {
    // h2o = RH * exp(c0 + c1*t + c2*t^2 + c3*t^3)，t 为大气温度(℃)
    std::array<double, 4> humidity_series = {{1.5587, 0.06939, -0.00027816, 0.00000068455}};

    // 透过率按 sqrt(distance / path_divisor) 计算；2 表示 IR 窗口位于路径中点
    double path_divisor = 2.0;
};

// R1 / (R2 * (exp(B / T) - F)) - O
double planckRawFromTemperature(const ParameterRecord& params, double kelvin);

// 上式的反函数，定义域之外返回 NaN
double planckTemperatureFromRaw(const ParameterRecord& params, double raw);

/*
 * 原始计数 -> 温度(K)。
 *
 * 构造时一次性算出大气透过率以及反射、大气、窗口辐射对应的原始计数，
 * 之后每个像素只需一次仿射校正加一次 Planck 反演。对象不可变，可在线程间共享。
 */
class RadiometricModel {
public:
    explicit RadiometricModel(const ParameterRecord& params,
                              const AtmosphereConstants& atmosphere = AtmosphereConstants());

    double rawFromTemperature(double kelvin) const;
    double temperatureFromRaw(double raw) const;

    // 水汽分压
    double waterVaporPressure() const { return h2o_; }
    double atmosphericTransmission() const { return tau_; }

    // 目标自身辐射对应的原始计数 = offset + gain * measured
    double objectRaw(double measured) const { return offset_ + gain_ * measured; }
    double gain() const { return gain_; }
    double offset() const { return offset_; }

    // 单个像素；结果非物理时返回 NaN
    double rawToTemperature(double raw) const;

    // 单通道原始图 -> CV_64FC1 温度图(K)
    cv::Mat convert(const cv::Mat& raw) const;

    const ParameterRecord& parameters() const { return params_; }

private:
    ParameterRecord params_;
    AtmosphereConstants atmosphere_;
    double h2o_ = 0.0;
    double tau_ = 1.0;
    double gain_ = 1.0;
    double offset_ = 0.0;
};

#endif // RADIOMETRY_H
