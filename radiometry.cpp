#include "radiometry.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

#include "thermal_error.h"

namespace {

double powerSeriesAt(const std::array<double, 4> &coeffs, double x)
{
    double pow = 1.0;
    double sum = 0.0;
    for (double coeff : coeffs)
    {
        sum += pow * coeff;
        pow *= x;
    }
    return sum;
}

} // namespace

const char *temperatureUnitName(TemperatureUnit unit)
{
    switch (unit)
    {
    case TemperatureUnit::Kelvin:     return "K";
    case TemperatureUnit::Celsius:    return "C";
    case TemperatureUnit::Fahrenheit: return "F";
    }
    return "?";
}

bool parseTemperatureUnit(const std::string &text, TemperatureUnit &unit)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "k" || lower == "kelvin")
        unit = TemperatureUnit::Kelvin;
    else if (lower == "c" || lower == "celsius")
        unit = TemperatureUnit::Celsius;
    else if (lower == "f" || lower == "fahrenheit")
        unit = TemperatureUnit::Fahrenheit;
    else
        return false;
    return true;
}

double kelvinTo(TemperatureUnit unit, double kelvin)
{
    switch (unit)
    {
    case TemperatureUnit::Kelvin:     return kelvin;
    case TemperatureUnit::Celsius:    return kelvin - kCelsiusOffset;
    case TemperatureUnit::Fahrenheit: return (kelvin - kCelsiusOffset) * 9.0 / 5.0 + 32.0;
    }
    return kelvin;
}

double toKelvin(TemperatureUnit unit, double value)
{
    switch (unit)
    {
    case TemperatureUnit::Kelvin:     return value;
    case TemperatureUnit::Celsius:    return value + kCelsiusOffset;
    case TemperatureUnit::Fahrenheit: return (value - 32.0) * 5.0 / 9.0 + kCelsiusOffset;
    }
    return value;
}

double planckRawFromTemperature(const ParameterRecord &params, double kelvin)
{
    return params.planck_r1 /
               (params.planck_r2 * (std::exp(params.planck_b / kelvin) - params.planck_f)) -
           params.planck_o;
}

double planckTemperatureFromRaw(const ParameterRecord &params, double raw)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();

    const double denom = params.planck_r2 * (raw + params.planck_o);
    const double arg = params.planck_r1 / denom + params.planck_f;
    // B > 0，温度为正要求 ln(arg) > 0
    if (!std::isfinite(arg) || arg <= 1.0)
        return nan;

    const double kelvin = params.planck_b / std::log(arg);
    if (!std::isfinite(kelvin) || kelvin <= 0.0)
        return nan;
    return kelvin;
}

RadiometricModel::RadiometricModel(const ParameterRecord &params,
                                   const AtmosphereConstants &atmosphere)
    : params_(params), atmosphere_(atmosphere)
{
    params_.validate();
    if (!(atmosphere_.path_divisor > 0.0))
    {
        throw ThermalError(ErrorKind::InvalidParameter,
                           "atmosphere path divisor must be positive", "path_divisor");
    }

    const double e = params_.emissivity;
    const double irt = params_.ir_window_transmission;

    // 相对湿度 -> 水汽分压
    const double atm_celsius = params_.atmospheric_temperature - kCelsiusOffset;
    h2o_ = params_.relative_humidity * std::exp(powerSeriesAt(atmosphere_.humidity_series, atm_celsius));
    const double h2o_sqrt = std::sqrt(h2o_);

    // 两项指数衰减的加权和
    const double dist_factor = std::sqrt(params_.object_distance / atmosphere_.path_divisor);
    const double x = params_.atmospheric_x;
    tau_ = x * std::exp(-dist_factor * (params_.atmospheric_alpha1 + params_.atmospheric_beta1 * h2o_sqrt)) +
           (1.0 - x) * std::exp(-dist_factor * (params_.atmospheric_alpha2 + params_.atmospheric_beta2 * h2o_sqrt));

    if (!std::isfinite(tau_) || tau_ <= 0.0)
    {
        throw ThermalError(ErrorKind::NumericDomainError,
                           "atmospheric transmission is not positive: " + std::to_string(tau_),
                           "atmospheric_transmission");
    }

    const double refl = rawFromTemperature(params_.reflected_temperature);
    const double atm = rawFromTemperature(params_.atmospheric_temperature);
    const double wind = rawFromTemperature(params_.ir_window_temperature);
    if (!std::isfinite(refl) || !std::isfinite(atm) || !std::isfinite(wind))
    {
        throw ThermalError(ErrorKind::NumericDomainError,
                           "Planck calibration is singular for the ambient temperatures");
    }

    // 窗口有增透膜，窗口反射项为 0
    const double refl_attn = (1.0 - e) / e * refl;
    const double atm1_attn = (1.0 - tau_) / e / tau_ * atm;
    const double wind_attn = (1.0 - irt) / e / tau_ / irt * wind;
    const double atm2_attn = (1.0 - tau_) / e / tau_ / irt / tau_ * atm;

    offset_ = -(refl_attn + atm1_attn + wind_attn + atm2_attn);
    gain_ = 1.0 / e / tau_ / irt / tau_;
}

double RadiometricModel::rawFromTemperature(double kelvin) const
{
    return planckRawFromTemperature(params_, kelvin);
}

double RadiometricModel::temperatureFromRaw(double raw) const
{
    return planckTemperatureFromRaw(params_, raw);
}

double RadiometricModel::rawToTemperature(double raw) const
{
    return temperatureFromRaw(objectRaw(raw));
}

cv::Mat RadiometricModel::convert(const cv::Mat &raw) const
{
    if (raw.empty() || raw.channels() != 1)
    {
        throw ThermalError(ErrorKind::InvalidParameter,
                           "raw value grid must be a non-empty single-channel matrix");
    }

    cv::Mat src;
    if (raw.depth() == CV_64F)
        src = raw;
    else
        raw.convertTo(src, CV_64F);

    cv::Mat temperatures(src.rows, src.cols, CV_64FC1);
    for (int row = 0; row < src.rows; ++row)
    {
        const double *in = src.ptr<double>(row);
        double *out = temperatures.ptr<double>(row);
        for (int col = 0; col < src.cols; ++col)
        {
            out[col] = rawToTemperature(in[col]);
        }
    }
    return temperatures;
}
