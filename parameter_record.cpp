#include "parameter_record.h"

#include <cmath>
#include <limits>

#include "thermal_error.h"
#include "debug_utils.h"

namespace {

struct FieldSpec {
    ParameterField field;
    const char *name;
    bool required;
    double default_value;
};

const double kNaN = std::numeric_limits<double>::quiet_NaN();

// 默认值取自 Thermimage raw2temp
const FieldSpec kFieldSpecs[] = {
    {ParameterField::Emissivity,             "emissivity",              true,  kNaN},
    {ParameterField::ObjectDistance,         "object_distance",         false, 1.0},
    {ParameterField::ReflectedTemperature,   "reflected_temperature",   false, 293.15},
    {ParameterField::AtmosphericTemperature, "atmospheric_temperature", false, 293.15},
    {ParameterField::RelativeHumidity,       "relative_humidity",       false, 0.5},
    {ParameterField::IRWindowTemperature,    "ir_window_temperature",   false, 293.15},
    {ParameterField::IRWindowTransmission,   "ir_window_transmission",  false, 1.0},
    {ParameterField::PlanckR1,               "planck_r1",               true,  kNaN},
    {ParameterField::PlanckR2,               "planck_r2",               false, 0.012545258},
    {ParameterField::PlanckB,                "planck_b",                true,  kNaN},
    {ParameterField::PlanckF,                "planck_f",                true,  kNaN},
    {ParameterField::PlanckO,                "planck_o",                false, -7340.0},
    {ParameterField::AtmosphericAlpha1,      "atmospheric_alpha1",      false, 0.006569},
    {ParameterField::AtmosphericAlpha2,      "atmospheric_alpha2",      false, 0.01262},
    {ParameterField::AtmosphericBeta1,       "atmospheric_beta1",       false, -0.002276},
    {ParameterField::AtmosphericBeta2,       "atmospheric_beta2",       false, -0.00667},
    {ParameterField::AtmosphericX,           "atmospheric_x",           false, 1.9},
};

const FieldSpec &specOf(ParameterField field)
{
    for (const auto &spec : kFieldSpecs)
    {
        if (spec.field == field)
            return spec;
    }
    throw std::logic_error("unknown parameter field");
}

void fail(ParameterField field, const std::string &rule, double value)
{
    const std::string name = parameterFieldName(field);
    throw ThermalError(ErrorKind::InvalidParameter,
                       "parameter `" + name + "` = " + std::to_string(value) + " violates " + rule,
                       name);
}

void requireFinite(ParameterField field, double value)
{
    if (!std::isfinite(value))
        fail(field, "finite", value);
}

void requireNonZero(ParameterField field, double value)
{
    requireFinite(field, value);
    if (value == 0.0)
        fail(field, "!= 0", value);
}

// (0, 1]
void requireFraction(ParameterField field, double value)
{
    requireFinite(field, value);
    if (!(value > 0.0 && value <= 1.0))
        fail(field, "(0, 1]", value);
}

void requirePositive(ParameterField field, double value)
{
    requireFinite(field, value);
    if (!(value > 0.0))
        fail(field, "> 0", value);
}

} // namespace

const char *parameterFieldName(ParameterField field)
{
    return specOf(field).name;
}

bool isRequiredField(ParameterField field)
{
    return specOf(field).required;
}

double defaultFieldValue(ParameterField field)
{
    return specOf(field).default_value;
}

double ParameterRecord::get(ParameterField field) const
{
    switch (field)
    {
    case ParameterField::Emissivity:             return emissivity;
    case ParameterField::ObjectDistance:         return object_distance;
    case ParameterField::ReflectedTemperature:   return reflected_temperature;
    case ParameterField::AtmosphericTemperature: return atmospheric_temperature;
    case ParameterField::RelativeHumidity:       return relative_humidity;
    case ParameterField::IRWindowTemperature:    return ir_window_temperature;
    case ParameterField::IRWindowTransmission:   return ir_window_transmission;
    case ParameterField::PlanckR1:               return planck_r1;
    case ParameterField::PlanckR2:               return planck_r2;
    case ParameterField::PlanckB:                return planck_b;
    case ParameterField::PlanckF:                return planck_f;
    case ParameterField::PlanckO:                return planck_o;
    case ParameterField::AtmosphericAlpha1:      return atmospheric_alpha1;
    case ParameterField::AtmosphericAlpha2:      return atmospheric_alpha2;
    case ParameterField::AtmosphericBeta1:       return atmospheric_beta1;
    case ParameterField::AtmosphericBeta2:       return atmospheric_beta2;
    case ParameterField::AtmosphericX:           return atmospheric_x;
    }
    throw std::logic_error("unknown parameter field");
}

void ParameterRecord::set(ParameterField field, double value)
{
    switch (field)
    {
    case ParameterField::Emissivity:             emissivity = value; break;
    case ParameterField::ObjectDistance:         object_distance = value; break;
    case ParameterField::ReflectedTemperature:   reflected_temperature = value; break;
    case ParameterField::AtmosphericTemperature: atmospheric_temperature = value; break;
    case ParameterField::RelativeHumidity:       relative_humidity = value; break;
    case ParameterField::IRWindowTemperature:    ir_window_temperature = value; break;
    case ParameterField::IRWindowTransmission:   ir_window_transmission = value; break;
    case ParameterField::PlanckR1:               planck_r1 = value; break;
    case ParameterField::PlanckR2:               planck_r2 = value; break;
    case ParameterField::PlanckB:                planck_b = value; break;
    case ParameterField::PlanckF:                planck_f = value; break;
    case ParameterField::PlanckO:                planck_o = value; break;
    case ParameterField::AtmosphericAlpha1:      atmospheric_alpha1 = value; break;
    case ParameterField::AtmosphericAlpha2:      atmospheric_alpha2 = value; break;
    case ParameterField::AtmosphericBeta1:       atmospheric_beta1 = value; break;
    case ParameterField::AtmosphericBeta2:       atmospheric_beta2 = value; break;
    case ParameterField::AtmosphericX:           atmospheric_x = value; break;
    }
}

void ParameterRecord::validate() const
{
    requireFraction(ParameterField::Emissivity, emissivity);
    requireFraction(ParameterField::IRWindowTransmission, ir_window_transmission);

    requireFinite(ParameterField::ObjectDistance, object_distance);
    if (object_distance < 0.0)
        fail(ParameterField::ObjectDistance, ">= 0", object_distance);

    requireFinite(ParameterField::RelativeHumidity, relative_humidity);
    if (relative_humidity < 0.0 || relative_humidity > 1.0)
        fail(ParameterField::RelativeHumidity, "[0, 1]", relative_humidity);

    // 绝对温度
    requirePositive(ParameterField::ReflectedTemperature, reflected_temperature);
    requirePositive(ParameterField::AtmosphericTemperature, atmospheric_temperature);
    requirePositive(ParameterField::IRWindowTemperature, ir_window_temperature);

    requireNonZero(ParameterField::PlanckR1, planck_r1);
    requireNonZero(ParameterField::PlanckR2, planck_r2);
    requirePositive(ParameterField::PlanckB, planck_b);
    requireFinite(ParameterField::PlanckF, planck_f);
    requireFinite(ParameterField::PlanckO, planck_o);

    requireFinite(ParameterField::AtmosphericAlpha1, atmospheric_alpha1);
    requireFinite(ParameterField::AtmosphericAlpha2, atmospheric_alpha2);
    requireFinite(ParameterField::AtmosphericBeta1, atmospheric_beta1);
    requireFinite(ParameterField::AtmosphericBeta2, atmospheric_beta2);
    requireFinite(ParameterField::AtmosphericX, atmospheric_x);
}

ParameterRecord ParameterRecord::withObjectDistance(double distance) const
{
    ParameterRecord copy = *this;
    copy.object_distance = distance;
    copy.validate();
    return copy;
}

void ParameterRecord::printParameters() const
{
    LOG_INFO("-------------------------------------------------------");
    for (const auto &spec : kFieldSpecs)
    {
        LOG_INFO("  " + std::string(spec.name) + ": " + std::to_string(get(spec.field)));
    }
    LOG_INFO("-------------------------------------------------------");
}

ParameterRecord buildParameterRecord(const ParameterFields &fields)
{
    // IR 窗口的温度和透过率必须同时给出或同时缺省
    const bool has_window_temp = fields.count(ParameterField::IRWindowTemperature) > 0;
    const bool has_window_trans = fields.count(ParameterField::IRWindowTransmission) > 0;
    if (has_window_temp != has_window_trans)
    {
        const ParameterField missing = has_window_temp ? ParameterField::IRWindowTransmission
                                                       : ParameterField::IRWindowTemperature;
        const std::string name = parameterFieldName(missing);
        throw ThermalError(ErrorKind::InvalidParameter,
                           "IR window temperature and transmission must be given together, `" +
                               name + "` is missing",
                           name);
    }

    ParameterRecord record;
    for (const auto &spec : kFieldSpecs)
    {
        auto it = fields.find(spec.field);
        if (it != fields.end())
        {
            record.set(spec.field, it->second);
        }
        else if (spec.required)
        {
            throw ThermalError(ErrorKind::MissingField,
                               "required parameter `" + std::string(spec.name) + "` is missing",
                               spec.name);
        }
        else
        {
            record.set(spec.field, spec.default_value);
        }
    }

    record.validate();
    return record;
}
