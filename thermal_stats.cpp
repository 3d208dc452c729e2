#include "thermal_stats.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "thermal_error.h"

TemperatureStats &TemperatureStats::operator+=(const TemperatureStats &other)
{
    if (other.unit != unit && other.valid_count + other.invalid_count > 0 &&
        valid_count + invalid_count > 0)
    {
        throw ThermalError(ErrorKind::InvalidParameter,
                           std::string("cannot merge statistics in ") + temperatureUnitName(other.unit) +
                               " into statistics in " + temperatureUnitName(unit),
                           "unit");
    }
    if (other.valid_count + other.invalid_count == 0)
        return *this;
    if (valid_count + invalid_count == 0)
    {
        *this = other;
        return *this;
    }

    invalid_count += other.invalid_count;
    percentiles.clear();
    if (other.valid_count == 0)
        return *this;
    if (valid_count == 0)
    {
        min = other.min;
        max = other.max;
        mean = other.mean;
        stddev = other.stddev;
        valid_count = other.valid_count;
        return *this;
    }

    // 两组方差的合并
    const double na = static_cast<double>(valid_count);
    const double nb = static_cast<double>(other.valid_count);
    const double n = na + nb;
    const double delta = other.mean - mean;
    const double m2 = stddev * stddev * na + other.stddev * other.stddev * nb + delta * delta * na * nb / n;

    mean += delta * nb / n;
    stddev = std::sqrt(m2 / n);
    min = std::min(min, other.min);
    max = std::max(max, other.max);
    valid_count += other.valid_count;
    return *this;
}

TemperatureStats computeStatistics(const cv::Mat &grid, TemperatureUnit unit,
                                   const std::vector<double> &percentiles)
{
    if (grid.empty() || grid.type() != CV_64FC1)
    {
        throw ThermalError(ErrorKind::InvalidParameter,
                           "temperature grid must be a non-empty CV_64FC1 matrix");
    }
    for (double p : percentiles)
    {
        if (!(p >= 0.0 && p <= 100.0))
        {
            throw ThermalError(ErrorKind::InvalidParameter,
                               "percentile " + std::to_string(p) + " is outside [0, 100]", "percentile");
        }
    }

    TemperatureStats stats;
    stats.unit = unit;

    std::vector<double> values;
    values.reserve(grid.total());
    for (int row = 0; row < grid.rows; ++row)
    {
        const double *p = grid.ptr<double>(row);
        for (int col = 0; col < grid.cols; ++col)
        {
            if (std::isfinite(p[col]))
                values.push_back(kelvinTo(unit, p[col]));
            else
                ++stats.invalid_count;
        }
    }

    stats.valid_count = values.size();
    if (values.empty())
    {
        stats.min = stats.max = stats.mean = stats.stddev = std::nan("");
        for (double p : percentiles)
            stats.percentiles.emplace_back(p, std::nan(""));
        return stats;
    }

    // Welford
    double mean = 0.0;
    double m2 = 0.0;
    std::size_t n = 0;
    for (double v : values)
    {
        ++n;
        const double delta = v - mean;
        mean += delta / static_cast<double>(n);
        m2 += delta * (v - mean);
    }
    stats.mean = mean;
    stats.stddev = std::sqrt(m2 / static_cast<double>(n));

    std::sort(values.begin(), values.end());
    stats.min = values.front();
    stats.max = values.back();

    for (double p : percentiles)
    {
        const double rank = p / 100.0 * static_cast<double>(values.size() - 1);
        const std::size_t lo = static_cast<std::size_t>(std::floor(rank));
        const std::size_t hi = std::min(lo + 1, values.size() - 1);
        const double frac = rank - static_cast<double>(lo);
        stats.percentiles.emplace_back(p, values[lo] + (values[hi] - values[lo]) * frac);
    }
    return stats;
}

std::string percentileLabel(double percentile)
{
    std::ostringstream oss;
    oss << "p" << percentile;
    return oss.str();
}

json statsToJson(const TemperatureStats &stats)
{
    json j;
    j["unit"] = temperatureUnitName(stats.unit);
    j["min"] = stats.min;
    j["max"] = stats.max;
    j["mean"] = stats.mean;
    j["stddev"] = stats.stddev;
    j["valid_count"] = stats.valid_count;
    j["invalid_count"] = stats.invalid_count;

    json pct = json::object();
    for (const auto &entry : stats.percentiles)
    {
        pct[percentileLabel(entry.first)] = entry.second;
    }
    j["percentiles"] = pct;
    return j;
}
