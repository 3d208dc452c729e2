#ifndef THERMAL_STATS_H
#define THERMAL_STATS_H

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>

#include "radiometry.h"

using json = nlohmann::json;

// 温度图统计量，单位为 unit；NaN 像素只计入 invalid_count
struct TemperatureStats {
    TemperatureUnit unit = TemperatureUnit::Celsius;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double stddev = 0.0;     // 总体标准差
    std::size_t valid_count = 0;
    std::size_t invalid_count = 0;

    // (百分位, 值)，只对单张图像有效
    std::vector<std::pair<double, double>> percentiles;

    bool empty() const { return valid_count == 0; }

    // 累计多张图像的统计量；单位必须一致，合并后百分位不再有意义而被清空
    TemperatureStats &operator+=(const TemperatureStats &other);
};

// grid: CV_64FC1 温度图(K)；percentiles 取值 [0, 100]，按相邻秩线性插值
TemperatureStats computeStatistics(const cv::Mat &grid,
                                   TemperatureUnit unit = TemperatureUnit::Celsius,
                                   const std::vector<double> &percentiles = {});

// 50 -> "p50", 99.5 -> "p99.5"
std::string percentileLabel(double percentile);

json statsToJson(const TemperatureStats &stats);

#endif // THERMAL_STATS_H
