#ifndef RASTER_H
#define RASTER_H

#include <string>
#include <utility>

#include <opencv2/core.hpp>

#include "radiometry.h"

// y = intercept + slope * x
struct LinearEquation {
    double intercept = 0.0;
    double slope = 1.0;

    double apply(double x) const { return intercept + slope * x; }
    std::string toString(const std::string &y, const std::string &x) const;
};

// 温度 [min, max]（单位 unit）线性映射到 [0, 2^depth - 1]
struct NormalizationRange {
    double min = 0.0;
    double max = 100.0;
    TemperatureUnit unit = TemperatureUnit::Celsius;

    // min >= max 或非有限值时抛出 ThermalError(InvalidParameter)
    void validate() const;

    // first: 前向 V = a + b * T；second: 逆向 T = a' + b' * V
    std::pair<LinearEquation, LinearEquation> coefficients(int depth = 16) const;
};

// grid: CV_64FC1 温度图(K) -> CV_16UC1 (depth 16) 或 CV_8UC1 (depth 8)
// 超出范围的值截断到边界，NaN 写为 0
cv::Mat normalizeTemperatures(const cv::Mat &grid, const NormalizationRange &range, int depth = 16);

// 单波段无损 TIFF，写入 TEMPERATURE_UNIT / FORWARD_EQUATION / INVERSE_EQUATION 元数据
bool saveRasterAsTIFF(const cv::Mat &raster, const std::string &outputPath,
                      const NormalizationRange &range);

bool saveRasterAsPNG(const cv::Mat &raster, const std::string &outputPath);

#endif // RASTER_H
