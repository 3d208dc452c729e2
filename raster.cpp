#include "raster.h"

#include <cmath>
#include <ctime>
#include <sstream>

#include <gdal_priv.h>
#include <cpl_conv.h>
#include <cpl_string.h>
#include <opencv2/imgcodecs.hpp>

#include "thermal_error.h"
#include "debug_utils.h"

namespace {

void requireRasterDepth(int depth)
{
    if (depth != 8 && depth != 16)
    {
        throw ThermalError(ErrorKind::InvalidParameter,
                           "raster depth must be 8 or 16 bits, got " + std::to_string(depth), "depth");
    }
}

} // namespace

std::string LinearEquation::toString(const std::string &y, const std::string &x) const
{
    std::ostringstream oss;
    oss.precision(12);
    oss << y << " = " << intercept << " + " << slope << " * " << x;
    return oss.str();
}

void NormalizationRange::validate() const
{
    if (!std::isfinite(min) || !std::isfinite(max) || min >= max)
    {
        throw ThermalError(ErrorKind::InvalidParameter,
                           "normalization range [" + std::to_string(min) + ", " + std::to_string(max) +
                               "] is empty",
                           "range");
    }
}

std::pair<LinearEquation, LinearEquation> NormalizationRange::coefficients(int depth) const
{
    validate();
    requireRasterDepth(depth);

    const double full_scale = std::ldexp(1.0, depth) - 1.0;
    const double factor = full_scale / (max - min);

    LinearEquation forward;
    forward.slope = factor;
    forward.intercept = -min * factor;

    LinearEquation inverse;
    inverse.slope = 1.0 / factor;
    inverse.intercept = min;
    return std::make_pair(forward, inverse);
}

cv::Mat normalizeTemperatures(const cv::Mat &grid, const NormalizationRange &range, int depth)
{
    if (grid.empty() || grid.type() != CV_64FC1)
    {
        throw ThermalError(ErrorKind::InvalidParameter,
                           "temperature grid must be a non-empty CV_64FC1 matrix");
    }
    const LinearEquation forward = range.coefficients(depth).first;

    cv::Mat raster(grid.rows, grid.cols, depth == 16 ? CV_16UC1 : CV_8UC1);
    for (int row = 0; row < grid.rows; ++row)
    {
        const double *in = grid.ptr<double>(row);
        for (int col = 0; col < grid.cols; ++col)
        {
            double value = 0.0;
            if (std::isfinite(in[col]))
                value = forward.apply(kelvinTo(range.unit, in[col]));

            if (depth == 16)
                raster.at<uint16_t>(row, col) = cv::saturate_cast<uint16_t>(value);
            else
                raster.at<uint8_t>(row, col) = cv::saturate_cast<uint8_t>(value);
        }
    }
    return raster;
}

bool saveRasterAsTIFF(const cv::Mat &raster, const std::string &outputPath,
                      const NormalizationRange &range)
{
    clock_t start = clock();

    if (raster.empty() || (raster.type() != CV_16UC1 && raster.type() != CV_8UC1))
    {
        LOG_ERROR("Raster must be a non-empty CV_16UC1 or CV_8UC1 matrix: " + outputPath);
        return false;
    }
    const int depth = raster.type() == CV_16UC1 ? 16 : 8;
    const GDALDataType type = depth == 16 ? GDT_UInt16 : GDT_Byte;

    std::pair<LinearEquation, LinearEquation> equations;
    try
    {
        equations = range.coefficients(depth);
    }
    catch (const ThermalError &e)
    {
        LOG_ERROR(e.describe());
        return false;
    }

    GDALAllRegister();
    GDALDriver *driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!driver)
    {
        LOG_ERROR("GDAL GTiff driver not available");
        return false;
    }

    // 无损压缩
    char **options = nullptr;
    options = CSLSetNameValue(options, "COMPRESS", "LZW");
    GDALDataset *dataset = driver->Create(outputPath.c_str(), raster.cols, raster.rows, 1, type, options);
    CSLDestroy(options);

    if (!dataset)
    {
        LOG_ERROR("Error: Could not create TIFF: " + outputPath);
        return false;
    }

    const std::string unit = temperatureUnitName(range.unit);
    dataset->SetMetadataItem("TEMPERATURE_UNIT", unit.c_str());
    dataset->SetMetadataItem("FORWARD_EQUATION", equations.first.toString("V", unit).c_str());
    dataset->SetMetadataItem("INVERSE_EQUATION", equations.second.toString(unit, "V").c_str());

    GDALRasterBand *band = dataset->GetRasterBand(1);
    CPLErr err = band->RasterIO(
        GF_Write, 0, 0, raster.cols, raster.rows,
        const_cast<uchar *>(raster.data),
        raster.cols, raster.rows, type,
        0,                                    // 像素间距
        static_cast<GSpacing>(raster.step)    // 行间距
    );

    GDALClose(dataset);
    if (err != CE_None)
    {
        LOG_ERROR("Error: RasterIO write failed with code " + std::to_string(err) + ": " + outputPath);
        return false;
    }

    LOG_INFO("SaveTIFF took: " + std::to_string(float(clock() - start) / CLOCKS_PER_SEC) + " seconds");
    return true;
}

bool saveRasterAsPNG(const cv::Mat &raster, const std::string &outputPath)
{
    if (raster.empty() || (raster.type() != CV_16UC1 && raster.type() != CV_8UC1))
    {
        LOG_ERROR("Raster must be a non-empty CV_16UC1 or CV_8UC1 matrix: " + outputPath);
        return false;
    }

    try
    {
        if (!cv::imwrite(outputPath, raster))
        {
            LOG_ERROR("Error: Could not write PNG: " + outputPath);
            return false;
        }
    }
    catch (const cv::Exception &e)
    {
        LOG_ERROR("OpenCV error: " + std::string(e.what()));
        return false;
    }
    return true;
}
