#include <iostream>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <getopt.h>

#include "image.h"
#include "metadata.h"
#include "raster.h"
#include "thermal_stats.h"
#include "debug_utils.h"

// ======================== Helpers ========================
static inline bool endsWith(const std::string &s, const std::string &suffix)
{
    if (s.size() < suffix.size()) return false;
    return std::equal(suffix.rbegin(), suffix.rend(), s.rbegin(),
                      [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) == b; });
}

struct ToolOptions {
    std::string input_path;
    std::string output_path;
    bool json_input = false;
    bool has_distance = false;
    double distance = 1.0;
    TemperatureUnit unit = TemperatureUnit::Celsius;
    bool has_min = false;
    bool has_max = false;
    NormalizationRange range;
    int depth = 16;
    bool copy_exif = false;
    std::vector<double> percentiles;
};

// 单张图像：温度统计 + 可选的栅格输出
static bool processImage(ThermalImage &image, const ToolOptions &opts, const Metadata *metadata,
                         TemperatureStats &stats, json &result)
{
    if (opts.has_distance && !image.setObjectDistance(opts.distance))
        return false;

    image.params.printParameters();

    cv::Mat grid;
    if (!image.temperatures(grid))
        return false;

    stats = computeStatistics(grid, opts.unit, opts.percentiles);
    if (stats.invalid_count > 0)
    {
        LOG_WARN(image.image_path + ": " + std::to_string(stats.invalid_count) +
                 " pixels outside the calibration domain");
    }
    result = build_stats_json(image.image_path, image.width(), image.height(), stats,
                              image.camera_info, metadata);

    if (opts.output_path.empty())
        return true;

    cv::Mat raster = normalizeTemperatures(grid, opts.range, opts.depth);
    const bool ok = endsWith(opts.output_path, ".png")
                        ? saveRasterAsPNG(raster, opts.output_path)
                        : saveRasterAsTIFF(raster, opts.output_path, opts.range);
    if (!ok)
        return false;

    if (opts.copy_exif && !copyExifAndXmp(opts.input_path, opts.output_path))
        return false;

    LOG_INFO("Raster written: " + opts.output_path);
    return true;
}

// ======================== CLI & main ========================
static void print_help(const char *program_name)
{
    std::cerr << "Usage: " << program_name << " [OPTIONS] IMAGE\n"
              << "Compute temperature statistics of a FLIR R-JPEG (or exiftool -j -b output)\n"
              << "and optionally write a normalized single-channel raster.\n"
              << "Options:\n"
              << "  -i, --input PATH           Input R-JPEG or exiftool JSON file\n"
              << "  -j, --json                 Input is exiftool JSON (default: by .json extension)\n"
              << "  -d, --distance M           Override object distance in meters\n"
              << "  -u, --unit UNIT            Output unit: K, C or F (default=C)\n"
              << "  -p, --percentile P         Report percentile P in [0,100], repeatable\n"
              << "  -o, --output PATH          Write normalized raster (.tif via GDAL, .png via OpenCV)\n"
              << "  -m, --min T                Temperature mapped to 0 (required with --output)\n"
              << "  -M, --max T                Temperature mapped to full scale (required with --output)\n"
              << "  -b, --depth BITS           Raster depth: 8 or 16 (default=16)\n"
              << "  -x, --copy_exif            Copy EXIF/XMP from the input to the raster\n"
              << "  -v, --verbose              Debug logging\n"
              << "  -h, --help                 Show this help message\n"
              << "\nEnvironment:\n"
              << "  THERMAL_LOG_LEVEL          debug, info, warn or error (default=info)\n"
              << "  THERMAL_LOG_FILE           Also append log lines to this file\n"
              << "\nExample:\n"
              << "  " << program_name << " -p 50 -p 99 flir_0001.jpg\n"
              << "  " << program_name << " -d 5 -m 10 -M 60 -o out.tif -x flir_0001.jpg\n";
}

int main(int argc, char *argv[])
{
    static struct option longopts[] = {
        {"input", required_argument, NULL, 'i'},
        {"json", no_argument, NULL, 'j'},
        {"distance", required_argument, NULL, 'd'},
        {"unit", required_argument, NULL, 'u'},
        {"percentile", required_argument, NULL, 'p'},
        {"output", required_argument, NULL, 'o'},
        {"min", required_argument, NULL, 'm'},
        {"max", required_argument, NULL, 'M'},
        {"depth", required_argument, NULL, 'b'},
        {"copy_exif", no_argument, NULL, 'x'},
        {"verbose", no_argument, NULL, 'v'},
        {"help", no_argument, NULL, 'h'},
        {NULL, 0, NULL, 0}
    };

    ToolOptions opts;

    int c = 0;
    try
    {
        while ((c = getopt_long(argc, argv, "i:jd:u:p:o:m:M:b:xvh", longopts, NULL)) != -1)
        {
            switch (c)
            {
            case 'i': opts.input_path = optarg; break;
            case 'j': opts.json_input = true; break;
            case 'd': opts.distance = std::stod(optarg); opts.has_distance = true; break;
            case 'u':
                if (!parseTemperatureUnit(optarg, opts.unit))
                {
                    std::cerr << "Error: Invalid unit '" << optarg << "'. Must be K, C or F.\n";
                    return 1;
                }
                break;
            case 'p': opts.percentiles.push_back(std::stod(optarg)); break;
            case 'o': opts.output_path = optarg; break;
            case 'm': opts.range.min = std::stod(optarg); opts.has_min = true; break;
            case 'M': opts.range.max = std::stod(optarg); opts.has_max = true; break;
            case 'b': opts.depth = std::stoi(optarg); break;
            case 'x': opts.copy_exif = true; break;
            case 'v': DebugLogger::getInstance().setMinLevel(LogLevel::DEBUG); break;
            case 'h': print_help(argv[0]); return 0;
            default:  print_help(argv[0]); return 1;
            }
        }
    }
    catch (const std::exception &)
    {
        std::cerr << "Error: Invalid numeric argument for -" << static_cast<char>(c) << ".\n\n";
        print_help(argv[0]);
        return 1;
    }

    if (opts.input_path.empty() && optind < argc)
        opts.input_path = argv[optind++];
    if (opts.input_path.empty() || optind < argc)
    {
        std::cerr << "Error: Exactly one input image is required.\n\n";
        print_help(argv[0]);
        return 1;
    }
    if (!opts.json_input && endsWith(opts.input_path, ".json"))
        opts.json_input = true;

    opts.range.unit = opts.unit;
    if (!opts.output_path.empty())
    {
        if (!opts.has_min || !opts.has_max)
        {
            std::cerr << "Error: --min and --max are required with --output.\n";
            return 1;
        }
        if (opts.depth != 8 && opts.depth != 16)
        {
            std::cerr << "Error: Invalid depth. Must be 8 or 16.\n";
            return 1;
        }
        if (!(opts.range.min < opts.range.max))
        {
            std::cerr << "Error: --min must be below --max.\n";
            return 1;
        }
        if (opts.copy_exif && opts.json_input)
        {
            std::cerr << "Error: --copy_exif needs an R-JPEG input.\n";
            return 1;
        }
    }
    for (double p : opts.percentiles)
    {
        if (!(p >= 0.0 && p <= 100.0))
        {
            std::cerr << "Error: Invalid percentile " << p << ". Must be 0..100.\n";
            return 1;
        }
    }

    LOG_INFO("Input: " + opts.input_path);
    LOG_INFO("Unit: " + std::string(temperatureUnitName(opts.unit)));
    if (opts.has_distance)
        LOG_INFO("Object distance override: " + std::to_string(opts.distance) + " m");
    if (!opts.output_path.empty())
        LOG_INFO("Output: " + opts.output_path + " (" + std::to_string(opts.depth) + " bit)");

    try
    {
        if (!opts.json_input)
        {
            ThermalImage image;
            if (!image.readRJpeg(opts.input_path))
                return 2;

            Metadata metadata;
            const bool has_metadata = metadata.extract(opts.input_path);
            if (!has_metadata)
                LOG_WARN("No EXIF/XMP metadata: " + opts.input_path);

            TemperatureStats stats;
            json result;
            if (!processImage(image, opts, has_metadata ? &metadata : nullptr, stats, result))
                return 2;
            std::cout << result.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
            return 0;
        }

        std::vector<ThermalImage> images;
        ThermalError error;
        if (!ThermalImage::readExiftoolJson(opts.input_path, images, error))
            return 2;
        if (!opts.output_path.empty() && images.size() != 1)
        {
            LOG_ERROR("--output needs exactly one document, found " + std::to_string(images.size()));
            return 1;
        }

        json per_image = json::array();
        TemperatureStats cumulative;
        cumulative.unit = opts.unit;
        for (auto &image : images)
        {
            TemperatureStats stats;
            json result;
            if (!processImage(image, opts, nullptr, stats, result))
                return 2;
            per_image.push_back(result);
            cumulative += stats;
        }

        json out;
        out["images"] = per_image;
        out["cumulative"] = statsToJson(cumulative);
        std::cout << out.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    }
    catch (const ThermalError &e)
    {
        LOG_ERROR(e.describe());
        return 2;
    }
    catch (const std::exception &e)
    {
        LOG_ERROR(std::string("Unexpected error: ") + e.what());
        return 2;
    }
    return 0;
}
