#include "image.h"

#include <ctime>
#include <fstream>
#include <iterator>

#include "flir_segment.h"
#include "debug_utils.h"

const char *sourceEncodingName(SourceEncoding encoding)
{
    switch (encoding)
    {
    case SourceEncoding::BinaryBlock:  return "binary";
    case SourceEncoding::JsonDocument: return "json";
    }
    return "?";
}

std::vector<uint8_t> readFileBytes(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw ThermalError(ErrorKind::Io, "could not open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        throw ThermalError(ErrorKind::Io, "could not read " + path);
    }
    return bytes;
}

bool ThermalImage::fail(const ThermalError &error)
{
    last_error = error;
    LOG_ERROR((image_path.empty() ? std::string("<memory>") : image_path) + ": " + error.describe());
    return false;
}

bool ThermalImage::readRJpeg(const std::string &path)
{
    image_path = path;

    std::vector<uint8_t> bytes;
    try
    {
        bytes = readFileBytes(path);
    }
    catch (const ThermalError &e)
    {
        return fail(e);
    }
    return fromRJpegBytes(bytes, path);
}

bool ThermalImage::fromRJpegBytes(const std::vector<uint8_t> &bytes, const std::string &name)
{
    image_path = name;

    clock_t start = clock();
    try
    {
        FlirSegment segment = FlirSegment::fromBytes(bytes);
        cv::Mat grid = segment.parseRawData();

        std::map<std::string, std::string> info;
        ParameterFields fields = segment.parseCameraParameters(&info);
        ParameterRecord record = buildParameterRecord(fields);

        encoding = SourceEncoding::BinaryBlock;
        raw = grid;
        params = record;
        camera_info = info;
        last_error = ThermalError();
    }
    catch (const ThermalError &e)
    {
        return fail(e);
    }
    catch (const cv::Exception &e)
    {
        return fail(ThermalError(ErrorKind::MalformedBlock, std::string("OpenCV error: ") + e.what()));
    }

    LOG_INFO("ReadRJpeg took: " + std::to_string(float(clock() - start) / CLOCKS_PER_SEC) + " seconds");
    LOG_DEBUG(std::string("Decoded ") + sourceEncodingName(encoding) + " source " +
              std::to_string(raw.cols) + "x" + std::to_string(raw.rows));
    return true;
}

bool ThermalImage::fromExiftoolDocument(const ExiftoolDocument &doc)
{
    image_path = doc.source_file;

    try
    {
        ParameterRecord record = buildParameterRecord(doc.fields);

        encoding = SourceEncoding::JsonDocument;
        raw = doc.raw;
        params = record;
        camera_info.clear();
        last_error = ThermalError();
    }
    catch (const ThermalError &e)
    {
        return fail(e);
    }

    LOG_DEBUG(std::string("Decoded ") + sourceEncodingName(encoding) + " source " +
              std::to_string(raw.cols) + "x" + std::to_string(raw.rows));
    return true;
}

bool ThermalImage::fromExiftoolJsonText(const std::string &text, std::vector<ThermalImage> &images,
                                        ThermalError &error)
{
    images.clear();

    std::vector<ExiftoolDocument> documents;
    try
    {
        documents = parseExiftoolJson(text);
    }
    catch (const ThermalError &e)
    {
        error = e;
        LOG_ERROR("Exiftool JSON: " + e.describe());
        return false;
    }

    for (const auto &doc : documents)
    {
        ThermalImage image;
        if (!image.fromExiftoolDocument(doc))
        {
            error = image.last_error;
            images.clear();
            return false;
        }
        images.push_back(image);
    }
    error = ThermalError();
    return true;
}

bool ThermalImage::readExiftoolJson(const std::string &path, std::vector<ThermalImage> &images,
                                    ThermalError &error)
{
    clock_t start = clock();

    std::vector<uint8_t> bytes;
    try
    {
        bytes = readFileBytes(path);
    }
    catch (const ThermalError &e)
    {
        error = e;
        LOG_ERROR(path + ": " + e.describe());
        return false;
    }

    if (!fromExiftoolJsonText(std::string(bytes.begin(), bytes.end()), images, error))
    {
        return false;
    }
    LOG_INFO("ReadExiftoolJson took: " + std::to_string(float(clock() - start) / CLOCKS_PER_SEC) + " seconds");
    return true;
}

bool ThermalImage::setObjectDistance(double distance)
{
    try
    {
        params = params.withObjectDistance(distance);
    }
    catch (const ThermalError &e)
    {
        return fail(e);
    }
    return true;
}

bool ThermalImage::temperatures(cv::Mat &grid, const AtmosphereConstants &atmosphere)
{
    if (empty())
    {
        return fail(ThermalError(ErrorKind::InvalidParameter, "no raw data loaded"));
    }

    clock_t start = clock();
    try
    {
        RadiometricModel model(params, atmosphere);
        grid = model.convert(raw);
        LOG_DEBUG("Atmospheric transmission: " + std::to_string(model.atmosphericTransmission()));
    }
    catch (const ThermalError &e)
    {
        return fail(e);
    }

    LOG_INFO("Convert took: " + std::to_string(float(clock() - start) / CLOCKS_PER_SEC) + " seconds");
    return true;
}
