#include "visionmcp/image/preprocessor.hpp"

#include "visionmcp/exceptions.hpp"
#include "visionmcp/util/base64.hpp"
#include "visionmcp/util/log.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace visionmcp::image
{

std::vector<uint8_t> read_file(const std::string& path)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec)
        throw ImageError("Cannot access image file: " + path + " (" + ec.message() + ")");
    if (!fs::exists(status))
        throw ImageError("Image file not found: " + path);
    if (fs::is_directory(status))
        throw ImageError("Image path is a directory: " + path);

    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw ImageError("Cannot open image file: " + path + " (" + std::strerror(errno) + ")");

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad())
        throw ImageError("Failed to read image file: " + path);
    return bytes;
}

std::pair<int, int> fit_within(int width, int height, int max_dimension)
{
    int larger = std::max(width, height);
    if (larger <= max_dimension)
        return {width, height};

    double scale = static_cast<double>(max_dimension) / static_cast<double>(larger);
    if (width >= height)
    {
        int h = static_cast<int>(std::lround(height * scale));
        return {max_dimension, std::max(h, 1)};
    }
    int w = static_cast<int>(std::lround(width * scale));
    return {std::max(w, 1), max_dimension};
}

ImageArtifact ImagePreprocessor::process(const std::string& path) const
{
    auto raw = read_file(path);
    log::debug("Read " + std::to_string(raw.size()) + " bytes from " + path);
    try
    {
        return process_bytes(raw);
    }
    catch (const ImageError& e)
    {
        throw ImageError(std::string(e.what()) + ": " + path);
    }
}

ImageArtifact ImagePreprocessor::process_bytes(const std::vector<uint8_t>& raw) const
{
    if (raw.empty())
        throw ImageError("Empty image file");

    cv::Mat decoded;
    try
    {
        cv::Mat buf(1, static_cast<int>(raw.size()), CV_8UC1, const_cast<uint8_t*>(raw.data()));
        decoded = cv::imdecode(buf, cv::IMREAD_COLOR);
    }
    catch (const cv::Exception& e)
    {
        throw ImageError(std::string("Failed to decode image: ") + e.what());
    }
    if (decoded.empty())
        throw ImageError("Failed to decode image data");

    ImageArtifact artifact;
    artifact.raw_size = raw.size();
    artifact.original_width = decoded.cols;
    artifact.original_height = decoded.rows;

    auto [w, h] = fit_within(decoded.cols, decoded.rows, profile_.max_dimension);
    cv::Mat output = decoded;
    if (w != decoded.cols || h != decoded.rows)
    {
        cv::resize(decoded, output, cv::Size(w, h), 0, 0, cv::INTER_AREA);
        log::debug("Resized " + std::to_string(decoded.cols) + "x" +
                   std::to_string(decoded.rows) + " -> " + std::to_string(w) + "x" +
                   std::to_string(h));
    }
    artifact.width = output.cols;
    artifact.height = output.rows;

    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, profile_.quality};
    bool ok = false;
    try
    {
        ok = cv::imencode(".jpg", output, artifact.encoded, params);
    }
    catch (const cv::Exception& e)
    {
        throw ImageError(std::string("Failed to encode image: ") + e.what());
    }
    if (!ok || artifact.encoded.empty())
        throw ImageError("Failed to encode image as JPEG");

    artifact.base64 = util::base64::encode(artifact.encoded);
    return artifact;
}

} // namespace visionmcp::image
