#pragma once
#include "visionmcp/settings.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace visionmcp::image
{

/// Per-call image payload. Owned by the call that produced it; never cached.
struct ImageArtifact
{
    std::size_t raw_size{0};
    int original_width{0};
    int original_height{0};
    int width{0};
    int height{0};
    std::vector<uint8_t> encoded; ///< JPEG bytes
    std::string base64;
    std::string mime_type{"image/jpeg"};
};

/// Size after bounding the larger side to max_dimension, keeping aspect ratio.
/// Returns the input unchanged when it already fits.
std::pair<int, int> fit_within(int width, int height, int max_dimension);

/**
 * Loads an image file and normalizes it for inline transport.
 *
 * Every call reads, decodes, optionally downsamples, and re-encodes to JPEG
 * at the profile quality, even when no resize is needed, so that format and
 * metadata are uniform. Failures throw ImageError naming the path.
 */
class ImagePreprocessor
{
  public:
    explicit ImagePreprocessor(ImageProfile profile = ImageProfile::high_fidelity())
        : profile_(profile)
    {
    }

    ImageArtifact process(const std::string& path) const;

    /// Same pipeline over bytes already in memory.
    ImageArtifact process_bytes(const std::vector<uint8_t>& raw) const;

    const ImageProfile& profile() const
    {
        return profile_;
    }

  private:
    ImageProfile profile_;
};

/// Read a whole file. Throws ImageError on any failure.
std::vector<uint8_t> read_file(const std::string& path);

} // namespace visionmcp::image
