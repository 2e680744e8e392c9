#pragma once

#include "core/cache/thumbnail_cache.hpp"
#include "core/decoder/frame_source.hpp"
#include "core/media_error.hpp"
#include "core/media_types.hpp"
#include <opencv2/core.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Decoder families the thumbnailer dispatches over
 */
enum class SourceFormat
{
    JPEG,
    PNG,
    HEIC,
    RAW,
    VIDEO,
    OTHER_RASTER, // webp, gif, bmp, tiff: decoded by OpenCV
    UNKNOWN
};

/**
 * @brief Produces the small/medium JPEG pair for still images
 *
 * Decode -> orientation fix -> Lanczos resize -> JPEG encode -> cache.
 * Orientation is applied before resizing, so every cached thumbnail is
 * already upright.
 */
class ImageThumbnailer
{
public:
    /**
     * @brief Constructor
     * @param cache Shared thumbnail cache
     * @param heic_decoder Frame source used to decode HEIC stills; may be null
     * @param jpeg_quality JPEG quality for the encoded thumbnails (1-100)
     */
    ImageThumbnailer(ThumbnailCache &cache, std::shared_ptr<FrameSource> heic_decoder = nullptr,
                     int jpeg_quality = 85);

    /**
     * @brief Generate (or fetch cached) thumbnails for an image file
     * @param path Source image
     * @param orientation EXIF orientation 1-8 as read by ImageMetadataReader
     * @return Cached paths, or a typed error so the caller can show a placeholder
     */
    MediaResult<ThumbnailPaths> generate(const std::string &path, int orientation);

    /**
     * @brief Same, for a caller that has already hashed the file
     * @param checksum Content hash the thumbnails are stored under
     */
    MediaResult<ThumbnailPaths> generate(const std::string &path, const std::string &checksum, int orientation);

    /**
     * @brief Decode an encoded still (e.g. a piped video frame) and render both sizes
     */
    MediaResult<EncodedThumbnails> renderFrame(const std::vector<uint8_t> &frame_bytes) const;

    /**
     * @brief Resize an upright image to both widths and JPEG-encode them
     */
    MediaResult<EncodedThumbnails> renderThumbnails(const cv::Mat &upright) const;

    /**
     * @brief Decode a file according to its detected format
     */
    MediaResult<cv::Mat> decode(const std::string &path) const;

    /**
     * @brief Identify the decoder family by magic bytes, then by extension
     */
    static SourceFormat detectFormat(const std::string &path);

    /**
     * @brief Apply an EXIF orientation so that the result displays upright
     *
     * 1 identity, 2 mirror horizontal, 3 rotate 180, 4 mirror vertical,
     * 5 transpose, 6 rotate 90 CW, 7 transverse, 8 rotate 90 CCW.
     * Values outside 1-8 are treated as 1.
     */
    static cv::Mat applyOrientation(const cv::Mat &image, int orientation);

    /**
     * @brief Target size for a given width, height = round(width * h / w)
     */
    static cv::Size targetSize(const cv::Size &source, int target_width);

    static std::string formatName(SourceFormat format);

    size_t getGeneratedCount() const { return generated_count_.load(); }

private:
    MediaResult<cv::Mat> decodeHeic(const std::string &path) const;

    ThumbnailCache &cache_;
    std::shared_ptr<FrameSource> heic_decoder_;
    int jpeg_quality_;
    std::atomic<size_t> generated_count_{0};
};
