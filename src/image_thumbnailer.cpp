#include "core/image_thumbnailer.hpp"
#include "core/decoder/raw_decoder.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <unistd.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <set>

namespace
{
    const std::set<std::string> &rawExtensions()
    {
        static const std::set<std::string> extensions = {"raw", "cr2", "cr3", "nef", "nrw", "dng", "arw", "srf",
                                                         "sr2", "orf", "rw2", "raf", "pef", "srw", "3fr", "kdc"};
        return extensions;
    }

    const std::set<std::string> &videoExtensions()
    {
        static const std::set<std::string> extensions = {"mp4", "mov", "avi", "mkv", "webm", "flv", "wmv",
                                                         "m4v", "mpg", "mpeg", "3gp"};
        return extensions;
    }

    bool startsWith(const std::vector<uint8_t> &header, const std::vector<uint8_t> &magic, size_t offset = 0)
    {
        return header.size() >= offset + magic.size() &&
               std::equal(magic.begin(), magic.end(), header.begin() + static_cast<std::ptrdiff_t>(offset));
    }

    // Normalise decoder output to 8-bit BGR
    cv::Mat toBgr8(const cv::Mat &image)
    {
        cv::Mat bgr;
        switch (image.channels())
        {
        case 1:
            cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
            break;
        case 4:
            cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
            break;
        default:
            bgr = image;
            break;
        }
        if (bgr.depth() != CV_8U)
        {
            cv::Mat converted;
            double scale = bgr.depth() == CV_16U ? 1.0 / 257.0 : 1.0;
            bgr.convertTo(converted, CV_8U, scale);
            bgr = converted;
        }
        return bgr;
    }
}

ImageThumbnailer::ImageThumbnailer(ThumbnailCache &cache, std::shared_ptr<FrameSource> heic_decoder, int jpeg_quality)
    : cache_(cache), heic_decoder_(std::move(heic_decoder)), jpeg_quality_(std::clamp(jpeg_quality, 1, 100))
{
}

SourceFormat ImageThumbnailer::detectFormat(const std::string &path)
{
    const std::string ext = FileUtils::getFileExtension(path);
    const std::vector<uint8_t> header = FileUtils::readHeader(path, 16);

    if (startsWith(header, {0xFF, 0xD8, 0xFF}))
        return SourceFormat::JPEG;
    if (startsWith(header, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A}))
        return SourceFormat::PNG;
    if (startsWith(header, {'f', 't', 'y', 'p'}, 4) && header.size() >= 12)
    {
        std::string brand(header.begin() + 8, header.begin() + 12);
        if (brand == "heic" || brand == "heix" || brand == "hevc" || brand == "hevx" ||
            brand == "mif1" || brand == "msf1" || brand == "heim" || brand == "heis")
            return SourceFormat::HEIC;
        return SourceFormat::VIDEO;
    }

    // TIFF containers are shared by most camera RAW formats
    bool tiff = startsWith(header, {'I', 'I', 0x2A, 0x00}) || startsWith(header, {'M', 'M', 0x00, 0x2A});
    if (rawExtensions().count(ext) > 0)
        return SourceFormat::RAW;
    if (tiff)
        return SourceFormat::OTHER_RASTER;

    if (startsWith(header, {'R', 'I', 'F', 'F'}) && startsWith(header, {'W', 'E', 'B', 'P'}, 8))
        return SourceFormat::OTHER_RASTER;
    if (startsWith(header, {'G', 'I', 'F', '8'}) || startsWith(header, {'B', 'M'}))
        return SourceFormat::OTHER_RASTER;

    // Unrecognised signature: fall back to the extension
    if (ext == "jpg" || ext == "jpeg")
        return SourceFormat::JPEG;
    if (ext == "png")
        return SourceFormat::PNG;
    if (ext == "heic" || ext == "heif")
        return SourceFormat::HEIC;
    if (videoExtensions().count(ext) > 0)
        return SourceFormat::VIDEO;
    if (ext == "webp" || ext == "gif" || ext == "bmp" || ext == "tif" || ext == "tiff")
        return SourceFormat::OTHER_RASTER;
    return SourceFormat::UNKNOWN;
}

std::string ImageThumbnailer::formatName(SourceFormat format)
{
    switch (format)
    {
    case SourceFormat::JPEG:
        return "JPEG";
    case SourceFormat::PNG:
        return "PNG";
    case SourceFormat::HEIC:
        return "HEIC";
    case SourceFormat::RAW:
        return "RAW";
    case SourceFormat::VIDEO:
        return "VIDEO";
    case SourceFormat::OTHER_RASTER:
        return "RASTER";
    default:
        return "UNKNOWN";
    }
}

MediaResult<cv::Mat> ImageThumbnailer::decode(const std::string &path) const
{
    using Result = MediaResult<cv::Mat>;

    SourceFormat format = detectFormat(path);
    try
    {
        switch (format)
        {
        case SourceFormat::JPEG:
        case SourceFormat::PNG:
        case SourceFormat::OTHER_RASTER:
        {
            // Orientation is applied explicitly below, never by OpenCV
            cv::Mat image = cv::imread(path, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
            if (image.empty())
            {
                if (access(path.c_str(), R_OK) != 0)
                    return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Cannot read " + path);
                return Result::fail(MediaErrorKind::DECODE_FAILURE, "Failed to decode image: " + path);
            }
            return Result::ok(image);
        }
        case SourceFormat::RAW:
            return RawDecoder::decode(path, true);
        case SourceFormat::HEIC:
            return decodeHeic(path);
        case SourceFormat::VIDEO:
        case SourceFormat::UNKNOWN:
        default:
            return Result::fail(MediaErrorKind::UNSUPPORTED_FORMAT,
                                "No still-image decoder for " + path + " (" + formatName(format) + ")");
        }
    }
    catch (const cv::Exception &e)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, "OpenCV error decoding " + path + ": " + e.what());
    }
}

MediaResult<cv::Mat> ImageThumbnailer::decodeHeic(const std::string &path) const
{
    using Result = MediaResult<cv::Mat>;

    if (!heic_decoder_)
    {
        return Result::fail(MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE, "No HEIC decoder configured for " + path);
    }

    auto frame = heic_decoder_->extractStill(path);
    if (!frame.success)
    {
        if (frame.error.kind == MediaErrorKind::NO_VIDEO_STREAM)
            return Result::fail(MediaErrorKind::DECODE_FAILURE, "HEIC without image data: " + path);
        return Result::fail(frame.error);
    }

    cv::Mat image = cv::imdecode(frame.value, cv::IMREAD_COLOR);
    if (image.empty())
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, "Failed to decode HEIC frame: " + path);
    }
    return Result::ok(image);
}

cv::Mat ImageThumbnailer::applyOrientation(const cv::Mat &image, int orientation)
{
    cv::Mat result;
    switch (orientation)
    {
    case 2:
        cv::flip(image, result, 1);
        break;
    case 3:
        cv::rotate(image, result, cv::ROTATE_180);
        break;
    case 4:
        cv::flip(image, result, 0);
        break;
    case 5:
        cv::transpose(image, result);
        break;
    case 6:
        cv::rotate(image, result, cv::ROTATE_90_CLOCKWISE);
        break;
    case 7:
    {
        cv::Mat rotated;
        cv::rotate(image, rotated, cv::ROTATE_90_COUNTERCLOCKWISE);
        cv::flip(rotated, result, 1);
        break;
    }
    case 8:
        cv::rotate(image, result, cv::ROTATE_90_COUNTERCLOCKWISE);
        break;
    case 1:
        result = image;
        break;
    default:
        Logger::debug("Ignoring invalid orientation value " + std::to_string(orientation));
        result = image;
        break;
    }
    return result;
}

cv::Size ImageThumbnailer::targetSize(const cv::Size &source, int target_width)
{
    if (source.width <= 0 || source.height <= 0)
        return cv::Size(0, 0);
    int height = static_cast<int>(std::lround(static_cast<double>(target_width) * source.height / source.width));
    return cv::Size(target_width, std::max(1, height));
}

MediaResult<EncodedThumbnails> ImageThumbnailer::renderThumbnails(const cv::Mat &upright) const
{
    using Result = MediaResult<EncodedThumbnails>;

    if (upright.empty())
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, "Empty image");
    }

    try
    {
        cv::Mat bgr = toBgr8(upright);
        const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality_};

        EncodedThumbnails encoded;
        for (SizeClass size : {SizeClass::SMALL, SizeClass::MEDIUM})
        {
            cv::Mat resized;
            cv::resize(bgr, resized, targetSize(bgr.size(), ThumbnailSizes::widthFor(size)), 0, 0, cv::INTER_LANCZOS4);

            std::vector<uint8_t> &out = size == SizeClass::SMALL ? encoded.small : encoded.medium;
            if (!cv::imencode(".jpg", resized, out, params))
            {
                return Result::fail(MediaErrorKind::DECODE_FAILURE, "JPEG encoding failed");
            }
        }
        return Result::ok(std::move(encoded));
    }
    catch (const cv::Exception &e)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, std::string("OpenCV error rendering thumbnails: ") + e.what());
    }
}

MediaResult<EncodedThumbnails> ImageThumbnailer::renderFrame(const std::vector<uint8_t> &frame_bytes) const
{
    cv::Mat frame;
    try
    {
        frame = cv::imdecode(frame_bytes, cv::IMREAD_COLOR);
    }
    catch (const cv::Exception &e)
    {
        return MediaResult<EncodedThumbnails>::fail(MediaErrorKind::DECODE_FAILURE,
                                                    std::string("Failed to decode frame: ") + e.what());
    }
    if (frame.empty())
    {
        return MediaResult<EncodedThumbnails>::fail(MediaErrorKind::DECODE_FAILURE, "Failed to decode frame");
    }
    return renderThumbnails(frame);
}

MediaResult<ThumbnailPaths> ImageThumbnailer::generate(const std::string &path, int orientation)
{
    using Result = MediaResult<ThumbnailPaths>;

    auto file_info = FileUtils::getFileMetadata(path);
    if (!file_info)
    {
        return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Source image does not exist: " + path);
    }

    std::string checksum = FileUtils::computeFileHash(path);
    if (checksum.empty())
    {
        return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Cannot read " + path);
    }

    return generate(path, checksum, orientation);
}

MediaResult<ThumbnailPaths> ImageThumbnailer::generate(const std::string &path, const std::string &checksum,
                                                       int orientation)
{
    using Result = MediaResult<ThumbnailPaths>;

    auto file_info = FileUtils::getFileMetadata(path);
    if (!file_info)
    {
        return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Source image does not exist: " + path);
    }

    return cache_.getOrGenerate(path, checksum, file_info->modification_time, [this, &path, orientation]()
                                {
        auto decoded = decode(path);
        if (!decoded.success)
        {
            Logger::warn("Thumbnail decode failed for " + path + ": " + decoded.error.message);
            return MediaResult<EncodedThumbnails>::fail(decoded.error);
        }
        generated_count_++;
        return renderThumbnails(applyOrientation(decoded.value, orientation)); });
}
