#include "core/video_frame_extractor.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <chrono>

VideoFrameExtractor::VideoFrameExtractor(std::shared_ptr<FrameSource> frame_source, ImageThumbnailer &thumbnailer,
                                         ThumbnailCache &cache, CodecPerformanceTracker &tracker)
    : frame_source_(std::move(frame_source)), thumbnailer_(thumbnailer), cache_(cache), tracker_(tracker)
{
}

double VideoFrameExtractor::seekTimestamp(double duration_seconds)
{
    return duration_seconds >= SEEK_SECONDS ? SEEK_SECONDS : 0.0;
}

MediaResult<std::vector<uint8_t>> VideoFrameExtractor::extractWithRetry(const std::string &path, double timestamp,
                                                                        const CancellationToken *cancel)
{
    auto frame = frame_source_->extractFrame(path, timestamp, cancel);
    if (frame.success || frame.error.kind != MediaErrorKind::DECODE_FAILURE || timestamp <= 0.0)
        return frame;

    Logger::warn("Frame extraction at " + std::to_string(timestamp) + "s failed for " + path +
                 ", retrying at first frame: " + frame.error.message);
    return frame_source_->extractFrame(path, 0.0, cancel);
}

MediaResult<ThumbnailPaths> VideoFrameExtractor::generate(const std::string &path, double duration_seconds,
                                                          const std::string &codec_name,
                                                          const CancellationToken *cancel)
{
    using Result = MediaResult<ThumbnailPaths>;

    if (!frame_source_)
    {
        return Result::fail(MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE, "No frame source configured");
    }

    auto file_info = FileUtils::getFileMetadata(path);
    if (!file_info)
    {
        return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Video file does not exist: " + path);
    }

    std::string checksum = FileUtils::computeFileHash(path);
    if (checksum.empty())
    {
        return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Cannot read " + path);
    }

    return generate(path, checksum, duration_seconds, codec_name, cancel);
}

MediaResult<ThumbnailPaths> VideoFrameExtractor::generate(const std::string &path, const std::string &checksum,
                                                          double duration_seconds, const std::string &codec_name,
                                                          const CancellationToken *cancel)
{
    using Result = MediaResult<ThumbnailPaths>;

    if (!frame_source_)
    {
        return Result::fail(MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE, "No frame source configured");
    }

    auto file_info = FileUtils::getFileMetadata(path);
    if (!file_info)
    {
        return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Video file does not exist: " + path);
    }

    const double timestamp = seekTimestamp(duration_seconds);
    const std::string codec = codec_name.empty() ? "unknown" : codec_name;

    return cache_.getOrGenerate(path, checksum, file_info->modification_time, [&]()
                                {
        auto started = std::chrono::steady_clock::now();
        auto frame = extractWithRetry(path, timestamp, cancel);
        double elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

        if (frame.success)
        {
            auto rendered = thumbnailer_.renderFrame(frame.value);
            tracker_.record(codec, elapsed_ms, rendered.success);
            return rendered;
        }

        // An interrupted run says nothing about the codec
        if (frame.error.kind != MediaErrorKind::CANCELLED)
            tracker_.record(codec, elapsed_ms, false);
        if (frame.error.kind == MediaErrorKind::UNSUPPORTED_CODEC)
        {
            frame.error.message = "Unsupported codec '" + codec + "': " + frame.error.message;
        }
        Logger::warn("Video frame extraction failed for " + path + ": " + frame.error.message);
        return MediaResult<EncodedThumbnails>::fail(frame.error); });
}
