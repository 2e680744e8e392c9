#include "core/video_metadata_reader.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"

VideoMetadataReader::VideoMetadataReader(std::shared_ptr<MediaProbe> probe) : probe_(std::move(probe))
{
}

MediaResult<MediaMetadata> VideoMetadataReader::readVideo(const std::string &path, const CancellationToken *cancel) const
{
    using Result = MediaResult<MediaMetadata>;

    auto file_info = FileUtils::getFileMetadata(path);
    if (!file_info)
    {
        return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Video file does not exist: " + path);
    }
    if (!probe_)
    {
        return Result::fail(MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE, "No media prober configured");
    }

    auto probed = probe_->probe(path, cancel);
    if (!probed.success)
    {
        Logger::warn("Probe failed for " + path + ": " + probed.error.message);
        return Result::fail(probed.error);
    }

    const ProbeInfo &info = probed.value;
    if (!info.has_video_stream)
    {
        return Result::fail(MediaErrorKind::NO_VIDEO_STREAM, "No video stream in " + path);
    }
    if (!info.has_duration)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, "Video duration unavailable: " + path);
    }
    if (info.width <= 0 || info.height <= 0)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, "Video dimensions unavailable: " + path);
    }

    MediaMetadata metadata;
    metadata.width = info.width;
    metadata.height = info.height;
    metadata.duration_seconds = info.duration_seconds;
    metadata.video_codec = info.codec_name.empty() ? std::string("unknown") : info.codec_name;
    metadata.file_size = file_info->file_size;
    metadata.file_modified = file_info->modification_time;
    metadata.capture_date = metadata.file_modified;

    Logger::debug("Video " + path + ": " + *metadata.video_codec + " " + std::to_string(info.width) + "x" +
                  std::to_string(info.height) + ", " + std::to_string(info.duration_seconds) + "s");
    return Result::ok(metadata);
}
