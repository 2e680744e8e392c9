#pragma once

#include "core/decoder/frame_source.hpp"
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief FrameSource backed by the ffmpeg command line tool
 *
 * The command seeks before opening the input, decodes with a single thread,
 * emits one frame and pipes it to stdout as PNG:
 *   ffmpeg -hide_banner -loglevel error -ss T -threads 1 -i PATH
 *          -frames:v 1 -an -f image2pipe -vcodec png pipe:1
 */
class FfmpegFrameSource : public FrameSource
{
public:
    explicit FfmpegFrameSource(const std::string &ffmpeg_path = "ffmpeg", int timeout_ms = 30000);

    MediaResult<std::vector<uint8_t>> extractFrame(const std::string &path, double timestamp_seconds,
                                                   const CancellationToken *cancel = nullptr) override;

    /**
     * @brief Same command with -noautorotate; EXIF orientation is applied downstream
     */
    MediaResult<std::vector<uint8_t>> extractStill(const std::string &path,
                                                   const CancellationToken *cancel = nullptr) override;

    bool isAvailable() override;

    /**
     * @brief First line of "ffmpeg -version", if the tool runs
     */
    std::optional<std::string> getVersion();

    /**
     * @brief Arguments for a single-frame extraction
     */
    std::vector<std::string> buildCommand(const std::string &path, double timestamp_seconds,
                                          bool autorotate = true) const;

    /**
     * @brief Map ffmpeg's stderr to a failure kind
     */
    static MediaErrorKind classifyFailure(const std::string &stderr_text);

    /**
     * @brief Best-effort codec name from an ffmpeg/ffprobe error message
     */
    static std::string extractCodecName(const std::string &stderr_text);

private:
    MediaResult<std::vector<uint8_t>> runExtraction(const std::string &path, double timestamp_seconds,
                                                    bool autorotate, const CancellationToken *cancel);

    std::string ffmpeg_path_;
    int timeout_ms_;
    std::once_flag availability_once_;
    bool available_ = false;
    std::optional<std::string> version_;
};

/**
 * @brief MediaProbe backed by ffprobe's JSON output
 *
 *   ffprobe -v error -print_format json -show_format -show_streams PATH
 */
class FfprobeMediaProbe : public MediaProbe
{
public:
    explicit FfprobeMediaProbe(const std::string &ffprobe_path = "ffprobe", int timeout_ms = 30000);

    MediaResult<ProbeInfo> probe(const std::string &path, const CancellationToken *cancel = nullptr) override;

    bool isAvailable() override;

    /**
     * @brief Parse ffprobe JSON into ProbeInfo
     * @return DECODE_FAILURE on malformed JSON
     */
    static MediaResult<ProbeInfo> parseProbeOutput(const std::string &json_text);

private:
    std::string ffprobe_path_;
    int timeout_ms_;
    std::once_flag availability_once_;
    bool available_ = false;
};
