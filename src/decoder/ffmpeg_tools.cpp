#include "core/decoder/ffmpeg_tools.hpp"
#include "core/subprocess.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <regex>
#include <sstream>
#include <utility>

namespace
{
    std::string toLower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string firstLine(const std::string &text)
    {
        size_t end = text.find('\n');
        std::string line = text.substr(0, end);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        return line;
    }

    std::string lastLine(const std::string &text)
    {
        std::string trimmed = text;
        while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r'))
            trimmed.pop_back();
        size_t start = trimmed.find_last_of('\n');
        return start == std::string::npos ? trimmed : trimmed.substr(start + 1);
    }

    std::optional<double> parseDuration(const nlohmann::json &node)
    {
        if (!node.contains("duration"))
            return std::nullopt;
        const auto &value = node["duration"];
        try
        {
            double seconds = value.is_string() ? std::stod(value.get<std::string>()) : value.get<double>();
            if (seconds >= 0.0)
                return seconds;
        }
        catch (const std::exception &e)
        {
            Logger::debug(std::string("Unparsable duration in probe output: ") + e.what());
        }
        return std::nullopt;
    }

    /**
     * @brief Display rotation in degrees, normalized to [0, 360)
     *
     * Newer ffprobe reports a "Display Matrix" side data entry; older
     * builds put the angle in tags.rotate.
     */
    int parseRotation(const nlohmann::json &stream)
    {
        double degrees = 0.0;
        try
        {
            if (stream.contains("side_data_list") && stream["side_data_list"].is_array())
            {
                for (const auto &side_data : stream["side_data_list"])
                {
                    if (side_data.contains("rotation") && side_data["rotation"].is_number())
                    {
                        degrees = side_data["rotation"].get<double>();
                        break;
                    }
                }
            }
            if (degrees == 0.0 && stream.contains("tags") && stream["tags"].contains("rotate"))
            {
                const auto &rotate = stream["tags"]["rotate"];
                degrees = rotate.is_string() ? std::stod(rotate.get<std::string>()) : rotate.get<double>();
            }
        }
        catch (const std::exception &e)
        {
            Logger::debug(std::string("Unparsable rotation in probe output: ") + e.what());
            return 0;
        }

        int normalized = static_cast<int>(std::lround(degrees)) % 360;
        return normalized < 0 ? normalized + 360 : normalized;
    }
}

// FfmpegFrameSource

FfmpegFrameSource::FfmpegFrameSource(const std::string &ffmpeg_path, int timeout_ms)
    : ffmpeg_path_(ffmpeg_path), timeout_ms_(timeout_ms)
{
}

bool FfmpegFrameSource::isAvailable()
{
    std::call_once(availability_once_, [this]()
                   {
        SubprocessResult result = Subprocess::run({ffmpeg_path_, "-version"}, nullptr, 10000);
        available_ = result.succeeded();
        if (available_)
        {
            std::string output(result.stdout_data.begin(), result.stdout_data.end());
            version_ = firstLine(output);
            Logger::info("FFmpeg detected: " + *version_);
        }
        else
        {
            Logger::warn("FFmpeg not available at '" + ffmpeg_path_ + "'; video thumbnails disabled");
        } });
    return available_;
}

std::optional<std::string> FfmpegFrameSource::getVersion()
{
    isAvailable();
    return version_;
}

std::vector<std::string> FfmpegFrameSource::buildCommand(const std::string &path, double timestamp_seconds,
                                                         bool autorotate) const
{
    std::ostringstream seek;
    seek << std::fixed << std::setprecision(3) << timestamp_seconds;

    std::vector<std::string> command = {ffmpeg_path_,
                                        "-hide_banner",
                                        "-loglevel", "error",
                                        "-ss", seek.str(),
                                        "-threads", "1"};
    // Input option, must precede -i
    if (!autorotate)
        command.push_back("-noautorotate");
    command.insert(command.end(), {"-i", path,
                                   "-frames:v", "1",
                                   "-an",
                                   "-f", "image2pipe",
                                   "-vcodec", "png",
                                   "pipe:1"});
    return command;
}

MediaResult<std::vector<uint8_t>> FfmpegFrameSource::extractFrame(const std::string &path, double timestamp_seconds,
                                                                  const CancellationToken *cancel)
{
    return runExtraction(path, timestamp_seconds, true, cancel);
}

MediaResult<std::vector<uint8_t>> FfmpegFrameSource::extractStill(const std::string &path,
                                                                  const CancellationToken *cancel)
{
    return runExtraction(path, 0.0, false, cancel);
}

MediaResult<std::vector<uint8_t>> FfmpegFrameSource::runExtraction(const std::string &path, double timestamp_seconds,
                                                                   bool autorotate, const CancellationToken *cancel)
{
    using Result = MediaResult<std::vector<uint8_t>>;

    if (!isAvailable())
    {
        return Result::fail(MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE, "ffmpeg not found: " + ffmpeg_path_);
    }

    SubprocessResult run = Subprocess::run(buildCommand(path, timestamp_seconds, autorotate), cancel, timeout_ms_);
    if (!run.launched)
    {
        return Result::fail(MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE, run.error_message);
    }
    if (run.cancelled)
    {
        return Result::fail(MediaErrorKind::CANCELLED, "Frame extraction cancelled: " + path);
    }
    if (run.timed_out)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, "Frame extraction timed out: " + path);
    }

    if (run.exit_code != 0 || run.stdout_data.empty())
    {
        MediaErrorKind kind = classifyFailure(run.stderr_text);
        std::string detail = lastLine(run.stderr_text);
        if (detail.empty())
            detail = run.exit_code != 0 ? "ffmpeg exited with code " + std::to_string(run.exit_code)
                                        : "ffmpeg produced no frame";
        if (kind == MediaErrorKind::UNSUPPORTED_CODEC)
        {
            std::string codec = extractCodecName(run.stderr_text);
            if (!codec.empty())
                detail = "codec " + codec + ": " + detail;
        }
        Logger::debug("ffmpeg failed for " + path + " at " + std::to_string(timestamp_seconds) + "s: " + detail);
        return Result::fail(kind, detail);
    }

    return Result::ok(std::move(run.stdout_data));
}

MediaErrorKind FfmpegFrameSource::classifyFailure(const std::string &stderr_text)
{
    const std::string text = toLower(stderr_text);

    if (text.find("does not contain any stream") != std::string::npos ||
        text.find("matches no streams") != std::string::npos ||
        text.find("no video stream") != std::string::npos)
        return MediaErrorKind::NO_VIDEO_STREAM;

    if (text.find("decoder (codec") != std::string::npos ||
        text.find("unknown decoder") != std::string::npos ||
        text.find("unsupported codec") != std::string::npos ||
        text.find("codec not currently supported") != std::string::npos ||
        text.find("no decoder for") != std::string::npos)
        return MediaErrorKind::UNSUPPORTED_CODEC;

    if (text.find("no such file or directory") != std::string::npos ||
        text.find("permission denied") != std::string::npos)
        return MediaErrorKind::UNREADABLE_FILE;

    return MediaErrorKind::DECODE_FAILURE;
}

std::string FfmpegFrameSource::extractCodecName(const std::string &stderr_text)
{
    static const std::regex codec_pattern(R"(codec[ :]+([A-Za-z0-9_]+))");
    std::smatch match;
    if (std::regex_search(stderr_text, match, codec_pattern))
        return match[1].str();
    return "";
}

// FfprobeMediaProbe

FfprobeMediaProbe::FfprobeMediaProbe(const std::string &ffprobe_path, int timeout_ms)
    : ffprobe_path_(ffprobe_path), timeout_ms_(timeout_ms)
{
}

bool FfprobeMediaProbe::isAvailable()
{
    std::call_once(availability_once_, [this]()
                   {
        available_ = Subprocess::isAvailable(ffprobe_path_);
        if (!available_)
            Logger::warn("ffprobe not available at '" + ffprobe_path_ + "'; video metadata disabled"); });
    return available_;
}

MediaResult<ProbeInfo> FfprobeMediaProbe::probe(const std::string &path, const CancellationToken *cancel)
{
    using Result = MediaResult<ProbeInfo>;

    if (!isAvailable())
    {
        return Result::fail(MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE, "ffprobe not found: " + ffprobe_path_);
    }

    std::vector<std::string> command = {ffprobe_path_, "-v", "error", "-print_format", "json",
                                        "-show_format", "-show_streams", path};
    SubprocessResult run = Subprocess::run(command, cancel, timeout_ms_);
    if (!run.launched)
    {
        return Result::fail(MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE, run.error_message);
    }
    if (run.cancelled)
    {
        return Result::fail(MediaErrorKind::CANCELLED, "Probe cancelled: " + path);
    }
    if (run.timed_out)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, "Probe timed out: " + path);
    }
    if (run.exit_code != 0)
    {
        MediaErrorKind kind = FfmpegFrameSource::classifyFailure(run.stderr_text);
        if (kind == MediaErrorKind::NO_VIDEO_STREAM)
            kind = MediaErrorKind::DECODE_FAILURE;
        std::string detail = lastLine(run.stderr_text);
        return Result::fail(kind, detail.empty() ? "ffprobe exited with code " + std::to_string(run.exit_code) : detail);
    }

    return parseProbeOutput(std::string(run.stdout_data.begin(), run.stdout_data.end()));
}

MediaResult<ProbeInfo> FfprobeMediaProbe::parseProbeOutput(const std::string &json_text)
{
    using Result = MediaResult<ProbeInfo>;

    nlohmann::json root;
    try
    {
        root = nlohmann::json::parse(json_text);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, std::string("Malformed ffprobe output: ") + e.what());
    }

    ProbeInfo info;
    try
    {
        if (root.contains("streams") && root["streams"].is_array())
        {
            for (const auto &stream : root["streams"])
            {
                if (stream.value("codec_type", "") != "video")
                    continue;
                // Cover art embedded in audio files is reported as a video stream
                if (stream.contains("disposition") && stream["disposition"].value("attached_pic", 0) == 1)
                    continue;

                info.has_video_stream = true;
                info.codec_name = stream.value("codec_name", "");
                info.width = stream.value("width", 0);
                info.height = stream.value("height", 0);
                info.rotation = parseRotation(stream);
                // ffmpeg auto-rotates decoded frames, so report what it will produce
                if (info.rotation == 90 || info.rotation == 270)
                    std::swap(info.width, info.height);
                if (auto stream_duration = parseDuration(stream))
                {
                    info.duration_seconds = *stream_duration;
                    info.has_duration = true;
                }
                break;
            }
        }

        if (root.contains("format"))
        {
            if (auto format_duration = parseDuration(root["format"]))
            {
                info.duration_seconds = *format_duration;
                info.has_duration = true;
            }
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, std::string("Unexpected ffprobe output: ") + e.what());
    }

    return Result::ok(info);
}
