#pragma once

#include "core/cancellation_token.hpp"
#include "core/media_error.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Stream facts returned by a single probe round-trip
 */
struct ProbeInfo
{
    bool has_video_stream = false;
    double duration_seconds = 0.0;
    bool has_duration = false;
    std::string codec_name;
    int width = 0;  // Display size, already swapped for a 90/270 rotation
    int height = 0;
    int rotation = 0; // Display rotation in degrees, 0-359
};

/**
 * @brief "Given a video path and a timestamp, return one decoded frame's bytes or fail"
 *
 * Frame bytes are an encoded still image (PNG) that OpenCV can decode.
 * Failures use NO_VIDEO_STREAM, UNSUPPORTED_CODEC, DECODE_FAILURE,
 * UNREADABLE_FILE, EXTERNAL_TOOL_UNAVAILABLE or CANCELLED.
 */
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    virtual MediaResult<std::vector<uint8_t>> extractFrame(const std::string &path, double timestamp_seconds,
                                                           const CancellationToken *cancel = nullptr) = 0;

    /**
     * @brief Decode the first frame of a still-image container (HEIC)
     *
     * The caller applies the EXIF orientation itself, so implementations
     * must not rotate the frame.
     */
    virtual MediaResult<std::vector<uint8_t>> extractStill(const std::string &path,
                                                           const CancellationToken *cancel = nullptr)
    {
        return extractFrame(path, 0.0, cancel);
    }

    /**
     * @brief Whether the backing decoder can run at all; checked once and cached
     */
    virtual bool isAvailable() = 0;
};

/**
 * @brief "Given a media path, return duration, codec and dimensions in one call"
 */
class MediaProbe
{
public:
    virtual ~MediaProbe() = default;

    virtual MediaResult<ProbeInfo> probe(const std::string &path, const CancellationToken *cancel = nullptr) = 0;

    virtual bool isAvailable() = 0;
};
