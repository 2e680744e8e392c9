#pragma once

#include "core/cancellation_token.hpp"
#include "core/decoder/frame_source.hpp"
#include "core/media_error.hpp"
#include "core/media_types.hpp"
#include <memory>
#include <string>

/**
 * @brief Reads duration, codec and dimensions of a video with one probe call
 *
 * capture_date always falls back to the file modification time. Camera and
 * GPS fields are never populated for video.
 */
class VideoMetadataReader
{
public:
    explicit VideoMetadataReader(std::shared_ptr<MediaProbe> probe);

    /**
     * @brief Extract metadata for one video
     * @return NO_VIDEO_STREAM for audio-only containers, DECODE_FAILURE for
     *         unreadable streams, EXTERNAL_TOOL_UNAVAILABLE without a prober
     */
    MediaResult<MediaMetadata> readVideo(const std::string &path, const CancellationToken *cancel = nullptr) const;

private:
    std::shared_ptr<MediaProbe> probe_;
};
