#pragma once

#include "core/cache/thumbnail_cache.hpp"
#include "core/cancellation_token.hpp"
#include "core/codec_performance_tracker.hpp"
#include "core/decoder/frame_source.hpp"
#include "core/image_thumbnailer.hpp"
#include "core/media_error.hpp"
#include "core/media_types.hpp"
#include <memory>
#include <string>

/**
 * @brief Thumbnails for videos from a single representative frame
 *
 * The frame is taken at 5s for videos at least 5s long, otherwise at 0s.
 * A corrupt stream at the seek point is retried once at the first frame.
 * Each extraction run is reported to the CodecPerformanceTracker.
 */
class VideoFrameExtractor
{
public:
    static constexpr double SEEK_SECONDS = 5.0;

    VideoFrameExtractor(std::shared_ptr<FrameSource> frame_source, ImageThumbnailer &thumbnailer,
                        ThumbnailCache &cache, CodecPerformanceTracker &tracker);

    /**
     * @brief Generate (or fetch cached) thumbnails for a video
     * @param path Video file
     * @param duration_seconds Duration reported by VideoMetadataReader
     * @param codec_name Codec reported by VideoMetadataReader, used for statistics
     * @param cancel Kills the decoder subprocess promptly when fired
     */
    MediaResult<ThumbnailPaths> generate(const std::string &path, double duration_seconds,
                                         const std::string &codec_name,
                                         const CancellationToken *cancel = nullptr);

    /**
     * @brief Same, for a caller that has already hashed the file
     */
    MediaResult<ThumbnailPaths> generate(const std::string &path, const std::string &checksum,
                                         double duration_seconds, const std::string &codec_name,
                                         const CancellationToken *cancel = nullptr);

    /**
     * @brief Seek position for a video of the given duration
     */
    static double seekTimestamp(double duration_seconds);

private:
    MediaResult<std::vector<uint8_t>> extractWithRetry(const std::string &path, double timestamp,
                                                       const CancellationToken *cancel);

    std::shared_ptr<FrameSource> frame_source_;
    ImageThumbnailer &thumbnailer_;
    ThumbnailCache &cache_;
    CodecPerformanceTracker &tracker_;
};
