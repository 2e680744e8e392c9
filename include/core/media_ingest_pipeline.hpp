#pragma once

#include "core/cache/thumbnail_cache.hpp"
#include "core/cancellation_token.hpp"
#include "core/codec_performance_tracker.hpp"
#include "core/decoder/frame_source.hpp"
#include "core/directory_scanner.hpp"
#include "core/format_classifier.hpp"
#include "core/image_metadata_reader.hpp"
#include "core/image_thumbnailer.hpp"
#include "core/media_error.hpp"
#include "core/media_types.hpp"
#include "core/video_frame_extractor.hpp"
#include "core/video_metadata_reader.hpp"
#include "core/worker_pool.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Everything known about one successfully ingested file
 */
struct MediaRecord
{
    MediaFile file;
    std::string checksum;
    MediaMetadata metadata;
    ThumbnailPaths thumbnails;
};

struct IngestOutcome
{
    ScanOutcome scan;                  // Per-file processing failures are appended to scan.errors
    std::vector<MediaRecord> records;  // Sorted by path
    size_t skipped_videos = 0;         // Videos not processed because the video tools are missing
    std::string video_tool_error;      // Set once when skipped_videos > 0
};

/**
 * @brief Settings the pipeline is constructed with
 */
struct PipelineSettings
{
    std::string cache_root = "thumbnail_cache";
    FormatConfig formats = FormatConfig::defaults();
    size_t max_worker_threads = 0;
    int jpeg_quality = 85;
};

/**
 * @brief Scan, metadata extraction and thumbnail generation in one call
 *
 * Files are processed in parallel on the pipeline's worker pool. A failure
 * on one file never aborts the run; it is recorded in the outcome and the
 * next file is processed.
 */
class MediaIngestPipeline
{
public:
    /**
     * @brief Constructor
     * @param settings Cache location, allow-lists and concurrency
     * @param frame_source Video frame extractor (also used for HEIC stills); may be null
     * @param probe Video/HEIC prober; may be null
     */
    MediaIngestPipeline(const PipelineSettings &settings, std::shared_ptr<FrameSource> frame_source,
                        std::shared_ptr<MediaProbe> probe);

    /**
     * @brief Prepare the cache directory
     */
    MediaResult<bool> initialize();

    /**
     * @brief Ingest every media file under root
     * @param root_path Directory to scan
     * @param options Progress callback and cancellation; the cancellation token is
     *        also honored between files and inside decoder subprocesses
     * @return The outcome, or the scanner's error when the root is rejected
     */
    MediaResult<IngestOutcome> ingest(const std::string &root_path, const ScanOptions &options = ScanOptions());

    /**
     * @brief Process a single classified file
     */
    MediaResult<MediaRecord> processFile(const MediaFile &file, const CancellationToken *cancel = nullptr);

    /**
     * @brief True when both the frame source and the prober can run; checked once
     */
    bool videoToolsAvailable();

    ThumbnailCache &getCache() { return cache_; }
    CodecPerformanceTracker &getTracker() { return tracker_; }
    WorkerPool &getWorkerPool() { return pool_; }
    const FormatConfig &getFormats() const { return settings_.formats; }

private:
    MediaResult<MediaRecord> processImage(const MediaFile &file);
    MediaResult<MediaRecord> processVideo(const MediaFile &file, const CancellationToken *cancel);

    PipelineSettings settings_;
    std::shared_ptr<FrameSource> frame_source_;
    std::shared_ptr<MediaProbe> probe_;

    WorkerPool pool_;
    ThumbnailCache cache_;
    CodecPerformanceTracker tracker_;
    ImageThumbnailer thumbnailer_;
    ImageMetadataReader image_reader_;
    VideoMetadataReader video_reader_;
    VideoFrameExtractor video_extractor_;

    std::once_flag video_tools_once_;
    bool video_tools_available_ = false;
};
