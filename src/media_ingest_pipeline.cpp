#include "core/media_ingest_pipeline.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <tbb/blocked_range.h>
#include <tbb/concurrent_vector.h>
#include <tbb/parallel_for.h>

MediaIngestPipeline::MediaIngestPipeline(const PipelineSettings &settings, std::shared_ptr<FrameSource> frame_source,
                                         std::shared_ptr<MediaProbe> probe)
    : settings_(settings),
      frame_source_(std::move(frame_source)),
      probe_(std::move(probe)),
      pool_(settings.max_worker_threads),
      cache_(settings.cache_root),
      thumbnailer_(cache_, frame_source_, settings.jpeg_quality),
      image_reader_(probe_),
      video_reader_(probe_),
      video_extractor_(frame_source_, thumbnailer_, cache_, tracker_)
{
}

MediaResult<bool> MediaIngestPipeline::initialize()
{
    std::string problem = settings_.formats.validate();
    if (!problem.empty())
    {
        return MediaResult<bool>::fail(MediaErrorKind::UNSUPPORTED_FORMAT, problem);
    }
    return cache_.initialize();
}

bool MediaIngestPipeline::videoToolsAvailable()
{
    std::call_once(video_tools_once_, [this]()
                   {
        video_tools_available_ = frame_source_ && probe_ && frame_source_->isAvailable() && probe_->isAvailable();
        if (!video_tools_available_)
        {
            Logger::warn("Video tools are not available; video files will be skipped");
        } });
    return video_tools_available_;
}

MediaResult<MediaRecord> MediaIngestPipeline::processImage(const MediaFile &file)
{
    using Result = MediaResult<MediaRecord>;

    auto metadata = image_reader_.readImage(file.path);
    if (!metadata.success)
    {
        return Result::fail(metadata.error);
    }

    std::string checksum = FileUtils::computeFileHash(file.path);
    if (checksum.empty())
    {
        return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Cannot read " + file.path);
    }

    auto thumbnails = thumbnailer_.generate(file.path, checksum, metadata.value.orientation);
    if (!thumbnails.success)
    {
        return Result::fail(thumbnails.error);
    }

    MediaRecord record;
    record.file = file;
    record.checksum = checksum;
    record.metadata = metadata.value;
    record.thumbnails = thumbnails.value;
    return Result::ok(record);
}

MediaResult<MediaRecord> MediaIngestPipeline::processVideo(const MediaFile &file, const CancellationToken *cancel)
{
    using Result = MediaResult<MediaRecord>;

    auto metadata = video_reader_.readVideo(file.path, cancel);
    if (!metadata.success)
    {
        return Result::fail(metadata.error);
    }

    double duration = metadata.value.duration_seconds.value_or(0.0);
    std::string codec = metadata.value.video_codec.value_or("unknown");

    std::string checksum = FileUtils::computeFileHash(file.path);
    if (checksum.empty())
    {
        return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Cannot read " + file.path);
    }

    auto thumbnails = video_extractor_.generate(file.path, checksum, duration, codec, cancel);
    if (!thumbnails.success)
    {
        return Result::fail(thumbnails.error);
    }

    MediaRecord record;
    record.file = file;
    record.checksum = checksum;
    record.metadata = metadata.value;
    record.thumbnails = thumbnails.value;
    return Result::ok(record);
}

MediaResult<MediaRecord> MediaIngestPipeline::processFile(const MediaFile &file, const CancellationToken *cancel)
{
    if (isCancelled(cancel))
    {
        return MediaResult<MediaRecord>::fail(MediaErrorKind::CANCELLED, "Cancelled before processing " + file.path);
    }

    try
    {
        if (file.media_type == MediaType::VIDEO)
            return processVideo(file, cancel);
        return processImage(file);
    }
    catch (const std::exception &e)
    {
        Logger::error("Exception processing file: " + file.path + " - " + std::string(e.what()));
        return MediaResult<MediaRecord>::fail(MediaErrorKind::DECODE_FAILURE, e.what());
    }
}

MediaResult<IngestOutcome> MediaIngestPipeline::ingest(const std::string &root_path, const ScanOptions &options)
{
    auto start = std::chrono::steady_clock::now();

    DirectoryScanner scanner(&pool_);
    auto scanned = scanner.scan(root_path, settings_.formats, options);
    if (!scanned.success)
    {
        Logger::error("Ingest rejected root " + root_path + ": " + scanned.error.message);
        return MediaResult<IngestOutcome>::fail(scanned.error);
    }

    IngestOutcome outcome;
    outcome.scan = scanned.value;
    if (outcome.scan.cancelled)
    {
        return MediaResult<IngestOutcome>::ok(outcome);
    }

    const bool videos_enabled = outcome.scan.video_count == 0 || videoToolsAvailable();

    tbb::concurrent_vector<MediaRecord> records;
    tbb::concurrent_vector<ScanError> failures;
    std::atomic<size_t> skipped_videos{0};
    std::atomic<bool> cancelled{false};

    const std::vector<MediaFile> &files = outcome.scan.files;
    pool_.execute([&]()
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, files.size()),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              if (isCancelled(options.cancel))
                                              {
                                                  cancelled.store(true);
                                                  return;
                                              }

                                              const MediaFile &file = files[i];
                                              if (file.media_type == MediaType::VIDEO && !videos_enabled)
                                              {
                                                  skipped_videos.fetch_add(1);
                                                  continue;
                                              }

                                              auto result = processFile(file, options.cancel);
                                              if (result.success)
                                              {
                                                  records.push_back(std::move(result.value));
                                              }
                                              else if (result.error.kind == MediaErrorKind::CANCELLED)
                                              {
                                                  cancelled.store(true);
                                              }
                                              else
                                              {
                                                  Logger::warn("Failed to ingest " + file.path + ": " + result.error.message);
                                                  failures.push_back(ScanError{file.path,
                                                                               MediaErrors::getKindName(result.error.kind),
                                                                               result.error.message});
                                              }
                                          }
                                      }); });

    outcome.records.assign(records.begin(), records.end());
    std::sort(outcome.records.begin(), outcome.records.end(), [](const MediaRecord &a, const MediaRecord &b)
              { return a.file.path < b.file.path; });

    std::vector<ScanError> sorted_failures(failures.begin(), failures.end());
    std::sort(sorted_failures.begin(), sorted_failures.end(), [](const ScanError &a, const ScanError &b)
              { return a.path < b.path; });
    outcome.scan.errors.insert(outcome.scan.errors.end(), sorted_failures.begin(), sorted_failures.end());

    outcome.skipped_videos = skipped_videos.load();
    if (outcome.skipped_videos > 0)
    {
        outcome.video_tool_error = MediaErrors::userFriendlyMessage(
            MediaError{MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE, "ffmpeg/ffprobe not found"});
    }
    outcome.scan.cancelled = cancelled.load();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::info("Ingest of " + root_path + " finished in " + std::to_string(elapsed.count()) + "ms - " +
                 std::to_string(outcome.records.size()) + " ingested, " + std::to_string(sorted_failures.size()) +
                 " failed, " + std::to_string(outcome.skipped_videos) + " videos skipped" +
                 (outcome.scan.cancelled ? " (cancelled)" : ""));

    return MediaResult<IngestOutcome>::ok(outcome);
}
