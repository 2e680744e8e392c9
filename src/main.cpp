#include "core/decoder/ffmpeg_tools.hpp"
#include "core/media_ingest_pipeline.hpp"
#include "core/pipeline_config.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace
{
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_BAD_ARGS = 1;
    constexpr int EXIT_ROOT_REJECTED = 2;
    constexpr int EXIT_CANCELLED = 130;

    CancellationToken g_cancel;

    // Only touches a lock-free atomic
    void handleSignal(int)
    {
        g_cancel.cancel();
    }

    void printUsage(const char *program)
    {
        std::cout << "Media Ingest - scan a directory tree and build its thumbnail cache" << std::endl;
        std::cout << "Usage: " << program << " [options] <root>" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config FILE      Load configuration from a JSON file" << std::endl;
        std::cout << "  --cache DIR        Thumbnail cache directory" << std::endl;
        std::cout << "  --threads N        Worker threads (0 = hardware concurrency)" << std::endl;
        std::cout << "  --log-level L      TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --stats            Include per-codec extraction statistics" << std::endl;
        std::cout << "  --clear-cache      Empty the cache before ingesting" << std::endl;
        std::cout << "  --help, -h         Show this help message" << std::endl;
    }

    std::string formatTime(const std::chrono::system_clock::time_point &tp)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return buf;
    }

    nlohmann::json recordToJson(const MediaRecord &record)
    {
        const MediaMetadata &md = record.metadata;
        nlohmann::json j = {
            {"path", record.file.path},
            {"type", mediaTypeName(record.file.media_type)},
            {"checksum", record.checksum},
            {"width", md.width},
            {"height", md.height},
            {"orientation", md.orientation},
            {"file_size", md.file_size},
            {"thumbnails", {{"small", record.thumbnails.small}, {"medium", record.thumbnails.medium}}}};

        if (md.capture_date)
            j["capture_date"] = formatTime(*md.capture_date);
        if (md.camera_make)
            j["camera_make"] = *md.camera_make;
        if (md.camera_model)
            j["camera_model"] = *md.camera_model;
        if (md.gps_latitude && md.gps_longitude)
            j["gps"] = {{"latitude", *md.gps_latitude}, {"longitude", *md.gps_longitude}};
        if (md.duration_seconds)
            j["duration_seconds"] = *md.duration_seconds;
        if (md.video_codec)
            j["video_codec"] = *md.video_codec;
        return j;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path;
    std::string cache_override;
    std::string level_override;
    std::string root;
    long threads_override = -1;
    bool show_stats = false;
    bool clear_cache = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        auto needValue = [&](const std::string &flag) -> const char *
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << flag << " requires a value" << std::endl;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return EXIT_OK;
        }
        else if (arg == "--config" || arg == "--cache" || arg == "--threads" || arg == "--log-level")
        {
            const char *value = needValue(arg);
            if (!value)
                return EXIT_BAD_ARGS;
            if (arg == "--config")
                config_path = value;
            else if (arg == "--cache")
                cache_override = value;
            else if (arg == "--log-level")
                level_override = value;
            else
            {
                try
                {
                    threads_override = std::stol(value);
                }
                catch (const std::exception &)
                {
                    std::cerr << "Error: --threads expects a number, got '" << value << "'" << std::endl;
                    return EXIT_BAD_ARGS;
                }
                if (threads_override < 0)
                {
                    std::cerr << "Error: --threads must not be negative" << std::endl;
                    return EXIT_BAD_ARGS;
                }
            }
        }
        else if (arg == "--stats")
        {
            show_stats = true;
        }
        else if (arg == "--clear-cache")
        {
            clear_cache = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return EXIT_BAD_ARGS;
        }
        else if (root.empty())
        {
            root = arg;
        }
        else
        {
            std::cerr << "Error: only one root directory may be given" << std::endl;
            return EXIT_BAD_ARGS;
        }
    }

    if (root.empty())
    {
        printUsage(argv[0]);
        return EXIT_BAD_ARGS;
    }

    PipelineConfig config;
    if (!config_path.empty() && !config.load(config_path))
    {
        std::cerr << "Error: cannot load configuration from " << config_path << std::endl;
        return EXIT_BAD_ARGS;
    }

    std::string log_level = level_override.empty() ? config.getLogLevel() : level_override;
    if (!Logger::isValidLevel(log_level))
    {
        std::cerr << "Error: invalid log level '" << log_level << "'" << std::endl;
        return EXIT_BAD_ARGS;
    }
    Logger::init(log_level);
    if (!config.getLogFile().empty())
    {
        Logger::enableFileLogging(config.getLogFile());
    }

    if (threads_override > 0 && !WorkerPool::validateThreadCount(static_cast<size_t>(threads_override)))
    {
        std::cerr << "Error: --threads must be between " << WorkerPool::MIN_THREADS << " and "
                  << WorkerPool::MAX_THREADS << std::endl;
        return EXIT_BAD_ARGS;
    }

    PipelineSettings settings;
    settings.cache_root = cache_override.empty() ? config.getCacheRoot() : cache_override;
    settings.formats = config.getFormatConfig();
    settings.max_worker_threads = threads_override >= 0 ? static_cast<size_t>(threads_override)
                                                        : static_cast<size_t>(std::max(0, config.getMaxWorkerThreads()));
    settings.jpeg_quality = config.getJpegQuality();

    auto frame_source = std::make_shared<FfmpegFrameSource>(config.getFfmpegPath(), config.getVideoTimeoutMs());
    auto probe = std::make_shared<FfprobeMediaProbe>(config.getFfprobePath(), config.getVideoTimeoutMs());

    MediaIngestPipeline pipeline(settings, frame_source, probe);
    auto ready = pipeline.initialize();
    if (!ready.success)
    {
        std::cerr << "Error: " << MediaErrors::userFriendlyMessage(ready.error) << std::endl;
        return EXIT_BAD_ARGS;
    }

    if (clear_cache)
    {
        size_t removed = pipeline.getCache().clear();
        Logger::info("Cleared " + std::to_string(removed) + " cached thumbnails");
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    ScanOptions options;
    options.progress_interval = static_cast<size_t>(std::max(1, config.getProgressInterval()));
    options.cancel = &g_cancel;
    options.on_progress = [](const ScanProgress &progress)
    {
        Logger::info("Scan progress: " + std::to_string(progress.files_found) + " files in " +
                     std::to_string(progress.directories_visited) + " directories");
    };

    Logger::info("Starting ingest of " + root + " (cache: " + settings.cache_root + ", threads: " +
                 std::to_string(pipeline.getWorkerPool().getThreadCount()) + ")");

    auto result = pipeline.ingest(root, options);
    if (!result.success)
    {
        nlohmann::json failure = {
            {"error", MediaErrors::getKindName(result.error.kind)},
            {"detail", result.error.message},
            {"message", MediaErrors::userFriendlyMessage(result.error)}};
        std::cout << failure.dump(2) << std::endl;
        return EXIT_ROOT_REJECTED;
    }

    const IngestOutcome &outcome = result.value;
    nlohmann::json summary;
    summary["root"] = root;
    summary["images"] = outcome.scan.image_count;
    summary["videos"] = outcome.scan.video_count;
    summary["ingested"] = outcome.records.size();
    summary["cancelled"] = outcome.scan.cancelled;
    summary["skipped_videos"] = outcome.skipped_videos;
    if (!outcome.video_tool_error.empty())
        summary["video_tool_error"] = outcome.video_tool_error;

    summary["errors"] = nlohmann::json::array();
    for (const auto &err : outcome.scan.errors)
    {
        summary["errors"].push_back({{"path", err.path}, {"error", err.message}, {"detail", err.detail}});
    }

    summary["files"] = nlohmann::json::array();
    for (const auto &record : outcome.records)
    {
        summary["files"].push_back(recordToJson(record));
    }

    summary["cache"] = {
        {"root", pipeline.getCache().getRoot()},
        {"size", pipeline.getCache().getCacheSizeString()},
        {"hits", pipeline.getCache().getHits()},
        {"misses", pipeline.getCache().getMisses()},
        {"generated", pipeline.getCache().getGenerations()}};

    if (show_stats)
    {
        summary["codec_stats"] = nlohmann::json::array();
        for (const auto &stat : pipeline.getTracker().snapshot())
        {
            summary["codec_stats"].push_back({{"codec", stat.codec_name},
                                              {"samples", stat.sample_count},
                                              {"successes", stat.success_count},
                                              {"avg_time_ms", stat.avgTimeMs()},
                                              {"success_rate", stat.successRate()}});
        }
    }

    std::cout << summary.dump(2) << std::endl;
    return outcome.scan.cancelled ? EXIT_CANCELLED : EXIT_OK;
}
