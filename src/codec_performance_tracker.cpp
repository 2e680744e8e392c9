#include "core/codec_performance_tracker.hpp"
#include "logging/logger.hpp"

void CodecPerformanceTracker::record(const std::string &codec_name, double elapsed_ms, bool success)
{
    std::lock_guard<std::mutex> lock(mutex_);
    CodecStat &stat = stats_[codec_name];
    if (stat.codec_name.empty())
        stat.codec_name = codec_name;
    stat.total_time_ms += elapsed_ms;
    stat.sample_count++;
    if (success)
        stat.success_count++;
}

std::vector<CodecStat> CodecPerformanceTracker::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CodecStat> result;
    result.reserve(stats_.size());
    for (const auto &entry : stats_)
    {
        result.push_back(entry.second);
    }
    return result;
}

void CodecPerformanceTracker::reset()
{
    size_t cleared;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cleared = stats_.size();
        stats_.clear();
    }
    Logger::info("Codec performance statistics reset (" + std::to_string(cleared) + " codecs)");
}
