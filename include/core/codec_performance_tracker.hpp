#pragma once

#include "core/media_types.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Running per-codec statistics for video frame extraction
 *
 * All access is serialised by a single mutex over the whole map. Instances
 * are owned by the caller and passed by reference to the components that
 * report into them.
 */
class CodecPerformanceTracker
{
public:
    CodecPerformanceTracker() = default;

    /**
     * @brief Record one extraction attempt
     * @param codec_name Codec of the video stream, e.g. "h264"
     * @param elapsed_ms Wall time spent extracting
     * @param success Whether a frame was produced
     */
    void record(const std::string &codec_name, double elapsed_ms, bool success);

    /**
     * @brief Point-in-time copy of all entries, sorted by codec name
     */
    std::vector<CodecStat> snapshot() const;

    /**
     * @brief Drop all statistics
     */
    void reset();

private:
    CodecPerformanceTracker(const CodecPerformanceTracker &) = delete;
    CodecPerformanceTracker &operator=(const CodecPerformanceTracker &) = delete;

    mutable std::mutex mutex_;
    std::map<std::string, CodecStat> stats_;
};
