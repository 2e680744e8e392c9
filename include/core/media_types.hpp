#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class MediaType
{
    IMAGE,
    VIDEO
};

inline std::string mediaTypeName(MediaType type)
{
    return type == MediaType::IMAGE ? "image" : "video";
}

/**
 * @brief A classified file discovered by the scanner
 */
struct MediaFile
{
    std::string path;
    MediaType media_type;
};

/**
 * @brief Per-entry failure collected during a scan
 *
 * message holds the error kind name (e.g. "DecodeFailure"); detail holds
 * the underlying reason.
 */
struct ScanError
{
    std::string path;
    std::string message;
    std::string detail;
};

struct ScanOutcome
{
    std::vector<MediaFile> files;
    size_t image_count = 0;
    size_t video_count = 0;
    std::vector<ScanError> errors;
    bool cancelled = false;
};

struct ScanProgress
{
    size_t files_found = 0;
    size_t directories_visited = 0;
    std::string current_path;
};

/**
 * @brief Extracted metadata for a single image or video
 *
 * Image records never carry duration/codec; video records never carry
 * camera or GPS fields. capture_date is always populated, falling back to
 * file_modified. width/height are display dimensions (after orientation).
 */
struct MediaMetadata
{
    std::optional<std::chrono::system_clock::time_point> capture_date;
    std::optional<std::string> camera_make;
    std::optional<std::string> camera_model;
    std::optional<double> gps_latitude;
    std::optional<double> gps_longitude;
    int width = 0;
    int height = 0;
    int orientation = 1;
    std::optional<double> duration_seconds;
    std::optional<std::string> video_codec;
    uint64_t file_size = 0;
    std::chrono::system_clock::time_point file_modified;
};

enum class SizeClass
{
    SMALL,
    MEDIUM
};

struct ThumbnailSizes
{
    static constexpr int SMALL_WIDTH = 150;
    static constexpr int MEDIUM_WIDTH = 600;

    static int widthFor(SizeClass size)
    {
        return size == SizeClass::SMALL ? SMALL_WIDTH : MEDIUM_WIDTH;
    }

    static std::string nameFor(SizeClass size)
    {
        return size == SizeClass::SMALL ? "small" : "medium";
    }
};

struct ThumbnailPaths
{
    std::string small;
    std::string medium;
};

/**
 * @brief JPEG bytes for both size classes, produced before a cache store
 */
struct EncodedThumbnails
{
    std::vector<uint8_t> small;
    std::vector<uint8_t> medium;
};

struct CodecStat
{
    std::string codec_name;
    double total_time_ms = 0.0;
    uint64_t sample_count = 0;
    uint64_t success_count = 0;

    double avgTimeMs() const
    {
        return sample_count == 0 ? 0.0 : total_time_ms / static_cast<double>(sample_count);
    }

    double successRate() const
    {
        return sample_count == 0 ? 0.0 : static_cast<double>(success_count) / static_cast<double>(sample_count);
    }
};
