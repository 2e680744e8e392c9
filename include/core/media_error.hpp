#pragma once

#include <string>
#include <utility>

/**
 * @brief Failure categories reported by the ingestion pipeline
 *
 * Every per-file failure is mapped onto one of these kinds so that callers
 * can pick a recovery (placeholder, skip, disable video) without parsing text.
 */
enum class MediaErrorKind
{
    NONE,
    UNREADABLE_FILE,           // Permission or I/O failure
    UNSUPPORTED_FORMAT,        // No decoder for this extension / signature
    DECODE_FAILURE,            // Corrupt data
    NO_VIDEO_STREAM,           // Container without a video stream
    UNSUPPORTED_CODEC,         // Decoder lacks the stream's codec
    EXTERNAL_TOOL_UNAVAILABLE, // ffmpeg / ffprobe missing
    CACHE_WRITE_FAILURE,       // Thumbnail cache not writable
    INVALID_ROOT,              // Scan root empty, missing or not a directory
    SYMLINK_LOOP,              // Directory cycle detected
    CANCELLED                  // Cooperative cancellation
};

/**
 * @brief A typed failure with a human readable detail string
 */
struct MediaError
{
    MediaErrorKind kind;
    std::string message;

    MediaError() : kind(MediaErrorKind::NONE) {}
    MediaError(MediaErrorKind k, const std::string &msg = "")
        : kind(k), message(msg) {}
};

class MediaErrors
{
public:
    /**
     * @brief Get the kind name as string
     * @param kind The error kind
     * @return Stable identifier, e.g. "DecodeFailure"
     */
    static std::string getKindName(MediaErrorKind kind)
    {
        switch (kind)
        {
        case MediaErrorKind::NONE:
            return "None";
        case MediaErrorKind::UNREADABLE_FILE:
            return "UnreadableFile";
        case MediaErrorKind::UNSUPPORTED_FORMAT:
            return "UnsupportedFormat";
        case MediaErrorKind::DECODE_FAILURE:
            return "DecodeFailure";
        case MediaErrorKind::NO_VIDEO_STREAM:
            return "NoVideoStream";
        case MediaErrorKind::UNSUPPORTED_CODEC:
            return "UnsupportedCodec";
        case MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE:
            return "ExternalToolUnavailable";
        case MediaErrorKind::CACHE_WRITE_FAILURE:
            return "CacheWriteFailure";
        case MediaErrorKind::INVALID_ROOT:
            return "InvalidRoot";
        case MediaErrorKind::SYMLINK_LOOP:
            return "SymlinkLoop";
        case MediaErrorKind::CANCELLED:
            return "Cancelled";
        default:
            return "Unknown";
        }
    }

    /**
     * @brief Convert a kind name back to the enum
     * @param name String produced by getKindName()
     * @return Matching kind, NONE if unrecognised
     */
    static MediaErrorKind fromString(const std::string &name)
    {
        static const MediaErrorKind all[] = {
            MediaErrorKind::UNREADABLE_FILE, MediaErrorKind::UNSUPPORTED_FORMAT,
            MediaErrorKind::DECODE_FAILURE, MediaErrorKind::NO_VIDEO_STREAM,
            MediaErrorKind::UNSUPPORTED_CODEC, MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE,
            MediaErrorKind::CACHE_WRITE_FAILURE, MediaErrorKind::INVALID_ROOT,
            MediaErrorKind::SYMLINK_LOOP, MediaErrorKind::CANCELLED};
        for (auto kind : all)
        {
            if (getKindName(kind) == name)
                return kind;
        }
        return MediaErrorKind::NONE;
    }

    /**
     * @brief Short sentence suitable for showing to an end user
     * @param error The error to describe
     * @return User-facing description
     */
    static std::string userFriendlyMessage(const MediaError &error);
};

/**
 * @brief Value-or-error result returned by pipeline components
 */
template <typename T>
struct MediaResult
{
    bool success;
    MediaError error;
    T value;

    MediaResult() : success(false), value() {}

    static MediaResult ok(T v)
    {
        MediaResult result;
        result.success = true;
        result.value = std::move(v);
        return result;
    }

    static MediaResult fail(MediaErrorKind kind, const std::string &message)
    {
        MediaResult result;
        result.error = MediaError(kind, message);
        return result;
    }

    static MediaResult fail(const MediaError &error)
    {
        MediaResult result;
        result.error = error;
        return result;
    }
};
