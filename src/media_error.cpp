#include "core/media_error.hpp"
#include <algorithm>
#include <cctype>

namespace
{
    bool containsIgnoreCase(const std::string &haystack, const std::string &needle)
    {
        auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                              [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)); });
        return it != haystack.end();
    }
}

std::string MediaErrors::userFriendlyMessage(const MediaError &error)
{
    const std::string &detail = error.message;

    // Low-level causes first; they are more specific than the kind
    if (containsIgnoreCase(detail, "permission denied"))
        return "Permission denied. Please check that the application has access to this folder.";
    if (containsIgnoreCase(detail, "no space left"))
        return "Not enough disk space to store thumbnails.";
    if (containsIgnoreCase(detail, "timed out") || containsIgnoreCase(detail, "timeout"))
        return "The operation took too long and was stopped.";

    switch (error.kind)
    {
    case MediaErrorKind::UNREADABLE_FILE:
        return "The file could not be read. It may have been moved or deleted.";
    case MediaErrorKind::UNSUPPORTED_FORMAT:
        return "This file format is not supported.";
    case MediaErrorKind::DECODE_FAILURE:
        return "The file appears to be corrupted or incomplete.";
    case MediaErrorKind::NO_VIDEO_STREAM:
        return "This file does not contain a video track.";
    case MediaErrorKind::UNSUPPORTED_CODEC:
        return "The video uses a codec that cannot be decoded on this system.";
    case MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE:
        return "FFmpeg was not found. Install FFmpeg to enable video thumbnails.";
    case MediaErrorKind::CACHE_WRITE_FAILURE:
        return "Thumbnails could not be saved to the cache folder.";
    case MediaErrorKind::INVALID_ROOT:
        return "The selected folder does not exist or is not a folder.";
    case MediaErrorKind::SYMLINK_LOOP:
        return "The folder contains a link that points back to itself.";
    case MediaErrorKind::CANCELLED:
        return "The operation was cancelled.";
    default:
        return "An unexpected error occurred.";
    }
}
