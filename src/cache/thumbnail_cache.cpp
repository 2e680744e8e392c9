#include "core/cache/thumbnail_cache.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <unistd.h>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

ThumbnailCache::ThumbnailCache(const std::string &cache_root) : cache_root_(cache_root)
{
}

MediaResult<bool> ThumbnailCache::initialize()
{
    std::error_code ec;
    fs::create_directories(cache_root_, ec);
    if (ec)
    {
        std::string msg = "Cannot create cache directory " + cache_root_ + ": " + ec.message();
        Logger::error(msg);
        return MediaResult<bool>::fail(MediaErrorKind::CACHE_WRITE_FAILURE, msg);
    }
    if (!fs::is_directory(cache_root_, ec) || access(cache_root_.c_str(), W_OK | X_OK) != 0)
    {
        std::string msg = "Cache directory is not writable: " + cache_root_;
        Logger::error(msg);
        return MediaResult<bool>::fail(MediaErrorKind::CACHE_WRITE_FAILURE, msg);
    }

    Logger::info("Thumbnail cache ready at " + cache_root_);
    return MediaResult<bool>::ok(true);
}

std::string ThumbnailCache::entryPath(const std::string &checksum, SizeClass size) const
{
    return (fs::path(cache_root_) / (checksum + "_" + ThumbnailSizes::nameFor(size) + ".jpg")).string();
}

CacheLookup ThumbnailCache::resolve(const std::string &source_path, const std::string &checksum,
                                    Clock::time_point source_mtime) const
{
    CacheLookup lookup;
    lookup.paths.small = entryPath(checksum, SizeClass::SMALL);
    lookup.paths.medium = entryPath(checksum, SizeClass::MEDIUM);
    lookup.needs_regeneration = false;

    for (const auto &path : {lookup.paths.small, lookup.paths.medium})
    {
        auto cached_mtime = FileUtils::getModificationTime(path);
        if (!cached_mtime)
        {
            lookup.needs_regeneration = true;
            break;
        }
        if (source_mtime > *cached_mtime)
        {
            Logger::debug("Source newer than cached thumbnail, regenerating: " + source_path);
            lookup.needs_regeneration = true;
            break;
        }
    }
    return lookup;
}

MediaResult<std::string> ThumbnailCache::store(const std::string &checksum, SizeClass size,
                                               const std::vector<uint8_t> &bytes)
{
    std::string path = entryPath(checksum, size);
    std::string error_message;
    if (!FileUtils::writeFileAtomically(path, bytes, error_message))
    {
        Logger::error("Failed to store thumbnail: " + error_message);
        return MediaResult<std::string>::fail(MediaErrorKind::CACHE_WRITE_FAILURE, error_message);
    }
    return MediaResult<std::string>::ok(path);
}

MediaResult<ThumbnailPaths> ThumbnailCache::getOrGenerate(const std::string &source_path, const std::string &checksum,
                                                          Clock::time_point source_mtime, const Producer &producer)
{
    using Result = MediaResult<ThumbnailPaths>;

    CacheLookup lookup = resolve(source_path, checksum, source_mtime);
    if (!lookup.needs_regeneration)
    {
        hits_++;
        Logger::debug("Thumbnail cache hit for " + source_path);
        return Result::ok(lookup.paths);
    }

    {
        std::unique_lock<std::mutex> lock(in_flight_mutex_);
        while (in_flight_.count(checksum) > 0)
        {
            in_flight_cv_.wait(lock);
        }

        // Another worker may have produced the entry while we waited
        lookup = resolve(source_path, checksum, source_mtime);
        if (!lookup.needs_regeneration)
        {
            hits_++;
            Logger::debug("Thumbnail produced by concurrent worker for " + source_path);
            return Result::ok(lookup.paths);
        }
        in_flight_.insert(checksum);
    }

    misses_++;

    MediaResult<EncodedThumbnails> encoded;
    try
    {
        encoded = producer();
    }
    catch (const std::exception &e)
    {
        finishGeneration(checksum);
        Logger::error("Thumbnail producer threw for " + source_path + ": " + e.what());
        return Result::fail(MediaErrorKind::DECODE_FAILURE, e.what());
    }

    if (!encoded.success)
    {
        finishGeneration(checksum);
        return Result::fail(encoded.error);
    }

    auto small = store(checksum, SizeClass::SMALL, encoded.value.small);
    auto medium = small.success ? store(checksum, SizeClass::MEDIUM, encoded.value.medium) : small;
    finishGeneration(checksum);

    if (!small.success)
        return Result::fail(small.error);
    if (!medium.success)
        return Result::fail(medium.error);

    generations_++;
    Logger::debug("Generated thumbnails for " + source_path + " -> " + checksum);
    return Result::ok(ThumbnailPaths{small.value, medium.value});
}

void ThumbnailCache::finishGeneration(const std::string &checksum)
{
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_.erase(checksum);
    }
    in_flight_cv_.notify_all();
}

uint64_t ThumbnailCache::getCacheSize() const
{
    uint64_t total_size = 0;
    std::error_code ec;
    for (fs::directory_iterator it(cache_root_, ec), end; !ec && it != end; it.increment(ec))
    {
        std::error_code size_ec;
        if (it->is_regular_file(size_ec))
        {
            uintmax_t size = it->file_size(size_ec);
            if (!size_ec)
                total_size += size;
        }
    }
    if (ec)
    {
        Logger::error("Error calculating cache size: " + ec.message());
    }
    return total_size;
}

std::string ThumbnailCache::getCacheSizeString() const
{
    const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size_double = static_cast<double>(getCacheSize());

    while (size_double >= 1024.0 && unit_index < 4)
    {
        size_double /= 1024.0;
        unit_index++;
    }

    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << size_double << " " << units[unit_index];
    return ss.str();
}

size_t ThumbnailCache::clear()
{
    size_t removed = 0;
    std::error_code ec;
    for (fs::directory_iterator it(cache_root_, ec), end; !ec && it != end; it.increment(ec))
    {
        std::error_code remove_ec;
        if (it->is_regular_file(remove_ec) && it->path().extension() == ".jpg" && fs::remove(it->path(), remove_ec))
            removed++;
        else if (remove_ec)
            Logger::warn("Could not remove " + it->path().string() + ": " + remove_ec.message());
    }
    Logger::info("Cleared " + std::to_string(removed) + " thumbnails from " + cache_root_);
    return removed;
}
