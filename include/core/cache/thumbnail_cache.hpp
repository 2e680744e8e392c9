#ifndef THUMBNAIL_CACHE_HPP
#define THUMBNAIL_CACHE_HPP

#include "core/media_error.hpp"
#include "core/media_types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Result of checking the cache for a source file
 */
struct CacheLookup
{
    ThumbnailPaths paths;      // Deterministic paths, whether or not they exist yet
    bool needs_regeneration;   // Either file missing, or source strictly newer than a cached file
};

/**
 * @brief Content-addressed on-disk store of JPEG thumbnails
 *
 * Entries live at {root}/{checksum}_{small|medium}.jpg. Identical content at
 * any path maps to the same entry. Writes go to a temp file and are renamed
 * into place, so readers never observe a partial thumbnail. Concurrent
 * generation requests for the same checksum are coalesced: the first caller
 * runs the producer, later callers wait and then re-check the cache.
 */
class ThumbnailCache
{
public:
    using Clock = std::chrono::system_clock;
    using Producer = std::function<MediaResult<EncodedThumbnails>()>;

    /**
     * @brief Constructor
     * @param cache_root Directory that holds the thumbnails
     */
    explicit ThumbnailCache(const std::string &cache_root);

    /**
     * @brief Create the cache directory if needed
     * @return CACHE_WRITE_FAILURE if it cannot be created or is not writable
     */
    MediaResult<bool> initialize();

    /**
     * @brief Path for one cache entry
     */
    std::string entryPath(const std::string &checksum, SizeClass size) const;

    /**
     * @brief Check whether the cached pair for checksum is present and fresh
     * @param source_path Source file, for logging only
     * @param checksum Content checksum of the source
     * @param source_mtime Modification time of the source
     */
    CacheLookup resolve(const std::string &source_path, const std::string &checksum,
                        Clock::time_point source_mtime) const;

    /**
     * @brief Atomically write one entry
     * @return Final path, or CACHE_WRITE_FAILURE
     */
    MediaResult<std::string> store(const std::string &checksum, SizeClass size, const std::vector<uint8_t> &bytes);

    /**
     * @brief Return cached thumbnails, running producer at most once per checksum at a time
     *
     * The producer's failure is propagated unchanged and nothing is written.
     */
    MediaResult<ThumbnailPaths> getOrGenerate(const std::string &source_path, const std::string &checksum,
                                              Clock::time_point source_mtime, const Producer &producer);

    const std::string &getRoot() const { return cache_root_; }

    /**
     * @brief Total size of the cache directory in bytes
     */
    uint64_t getCacheSize() const;

    /**
     * @brief Human readable cache size, e.g. "12.4 MB"
     */
    std::string getCacheSizeString() const;

    /**
     * @brief Delete all thumbnails in the cache root
     * @return Number of files removed
     */
    size_t clear();

    // Statistics
    size_t getHits() const { return hits_.load(); }
    size_t getMisses() const { return misses_.load(); }
    size_t getGenerations() const { return generations_.load(); }

private:
    ThumbnailCache(const ThumbnailCache &) = delete;
    ThumbnailCache &operator=(const ThumbnailCache &) = delete;

    void finishGeneration(const std::string &checksum);

    std::string cache_root_;

    std::mutex in_flight_mutex_;
    std::condition_variable in_flight_cv_;
    std::unordered_set<std::string> in_flight_;

    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> generations_{0};
};

#endif // THUMBNAIL_CACHE_HPP
