#pragma once

#include "core/cancellation_token.hpp"
#include "core/format_classifier.hpp"
#include "core/media_error.hpp"
#include "core/media_types.hpp"
#include <atomic>
#include <functional>
#include <string>

class WorkerPool;

/**
 * @brief Caller-side knobs for a single scan
 */
struct ScanOptions
{
    using ProgressCallback = std::function<void(const ScanProgress &)>;

    size_t progress_interval = 100;           // Fire on_progress every N discovered media files
    ProgressCallback on_progress;             // Invoked serially, never concurrently
    const CancellationToken *cancel = nullptr; // Checked between entries
};

/**
 * @brief Recursive, parallel discovery of media files under a root directory
 *
 * Each directory is listed by its own task on the worker pool. Unreadable
 * entries are collected into ScanOutcome::errors and the walk continues.
 * Symbolic links to directories are not followed; directories reached twice
 * (bind mounts, hard-linked trees) are reported as SymlinkLoop. Root-level
 * problems fail the whole call.
 */
class DirectoryScanner
{
public:
    /**
     * @param pool Worker pool to run on; nullptr runs on the calling thread's arena
     */
    explicit DirectoryScanner(WorkerPool *pool = nullptr);

    /**
     * @brief Scan a directory tree
     * @param root_path Root directory
     * @param config Format allow-lists used for classification
     * @param options Progress and cancellation
     * @return ScanOutcome, or INVALID_ROOT / UNREADABLE_FILE / SYMLINK_LOOP for a bad root
     */
    MediaResult<ScanOutcome> scan(const std::string &root_path, const FormatConfig &config,
                                  const ScanOptions &options = ScanOptions());

    // Statistics from the last scan
    size_t getFilesScanned() const { return files_scanned_.load(); }
    size_t getFilesSkipped() const { return files_skipped_.load(); }
    size_t getDirectoriesVisited() const { return directories_visited_.load(); }

private:
    struct ScanState;

    MediaResult<ScanOutcome> validateRoot(const std::string &root_path) const;
    void walkDirectory(const std::string &dir_path, ScanState &state);
    void handleFile(const std::string &file_path, ScanState &state);
    void reportProgress(const std::string &current_path, ScanState &state);

    WorkerPool *pool_;
    std::atomic<size_t> files_scanned_{0};
    std::atomic<size_t> files_skipped_{0};
    std::atomic<size_t> directories_visited_{0};
};
