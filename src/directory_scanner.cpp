#include "core/directory_scanner.hpp"
#include "core/worker_pool.hpp"
#include "logging/logger.hpp"
#include <tbb/concurrent_vector.h>
#include <tbb/task_group.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <filesystem>
#include <mutex>
#include <set>
#include <utility>

namespace fs = std::filesystem;

struct DirectoryScanner::ScanState
{
    const FormatConfig &config;
    const ScanOptions &options;
    tbb::task_group tasks;
    tbb::concurrent_vector<MediaFile> files;
    tbb::concurrent_vector<ScanError> errors;
    std::atomic<size_t> image_count{0};
    std::atomic<size_t> video_count{0};
    std::atomic<size_t> files_found{0};
    std::atomic<size_t> directories{0};
    std::atomic<bool> cancelled{false};

    std::mutex visited_mutex;
    std::set<std::pair<uint64_t, uint64_t>> visited;

    std::mutex progress_mutex;

    ScanState(const FormatConfig &c, const ScanOptions &o) : config(c), options(o) {}

    void addError(const std::string &path, MediaErrorKind kind, const std::string &detail)
    {
        errors.push_back(ScanError{path, MediaErrors::getKindName(kind), detail});
    }

    // Returns false when the directory identity was seen before
    bool markVisited(const std::string &dir_path)
    {
        struct stat st;
        if (stat(dir_path.c_str(), &st) != 0)
            return true;
        std::lock_guard<std::mutex> lock(visited_mutex);
        return visited.emplace(static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)).second;
    }
};

DirectoryScanner::DirectoryScanner(WorkerPool *pool) : pool_(pool)
{
}

MediaResult<ScanOutcome> DirectoryScanner::validateRoot(const std::string &root_path) const
{
    if (root_path.empty())
    {
        return MediaResult<ScanOutcome>::fail(MediaErrorKind::INVALID_ROOT, "Scan root path is empty");
    }

    std::error_code ec;
    fs::file_status status = fs::status(root_path, ec);
    if (ec)
    {
        if (ec.value() == ELOOP)
            return MediaResult<ScanOutcome>::fail(MediaErrorKind::SYMLINK_LOOP,
                                                  "Too many levels of symbolic links: " + root_path);
        if (ec.value() == EACCES)
            return MediaResult<ScanOutcome>::fail(MediaErrorKind::UNREADABLE_FILE,
                                                  "Permission denied: " + root_path);
        if (ec.value() != ENOENT && ec.value() != ENOTDIR)
            return MediaResult<ScanOutcome>::fail(MediaErrorKind::UNREADABLE_FILE,
                                                  "Cannot access " + root_path + ": " + ec.message());
    }

    if (!fs::exists(status))
    {
        return MediaResult<ScanOutcome>::fail(MediaErrorKind::INVALID_ROOT, "Path does not exist: " + root_path);
    }
    if (!fs::is_directory(status))
    {
        return MediaResult<ScanOutcome>::fail(MediaErrorKind::INVALID_ROOT, "Path is not a directory: " + root_path);
    }
    if (access(root_path.c_str(), R_OK | X_OK) != 0)
    {
        return MediaResult<ScanOutcome>::fail(MediaErrorKind::UNREADABLE_FILE, "Permission denied: " + root_path);
    }

    return MediaResult<ScanOutcome>::ok(ScanOutcome());
}

MediaResult<ScanOutcome> DirectoryScanner::scan(const std::string &root_path, const FormatConfig &config,
                                                const ScanOptions &options)
{
    auto validation = validateRoot(root_path);
    if (!validation.success)
    {
        Logger::error("Rejected scan root: " + validation.error.message);
        return validation;
    }

    files_scanned_ = 0;
    files_skipped_ = 0;
    directories_visited_ = 0;

    Logger::info("Starting scan of directory: " + root_path);

    ScanState state(config, options);
    state.markVisited(root_path);

    auto run = [this, &root_path, &state]()
    {
        state.tasks.run([this, root_path, &state]()
                        { walkDirectory(root_path, state); });
        state.tasks.wait();
    };

    if (pool_)
        pool_->execute(run);
    else
        run();

    ScanOutcome outcome;
    outcome.files.assign(state.files.begin(), state.files.end());
    outcome.errors.assign(state.errors.begin(), state.errors.end());
    outcome.image_count = state.image_count.load();
    outcome.video_count = state.video_count.load();
    outcome.cancelled = state.cancelled.load();

    reportProgress(root_path, state);

    if (outcome.cancelled)
    {
        Logger::warn("Scan of " + root_path + " cancelled after " + std::to_string(outcome.files.size()) + " files");
    }
    Logger::info("Scan completed for " + root_path + ": " + std::to_string(outcome.image_count) + " images, " +
                 std::to_string(outcome.video_count) + " videos, " + std::to_string(outcome.errors.size()) +
                 " errors, " + std::to_string(files_skipped_.load()) + " skipped");

    return MediaResult<ScanOutcome>::ok(std::move(outcome));
}

void DirectoryScanner::walkDirectory(const std::string &dir_path, ScanState &state)
{
    if (isCancelled(state.options.cancel))
    {
        state.cancelled = true;
        return;
    }

    directories_visited_++;
    state.directories++;

    std::error_code ec;
    fs::directory_iterator it(dir_path, fs::directory_options::none, ec);
    if (ec)
    {
        Logger::warn("Could not access directory: " + dir_path + " (" + ec.message() + ")");
        state.addError(dir_path, MediaErrorKind::UNREADABLE_FILE, ec.message());
        return;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec))
    {
        if (ec)
        {
            Logger::warn("Error while listing " + dir_path + ": " + ec.message());
            state.addError(dir_path, MediaErrorKind::UNREADABLE_FILE, ec.message());
            break;
        }
        if (isCancelled(state.options.cancel))
        {
            state.cancelled = true;
            return;
        }

        const std::string entry_path = it->path().string();
        try
        {
            std::error_code entry_ec;
            fs::file_status link_status = it->symlink_status(entry_ec);
            if (entry_ec)
            {
                state.addError(entry_path, MediaErrorKind::UNREADABLE_FILE, entry_ec.message());
                continue;
            }

            if (fs::is_symlink(link_status))
            {
                fs::file_status target = fs::status(it->path(), entry_ec);
                if (entry_ec)
                {
                    MediaErrorKind kind = entry_ec.value() == ELOOP ? MediaErrorKind::SYMLINK_LOOP
                                                                    : MediaErrorKind::UNREADABLE_FILE;
                    std::string detail = entry_ec.value() == ENOENT ? "Broken symbolic link" : entry_ec.message();
                    Logger::warn("Skipping symbolic link " + entry_path + ": " + detail);
                    state.addError(entry_path, kind, detail);
                    continue;
                }
                if (fs::is_directory(target))
                {
                    Logger::debug("Not following directory symlink: " + entry_path);
                    continue;
                }
                if (fs::is_regular_file(target))
                {
                    handleFile(entry_path, state);
                }
                continue;
            }

            if (fs::is_directory(link_status))
            {
                if (!state.markVisited(entry_path))
                {
                    Logger::warn("Directory reached twice, skipping: " + entry_path);
                    state.addError(entry_path, MediaErrorKind::SYMLINK_LOOP, "Directory already visited");
                    continue;
                }
                state.tasks.run([this, entry_path, &state]()
                                { walkDirectory(entry_path, state); });
            }
            else if (fs::is_regular_file(link_status))
            {
                handleFile(entry_path, state);
            }
        }
        catch (const std::exception &e)
        {
            Logger::warn("Error processing entry " + entry_path + ": " + e.what());
            state.addError(entry_path, MediaErrorKind::UNREADABLE_FILE, e.what());
        }
    }
}

void DirectoryScanner::handleFile(const std::string &file_path, ScanState &state)
{
    files_scanned_++;

    auto media_type = FormatClassifier::classify(file_path, state.config);
    if (!media_type)
    {
        files_skipped_++;
        Logger::trace("Skipping unsupported file: " + file_path);
        return;
    }

    if (access(file_path.c_str(), R_OK) != 0)
    {
        Logger::warn("Unreadable media file: " + file_path);
        state.addError(file_path, MediaErrorKind::UNREADABLE_FILE, "Permission denied");
        return;
    }

    state.files.push_back(MediaFile{file_path, *media_type});
    if (*media_type == MediaType::IMAGE)
        state.image_count++;
    else
        state.video_count++;

    size_t found = ++state.files_found;
    if (state.options.progress_interval > 0 && found % state.options.progress_interval == 0)
    {
        reportProgress(file_path, state);
    }
}

void DirectoryScanner::reportProgress(const std::string &current_path, ScanState &state)
{
    if (!state.options.on_progress)
        return;

    std::lock_guard<std::mutex> lock(state.progress_mutex);
    ScanProgress progress;
    progress.files_found = state.files_found.load();
    progress.directories_visited = state.directories.load();
    progress.current_path = current_path;
    try
    {
        state.options.on_progress(progress);
    }
    catch (const std::exception &e)
    {
        Logger::warn(std::string("Progress callback threw: ") + e.what());
    }
}
