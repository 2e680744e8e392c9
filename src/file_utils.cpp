#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <thread>

namespace
{
    std::string toHex(const unsigned char *hash, size_t length)
    {
        std::stringstream ss;
        for (size_t i = 0; i < length; ++i)
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        return ss.str();
    }

    std::chrono::system_clock::time_point toTimePoint(const struct timespec &ts)
    {
        auto since_epoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
    }
}

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0)
    {
        return std::nullopt;
    }

    FileMetadata metadata;
    metadata.file_path = file_path;
#ifdef __APPLE__
    metadata.modification_time = toTimePoint(st.st_mtimespec);
#else
    metadata.modification_time = toTimePoint(st.st_mtim);
#endif
    metadata.file_size = static_cast<uint64_t>(st.st_size);
    metadata.inode = static_cast<uint64_t>(st.st_ino);
    metadata.device_id = static_cast<uint64_t>(st.st_dev);
    return metadata;
}

std::optional<std::chrono::system_clock::time_point> FileUtils::getModificationTime(const std::string &file_path)
{
    auto metadata = getFileMetadata(file_path);
    if (!metadata)
        return std::nullopt;
    return metadata->modification_time;
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    try
    {
        fs::path dir_path(path);
        return fs::exists(dir_path) && fs::is_directory(dir_path);
    }
    catch (const std::exception &e)
    {
        return false;
    }
}

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    constexpr size_t buffer_size = 8192;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        return "";
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return "";
    std::vector<char> buffer(buffer_size);
    while (file.good())
    {
        file.read(buffer.data(), buffer_size);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (SHA256_Update(&sha256, buffer.data(), bytes_read) != 1)
                return "";
        }
    }
    if (file.bad())
    {
        Logger::warn("I/O error while hashing: " + file_path);
        return "";
    }
    if (SHA256_Final(hash, &sha256) != 1)
        return "";
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::computeHash(const std::vector<uint8_t> &data)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash, &sha256);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string file_name = fs::path(file_path).filename().string();
    size_t dot_pos = file_name.find_last_of('.');
    if (dot_pos == std::string::npos || dot_pos + 1 == file_name.size())
    {
        return "";
    }

    std::string extension = file_name.substr(dot_pos + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return extension;
}

std::vector<uint8_t> FileUtils::readHeader(const std::string &file_path, size_t max_bytes)
{
    std::vector<uint8_t> header(max_bytes);
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return {};
    file.read(reinterpret_cast<char *>(header.data()), static_cast<std::streamsize>(max_bytes));
    header.resize(static_cast<size_t>(file.gcount()));
    return header;
}

bool FileUtils::writeFileAtomically(const std::string &target_path, const std::vector<uint8_t> &data,
                                    std::string &error_message)
{
    static std::atomic<uint64_t> sequence{0};

    std::stringstream tmp_name;
    tmp_name << target_path << "." << getpid() << "_"
             << std::hash<std::thread::id>{}(std::this_thread::get_id()) << "_"
             << sequence.fetch_add(1) << ".tmp";
    const std::string tmp_path = tmp_name.str();

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            error_message = "Cannot open " + tmp_path + ": " + std::strerror(errno);
            return false;
        }
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out.good())
        {
            error_message = "Short write to " + tmp_path;
            out.close();
            std::remove(tmp_path.c_str());
            return false;
        }
    }

    if (std::rename(tmp_path.c_str(), target_path.c_str()) != 0)
    {
        error_message = "Cannot rename " + tmp_path + " to " + target_path + ": " + std::strerror(errno);
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

std::string FileMetadata::toString() const
{
    std::stringstream ss;
    ss << "FileMetadata{path=" << file_path
       << ", mtime_ns=" << std::chrono::duration_cast<std::chrono::nanoseconds>(modification_time.time_since_epoch()).count()
       << ", size=" << file_size
       << ", inode=" << inode
       << ", device=" << device_id << "}";
    return ss.str();
}
