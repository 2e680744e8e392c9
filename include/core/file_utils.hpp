#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace fs = std::filesystem;

/**
 * @brief File facts gathered with a single stat() call
 */
struct FileMetadata
{
    std::string file_path;
    std::chrono::system_clock::time_point modification_time; // Nanosecond precision where the FS provides it
    uint64_t file_size;                                      // File size in bytes
    uint64_t inode;                                          // Inode number
    uint64_t device_id;                                      // Device ID

    std::string toString() const;
};

/**
 * @brief File utilities shared by the scanner, readers and cache
 */
class FileUtils
{
public:
    /**
     * @brief Get file metadata without reading file content
     * @param file_path Path to the file
     * @return Optional FileMetadata if file exists and is accessible
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * @brief Modification time of a path, following symlinks
     * @return std::nullopt if the path cannot be stat'ed
     */
    static std::optional<std::chrono::system_clock::time_point> getModificationTime(const std::string &file_path);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * Computes SHA256 hash of a file
     * @param file_path Path to the file
     * @return SHA256 hash as lowercase hexadecimal string, empty on read failure
     */
    static std::string computeFileHash(const std::string &file_path);

    /**
     * Computes SHA256 hash of an in-memory buffer
     */
    static std::string computeHash(const std::vector<uint8_t> &data);

    /**
     * @brief Lowercase extension without the dot, "" if there is none
     */
    static std::string getFileExtension(const std::string &file_path);

    /**
     * @brief Read up to max_bytes from the start of a file
     * @return Bytes read; empty if the file cannot be opened
     */
    static std::vector<uint8_t> readHeader(const std::string &file_path, size_t max_bytes);

    /**
     * @brief Write a buffer to a unique temp file beside target, then rename over target
     * @param target_path Final destination
     * @param data Bytes to write
     * @param error_message Filled with the failure reason
     * @return true if target_path now holds exactly data
     */
    static bool writeFileAtomically(const std::string &target_path, const std::vector<uint8_t> &data,
                                    std::string &error_message);
};
