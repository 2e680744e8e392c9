#pragma once

#include "core/format_classifier.hpp"
#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief JSON-backed configuration for the ingestion pipeline
 *
 * Starts from built-in defaults; load() replaces them with a file's content
 * and missing keys fall back to the defaults in each getter.
 */
class PipelineConfig
{
public:
    PipelineConfig();

    bool load(const std::string &path);

    /**
     * @brief Persist the configuration
     * @return false if the file cannot be written or the format lists are invalid
     */
    bool save(const std::string &path) const;

    nlohmann::json getAll() const;
    void update(const nlohmann::json &patch);

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;

    // Pipeline settings
    std::string getLogLevel() const;
    std::string getLogFile() const;
    std::string getCacheRoot() const;
    int getJpegQuality() const;
    int getMaxWorkerThreads() const;
    int getProgressInterval() const;
    std::string getFfmpegPath() const;
    std::string getFfprobePath() const;
    int getVideoTimeoutMs() const;

    /**
     * @brief Current allow-lists; falls back to defaults for a missing list
     */
    FormatConfig getFormatConfig() const;

    /**
     * @brief Replace both allow-lists
     * @return Validation message, empty on success; invalid lists are not applied
     */
    std::string setFormatConfig(const FormatConfig &formats);

    static nlohmann::json defaultConfig();

private:
    void replaceWith(const nlohmann::json &document);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
