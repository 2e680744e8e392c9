#include "core/pipeline_config.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PipelineConfig::PipelineConfig()
{
    cfg_ = new JSONConfiguration();
    replaceWith(defaultConfig());
}

nlohmann::json PipelineConfig::defaultConfig()
{
    FormatConfig formats = FormatConfig::defaults();
    return {
        {"log_level", "INFO"},
        {"log_file", ""},
        {"cache", {{"root", "thumbnail_cache"}, {"jpeg_quality", 85}}},
        {"formats",
         {{"image", std::vector<std::string>(formats.image_formats.begin(), formats.image_formats.end())},
          {"video", std::vector<std::string>(formats.video_formats.begin(), formats.video_formats.end())}}},
        {"threading", {{"max_worker_threads", 0}}},
        {"scan", {{"progress_interval", 100}}},
        {"video", {{"ffmpeg_path", "ffmpeg"}, {"ffprobe_path", "ffprobe"}, {"timeout_ms", 30000}}}};
}

void PipelineConfig::replaceWith(const nlohmann::json &document)
{
    std::istringstream in(document.dump());
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    tmp->load(in);
    cfg_ = tmp;
}

bool PipelineConfig::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::warn("Config file not found: " + path + ", using defaults");
        return false;
    }

    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse config file " + path + ": " + e.displayText());
        return false;
    }

    FormatConfig formats = getFormatConfig();
    std::string problem = formats.validate();
    if (!problem.empty())
    {
        Logger::warn("Invalid format lists in " + path + ": " + problem + " Using defaults.");
        setFormatConfig(FormatConfig::defaults());
    }

    Logger::info("Configuration loaded from " + path);
    return true;
}

bool PipelineConfig::save(const std::string &path) const
{
    std::string problem = getFormatConfig().validate();
    if (!problem.empty())
    {
        Logger::error("Refusing to save configuration: " + problem);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
    {
        Logger::error("Cannot write config file: " + path);
        return false;
    }
    cfg_->save(out);
    return true;
}

nlohmann::json PipelineConfig::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PipelineConfig::update(const nlohmann::json &patch)
{
    nlohmann::json document = getAll();
    document.merge_patch(patch);

    std::lock_guard<std::mutex> lock(mutex_);
    replaceWith(document);
}

std::string PipelineConfig::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PipelineConfig::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config key " + key + " is not an integer, using " + std::to_string(def));
        return def;
    }
}

bool PipelineConfig::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Config key " + key + " is not a boolean, using default");
        return def;
    }
}

std::string PipelineConfig::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PipelineConfig::getLogFile() const
{
    return getString("log_file", "");
}

std::string PipelineConfig::getCacheRoot() const
{
    return getString("cache.root", "thumbnail_cache");
}

int PipelineConfig::getJpegQuality() const
{
    return getInt("cache.jpeg_quality", 85);
}

int PipelineConfig::getMaxWorkerThreads() const
{
    return getInt("threading.max_worker_threads", 0);
}

int PipelineConfig::getProgressInterval() const
{
    return getInt("scan.progress_interval", 100);
}

std::string PipelineConfig::getFfmpegPath() const
{
    return getString("video.ffmpeg_path", "ffmpeg");
}

std::string PipelineConfig::getFfprobePath() const
{
    return getString("video.ffprobe_path", "ffprobe");
}

int PipelineConfig::getVideoTimeoutMs() const
{
    return getInt("video.timeout_ms", 30000);
}

FormatConfig PipelineConfig::getFormatConfig() const
{
    FormatConfig formats;
    FormatConfig defaults = FormatConfig::defaults();
    nlohmann::json all = getAll();

    auto readList = [&all](const char *family, std::set<std::string> &target, const std::set<std::string> &fallback)
    {
        if (!all.contains("formats") || !all["formats"].contains(family) || !all["formats"][family].is_array())
        {
            target = fallback;
            return;
        }
        for (const auto &item : all["formats"][family])
        {
            if (item.is_string())
                target.insert(FormatClassifier::normalizeExtension(item.get<std::string>()));
        }
    };

    readList("image", formats.image_formats, defaults.image_formats);
    readList("video", formats.video_formats, defaults.video_formats);
    return formats;
}

std::string PipelineConfig::setFormatConfig(const FormatConfig &formats)
{
    std::string problem = formats.validate();
    if (!problem.empty())
    {
        Logger::warn("Rejected format configuration: " + problem);
        return problem;
    }

    // merge_patch replaces arrays wholesale
    update({{"formats",
             {{"image", std::vector<std::string>(formats.image_formats.begin(), formats.image_formats.end())},
              {"video", std::vector<std::string>(formats.video_formats.begin(), formats.video_formats.end())}}}});
    return "";
}
