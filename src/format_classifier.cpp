#include "core/format_classifier.hpp"
#include "core/file_utils.hpp"
#include <algorithm>
#include <cctype>

FormatConfig FormatConfig::defaults()
{
    FormatConfig config;
    config.image_formats = {"jpg", "jpeg", "png", "heic", "raw", "cr2", "nef",
                            "dng", "arw", "webp", "gif", "bmp", "tiff"};
    config.video_formats = {"mp4", "mov", "avi", "mkv", "webm", "flv",
                            "wmv", "m4v", "mpg", "mpeg", "3gp"};
    return config;
}

namespace
{
    std::string validateFormatSet(const std::set<std::string> &formats, const std::string &family)
    {
        if (formats.empty())
        {
            return "At least one " + family + " format must be selected.";
        }
        for (const auto &format : formats)
        {
            if (format.empty())
                return "Format names cannot be empty.";
            if (format.find('.') != std::string::npos)
                return "Format '" + format + "' should not contain dots.";
            for (char c : format)
            {
                unsigned char uc = static_cast<unsigned char>(c);
                if (!std::isalnum(uc))
                    return "Format '" + format + "' must be alphanumeric.";
                if (std::isupper(uc))
                    return "Format '" + format + "' must be lowercase.";
            }
        }
        return "";
    }
}

std::string FormatConfig::validate() const
{
    std::string problem = validateFormatSet(image_formats, "image");
    if (!problem.empty())
        return problem;
    return validateFormatSet(video_formats, "video");
}

std::string FormatClassifier::normalizeExtension(const std::string &extension)
{
    std::string normalized = extension;
    if (!normalized.empty() && normalized.front() == '.')
        normalized.erase(0, 1);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

std::optional<MediaType> FormatClassifier::classify(const std::string &path, const FormatConfig &config)
{
    std::string ext = FileUtils::getFileExtension(path);
    if (ext.empty())
        return std::nullopt;

    if (config.image_formats.count(ext) > 0)
        return MediaType::IMAGE;
    if (config.video_formats.count(ext) > 0)
        return MediaType::VIDEO;
    return std::nullopt;
}
