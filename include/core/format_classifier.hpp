#pragma once

#include "core/media_types.hpp"
#include <optional>
#include <set>
#include <string>

/**
 * @brief Extension allow-lists for the two media families
 *
 * Extensions are stored lowercase without a leading dot.
 */
struct FormatConfig
{
    std::set<std::string> image_formats;
    std::set<std::string> video_formats;

    /**
     * @brief The default allow-lists used when no configuration is present
     */
    static FormatConfig defaults();

    /**
     * @brief Check that both sets are non-empty and every entry is a bare
     *        lowercase alphanumeric extension
     * @return Empty string when valid, otherwise the first problem found
     */
    std::string validate() const;

    bool isValid() const { return validate().empty(); }
};

class FormatClassifier
{
public:
    /**
     * @brief Classify a path by its extension
     * @param path File path or bare file name
     * @param config Allow-lists to check against
     * @return IMAGE or VIDEO, or std::nullopt when the extension is in neither set
     */
    static std::optional<MediaType> classify(const std::string &path, const FormatConfig &config);

    /**
     * @brief Lowercase an extension and strip a leading dot
     */
    static std::string normalizeExtension(const std::string &extension);
};
