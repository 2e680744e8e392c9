#pragma once

#include "core/decoder/frame_source.hpp"
#include "core/media_error.hpp"
#include "core/media_types.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

/**
 * @brief Reads dimensions, capture date, camera and GPS facts from still images
 *
 * Embedded metadata is read with Exiv2. Fields that cannot be read are left
 * absent; only a file whose dimensions cannot be determined fails.
 */
class ImageMetadataReader
{
public:
    /**
     * @param probe Optional prober, used for HEIC dimensions when Exiv2 cannot provide them
     */
    explicit ImageMetadataReader(std::shared_ptr<MediaProbe> probe = nullptr);

    /**
     * @brief Extract metadata for one image
     * @param path Image file
     * @return Metadata with display (post-orientation) width/height and the raw
     *         orientation flag, or UNREADABLE_FILE / DECODE_FAILURE
     */
    MediaResult<MediaMetadata> readImage(const std::string &path) const;

    /**
     * @brief Parse an EXIF "YYYY:MM:DD HH:MM:SS" timestamp, interpreted as UTC
     */
    static std::optional<std::chrono::system_clock::time_point> parseExifDateTime(const std::string &text);

    /**
     * @brief Convert degrees/minutes/seconds and a hemisphere ref to decimal degrees
     * @param ref "N", "S", "E" or "W"; S and W give negative values
     */
    static double dmsToDecimal(double degrees, double minutes, double seconds, const std::string &ref);

    static bool isValidLatitude(double value) { return value >= -90.0 && value <= 90.0; }
    static bool isValidLongitude(double value) { return value >= -180.0 && value <= 180.0; }

    /**
     * @brief Orientations 5-8 rotate by 90 degrees, so stored width/height swap on display
     */
    static bool swapsDimensions(int orientation) { return orientation >= 5 && orientation <= 8; }

private:
    std::shared_ptr<MediaProbe> probe_;
};
