#include "core/image_metadata_reader.hpp"
#include "core/decoder/raw_decoder.hpp"
#include "core/file_utils.hpp"
#include "core/image_thumbnailer.hpp"
#include "logging/logger.hpp"
#include <exiv2/exiv2.hpp>
#include <opencv2/imgcodecs.hpp>
#include <unistd.h>
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <utility>

namespace
{
    struct ExifFacts
    {
        std::optional<std::chrono::system_clock::time_point> capture_date;
        std::optional<std::string> make;
        std::optional<std::string> model;
        std::optional<double> latitude;
        std::optional<double> longitude;
        int orientation = 1;
        int width = 0;
        int height = 0;
    };

    void initExiv2()
    {
        static std::once_flag once;
        std::call_once(once, []()
                       {
            Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
#ifdef EXV_ENABLE_BMFF
            Exiv2::enableBMFF(true);
#endif
        });
    }

    std::string trim(const std::string &value)
    {
        const char *whitespace = " \t\r\n";
        std::string result = value;
        result.erase(std::find(result.begin(), result.end(), '\0'), result.end());
        size_t start = result.find_first_not_of(whitespace);
        if (start == std::string::npos)
            return "";
        size_t end = result.find_last_not_of(whitespace);
        return result.substr(start, end - start + 1);
    }

    std::optional<std::string> readString(const Exiv2::ExifData &exif, const char *key)
    {
        auto it = exif.findKey(Exiv2::ExifKey(key));
        if (it == exif.end())
            return std::nullopt;
        std::string value = trim(it->toString());
        if (value.empty())
            return std::nullopt;
        return value;
    }

    std::optional<double> readDms(const Exiv2::ExifData &exif, const char *key)
    {
        auto it = exif.findKey(Exiv2::ExifKey(key));
        if (it == exif.end() || it->count() < 3)
            return std::nullopt;

        double parts[3];
        for (size_t i = 0; i < 3; ++i)
        {
            Exiv2::Rational r = it->toRational(i);
            if (r.second == 0)
                return std::nullopt;
            parts[i] = static_cast<double>(r.first) / static_cast<double>(r.second);
        }
        return parts[0] + parts[1] / 60.0 + parts[2] / 3600.0;
    }

    void readGps(const Exiv2::ExifData &exif, const std::string &path, ExifFacts &facts)
    {
        auto lat = readDms(exif, "Exif.GPSInfo.GPSLatitude");
        auto lon = readDms(exif, "Exif.GPSInfo.GPSLongitude");
        if (!lat || !lon)
            return;

        std::string lat_ref = readString(exif, "Exif.GPSInfo.GPSLatitudeRef").value_or("N");
        std::string lon_ref = readString(exif, "Exif.GPSInfo.GPSLongitudeRef").value_or("E");

        double latitude = ImageMetadataReader::dmsToDecimal(*lat, 0.0, 0.0, lat_ref);
        double longitude = ImageMetadataReader::dmsToDecimal(*lon, 0.0, 0.0, lon_ref);

        if (!ImageMetadataReader::isValidLatitude(latitude) || !ImageMetadataReader::isValidLongitude(longitude))
        {
            Logger::warn("Discarding out-of-range GPS position (" + std::to_string(latitude) + ", " +
                         std::to_string(longitude) + ") in " + path);
            return;
        }
        facts.latitude = latitude;
        facts.longitude = longitude;
    }

    // Embedded metadata is optional; any Exiv2 failure leaves the facts empty
    ExifFacts readExif(const std::string &path)
    {
        ExifFacts facts;
        initExiv2();
        try
        {
            Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(path);
            image->readMetadata();

            facts.width = static_cast<int>(image->pixelWidth());
            facts.height = static_cast<int>(image->pixelHeight());

            const Exiv2::ExifData &exif = image->exifData();
            if (exif.empty())
                return facts;

            auto orientation = exif.findKey(Exiv2::ExifKey("Exif.Image.Orientation"));
            if (orientation != exif.end())
            {
                int64_t value = orientation->toInt64();
                if (value >= 1 && value <= 8)
                    facts.orientation = static_cast<int>(value);
            }

            for (const char *key : {"Exif.Photo.DateTimeOriginal", "Exif.Image.DateTime"})
            {
                auto text = readString(exif, key);
                if (text)
                {
                    facts.capture_date = ImageMetadataReader::parseExifDateTime(*text);
                    if (facts.capture_date)
                        break;
                }
            }

            facts.make = readString(exif, "Exif.Image.Make");
            facts.model = readString(exif, "Exif.Image.Model");
            readGps(exif, path, facts);

            if (facts.width <= 0 || facts.height <= 0)
            {
                auto x = exif.findKey(Exiv2::ExifKey("Exif.Photo.PixelXDimension"));
                auto y = exif.findKey(Exiv2::ExifKey("Exif.Photo.PixelYDimension"));
                if (x != exif.end() && y != exif.end())
                {
                    facts.width = static_cast<int>(x->toInt64());
                    facts.height = static_cast<int>(y->toInt64());
                }
            }
        }
        catch (const Exiv2::Error &e)
        {
            Logger::debug("No readable embedded metadata in " + path + ": " + e.what());
        }
        catch (const std::exception &e)
        {
            Logger::warn("Error reading embedded metadata from " + path + ": " + e.what());
        }
        return facts;
    }
}

ImageMetadataReader::ImageMetadataReader(std::shared_ptr<MediaProbe> probe) : probe_(std::move(probe))
{
}

MediaResult<MediaMetadata> ImageMetadataReader::readImage(const std::string &path) const
{
    using Result = MediaResult<MediaMetadata>;

    auto file_info = FileUtils::getFileMetadata(path);
    if (!file_info)
    {
        return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Image file does not exist: " + path);
    }
    if (access(path.c_str(), R_OK) != 0)
    {
        return Result::fail(MediaErrorKind::UNREADABLE_FILE, "Permission denied: " + path);
    }

    MediaMetadata metadata;
    metadata.file_size = file_info->file_size;
    metadata.file_modified = file_info->modification_time;

    ExifFacts facts = readExif(path);
    metadata.orientation = facts.orientation;
    metadata.capture_date = facts.capture_date;
    metadata.camera_make = facts.make;
    metadata.camera_model = facts.model;
    metadata.gps_latitude = facts.latitude;
    metadata.gps_longitude = facts.longitude;

    int width = facts.width;
    int height = facts.height;
    SourceFormat format = ImageThumbnailer::detectFormat(path);

    // RAW containers often report the embedded preview size, so ask LibRaw first
    if (format == SourceFormat::RAW)
    {
        auto raw_size = RawDecoder::readDimensions(path);
        if (raw_size.success)
        {
            width = raw_size.value.width;
            height = raw_size.value.height;
        }
    }

    if ((width <= 0 || height <= 0) && format == SourceFormat::HEIC && probe_)
    {
        auto probed = probe_->probe(path);
        if (probed.success && probed.value.width > 0 && probed.value.height > 0)
        {
            width = probed.value.width;
            height = probed.value.height;
        }
    }

    if ((width <= 0 || height <= 0) &&
        (format == SourceFormat::JPEG || format == SourceFormat::PNG || format == SourceFormat::OTHER_RASTER))
    {
        try
        {
            cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED | cv::IMREAD_IGNORE_ORIENTATION);
            if (!image.empty())
            {
                width = image.cols;
                height = image.rows;
            }
        }
        catch (const cv::Exception &e)
        {
            Logger::debug("OpenCV could not open " + path + ": " + e.what());
        }
    }

    if (width <= 0 || height <= 0)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, "Could not determine image dimensions: " + path);
    }

    if (swapsDimensions(metadata.orientation))
        std::swap(width, height);
    metadata.width = width;
    metadata.height = height;

    if (!metadata.capture_date)
        metadata.capture_date = metadata.file_modified;

    return Result::ok(metadata);
}

std::optional<std::chrono::system_clock::time_point> ImageMetadataReader::parseExifDateTime(const std::string &text)
{
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (std::sscanf(text.c_str(), "%4d:%2d:%2d %2d:%2d:%2d", &year, &month, &day, &hour, &minute, &second) != 6)
        return std::nullopt;
    if (year < 1800 || month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60 || hour < 0 || minute < 0 || second < 0)
        return std::nullopt;

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t seconds = timegm(&tm);
    return std::chrono::system_clock::from_time_t(seconds);
}

double ImageMetadataReader::dmsToDecimal(double degrees, double minutes, double seconds, const std::string &ref)
{
    double decimal = degrees + minutes / 60.0 + seconds / 3600.0;
    if (!ref.empty() && (ref[0] == 'S' || ref[0] == 's' || ref[0] == 'W' || ref[0] == 'w'))
        decimal = -decimal;
    return decimal;
}
