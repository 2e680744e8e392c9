#pragma once

#include "core/media_error.hpp"
#include <opencv2/core.hpp>
#include <mutex>
#include <string>

/**
 * @brief Camera RAW decoding through LibRaw
 *
 * Output is an 8-bit BGR cv::Mat in sensor orientation; LibRaw's own flip is
 * disabled so that EXIF orientation is applied exactly once by the caller.
 */
class RawDecoder
{
public:
    /**
     * @brief Develop a RAW file into a BGR image
     * @param file_path RAW file (cr2, nef, dng, arw, ...)
     * @param half_size Decode at half resolution, enough for thumbnails
     * @return BGR image or DECODE_FAILURE / UNREADABLE_FILE
     */
    static MediaResult<cv::Mat> decode(const std::string &file_path, bool half_size = true);

    /**
     * @brief Read output dimensions from the RAW header without unpacking
     * @return cv::Size in sensor orientation, or DECODE_FAILURE
     */
    static MediaResult<cv::Size> readDimensions(const std::string &file_path);

private:
    static std::mutex libraw_mutex_;
};
