#include "core/decoder/raw_decoder.hpp"
#include "logging/logger.hpp"
#include <libraw/libraw.h>
#include <opencv2/imgproc.hpp>
#include <cstring>
#include <memory>

std::mutex RawDecoder::libraw_mutex_;

namespace
{
    // Owns a LibRaw processor and the memory image it hands out
    class LibRawHandle
    {
    public:
        LibRawHandle() : raw_(new LibRaw()), img_(nullptr) {}

        ~LibRawHandle()
        {
            if (img_)
                LibRaw::dcraw_clear_mem(img_);
            raw_->recycle();
        }

        LibRawHandle(const LibRawHandle &) = delete;
        LibRawHandle &operator=(const LibRawHandle &) = delete;

        LibRaw *get() { return raw_.get(); }

        void setImg(libraw_processed_image_t *img) { img_ = img; }
        libraw_processed_image_t *getImg() { return img_; }

    private:
        std::unique_ptr<LibRaw> raw_;
        libraw_processed_image_t *img_;
    };

    MediaErrorKind kindFor(int rc)
    {
        if (rc == LIBRAW_IO_ERROR)
            return MediaErrorKind::UNREADABLE_FILE;
        if (rc == LIBRAW_FILE_UNSUPPORTED)
            return MediaErrorKind::UNSUPPORTED_FORMAT;
        return MediaErrorKind::DECODE_FAILURE;
    }

    std::string describe(const std::string &step, int rc, const std::string &path)
    {
        return "LibRaw " + step + " failed: " + std::string(libraw_strerror(rc)) + " (" + std::to_string(rc) + ") for: " + path;
    }
}

MediaResult<cv::Mat> RawDecoder::decode(const std::string &file_path, bool half_size)
{
    using Result = MediaResult<cv::Mat>;
    std::lock_guard<std::mutex> lock(libraw_mutex_);

    try
    {
        LibRawHandle handle;
        LibRaw *raw = handle.get();

        raw->imgdata.params.use_camera_wb = 1;
        raw->imgdata.params.use_auto_wb = 0;
        raw->imgdata.params.no_auto_bright = 1;
        raw->imgdata.params.output_bps = 8;
        raw->imgdata.params.output_color = 1; // sRGB
        raw->imgdata.params.half_size = half_size ? 1 : 0;
        raw->imgdata.params.user_flip = 0;    // Orientation is applied by the thumbnailer

        int rc = raw->open_file(file_path.c_str());
        if (rc != LIBRAW_SUCCESS)
        {
            std::string msg = describe("open_file", rc, file_path);
            Logger::warn(msg);
            return Result::fail(kindFor(rc), msg);
        }

        rc = raw->unpack();
        if (rc != LIBRAW_SUCCESS)
        {
            std::string msg = describe("unpack", rc, file_path);
            Logger::warn(msg);
            return Result::fail(kindFor(rc), msg);
        }

        rc = raw->dcraw_process();
        if (rc != LIBRAW_SUCCESS)
        {
            std::string msg = describe("dcraw_process", rc, file_path);
            Logger::warn(msg);
            return Result::fail(kindFor(rc), msg);
        }

        libraw_processed_image_t *img = raw->dcraw_make_mem_image(&rc);
        if (!img || rc != LIBRAW_SUCCESS)
        {
            std::string msg = describe("dcraw_make_mem_image", rc, file_path);
            Logger::warn(msg);
            return Result::fail(MediaErrorKind::DECODE_FAILURE, msg);
        }
        handle.setImg(img);

        if (img->type != LIBRAW_IMAGE_BITMAP || img->colors != 3 || img->bits != 8 ||
            img->width == 0 || img->height == 0)
        {
            return Result::fail(MediaErrorKind::DECODE_FAILURE,
                                "Unexpected LibRaw output (" + std::to_string(img->width) + "x" +
                                    std::to_string(img->height) + ", " + std::to_string(img->colors) +
                                    " colors, " + std::to_string(img->bits) + " bits) for: " + file_path);
        }

        // Wrap LibRaw's buffer, then convert into an owned BGR matrix before it is freed
        cv::Mat rgb(img->height, img->width, CV_8UC3, img->data);
        cv::Mat bgr;
        cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);

        Logger::debug("Decoded RAW " + file_path + " (" + std::to_string(bgr.cols) + "x" + std::to_string(bgr.rows) + ")");
        return Result::ok(bgr);
    }
    catch (const cv::Exception &e)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, "OpenCV error converting RAW " + file_path + ": " + e.what());
    }
    catch (const std::bad_alloc &)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, "Out of memory decoding RAW: " + file_path);
    }
}

MediaResult<cv::Size> RawDecoder::readDimensions(const std::string &file_path)
{
    using Result = MediaResult<cv::Size>;
    std::lock_guard<std::mutex> lock(libraw_mutex_);

    LibRawHandle handle;
    int rc = handle.get()->open_file(file_path.c_str());
    if (rc != LIBRAW_SUCCESS)
    {
        return Result::fail(kindFor(rc), describe("open_file", rc, file_path));
    }

    const auto &sizes = handle.get()->imgdata.sizes;
    if (sizes.width == 0 || sizes.height == 0)
    {
        return Result::fail(MediaErrorKind::DECODE_FAILURE, "RAW header without dimensions: " + file_path);
    }
    return Result::ok(cv::Size(sizes.width, sizes.height));
}
