#include "test_base.hpp"
#include "core/video_metadata_reader.hpp"

class VideoMetadataReaderTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        probe_ = std::make_shared<FakeMediaProbe>();
        video_path_ = writeFile("clip.mp4", std::string(1024, 'v'));
    }

    std::shared_ptr<FakeMediaProbe> probe_;
    std::string video_path_;
};

TEST_F(VideoMetadataReaderTest, ReadsDurationCodecAndDimensions)
{
    probe_->setVideo(video_path_, 12.0, "h264", 1920, 1080);

    VideoMetadataReader reader(probe_);
    auto result = reader.readVideo(video_path_);

    ASSERT_TRUE(result.success) << result.error.message;
    const MediaMetadata &md = result.value;
    EXPECT_DOUBLE_EQ(md.duration_seconds.value_or(-1), 12.0);
    EXPECT_EQ(md.video_codec.value_or(""), "h264");
    EXPECT_EQ(md.width, 1920);
    EXPECT_EQ(md.height, 1080);
    EXPECT_EQ(md.file_size, 1024u);
    EXPECT_EQ(probe_->calls(), 1u);
}

TEST_F(VideoMetadataReaderTest, CaptureDateIsFileModificationTime)
{
    probe_->setVideo(video_path_, 3.0, "hevc", 1280, 720);

    VideoMetadataReader reader(probe_);
    auto result = reader.readVideo(video_path_);

    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.value.capture_date.has_value());
    EXPECT_EQ(*result.value.capture_date, result.value.file_modified);
    EXPECT_FALSE(result.value.camera_make.has_value());
    EXPECT_FALSE(result.value.gps_latitude.has_value());
}

TEST_F(VideoMetadataReaderTest, MissingCodecNameIsUnknown)
{
    probe_->setVideo(video_path_, 3.0, "", 640, 480);

    VideoMetadataReader reader(probe_);
    auto result = reader.readVideo(video_path_);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.value.video_codec.value_or(""), "unknown");
}

TEST_F(VideoMetadataReaderTest, AudioOnlyContainerHasNoVideoStream)
{
    probe_->setAudioOnly(video_path_, 180.0);

    VideoMetadataReader reader(probe_);
    auto result = reader.readVideo(video_path_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, MediaErrorKind::NO_VIDEO_STREAM);
}

TEST_F(VideoMetadataReaderTest, MissingDurationIsDecodeFailure)
{
    ProbeInfo info;
    info.has_video_stream = true;
    info.codec_name = "h264";
    info.width = 640;
    info.height = 480;
    probe_->set(video_path_, info);

    VideoMetadataReader reader(probe_);
    auto result = reader.readVideo(video_path_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, MediaErrorKind::DECODE_FAILURE);
}

TEST_F(VideoMetadataReaderTest, ProbeFailureIsPropagated)
{
    probe_->setError(video_path_, MediaErrorKind::DECODE_FAILURE, "moov atom not found");

    VideoMetadataReader reader(probe_);
    auto result = reader.readVideo(video_path_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, MediaErrorKind::DECODE_FAILURE);
    EXPECT_EQ(result.error.message, "moov atom not found");
}

TEST_F(VideoMetadataReaderTest, NoProbeMeansToolUnavailable)
{
    VideoMetadataReader reader(nullptr);
    auto result = reader.readVideo(video_path_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE);
}

TEST_F(VideoMetadataReaderTest, MissingFileIsUnreadable)
{
    VideoMetadataReader reader(probe_);
    auto result = reader.readVideo(rootPath("gone.mp4"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, MediaErrorKind::UNREADABLE_FILE);
    EXPECT_EQ(probe_->calls(), 0u);
}
