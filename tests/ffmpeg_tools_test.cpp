#include "test_base.hpp"
#include "core/decoder/ffmpeg_tools.hpp"
#include <algorithm>
#include <filesystem>
#include <iterator>

namespace fs = std::filesystem;

class FfmpegToolsTest : public TestBase
{
protected:
    /**
     * @brief Install an executable shell script standing in for ffmpeg/ffprobe
     */
    std::string writeScript(const std::string &name, const std::string &body)
    {
        std::string path = writeFile("bin/" + name, "#!/bin/sh\n" + body);
        fs::permissions(path, fs::perms::owner_all);
        return path;
    }
};

TEST_F(FfmpegToolsTest, BuildsSingleFrameCommand)
{
    FfmpegFrameSource source("ffmpeg");
    auto command = source.buildCommand("/videos/a.mp4", 5.0);

    std::vector<std::string> expected = {"ffmpeg", "-hide_banner", "-loglevel", "error", "-ss", "5.000",
                                         "-threads", "1", "-i", "/videos/a.mp4", "-frames:v", "1", "-an",
                                         "-f", "image2pipe", "-vcodec", "png", "pipe:1"};
    EXPECT_EQ(command, expected);
}

TEST_F(FfmpegToolsTest, StillCommandDisablesAutorotate)
{
    FfmpegFrameSource source("ffmpeg");
    auto command = source.buildCommand("/photos/a.heic", 0.0, false);

    auto noautorotate = std::find(command.begin(), command.end(), "-noautorotate");
    auto input = std::find(command.begin(), command.end(), "-i");
    ASSERT_NE(noautorotate, command.end());
    ASSERT_NE(input, command.end());
    EXPECT_LT(std::distance(command.begin(), noautorotate), std::distance(command.begin(), input));

    auto video = source.buildCommand("/videos/a.mp4", 0.0);
    EXPECT_EQ(std::find(video.begin(), video.end(), "-noautorotate"), video.end());
}

TEST_F(FfmpegToolsTest, ClassifiesStderr)
{
    EXPECT_EQ(FfmpegFrameSource::classifyFailure("Output file #0 does not contain any stream"),
              MediaErrorKind::NO_VIDEO_STREAM);
    EXPECT_EQ(FfmpegFrameSource::classifyFailure("Stream map '0:v' matches no streams."),
              MediaErrorKind::NO_VIDEO_STREAM);
    EXPECT_EQ(FfmpegFrameSource::classifyFailure("Decoder (codec av1) not found for input stream #0:0"),
              MediaErrorKind::UNSUPPORTED_CODEC);
    EXPECT_EQ(FfmpegFrameSource::classifyFailure("/x.mp4: No such file or directory"),
              MediaErrorKind::UNREADABLE_FILE);
    EXPECT_EQ(FfmpegFrameSource::classifyFailure("moov atom not found\nInvalid data found when processing input"),
              MediaErrorKind::DECODE_FAILURE);
    EXPECT_EQ(FfmpegFrameSource::classifyFailure(""), MediaErrorKind::DECODE_FAILURE);
}

TEST_F(FfmpegToolsTest, ExtractsCodecName)
{
    EXPECT_EQ(FfmpegFrameSource::extractCodecName("Decoder (codec av1) not found"), "av1");
    EXPECT_EQ(FfmpegFrameSource::extractCodecName("nothing useful"), "");
}

TEST_F(FfmpegToolsTest, ParsesProbeOutput)
{
    const std::string json = R"({
        "streams": [
            {"index": 0, "codec_type": "audio", "codec_name": "aac", "duration": "12.0"},
            {"index": 1, "codec_type": "video", "codec_name": "h264", "width": 1920, "height": 1080,
             "duration": "11.5", "disposition": {"attached_pic": 0}}
        ],
        "format": {"filename": "b.mp4", "duration": "12.000000"}
    })";

    auto result = FfprobeMediaProbe::parseProbeOutput(json);
    ASSERT_TRUE(result.success) << result.error.message;
    EXPECT_TRUE(result.value.has_video_stream);
    EXPECT_EQ(result.value.codec_name, "h264");
    EXPECT_EQ(result.value.width, 1920);
    EXPECT_EQ(result.value.height, 1080);
    EXPECT_TRUE(result.value.has_duration);
    EXPECT_DOUBLE_EQ(result.value.duration_seconds, 12.0);
}

TEST_F(FfmpegToolsTest, ParsesRotatedStream)
{
    const std::string json = R"({"streams": [{"codec_type": "video", "codec_name": "hevc",
                                              "width": 1920, "height": 1080,
                                              "side_data_list": [{"side_data_type": "Display Matrix",
                                                                  "rotation": -90}]}],
                                 "format": {"duration": "8.0"}})";

    auto result = FfprobeMediaProbe::parseProbeOutput(json);
    ASSERT_TRUE(result.success) << result.error.message;
    EXPECT_EQ(result.value.rotation, 270);
    EXPECT_EQ(result.value.width, 1080);
    EXPECT_EQ(result.value.height, 1920);
}

TEST_F(FfmpegToolsTest, ParsesLegacyRotateTag)
{
    const std::string rotated = R"({"streams": [{"codec_type": "video", "codec_name": "h264",
                                                 "width": 1280, "height": 720, "tags": {"rotate": "90"}}],
                                    "format": {"duration": "4.0"}})";
    auto portrait = FfprobeMediaProbe::parseProbeOutput(rotated);
    ASSERT_TRUE(portrait.success);
    EXPECT_EQ(portrait.value.width, 720);
    EXPECT_EQ(portrait.value.height, 1280);

    const std::string upside_down = R"({"streams": [{"codec_type": "video", "codec_name": "h264",
                                                     "width": 1280, "height": 720, "tags": {"rotate": "180"}}],
                                        "format": {"duration": "4.0"}})";
    auto flipped = FfprobeMediaProbe::parseProbeOutput(upside_down);
    ASSERT_TRUE(flipped.success);
    EXPECT_EQ(flipped.value.rotation, 180);
    EXPECT_EQ(flipped.value.width, 1280);
    EXPECT_EQ(flipped.value.height, 720);
}

TEST_F(FfmpegToolsTest, StreamDurationIsUsedWithoutFormatDuration)
{
    const std::string json = R"({"streams": [{"codec_type": "video", "codec_name": "vp9",
                                              "width": 640, "height": 360, "duration": "3.25"}],
                                 "format": {}})";

    auto result = FfprobeMediaProbe::parseProbeOutput(json);
    ASSERT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.value.duration_seconds, 3.25);
}

TEST_F(FfmpegToolsTest, CoverArtIsNotAVideoStream)
{
    const std::string json = R"({"streams": [
            {"codec_type": "audio", "codec_name": "mp3"},
            {"codec_type": "video", "codec_name": "mjpeg", "width": 500, "height": 500,
             "disposition": {"attached_pic": 1}}],
        "format": {"duration": "200.0"}})";

    auto result = FfprobeMediaProbe::parseProbeOutput(json);
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(result.value.has_video_stream);
    EXPECT_TRUE(result.value.has_duration);
}

TEST_F(FfmpegToolsTest, MalformedProbeOutputIsDecodeFailure)
{
    auto result = FfprobeMediaProbe::parseProbeOutput("{not json");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, MediaErrorKind::DECODE_FAILURE);
}

TEST_F(FfmpegToolsTest, MissingBinaryIsToolUnavailable)
{
    FfmpegFrameSource source(rootPath("bin/no-ffmpeg"));
    EXPECT_FALSE(source.isAvailable());
    EXPECT_FALSE(source.getVersion().has_value());

    auto frame = source.extractFrame(rootPath("a.mp4"), 0.0);
    EXPECT_FALSE(frame.success);
    EXPECT_EQ(frame.error.kind, MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE);

    FfprobeMediaProbe probe(rootPath("bin/no-ffprobe"));
    auto info = probe.probe(rootPath("a.mp4"));
    EXPECT_FALSE(info.success);
    EXPECT_EQ(info.error.kind, MediaErrorKind::EXTERNAL_TOOL_UNAVAILABLE);
}

TEST_F(FfmpegToolsTest, ReadsFrameFromToolStdout)
{
    std::vector<uint8_t> png = encodePng(64, 48);
    std::string frame_file = writeFile("frame.png", std::string(png.begin(), png.end()));
    std::string tool = writeScript("ffmpeg",
                                   "if [ \"$1\" = \"-version\" ]; then echo 'ffmpeg version 6.1-test'; exit 0; fi\n"
                                   "cat '" + frame_file + "'\n");

    FfmpegFrameSource source(tool);
    ASSERT_TRUE(source.isAvailable());
    EXPECT_EQ(source.getVersion().value_or(""), "ffmpeg version 6.1-test");

    auto frame = source.extractFrame(rootPath("clip.mp4"), 5.0);
    ASSERT_TRUE(frame.success) << frame.error.message;
    EXPECT_EQ(frame.value, png);
}

TEST_F(FfmpegToolsTest, StillExtractionPassesNoAutorotate)
{
    std::vector<uint8_t> png = encodePng(32, 32);
    std::string frame_file = writeFile("still.png", std::string(png.begin(), png.end()));
    std::string tool = writeScript("ffmpeg",
                                   "if [ \"$1\" = \"-version\" ]; then echo 'ffmpeg version 6.1-test'; exit 0; fi\n"
                                   "case \" $* \" in\n"
                                   "  *\" -noautorotate \"*) cat '" + frame_file + "' ;;\n"
                                   "  *) echo 'autorotate enabled' >&2; exit 1 ;;\n"
                                   "esac\n");

    FfmpegFrameSource source(tool);
    auto still = source.extractStill(rootPath("photo.heic"));
    ASSERT_TRUE(still.success) << still.error.message;
    EXPECT_EQ(still.value, png);

    auto frame = source.extractFrame(rootPath("clip.mp4"), 0.0);
    EXPECT_FALSE(frame.success);
}

TEST_F(FfmpegToolsTest, ToolFailureIsClassified)
{
    std::string tool = writeScript("ffmpeg",
                                   "if [ \"$1\" = \"-version\" ]; then echo 'ffmpeg version 6.1-test'; exit 0; fi\n"
                                   "echo 'Decoder (codec av1) not found for input stream #0:0' >&2\n"
                                   "exit 1\n");

    FfmpegFrameSource source(tool);
    auto frame = source.extractFrame(rootPath("clip.mkv"), 0.0);

    EXPECT_FALSE(frame.success);
    EXPECT_EQ(frame.error.kind, MediaErrorKind::UNSUPPORTED_CODEC);
    EXPECT_NE(frame.error.message.find("av1"), std::string::npos);
}

TEST_F(FfmpegToolsTest, ProbeRunsToolAndParsesJson)
{
    std::string tool = writeScript("ffprobe",
                                   "if [ \"$1\" = \"-version\" ]; then echo 'ffprobe version 6.1-test'; exit 0; fi\n"
                                   "echo '{\"streams\":[{\"codec_type\":\"video\",\"codec_name\":\"hevc\","
                                   "\"width\":3840,\"height\":2160}],\"format\":{\"duration\":\"42.5\"}}'\n");

    FfprobeMediaProbe probe(tool);
    ASSERT_TRUE(probe.isAvailable());

    auto info = probe.probe(rootPath("clip.mov"));
    ASSERT_TRUE(info.success) << info.error.message;
    EXPECT_EQ(info.value.codec_name, "hevc");
    EXPECT_EQ(info.value.width, 3840);
    EXPECT_DOUBLE_EQ(info.value.duration_seconds, 42.5);
}
