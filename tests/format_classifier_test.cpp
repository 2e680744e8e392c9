#include <gtest/gtest.h>
#include "core/format_classifier.hpp"

TEST(FormatClassifierTest, ClassifiesDefaultImageAndVideoExtensions)
{
    FormatConfig config = FormatConfig::defaults();

    EXPECT_EQ(FormatClassifier::classify("/photos/a.jpg", config), MediaType::IMAGE);
    EXPECT_EQ(FormatClassifier::classify("/photos/b.HEIC", config), MediaType::IMAGE);
    EXPECT_EQ(FormatClassifier::classify("/photos/c.Nef", config), MediaType::IMAGE);
    EXPECT_EQ(FormatClassifier::classify("/videos/d.MP4", config), MediaType::VIDEO);
    EXPECT_EQ(FormatClassifier::classify("/videos/e.3gp", config), MediaType::VIDEO);
}

TEST(FormatClassifierTest, IgnoresUnknownAndMissingExtensions)
{
    FormatConfig config = FormatConfig::defaults();

    EXPECT_FALSE(FormatClassifier::classify("/docs/notes.txt", config).has_value());
    EXPECT_FALSE(FormatClassifier::classify("/docs/README", config).has_value());
    EXPECT_FALSE(FormatClassifier::classify("/docs/trailing.", config).has_value());
    EXPECT_FALSE(FormatClassifier::classify("/photos.jpg/file", config).has_value());
}

TEST(FormatClassifierTest, RespectsCustomAllowLists)
{
    FormatConfig config;
    config.image_formats = {"png"};
    config.video_formats = {"mkv"};

    EXPECT_EQ(FormatClassifier::classify("x.png", config), MediaType::IMAGE);
    EXPECT_EQ(FormatClassifier::classify("x.mkv", config), MediaType::VIDEO);
    EXPECT_FALSE(FormatClassifier::classify("x.jpg", config).has_value());
    EXPECT_FALSE(FormatClassifier::classify("x.mp4", config).has_value());
}

TEST(FormatClassifierTest, DefaultListsAreValid)
{
    FormatConfig config = FormatConfig::defaults();
    EXPECT_TRUE(config.isValid());
    EXPECT_EQ(config.image_formats.size(), 13u);
    EXPECT_EQ(config.video_formats.size(), 11u);
}

TEST(FormatClassifierTest, RejectsEmptyAllowList)
{
    FormatConfig config = FormatConfig::defaults();
    config.image_formats.clear();
    EXPECT_EQ(config.validate(), "At least one image format must be selected.");

    config = FormatConfig::defaults();
    config.video_formats.clear();
    EXPECT_EQ(config.validate(), "At least one video format must be selected.");
}

TEST(FormatClassifierTest, RejectsMalformedFormatNames)
{
    FormatConfig config = FormatConfig::defaults();

    config.image_formats = {".jpg"};
    EXPECT_FALSE(config.isValid());

    config.image_formats = {"JPG"};
    EXPECT_FALSE(config.isValid());

    config.image_formats = {"j-pg"};
    EXPECT_FALSE(config.isValid());

    config.image_formats = {""};
    EXPECT_FALSE(config.isValid());
}

TEST(FormatClassifierTest, NormalizesExtensions)
{
    EXPECT_EQ(FormatClassifier::normalizeExtension(".JPG"), "jpg");
    EXPECT_EQ(FormatClassifier::normalizeExtension("Mov"), "mov");
    EXPECT_EQ(FormatClassifier::normalizeExtension(""), "");
}

TEST(FormatClassifierTest, NonAsciiNamesAreClassifiedByExtension)
{
    FormatConfig config = FormatConfig::defaults();
    EXPECT_EQ(FormatClassifier::classify("/photos/\xC3\x89t\xC3\xA9 \xE5\x86\x99\xE7\x9C\x9F.JPG", config), MediaType::IMAGE);
    EXPECT_EQ(FormatClassifier::normalizeExtension(".M\xC3\x96V"), "m\xC3\x96v");
    EXPECT_FALSE(FormatClassifier::classify("/clips/caf\xC3\xA9.\xC3\xA9x", config).has_value());
}
