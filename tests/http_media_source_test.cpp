#include <gtest/gtest.h>

#include "Errors.hpp"
#include "HttpMediaSource.hpp"

namespace fetcher {
namespace {

TEST(HttpMediaSourceTest, FileNameFromUrl) {
  EXPECT_EQ(
      HttpMediaSource::fileNameFromUrl("https://cdn.example.com/v/clip.mp4"),
      "clip.mp4");
  EXPECT_EQ(HttpMediaSource::fileNameFromUrl(
                "https://cdn.example.com/a/song.m4a?sig=abc&x=1#t=10"),
            "song.m4a");
  EXPECT_EQ(HttpMediaSource::fileNameFromUrl("https://cdn.example.com"),
            "download");
  EXPECT_EQ(HttpMediaSource::fileNameFromUrl("https://cdn.example.com/"),
            "download");
  EXPECT_EQ(HttpMediaSource::fileNameFromUrl("https://cdn.example.com/dir/"),
            "download");
  EXPECT_EQ(HttpMediaSource::fileNameFromUrl("https://cdn.example.com/a/.."),
            "download");
}

TEST(HttpMediaSourceTest, LayoutFromContentType) {
  EXPECT_EQ(HttpMediaSource::layoutFromContentType("video/mp4"),
            StreamLayout::AUDIO_VIDEO);
  EXPECT_EQ(HttpMediaSource::layoutFromContentType("Video/WebM; codecs=vp9"),
            StreamLayout::AUDIO_VIDEO);
  EXPECT_EQ(HttpMediaSource::layoutFromContentType("audio/mpeg"),
            StreamLayout::AUDIO_ONLY);
  EXPECT_EQ(HttpMediaSource::layoutFromContentType("text/html"),
            StreamLayout::UNKNOWN);
  EXPECT_EQ(HttpMediaSource::layoutFromContentType(""), StreamLayout::UNKNOWN);
}

TEST(HttpMediaSourceTest, IsHttpUrl) {
  EXPECT_TRUE(HttpMediaSource::isHttpUrl("http://example.com/a.mp4"));
  EXPECT_TRUE(HttpMediaSource::isHttpUrl("HTTPS://example.com"));
  EXPECT_FALSE(HttpMediaSource::isHttpUrl("not-a-url"));
  EXPECT_FALSE(HttpMediaSource::isHttpUrl("ftp://example.com/a.mp4"));
  EXPECT_FALSE(HttpMediaSource::isHttpUrl("http://"));
  EXPECT_FALSE(HttpMediaSource::isHttpUrl("https:///path"));
}

TEST(HttpMediaSourceTest, ResolveRejectsNonHttpTargetWithoutNetwork) {
  HttpMediaSource source;
  EXPECT_THROW(source.resolve("not-a-url", std::nullopt), ResolutionError);
}

TEST(HttpMediaSourceTest, TransferIntoMissingDirectoryFails) {
  HttpMediaSource source;
  StreamDescriptor stream;
  stream.locator = "http://127.0.0.1:9/clip.mp4";
  stream.fileName = "clip.mp4";
  EXPECT_THROW(source.transfer(stream, "/nonexistent-media-fetcher-dir",
                               std::nullopt, nullptr),
               TransferError);
}

}  // namespace
}  // namespace fetcher
