// Unit tests for the ffmpeg command builders and tool failure reporting

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "fixtures/fake_tools.hpp"
#include "multicam/ffmpeg_tools.hpp"
#include "multicam/resolution_probe.hpp"

namespace multicam {
namespace {

bool Contains(const std::vector<std::string> &args, const std::string &a) {
  return std::find(args.begin(), args.end(), a) != args.end();
}

/// Value following a flag, empty if absent
std::string After(const std::vector<std::string> &args, const std::string &flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end()) return "";
  return *(it + 1);
}

TEST(FfmpegExtractorTest, StreamCopyBetweenWindowBounds) {
  FfmpegSegmentExtractor extractor("ffmpeg");
  auto cmd = extractor.build_command("/media/cam 1.mp4", 66600.0, 74700.5,
                                     "/work/segments/x.mp4");

  EXPECT_EQ(cmd.front(), "ffmpeg");
  EXPECT_EQ(cmd.back(), "/work/segments/x.mp4");
  EXPECT_EQ(After(cmd, "-ss"), "66600.000");
  EXPECT_EQ(After(cmd, "-to"), "74700.500");
  EXPECT_EQ(After(cmd, "-i"), "/media/cam 1.mp4");
  EXPECT_EQ(After(cmd, "-c"), "copy");
  EXPECT_TRUE(Contains(cmd, "-y"));
}

TEST(FfmpegTranscoderTest, SoftwareUsesLibx264) {
  FfmpegTranscoder transcoder("/opt/ffmpeg/bin/ffmpeg");
  auto cmd = transcoder.build_command("in.mp4", "out.mp4", {1920, 1080},
                                      TranscodeBackend::Software);

  EXPECT_EQ(cmd.front(), "/opt/ffmpeg/bin/ffmpeg");
  EXPECT_EQ(After(cmd, "-c:v"), "libx264");
  EXPECT_EQ(After(cmd, "-vf"), "scale=1920:1080");
  EXPECT_FALSE(Contains(cmd, "-hwaccel"));
  EXPECT_EQ(cmd.back(), "out.mp4");
}

TEST(FfmpegTranscoderTest, HardwareUsesNvenc) {
  FfmpegTranscoder transcoder("ffmpeg");
  auto cmd = transcoder.build_command("in.mp4", "out.mp4", {1920, 1080},
                                      TranscodeBackend::Hardware);

  EXPECT_EQ(After(cmd, "-hwaccel"), "cuda");
  EXPECT_EQ(After(cmd, "-c:v"), "h264_nvenc");
  EXPECT_EQ(After(cmd, "-vf"), "scale_cuda=1920:1080");
  EXPECT_EQ(After(cmd, "-i"), "in.mp4");
}

TEST(FfmpegExtractorTest, NonZeroExitIsToolInvocationError) {
  fakes::TempDir dir;
  FfmpegSegmentExtractor extractor("false");

  Status s = extractor.extract("/media/a.mp4", 0, 10, dir.file("x.mp4"));
  EXPECT_EQ(s.kind, ErrorKind::ToolInvocation);
  EXPECT_NE(s.message.find("status 1"), std::string::npos) << s.message;
}

TEST(FfmpegTranscoderTest, MissingBinaryIsToolInvocationError) {
  fakes::TempDir dir;
  FfmpegTranscoder transcoder("multicam-no-such-ffmpeg");

  Status s = transcoder.transcode(dir.file("in.mp4"), dir.file("out.mp4"),
                                  {1920, 1080}, TranscodeBackend::Software);
  EXPECT_EQ(s.kind, ErrorKind::ToolInvocation);
  EXPECT_NE(s.message.find("command not found"), std::string::npos)
      << s.message;
}

TEST(AvResolutionProbeTest, MissingFileIsResolutionUnknown) {
  AvResolutionProbe probe(std::chrono::milliseconds(2000));
  Resolution r;
  Status s = probe.probe("/nonexistent/clip.mp4", r);
  EXPECT_EQ(s.kind, ErrorKind::ResolutionUnknown);
}

TEST(AvResolutionProbeTest, NonVideoFileIsResolutionUnknown) {
  fakes::TempDir dir;
  std::string path = dir.file("notes.txt");
  fakes::WriteFile(path, "not a video container\n");

  AvResolutionProbe probe(std::chrono::milliseconds(2000));
  Resolution r;
  EXPECT_EQ(probe.probe(path, r).kind, ErrorKind::ResolutionUnknown);
}

}  // namespace
}  // namespace multicam
