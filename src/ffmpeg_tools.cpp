/**
 * @file ffmpeg_tools.cpp
 * @brief ffmpeg execution implementation
 */

#include "multicam/ffmpeg_tools.hpp"

#include <filesystem>

#include <fmt/core.h>

#include "multicam/logging.hpp"
#include "multicam/process.hpp"
#include "multicam/system.hpp"

namespace multicam {

namespace {

/// ffmpeg accepts fractional seconds for -ss / -to
std::string seconds_arg(double seconds) { return fmt::format("{:.3f}", seconds); }

Status tool_failure(const char *what, const ProcessResult &r) {
  if (!r.started) {
    return Status::error(ErrorKind::ToolInvocation,
                         fmt::format("{}: could not start ffmpeg", what));
  }
  if (r.timed_out) {
    return Status::error(ErrorKind::ToolInvocation,
                         fmt::format("{}: ffmpeg timed out", what));
  }
  return Status::error(ErrorKind::ToolInvocation,
                       fmt::format("{}: ffmpeg exited with status {}: {}",
                                   what, r.exit_code, r.stderr_tail));
}

} // anonymous namespace

// **---- Extraction ----**

FfmpegSegmentExtractor::FfmpegSegmentExtractor(std::string ffmpeg_bin)
    : ffmpeg_bin_(std::move(ffmpeg_bin)) {}

std::vector<std::string>
FfmpegSegmentExtractor::build_command(const std::string &source_path,
                                      double start, double end,
                                      const std::string &output_path) const {
  return {ffmpeg_bin_,
          "-y",
          "-hide_banner",
          "-loglevel",
          "error",
          "-ss",
          seconds_arg(start),
          "-to",
          seconds_arg(end),
          "-i",
          source_path,
          "-c",
          "copy",
          "-avoid_negative_ts",
          "make_zero",
          "-movflags",
          "+faststart",
          output_path};
}

Status FfmpegSegmentExtractor::extract(const std::string &source_path,
                                       double start, double end,
                                       const std::string &output_path) {
  auto cmd = build_command(source_path, start, end, output_path);
  LOG_INFO("Extracting {} -> {} ({} to {})",
           std::filesystem::path(source_path).filename().string(),
           std::filesystem::path(output_path).filename().string(),
           format_time(start), format_time(end));

  ProcessResult r = run_process(cmd);
  if (!r.ok()) {
    Status s = tool_failure("extract", r);
    LOG_ERROR("{}", s.message);
    return s;
  }
  return Status::success();
}

// **---- Transcoding ----**

FfmpegTranscoder::FfmpegTranscoder(std::string ffmpeg_bin)
    : ffmpeg_bin_(std::move(ffmpeg_bin)) {}

std::vector<std::string>
FfmpegTranscoder::build_command(const std::string &input_path,
                                const std::string &output_path,
                                Resolution target,
                                TranscodeBackend backend) const {
  std::vector<std::string> cmd = {ffmpeg_bin_, "-y", "-hide_banner",
                                  "-loglevel", "error"};

  if (backend == TranscodeBackend::Hardware) {
    cmd.insert(cmd.end(),
               {"-hwaccel", "cuda", "-hwaccel_output_format", "cuda", "-i",
                input_path, "-vf",
                fmt::format("scale_cuda={}:{}", target.width, target.height),
                "-c:v", "h264_nvenc", "-preset", "p7", "-tune", "hq", "-rc",
                "vbr", "-cq", "19", "-b:v", "8M", "-maxrate", "12M",
                "-bufsize", "16M"});
  } else {
    cmd.insert(cmd.end(),
               {"-i", input_path, "-vf",
                fmt::format("scale={}:{}", target.width, target.height),
                "-c:v", "libx264", "-preset", "slow", "-crf", "20",
                "-pix_fmt", "yuv420p"});
  }

  cmd.insert(cmd.end(), {"-c:a", "aac", "-b:a", "192k", "-movflags",
                         "+faststart", output_path});
  return cmd;
}

Status FfmpegTranscoder::transcode(const std::string &input_path,
                                   const std::string &output_path,
                                   Resolution target,
                                   TranscodeBackend backend) {
  auto cmd = build_command(input_path, output_path, target, backend);
  LOG_INFO("Transcoding {} to {}x{} ({})",
           std::filesystem::path(input_path).filename().string(), target.width,
           target.height, to_string(backend));

  ProcessResult r = run_process(cmd);
  if (!r.ok()) {
    Status s = tool_failure(backend == TranscodeBackend::Hardware
                                ? "hardware transcode"
                                : "software transcode",
                            r);
    LOG_ERROR("{}", s.message);
    return s;
  }
  return Status::success();
}

} // namespace multicam
