/**
 * @file resolution_probe.cpp
 * @brief libavformat resolution probe implementation
 */

#include "multicam/resolution_probe.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <fmt/core.h>

#include "multicam/logging.hpp"

namespace multicam {

namespace {

struct Deadline {
  std::chrono::steady_clock::time_point at;
};

/// Non-zero return aborts the blocking libavformat call
int interrupt_on_deadline(void *opaque) {
  auto *deadline = static_cast<Deadline *>(opaque);
  return std::chrono::steady_clock::now() > deadline->at ? 1 : 0;
}

/// Closes the context on every return path
struct FormatContextGuard {
  AVFormatContext *ctx = nullptr;
  ~FormatContextGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

} // anonymous namespace

AvResolutionProbe::AvResolutionProbe(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
  av_log_set_level(AV_LOG_ERROR);
}

Status AvResolutionProbe::probe(const std::string &path, Resolution &out) {
  Deadline deadline{std::chrono::steady_clock::now() + timeout_};

  FormatContextGuard guard;
  guard.ctx = avformat_alloc_context();
  if (!guard.ctx) {
    return Status::error(ErrorKind::ResolutionUnknown,
                         "Failed to allocate AVFormatContext");
  }
  guard.ctx->interrupt_callback.callback = interrupt_on_deadline;
  guard.ctx->interrupt_callback.opaque = &deadline;

  /// On failure avformat_open_input frees the context and nulls the pointer
  if (avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr) < 0) {
    return Status::error(ErrorKind::ResolutionUnknown,
                         fmt::format("Could not open {}", path));
  }

  /// Reads some packets to fill in codec parameters
  if (avformat_find_stream_info(guard.ctx, nullptr) < 0) {
    return Status::error(ErrorKind::ResolutionUnknown,
                         fmt::format("Could not read stream info of {}", path));
  }

  int video_stream_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    return Status::error(ErrorKind::ResolutionUnknown,
                         fmt::format("No video stream found in {}", path));
  }

  const AVCodecParameters *param =
      guard.ctx->streams[video_stream_idx]->codecpar;
  if (param->width <= 0 || param->height <= 0) {
    return Status::error(
        ErrorKind::ResolutionUnknown,
        fmt::format("Video stream of {} has no dimensions", path));
  }

  out.width = param->width;
  out.height = param->height;
  return Status::success();
}

} // namespace multicam
