/**
 * @file ffmpeg_tools.hpp
 * @brief ffmpeg-backed extraction and transcoding
 *
 * @details Both classes build an argument vector and run the ffmpeg binary
 *          named by FFMPEG_BIN. Neither has a deadline: cuts of long
 *          recordings and 4K transcodes legitimately take many minutes.
 */

#ifndef MULTICAM_FFMPEG_TOOLS_HPP
#define MULTICAM_FFMPEG_TOOLS_HPP

#include <string>
#include <vector>

#include "media_tools.hpp"

namespace multicam {

/**
 * @class FfmpegSegmentExtractor
 * @brief Stream-copy cut (-c copy), no re-encoding.
 */
class FfmpegSegmentExtractor : public SegmentExtractor {
public:
  explicit FfmpegSegmentExtractor(std::string ffmpeg_bin);

  Status extract(const std::string &source_path, double start, double end,
                 const std::string &output_path) override;

  /// Argument vector for a cut, exposed for inspection
  std::vector<std::string> build_command(const std::string &source_path,
                                         double start, double end,
                                         const std::string &output_path) const;

private:
  std::string ffmpeg_bin_;
};

/**
 * @class FfmpegTranscoder
 * @brief Downscale with h264_nvenc (hardware) or libx264 (software).
 */
class FfmpegTranscoder : public Transcoder {
public:
  explicit FfmpegTranscoder(std::string ffmpeg_bin);

  Status transcode(const std::string &input_path,
                   const std::string &output_path, Resolution target,
                   TranscodeBackend backend) override;

  std::vector<std::string> build_command(const std::string &input_path,
                                         const std::string &output_path,
                                         Resolution target,
                                         TranscodeBackend backend) const;

private:
  std::string ffmpeg_bin_;
};

} // namespace multicam

#endif // MULTICAM_FFMPEG_TOOLS_HPP
