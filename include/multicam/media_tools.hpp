/**
 * @file media_tools.hpp
 * @brief Interfaces to the external media capabilities
 *
 * @details The pipeline only sees these interfaces:
 *
 *          - SegmentExtractor: lossless cut of a time window
 *
 *          - ResolutionProber: width / height of the first video stream
 *
 *          - Transcoder: downscale on a hardware or software backend
 *
 *          Production implementations live in ffmpeg_tools.hpp and
 *          resolution_probe.hpp; tests substitute fakes.
 */

#ifndef MULTICAM_MEDIA_TOOLS_HPP
#define MULTICAM_MEDIA_TOOLS_HPP

#include <string>

#include "types.hpp"

namespace multicam {

enum class TranscodeBackend { Hardware, Software };

inline const char *to_string(TranscodeBackend b) {
  return b == TranscodeBackend::Hardware ? "hardware" : "software";
}

class SegmentExtractor {
public:
  virtual ~SegmentExtractor() = default;

  /**
   * @brief Copy [start, end] of source into output without re-encoding.
   * @return ToolInvocation error on failure
   */
  virtual Status extract(const std::string &source_path, double start,
                         double end, const std::string &output_path) = 0;
};

class ResolutionProber {
public:
  virtual ~ResolutionProber() = default;

  /**
   * @return ResolutionUnknown error if no video stream dimensions are found
   */
  virtual Status probe(const std::string &path, Resolution &out) = 0;
};

class Transcoder {
public:
  virtual ~Transcoder() = default;

  virtual Status transcode(const std::string &input_path,
                           const std::string &output_path, Resolution target,
                           TranscodeBackend backend) = 0;
};

/**
 * @struct MediaTools
 * @brief Non-owning bundle handed to every pipeline.
 */
struct MediaTools {
  SegmentExtractor *extractor = nullptr;
  ResolutionProber *prober = nullptr;
  Transcoder *transcoder = nullptr;
};

} // namespace multicam

#endif // MULTICAM_MEDIA_TOOLS_HPP
