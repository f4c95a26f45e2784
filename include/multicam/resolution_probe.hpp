/**
 * @file resolution_probe.hpp
 * @brief Video stream dimension probing with libavformat
 *
 * @details Opens the container, reads stream info and returns the codec
 *          dimensions of the best video stream. No decoding takes place.
 *
 * @attention THREAD MODEL:
 *            - Every probe() call owns its AVFormatContext, so one
 *              AvResolutionProbe may be shared by all pipelines.
 */

#ifndef MULTICAM_RESOLUTION_PROBE_HPP
#define MULTICAM_RESOLUTION_PROBE_HPP

#include <chrono>
#include <string>

#include "media_tools.hpp"

namespace multicam {

/**
 * @class AvResolutionProbe
 * @brief ResolutionProber backed by libavformat.
 *
 * @note The probe is bounded by a deadline enforced through the
 *       AVIOInterruptCB of the format context; a stalled read (network
 *       mount, damaged file) aborts with ResolutionUnknown.
 */
class AvResolutionProbe : public ResolutionProber {
public:
  explicit AvResolutionProbe(std::chrono::milliseconds timeout);

  Status probe(const std::string &path, Resolution &out) override;

private:
  std::chrono::milliseconds timeout_;
};

} // namespace multicam

#endif // MULTICAM_RESOLUTION_PROBE_HPP
