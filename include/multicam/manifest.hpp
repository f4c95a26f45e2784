/**
 * @file manifest.hpp
 * @brief Job descriptor parsing and validation
 *
 * @details A manifest holds one job per line:
 *
 *          date|sequence|start|end|angle=path|angle=path...
 *
 *          e.g. "10-02|1|18:30:00|20:45:00|wide=/media/cam1.mp4"
 *
 *          Blank lines and lines starting with '#' are ignored.
 */

#ifndef MULTICAM_MANIFEST_HPP
#define MULTICAM_MANIFEST_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace multicam {

/**
 * @brief Parse one manifest line.
 * @return Validation error naming the problem
 */
Status parse_manifest_line(const std::string &line, JobDescriptor &out);

/**
 * @brief Read every job from a manifest file.
 * @return Validation error with the offending line number
 */
Status load_manifest(const std::string &path, std::vector<JobDescriptor> &out);

/**
 * @brief Check a single descriptor: clock format, end after start, at
 *        least one angle, positive sequence.
 */
Status validate_job(const JobDescriptor &job);

/**
 * @brief validate_job() on every entry, plus no duplicate job ids and no
 *        overlapping windows between jobs of the same event date.
 */
Status validate_batch(const std::vector<JobDescriptor> &jobs);

} // namespace multicam

#endif // MULTICAM_MANIFEST_HPP
