/**
 * @file manifest.cpp
 * @brief Manifest parsing and job validation
 */

#include "multicam/manifest.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <map>
#include <set>
#include <sstream>

#include <fmt/core.h>

#include "multicam/system.hpp"

namespace multicam {

namespace {

std::string trim(const std::string &s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

/// Ids end up in object keys and file names
bool valid_id(const std::string &s) {
  if (s.empty())
    return false;
  for (unsigned char c : s) {
    if (!std::isalnum(c) && c != '-' && c != '_')
      return false;
  }
  return true;
}

Status invalid(std::string msg) {
  return Status::error(ErrorKind::Validation, std::move(msg));
}

struct Window {
  std::string job_id;
  double start;
  double end;
};

} // anonymous namespace

Status parse_manifest_line(const std::string &line, JobDescriptor &out) {
  std::vector<std::string> fields;
  std::stringstream ss(line);
  std::string field;
  while (std::getline(ss, field, '|')) {
    fields.push_back(trim(field));
  }
  if (fields.size() < 5) {
    return invalid("Expected date|sequence|start|end|angle=path...");
  }

  JobDescriptor d;
  d.event_date = fields[0];

  char *end = nullptr;
  errno = 0;
  long seq = std::strtol(fields[1].c_str(), &end, 10);
  if (fields[1].empty() || *end != '\0') {
    return invalid(fmt::format("Bad sequence number '{}'", fields[1]));
  }
  /// A wrapped value would alias another job's id and destination key
  if (errno == ERANGE || seq > INT_MAX || seq < INT_MIN) {
    return invalid(fmt::format("Sequence number '{}' out of range", fields[1]));
  }
  d.sequence = static_cast<int>(seq);
  d.window_start = fields[2];
  d.window_end = fields[3];

  for (size_t i = 4; i < fields.size(); ++i) {
    auto eq = fields[i].find('=');
    if (eq == std::string::npos) {
      return invalid(fmt::format("Bad angle entry '{}'", fields[i]));
    }
    std::string angle = trim(fields[i].substr(0, eq));
    std::string path = trim(fields[i].substr(eq + 1));
    if (!d.angles.emplace(angle, path).second) {
      return invalid(fmt::format("Duplicate angle '{}'", angle));
    }
  }

  out = std::move(d);
  return Status::success();
}

Status load_manifest(const std::string &path, std::vector<JobDescriptor> &out) {
  std::ifstream in(path);
  if (!in) {
    return invalid(fmt::format("Cannot open manifest {}", path));
  }

  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string t = trim(line);
    if (t.empty() || t[0] == '#')
      continue;

    JobDescriptor d;
    Status s = parse_manifest_line(t, d);
    if (!s.ok()) {
      return invalid(fmt::format("{}:{}: {}", path, line_no, s.message));
    }
    out.push_back(std::move(d));
  }
  return Status::success();
}

Status validate_job(const JobDescriptor &job) {
  if (!valid_id(job.event_date)) {
    return invalid(fmt::format("Bad event date '{}'", job.event_date));
  }
  if (job.sequence <= 0) {
    return invalid(fmt::format("Sequence must be positive, got {}",
                               job.sequence));
  }

  double start = 0;
  double end = 0;
  if (!parse_clock(job.window_start, start)) {
    return invalid(fmt::format("Bad start time '{}'", job.window_start));
  }
  if (!parse_clock(job.window_end, end)) {
    return invalid(fmt::format("Bad end time '{}'", job.window_end));
  }
  if (end <= start) {
    return invalid(fmt::format("End {} is not after start {}", job.window_end,
                               job.window_start));
  }

  if (job.angles.empty()) {
    return invalid("No angles configured");
  }
  for (const auto &angle : job.angles) {
    if (!valid_id(angle.first)) {
      return invalid(fmt::format("Bad angle id '{}'", angle.first));
    }
    if (angle.second.empty()) {
      return invalid(fmt::format("Angle '{}' has no source path",
                                 angle.first));
    }
  }
  return Status::success();
}

Status validate_batch(const std::vector<JobDescriptor> &jobs) {
  std::set<std::string> ids;
  std::map<std::string, std::vector<Window>> by_date;

  for (const auto &job : jobs) {
    Job j(job);
    Status s = validate_job(job);
    if (!s.ok()) {
      return invalid(fmt::format("{}: {}", j.id, s.message));
    }
    if (!ids.insert(j.id).second) {
      return invalid(fmt::format("Duplicate job {}", j.id));
    }

    Window w{j.id, 0, 0};
    parse_clock(job.window_start, w.start);
    parse_clock(job.window_end, w.end);

    for (const auto &other : by_date[job.event_date]) {
      if (w.start < other.end && other.start < w.end) {
        return invalid(fmt::format("{} overlaps {}", j.id, other.job_id));
      }
    }
    by_date[job.event_date].push_back(w);
  }
  return Status::success();
}

} // namespace multicam
