/**
 * @file types.cpp
 * @brief String conversions and Job construction
 */

#include "multicam/types.hpp"

#include <fmt/core.h>

namespace multicam {

Job::Job(JobDescriptor d) : descriptor(std::move(d)) {
  id = fmt::format("{}_game{}", descriptor.event_date, descriptor.sequence);
  key_prefix =
      fmt::format("{}/Game-{}", descriptor.event_date, descriptor.sequence);
  for (const auto &angle : descriptor.angles) {
    angle_status[angle.first] = AngleStatus::Pending;
  }
}

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::ToolInvocation:
    return "tool_invocation";
  case ErrorKind::ResolutionUnknown:
    return "resolution_unknown";
  case ErrorKind::Transfer:
    return "transfer";
  }
  return "unknown";
}

const char *to_string(TransferFault fault) {
  switch (fault) {
  case TransferFault::None:
    return "none";
  case TransferFault::Permission:
    return "permission";
  case TransferFault::MissingContainer:
    return "missing_container";
  case TransferFault::Connectivity:
    return "connectivity";
  case TransferFault::Rejected:
    return "rejected";
  }
  return "unknown";
}

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Pending:
    return "pending";
  case JobStatus::Processing:
    return "processing";
  case JobStatus::Completed:
    return "completed";
  case JobStatus::Error:
    return "error";
  }
  return "unknown";
}

const char *to_string(AngleStatus status) {
  switch (status) {
  case AngleStatus::Pending:
    return "pending";
  case AngleStatus::Extracting:
    return "extracting";
  case AngleStatus::CheckingResolution:
    return "checking_resolution";
  case AngleStatus::Compressing:
    return "compressing";
  case AngleStatus::SkippingCompression:
    return "skipping_compression";
  case AngleStatus::Uploading:
    return "uploading";
  case AngleStatus::Complete:
    return "complete";
  case AngleStatus::Error:
    return "error";
  }
  return "unknown";
}

} // namespace multicam
