/**
 * @file types.hpp
 * @brief Core data types for Multicam Ingest
 *
 * @details Contains the data structures shared by every module:
 *          - Status values and error taxonomy
 *
 *          - Job / AngleTask records and their status enums
 *
 *          - ResourceSnapshot, TransferAttempt, BatchStatus
 */

#ifndef MULTICAM_TYPES_HPP
#define MULTICAM_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace multicam {

// **----- CONSTANTS -----**

/// Hard bounds on the number of concurrently executing heavy stages
constexpr int MIN_CEILING = 1;
constexpr int MAX_CEILING = 4;

/// Resolution at or above which footage is compressed
constexpr int UHD_WIDTH = 3840;
constexpr int UHD_HEIGHT = 2160;

/// Compression target
constexpr int TARGET_WIDTH = 1920;
constexpr int TARGET_HEIGHT = 1080;

// **----- ERRORS -----**

/**
 * @enum ErrorKind
 * @brief Failure taxonomy reported through Status.
 * @note Resource probe failures never appear here; they are masked by
 *       fallback defaults inside ResourceProbe.
 */
enum class ErrorKind {
  None,
  Validation,        //< Malformed job descriptor or missing credentials
  ToolInvocation,    //< Extractor / transcoder non-zero exit or timeout
  ResolutionUnknown, //< Probe could not find a video stream
  Transfer           //< Object store failure after retries
};

/**
 * @enum TransferFault
 * @brief Refines ErrorKind::Transfer.
 */
enum class TransferFault {
  None,
  Permission,       //< Credentials invalid or lacking permission
  MissingContainer, //< Bucket does not exist
  Connectivity,     //< Network failure, retries exhausted
  Rejected          //< Non-retryable request rejection
};

/**
 * @struct Status
 * @brief Result of an operation that may fail.
 */
struct Status {
  ErrorKind kind = ErrorKind::None;
  TransferFault fault = TransferFault::None;
  std::string message;

  bool ok() const { return kind == ErrorKind::None; }

  static Status success() { return {}; }
  static Status error(ErrorKind k, std::string msg) {
    Status s;
    s.kind = k;
    s.message = std::move(msg);
    return s;
  }
  static Status transfer(TransferFault f, std::string msg) {
    Status s;
    s.kind = ErrorKind::Transfer;
    s.fault = f;
    s.message = std::move(msg);
    return s;
  }
};

const char *to_string(ErrorKind kind);
const char *to_string(TransferFault fault);

// **----- JOB MODEL -----**

enum class JobStatus { Pending, Processing, Completed, Error };

enum class AngleStatus {
  Pending,
  Extracting,
  CheckingResolution,
  Compressing,
  SkippingCompression,
  Uploading,
  Complete,
  Error
};

const char *to_string(JobStatus status);
const char *to_string(AngleStatus status);

/// Whether an angle can no longer change state
inline bool is_terminal(AngleStatus s) {
  return s == AngleStatus::Complete || s == AngleStatus::Error;
}

/**
 * @struct JobDescriptor
 * @brief Input describing one event to process.
 */
struct JobDescriptor {
  std::string event_date;                   //< e.g. "10-02"
  int sequence = 0;                         //< Event number within the date
  std::string window_start;                 //< "HH:MM:SS"
  std::string window_end;                   //< "HH:MM:SS"
  std::map<std::string, std::string> angles; //< angle id -> source path
};

/**
 * @struct Job
 * @brief One schedulable unit: every angle of one event.
 * @note Written only by the job task that runs it. Readers receive copies.
 */
struct Job {
  JobDescriptor descriptor;
  std::string id;         //< "<date>_game<sequence>"
  std::string key_prefix; //< "<date>/Game-<sequence>"
  JobStatus status = JobStatus::Pending;
  std::map<std::string, AngleStatus> angle_status;
  std::string error_message;

  explicit Job(JobDescriptor d);
};

/**
 * @struct AngleTask
 * @brief Per-angle work item with its derived paths.
 */
struct AngleTask {
  std::string job_id;
  std::string angle_id;
  std::string source_path;
  std::string segment_path;    //< Transient, lossless cut
  std::string compressed_path; //< Transient, only when compressing
  std::string destination_key;
  double window_start = 0;     //< Seconds
  double window_end = 0;       //< Seconds
  AngleStatus status = AngleStatus::Pending;
};

struct Resolution {
  int width = 0;
  int height = 0;
};

/// 4K or higher on either axis
inline bool needs_compression(const Resolution &r) {
  return r.width >= UHD_WIDTH || r.height >= UHD_HEIGHT;
}

// **----- RESOURCES / TRANSFER / BATCH -----**

struct ResourceSnapshot {
  int cpu_count = 0;
  double available_memory_gb = 0;
  bool accelerator_present = false;
  int computed_ceiling = MIN_CEILING;
};

enum class AttemptOutcome { Success, RetryableFailure, TerminalFailure };

struct TransferAttempt {
  int index = 0;                           //< 0-based
  std::chrono::milliseconds delay{0};      //< Waited before this attempt
  AttemptOutcome outcome = AttemptOutcome::Success;
};

struct Aggregate {
  int total = 0;
  int completed = 0;
  int failed = 0;
};

/**
 * @struct BatchStatus
 * @brief Queryable view of the current or last batch.
 */
struct BatchStatus {
  bool processing_active = false;
  int total_jobs = 0;
  int completed = 0;
  int in_progress = 0;
  int pending = 0;
  int error = 0;
  int ceiling = 0;
};

} // namespace multicam

#endif // MULTICAM_TYPES_HPP
