/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables, and
 *          StorageConfig for object store credentials.
 *          See config/multicam.env for an annotated example.
 *
 */

#ifndef MULTICAM_CONFIG_HPP
#define MULTICAM_CONFIG_HPP

#include <cstdlib>
#include <string>

#include "types.hpp"

namespace multicam {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/// Accepts 1/0, true/false, yes/no
inline bool get_env_bool(const char *name, bool default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;
  std::string s(val);
  return s == "1" || s == "true" || s == "TRUE" || s == "yes";
}

// **---- CONCURRENCY ----**

/**
 * @brief Ceiling override for heavy stages
 * @note 0 = derive from detected resources. Non-zero values are still
 *       clamped to [1, 4].
 */
inline int max_concurrent() {
  static int val = get_env_int("MAX_CONCURRENT", 0);
  return val;
}

// **---- PATHS & KEYS ----**

/// Root of the transient artifact tree (segments/, compressed/)
inline const std::string &work_dir() {
  static std::string val = get_env_string("WORK_DIR", "temp");
  return val;
}

/// First component of every destination key
inline const std::string &key_root() {
  static std::string val = get_env_string("KEY_ROOT", "Games");
  return val;
}

// **---- EXTERNAL TOOLS ----**

inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

/// Command whose zero exit status means an accelerator is usable
inline const std::string &accelerator_probe_cmd() {
  static std::string val = get_env_string("ACCELERATOR_PROBE_CMD", "nvidia-smi");
  return val;
}

inline int accelerator_probe_timeout_sec() {
  static int val = get_env_int("ACCELERATOR_PROBE_TIMEOUT_SEC", 5);
  return val;
}

/// Deadline for the resolution query
inline int probe_timeout_sec() {
  static int val = get_env_int("PROBE_TIMEOUT_SEC", 30);
  return val;
}

// **---- TRANSFER ----**

inline int transfer_max_retries() {
  static int val = get_env_int("TRANSFER_MAX_RETRIES", 3);
  return val;
}

/// Delay before the second attempt; doubles for each following attempt
inline int transfer_backoff_base_ms() {
  static int val = get_env_int("TRANSFER_BACKOFF_BASE_MS", 1000);
  return val;
}

/**
 * @brief Artifacts at or above this size use multipart transfer
 */
inline int multipart_threshold_mb() {
  static int val = get_env_int("MULTIPART_THRESHOLD_MB", 100);
  return val;
}

inline int multipart_chunk_mb() {
  static int val = get_env_int("MULTIPART_CHUNK_MB", 25);
  return val;
}

inline int multipart_max_parallel() {
  static int val = get_env_int("MULTIPART_MAX_PARALLEL", 4);
  return val;
}

inline int presign_expires_sec() {
  static int val = get_env_int("PRESIGN_EXPIRES_SEC", 3600);
  return val;
}

// **---- LOGGING ----**

/// "info", "warn" or "error"; lines below it are not printed
inline const std::string &log_level() {
  static std::string val = get_env_string("MULTICAM_LOG_LEVEL", "info");
  return val;
}

// **---- PROGRESS ----**

/// Events kept before the oldest is dropped
inline int progress_queue_capacity() {
  static int val = get_env_int("PROGRESS_QUEUE_CAPACITY", 1024);
  return val;
}

} // namespace Config

/**
 * @struct StorageConfig
 * @brief Object store credentials and feature flags.
 * @note Not memoized: a new StorageConfig may be built whenever the
 *       operator changes credentials.
 */
struct StorageConfig {
  std::string container = "multicam-footage"; //< Bucket name
  std::string region = "us-east-1";
  std::string access_key;
  std::string secret_key;
  std::string endpoint; //< Optional override (path-style addressing)
  bool accelerator_enabled = false;

  /**
   * @brief Build from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, S3_BUCKET,
   *        AWS_REGION, S3_ENDPOINT and ACCELERATOR_ENABLED.
   */
  static StorageConfig from_env();

  /**
   * @brief Pre-flight check run before a batch starts.
   * @return Validation error naming the first missing field
   */
  Status validate() const;
};

} // namespace multicam

#endif // MULTICAM_CONFIG_HPP
