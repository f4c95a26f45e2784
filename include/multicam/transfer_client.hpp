/**
 * @file transfer_client.hpp
 * @brief Retrying upload / download on top of an ObjectStore
 *
 * @details TransferClient turns single-request ObjectStore primitives into
 *          the operations the pipeline needs:
 *
 *          - upload(): single-shot below the multipart threshold, parallel
 *            multipart at or above it
 *
 *          - download(): ranged GET that resumes from the local file size
 *
 *          - head_exists(), test_connection(), presigned_url()
 *
 *          Transient failures are retried with exponential backoff. Any
 *          other failure class ends the operation immediately.
 *
 * @note One ObjectStore is cached per credential set, so repeated calls with
 *       the same StorageConfig reuse the same connection state.
 */

#ifndef MULTICAM_TRANSFER_CLIENT_HPP
#define MULTICAM_TRANSFER_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "object_store.hpp"
#include "types.hpp"

namespace multicam {

/**
 * @struct TransferPolicy
 * @brief Retry and strategy parameters.
 */
struct TransferPolicy {
  int max_retries = 3; //< Total attempts, including the first
  std::chrono::milliseconds backoff_base{1000};
  uint64_t multipart_threshold = 100ull * 1024 * 1024;
  uint64_t chunk_size = 25ull * 1024 * 1024;
  int max_parallel = 4; //< Parts in flight per multipart upload

  /// Values from TRANSFER_* and MULTIPART_* environment variables
  static TransferPolicy from_config();
};

using StoreFactory =
    std::function<std::unique_ptr<ObjectStore>(const StorageConfig &)>;

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Factory producing S3ObjectStore instances
StoreFactory s3_store_factory();

class TransferClient {
public:
  explicit TransferClient(StorageConfig config,
                          TransferPolicy policy = TransferPolicy::from_config(),
                          StoreFactory factory = s3_store_factory());

  TransferClient(const TransferClient &) = delete;
  TransferClient &operator=(const TransferClient &) = delete;

  /**
   * @brief Upload a local file to key.
   *
   * @param attempts Optional output: one record per attempt made
   * @return Transfer error with the fault of the last failure
   */
  Status upload(const std::string &path, const std::string &key,
                std::vector<TransferAttempt> *attempts = nullptr);

  /**
   * @brief Whether an object already exists at key.
   * @note A failed check is logged and reported as "does not exist"; the
   *       following upload surfaces the real error.
   */
  bool head_exists(const std::string &key);

  /**
   * @brief Check that the container is reachable with the configured
   *        credentials.
   * @return Permission, MissingContainer or Connectivity fault on failure
   */
  Status test_connection();

  /**
   * @brief Fetch key into path, resuming from any bytes already present.
   */
  Status download(const std::string &key, const std::string &path);

  std::string presigned_url(const std::string &key,
                            std::chrono::seconds expires);

  /**
   * @brief Switch credentials. A cached store is reused if this credential
   *        set was seen before.
   */
  void reconfigure(const StorageConfig &config);

  StorageConfig config() const;

  /// Replace the backoff sleep (tests)
  void set_sleeper(Sleeper sleeper);

  /// Number of distinct stores created so far
  size_t cached_stores() const;

  /**
   * @brief Delay before attempt index (0-based).
   * @return 0 for the first attempt, base * 2^(index-1) afterwards
   */
  static std::chrono::milliseconds backoff_delay(int index,
                                                 std::chrono::milliseconds base);

private:
  mutable std::mutex mutex_;
  StorageConfig config_;
  TransferPolicy policy_;
  StoreFactory factory_;
  Sleeper sleeper_;
  std::unordered_map<size_t, std::shared_ptr<ObjectStore>> stores_;

  /// Cached store for the current configuration
  std::shared_ptr<ObjectStore> store();

  static size_t credential_hash(const StorageConfig &config);

  /**
   * @brief Run op until it succeeds, fails non-transiently, or max_retries
   *        attempts have been made.
   */
  StoreResult with_retry(const std::string &what,
                         const std::function<StoreResult()> &op,
                         std::vector<TransferAttempt> *attempts);

  StoreResult upload_multipart(ObjectStore &store, const std::string &path,
                               const std::string &key, uint64_t size);

  StoreResult download_once(ObjectStore &store, const std::string &key,
                            const std::string &path);
};

/// Map a store failure onto the public error taxonomy
Status to_status(const StoreResult &result);

} // namespace multicam

#endif // MULTICAM_TRANSFER_CLIENT_HPP
