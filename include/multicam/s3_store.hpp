/**
 * @file s3_store.hpp
 * @brief S3-compatible ObjectStore over the AWS SDK for C++
 *
 * @details Each S3ObjectStore owns one Aws::S3::S3Client built from a
 *          StorageConfig. Addressing is virtual-hosted unless an endpoint
 *          override is configured, in which case path-style requests are
 *          sent to the override (MinIO and similar servers).
 *
 *          The SDK's own retry strategy is disabled: TransferClient owns
 *          retries and backoff, so every call here is exactly one request.
 *
 * @attention THREAD MODEL:
 *            - S3Client is thread-safe, so one S3ObjectStore may serve
 *              concurrent uploads and parallel parts.
 *            - AwsSdk::acquire() must run before the first client is built;
 *              the constructor does it.
 */

#ifndef MULTICAM_S3_STORE_HPP
#define MULTICAM_S3_STORE_HPP

#include <memory>
#include <string>

#include <aws/core/client/AWSError.h>
#include <aws/s3/S3Errors.h>

#include "config.hpp"
#include "object_store.hpp"

namespace Aws {
namespace S3 {
class S3Client;
} // namespace S3
} // namespace Aws

namespace multicam {

/**
 * @class AwsSdk
 * @brief Process-wide Aws::InitAPI / Aws::ShutdownAPI pairing.
 * @note The API is initialised on first acquire() and shut down at static
 *       destruction, after every client is gone.
 */
class AwsSdk {
public:
  static void acquire();

private:
  AwsSdk();
  ~AwsSdk();
};

class S3ObjectStore : public ObjectStore {
public:
  explicit S3ObjectStore(const StorageConfig &config);
  ~S3ObjectStore() override;

  StoreResult put_object(const std::string &key,
                         const std::string &path) override;
  StoreResult create_multipart(const std::string &key,
                               std::string &upload_id) override;
  StoreResult upload_part(const std::string &key, const std::string &upload_id,
                          int part_number, const std::string &path,
                          uint64_t offset, uint64_t length,
                          std::string &etag) override;
  StoreResult complete_multipart(const std::string &key,
                                 const std::string &upload_id,
                                 const std::vector<CompletedPart> &parts) override;
  StoreResult abort_multipart(const std::string &key,
                              const std::string &upload_id) override;
  StoreResult head_object(const std::string &key, ObjectInfo &info) override;
  StoreResult head_container() override;
  StoreResult get_object_range(const std::string &key, const std::string &path,
                               uint64_t offset) override;
  std::string presign_get(const std::string &key,
                          std::chrono::seconds expires) override;

  /// Classify an HTTP status (0 = no response)
  static StoreErrorClass classify_http(long status);

  /// Classify an SDK error by its HTTP status and retryability
  static StoreErrorClass
  classify_error(const Aws::Client::AWSError<Aws::S3::S3Errors> &error);

private:
  /// StoreResult for a failed outcome of operation `op` on `key`
  static StoreResult
  failure(const char *op, const std::string &key,
          const Aws::Client::AWSError<Aws::S3::S3Errors> &error);

  std::string bucket_;
  std::unique_ptr<Aws::S3::S3Client> client_;
};

} // namespace multicam

#endif // MULTICAM_S3_STORE_HPP
