/**
 * @file object_store.hpp
 * @brief Remote object store capability
 *
 * @details The primitive operations TransferClient composes into uploads,
 *          downloads and connection checks. Every call is a single request:
 *          no retries happen at this level.
 */

#ifndef MULTICAM_OBJECT_STORE_HPP
#define MULTICAM_OBJECT_STORE_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace multicam {

/**
 * @enum StoreErrorClass
 * @brief How a failed request should be treated.
 */
enum class StoreErrorClass {
  None,
  Transient,  //< Network error, timeout, throttling, 5xx: retry
  Permission, //< 401 / 403
  NotFound,   //< 404
  Terminal    //< Any other rejection
};

const char *to_string(StoreErrorClass c);

struct StoreResult {
  StoreErrorClass error = StoreErrorClass::None;
  long http_status = 0;
  std::string message;

  bool ok() const { return error == StoreErrorClass::None; }

  static StoreResult fail(StoreErrorClass c, std::string msg,
                          long status = 0) {
    StoreResult r;
    r.error = c;
    r.http_status = status;
    r.message = std::move(msg);
    return r;
  }
};

struct ObjectInfo {
  bool exists = false;
  uint64_t size = 0;
};

struct CompletedPart {
  int part_number = 0;
  std::string etag;
};

class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  /// Single-shot upload of a whole file
  virtual StoreResult put_object(const std::string &key,
                                 const std::string &path) = 0;

  virtual StoreResult create_multipart(const std::string &key,
                                       std::string &upload_id) = 0;

  /**
   * @brief Upload bytes [offset, offset + length) of path as one part.
   * @param etag Output: entity tag the store assigned to the part
   */
  virtual StoreResult upload_part(const std::string &key,
                                  const std::string &upload_id,
                                  int part_number, const std::string &path,
                                  uint64_t offset, uint64_t length,
                                  std::string &etag) = 0;

  virtual StoreResult
  complete_multipart(const std::string &key, const std::string &upload_id,
                     const std::vector<CompletedPart> &parts) = 0;

  virtual StoreResult abort_multipart(const std::string &key,
                                      const std::string &upload_id) = 0;

  /**
   * @brief Existence check. A missing object is success with
   *        info.exists == false.
   */
  virtual StoreResult head_object(const std::string &key,
                                  ObjectInfo &info) = 0;

  /// Container reachability / permission check
  virtual StoreResult head_container() = 0;

  /**
   * @brief Fetch bytes [offset, end) and append them to path.
   * @note offset 0 truncates path first.
   */
  virtual StoreResult get_object_range(const std::string &key,
                                       const std::string &path,
                                       uint64_t offset) = 0;

  /// Short-lived GET URL
  virtual std::string presign_get(const std::string &key,
                                  std::chrono::seconds expires) = 0;
};

} // namespace multicam

#endif // MULTICAM_OBJECT_STORE_HPP
