/**
 * @file transfer_client.cpp
 * @brief Retrying transfer implementation
 *
 * @details Multipart parts are distributed to worker threads through a
 *          shared part index, the same way batch streams pull files from
 *          one work queue.
 */

#include "multicam/transfer_client.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <system_error>
#include <thread>

#include <fmt/core.h>

#include "multicam/logging.hpp"
#include "multicam/s3_store.hpp"
#include "multicam/system.hpp"

namespace multicam {

namespace fs = std::filesystem;

namespace {

constexpr int MAX_BACKOFF_SHIFT = 20;

} // anonymous namespace

TransferPolicy TransferPolicy::from_config() {
  TransferPolicy p;
  p.max_retries = std::max(1, Config::transfer_max_retries());
  p.backoff_base = std::chrono::milliseconds(
      std::max(0, Config::transfer_backoff_base_ms()));
  p.multipart_threshold =
      static_cast<uint64_t>(std::max(1, Config::multipart_threshold_mb())) *
      1024 * 1024;
  /// S3 rejects parts below 5MB (except the last)
  p.chunk_size =
      static_cast<uint64_t>(std::max(5, Config::multipart_chunk_mb())) * 1024 *
      1024;
  p.max_parallel = std::max(1, Config::multipart_max_parallel());
  return p;
}

StoreFactory s3_store_factory() {
  return [](const StorageConfig &config) -> std::unique_ptr<ObjectStore> {
    return std::make_unique<S3ObjectStore>(config);
  };
}

const char *to_string(StoreErrorClass c) {
  switch (c) {
  case StoreErrorClass::None:
    return "none";
  case StoreErrorClass::Transient:
    return "transient";
  case StoreErrorClass::Permission:
    return "permission";
  case StoreErrorClass::NotFound:
    return "not_found";
  case StoreErrorClass::Terminal:
    return "terminal";
  }
  return "unknown";
}

Status to_status(const StoreResult &result) {
  switch (result.error) {
  case StoreErrorClass::None:
    return Status::success();
  case StoreErrorClass::Permission:
    return Status::transfer(TransferFault::Permission, result.message);
  case StoreErrorClass::NotFound:
    return Status::transfer(TransferFault::MissingContainer, result.message);
  case StoreErrorClass::Transient:
    return Status::transfer(TransferFault::Connectivity, result.message);
  case StoreErrorClass::Terminal:
    return Status::transfer(TransferFault::Rejected, result.message);
  }
  return Status::transfer(TransferFault::Rejected, result.message);
}

// **---- Construction / cache ----**

TransferClient::TransferClient(StorageConfig config, TransferPolicy policy,
                               StoreFactory factory)
    : config_(std::move(config)), policy_(policy),
      factory_(std::move(factory)),
      sleeper_([](std::chrono::milliseconds d) {
        std::this_thread::sleep_for(d);
      }) {}

size_t TransferClient::credential_hash(const StorageConfig &config) {
  /// Container and endpoint select a different host, so they are part of
  /// the identity too
  std::string key = config.access_key + '\0' + config.secret_key + '\0' +
                    config.region + '\0' + config.container + '\0' +
                    config.endpoint;
  return std::hash<std::string>{}(key);
}

std::shared_ptr<ObjectStore> TransferClient::store() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t h = credential_hash(config_);
  auto it = stores_.find(h);
  if (it != stores_.end())
    return it->second;

  std::shared_ptr<ObjectStore> created = factory_(config_);
  stores_.emplace(h, created);
  LOG_INFO("Object store client created for {} ({})", config_.container,
           config_.region);
  return created;
}

void TransferClient::reconfigure(const StorageConfig &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_ = config;
}

StorageConfig TransferClient::config() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

void TransferClient::set_sleeper(Sleeper sleeper) {
  std::lock_guard<std::mutex> lock(mutex_);
  sleeper_ = std::move(sleeper);
}

size_t TransferClient::cached_stores() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stores_.size();
}

// **---- Retry ----**

std::chrono::milliseconds
TransferClient::backoff_delay(int index, std::chrono::milliseconds base) {
  if (index <= 0)
    return std::chrono::milliseconds(0);
  /// 2^20 x base is already longer than any useful wait; larger shifts
  /// would overflow
  int shift = std::min(index - 1, MAX_BACKOFF_SHIFT);
  return base * (1LL << shift);
}

StoreResult TransferClient::with_retry(const std::string &what,
                                       const std::function<StoreResult()> &op,
                                       std::vector<TransferAttempt> *attempts) {
  Sleeper sleep;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sleep = sleeper_;
  }

  StoreResult result;
  for (int i = 0; i < policy_.max_retries; ++i) {
    TransferAttempt attempt;
    attempt.index = i;
    attempt.delay = backoff_delay(i, policy_.backoff_base);

    if (attempt.delay.count() > 0) {
      LOG_WARN("{}: retry {}/{} in {}ms", what, i + 1, policy_.max_retries,
               attempt.delay.count());
      sleep(attempt.delay);
    }

    result = op();

    bool retry = result.error == StoreErrorClass::Transient &&
                 i + 1 < policy_.max_retries;
    if (result.ok()) {
      attempt.outcome = AttemptOutcome::Success;
    } else if (retry) {
      attempt.outcome = AttemptOutcome::RetryableFailure;
    } else {
      attempt.outcome = AttemptOutcome::TerminalFailure;
    }
    if (attempts)
      attempts->push_back(attempt);

    if (result.ok())
      return result;

    if (!retry) {
      if (result.error == StoreErrorClass::Transient) {
        LOG_ERROR("{}: giving up after {} attempts: {}", what,
                  policy_.max_retries, result.message);
      } else {
        LOG_ERROR("{}: {} failure: {}", what, to_string(result.error),
                  result.message);
      }
      return result;
    }
    LOG_WARN("{}: attempt {} failed: {}", what, i + 1, result.message);
  }
  return result;
}

// **---- Upload ----**

Status TransferClient::upload(const std::string &path, const std::string &key,
                              std::vector<TransferAttempt> *attempts) {
  std::error_code ec;
  uint64_t size = fs::file_size(path, ec);
  if (ec) {
    LOG_ERROR("Cannot stat {}: {}", path, ec.message());
    return Status::transfer(TransferFault::Rejected,
                            fmt::format("Cannot stat {}: {}", path,
                                        ec.message()));
  }

  std::shared_ptr<ObjectStore> s = store();
  bool multipart = size >= policy_.multipart_threshold;

  LOG_INFO("Uploading {} ({}) -> {} [{}]", path, format_bytes(size), key,
           multipart ? "multipart" : "single");

  StoreResult result = with_retry(
      fmt::format("upload {}", key),
      [&]() {
        return multipart ? upload_multipart(*s, path, key, size)
                         : s->put_object(key, path);
      },
      attempts);

  return to_status(result);
}

StoreResult TransferClient::upload_multipart(ObjectStore &store,
                                             const std::string &path,
                                             const std::string &key,
                                             uint64_t size) {
  std::string upload_id;
  StoreResult created = store.create_multipart(key, upload_id);
  if (!created.ok())
    return created;

  int num_parts = static_cast<int>((size + policy_.chunk_size - 1) /
                                   policy_.chunk_size);
  std::vector<CompletedPart> parts(num_parts);

  std::atomic<int> next_part{0};
  std::atomic<bool> failed{false};
  std::mutex error_mutex;
  StoreResult first_error;

  auto worker = [&]() {
    int idx;
    while (!failed.load() && (idx = next_part.fetch_add(1)) < num_parts) {
      uint64_t offset = static_cast<uint64_t>(idx) * policy_.chunk_size;
      uint64_t length = std::min(policy_.chunk_size, size - offset);
      std::string etag;
      StoreResult r = store.upload_part(key, upload_id, idx + 1, path, offset,
                                        length, etag);
      if (!r.ok()) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!failed.exchange(true))
          first_error = r;
        return;
      }
      parts[idx] = CompletedPart{idx + 1, etag};
    }
  };

  int num_workers = std::min(policy_.max_parallel, num_parts);
  std::vector<std::thread> workers;
  for (int i = 0; i < num_workers; ++i)
    workers.emplace_back(worker);
  for (auto &w : workers)
    w.join();

  StoreResult result = failed.load()
                           ? first_error
                           : store.complete_multipart(key, upload_id, parts);
  if (!result.ok()) {
    StoreResult aborted = store.abort_multipart(key, upload_id);
    if (!aborted.ok()) {
      LOG_WARN("Abort of multipart upload {} failed: {}", upload_id,
               aborted.message);
    }
  }
  return result;
}

// **---- Queries ----**

bool TransferClient::head_exists(const std::string &key) {
  ObjectInfo info;
  StoreResult r = store()->head_object(key, info);
  if (!r.ok()) {
    LOG_WARN("Existence check for {} failed: {}", key, r.message);
    return false;
  }
  return info.exists;
}

Status TransferClient::test_connection() {
  StoreResult r = store()->head_container();
  if (r.ok()) {
    LOG_SUCCESS("Connection to {} OK", config().container);
    return Status::success();
  }

  Status s;
  switch (r.error) {
  case StoreErrorClass::Permission:
    s = Status::transfer(TransferFault::Permission,
                         "Access denied: check credentials and permissions");
    break;
  case StoreErrorClass::NotFound:
    s = Status::transfer(TransferFault::MissingContainer,
                         fmt::format("Container {} does not exist",
                                     config().container));
    break;
  default:
    s = Status::transfer(TransferFault::Connectivity,
                         fmt::format("Connection failed: {}", r.message));
    break;
  }
  LOG_ERROR("{}", s.message);
  return s;
}

std::string TransferClient::presigned_url(const std::string &key,
                                          std::chrono::seconds expires) {
  return store()->presign_get(key, expires);
}

// **---- Download ----**

StoreResult TransferClient::download_once(ObjectStore &store,
                                          const std::string &key,
                                          const std::string &path) {
  ObjectInfo info;
  StoreResult r = store.head_object(key, info);
  if (!r.ok())
    return r;
  if (!info.exists) {
    return StoreResult::fail(StoreErrorClass::Terminal,
                             fmt::format("Object {} does not exist", key), 404);
  }

  std::error_code ec;
  uint64_t local = fs::exists(path, ec) ? fs::file_size(path, ec) : 0;
  if (ec)
    local = 0;

  if (local == info.size && local > 0) {
    LOG_INFO("{} already complete ({})", path, format_bytes(local));
    return StoreResult{};
  }
  if (local > info.size)
    local = 0;

  if (local > 0) {
    LOG_INFO("Resuming {} at {} of {}", key, format_bytes(local),
             format_bytes(info.size));
  }
  return store.get_object_range(key, path, local);
}

Status TransferClient::download(const std::string &key,
                                const std::string &path) {
  std::shared_ptr<ObjectStore> s = store();

  std::error_code ec;
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty())
    fs::create_directories(parent, ec);

  StoreResult r = with_retry(fmt::format("download {}", key),
                             [&]() { return download_once(*s, key, path); },
                             nullptr);
  if (r.ok()) {
    LOG_SUCCESS("Downloaded {} -> {}", key, path);
  }
  return to_status(r);
}

} // namespace multicam
