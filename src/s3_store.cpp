/**
 * @file s3_store.cpp
 * @brief AWS SDK S3 client implementation
 */

#include "multicam/s3_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <ios>
#include <system_error>
#include <vector>

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/http/HttpTypes.h>
#include <aws/core/utils/memory/AWSMemory.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadBucketRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>
#include <fmt/core.h>

namespace multicam {

namespace fs = std::filesystem;

namespace {

const char *ALLOC_TAG = "multicam";

constexpr long CONNECT_TIMEOUT_MS = 30 * 1000;

/// Abort a transfer that stalls for this long
constexpr long STALL_TIMEOUT_MS = 120 * 1000;

using S3Error = Aws::Client::AWSError<Aws::S3::S3Errors>;

Aws::SDKOptions &sdk_options() {
  static Aws::SDKOptions options;
  return options;
}

Aws::String aws_string(const std::string &s) {
  return Aws::String(s.c_str(), s.size());
}

std::string std_string(const Aws::String &s) {
  return std::string(s.c_str(), s.size());
}

/// Move the downloaded range into place: append after offset, or replace
bool commit_download(const std::string &staging, const std::string &path,
                     bool append) {
  std::error_code ec;
  if (!append) {
    fs::rename(staging, path, ec);
    return !ec;
  }

  {
    std::ifstream in(staging, std::ios::binary);
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!in || !out)
      return false;
    out << in.rdbuf();
    if (!out)
      return false;
  }
  fs::remove(staging, ec);
  return true;
}

} // anonymous namespace

// **---- SDK lifetime ----**

void AwsSdk::acquire() { static AwsSdk instance; }

AwsSdk::AwsSdk() {
  /// Credentials always come from StorageConfig; never query instance
  /// metadata for a region or role
  setenv("AWS_EC2_METADATA_DISABLED", "true", 0);
  Aws::InitAPI(sdk_options());
}

AwsSdk::~AwsSdk() { Aws::ShutdownAPI(sdk_options()); }

// **---- Client ----**

S3ObjectStore::S3ObjectStore(const StorageConfig &config)
    : bucket_(config.container) {
  AwsSdk::acquire();

  Aws::Client::ClientConfiguration cfg;
  cfg.region = aws_string(config.region);
  cfg.connectTimeoutMs = CONNECT_TIMEOUT_MS;
  cfg.requestTimeoutMs = STALL_TIMEOUT_MS;
  /// TransferClient owns retries; one call here is one request
  cfg.retryStrategy =
      Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(ALLOC_TAG, 0);

  bool virtual_hosting = config.endpoint.empty();
  if (!virtual_hosting) {
    /// "http://minio:9000/" -> scheme HTTP, endpoint "http://minio:9000"
    std::string endpoint = config.endpoint;
    while (!endpoint.empty() && endpoint.back() == '/')
      endpoint.pop_back();
    if (endpoint.compare(0, 7, "http://") == 0)
      cfg.scheme = Aws::Http::Scheme::HTTP;
    cfg.endpointOverride = aws_string(endpoint);
  }

  client_ = std::make_unique<Aws::S3::S3Client>(
      Aws::Auth::AWSCredentials(aws_string(config.access_key),
                                aws_string(config.secret_key)),
      cfg, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      virtual_hosting);
}

S3ObjectStore::~S3ObjectStore() = default;

StoreErrorClass S3ObjectStore::classify_http(long status) {
  if (status >= 200 && status < 300)
    return StoreErrorClass::None;
  if (status == 401 || status == 403)
    return StoreErrorClass::Permission;
  if (status == 404)
    return StoreErrorClass::NotFound;
  if (status <= 0 || status == 408 || status == 429 || status >= 500)
    return StoreErrorClass::Transient;
  return StoreErrorClass::Terminal;
}

StoreErrorClass S3ObjectStore::classify_error(const S3Error &error) {
  auto code = error.GetResponseCode();
  if (code == Aws::Http::HttpResponseCode::REQUEST_NOT_MADE)
    return StoreErrorClass::Transient;

  StoreErrorClass c = classify_http(static_cast<long>(code));
  /// An error inside a 2xx, or a 4xx the service marks retryable
  /// (RequestTimeout, SlowDown)
  if (c == StoreErrorClass::None || c == StoreErrorClass::Terminal) {
    return error.ShouldRetry() ? StoreErrorClass::Transient
                               : StoreErrorClass::Terminal;
  }
  return c;
}

StoreResult S3ObjectStore::failure(const char *op, const std::string &key,
                                   const S3Error &error) {
  long status = static_cast<long>(error.GetResponseCode());
  if (status < 0)
    status = 0;
  return StoreResult::fail(
      classify_error(error),
      fmt::format("{} {}: HTTP {} {} ({})", op, key, status,
                  std_string(error.GetExceptionName()),
                  std_string(error.GetMessage())),
      status);
}

// **---- Operations ----**

StoreResult S3ObjectStore::put_object(const std::string &key,
                                      const std::string &path) {
  std::error_code ec;
  uint64_t size = fs::file_size(path, ec);
  if (ec) {
    return StoreResult::fail(StoreErrorClass::Terminal,
                             fmt::format("Cannot open {}", path));
  }

  auto body = Aws::MakeShared<Aws::FStream>(
      ALLOC_TAG, path.c_str(), std::ios_base::in | std::ios_base::binary);
  if (!body->good()) {
    return StoreResult::fail(StoreErrorClass::Terminal,
                             fmt::format("Cannot open {}", path));
  }

  Aws::S3::Model::PutObjectRequest req;
  req.SetBucket(aws_string(bucket_));
  req.SetKey(aws_string(key));
  req.SetContentLength(static_cast<long long>(size));
  req.SetBody(body);

  auto outcome = client_->PutObject(req);
  if (!outcome.IsSuccess())
    return failure("PutObject", key, outcome.GetError());
  return StoreResult{};
}

StoreResult S3ObjectStore::create_multipart(const std::string &key,
                                            std::string &upload_id) {
  Aws::S3::Model::CreateMultipartUploadRequest req;
  req.SetBucket(aws_string(bucket_));
  req.SetKey(aws_string(key));

  auto outcome = client_->CreateMultipartUpload(req);
  if (!outcome.IsSuccess())
    return failure("CreateMultipartUpload", key, outcome.GetError());

  upload_id = std_string(outcome.GetResult().GetUploadId());
  if (upload_id.empty()) {
    return StoreResult::fail(StoreErrorClass::Transient,
                             "CreateMultipartUpload returned no UploadId");
  }
  return StoreResult{};
}

StoreResult S3ObjectStore::upload_part(const std::string &key,
                                       const std::string &upload_id,
                                       int part_number,
                                       const std::string &path,
                                       uint64_t offset, uint64_t length,
                                       std::string &etag) {
  std::vector<unsigned char> buffer(static_cast<size_t>(length));
  {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      return StoreResult::fail(StoreErrorClass::Terminal,
                               fmt::format("Cannot open {}", path));
    }
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(reinterpret_cast<char *>(buffer.data()),
            static_cast<std::streamsize>(length));
    if (static_cast<uint64_t>(in.gcount()) != length) {
      return StoreResult::fail(
          StoreErrorClass::Terminal,
          fmt::format("Short read of part {} from {}", part_number, path));
    }
  }

  /// The stream reads straight from buffer; both outlive the request
  Aws::Utils::Stream::PreallocatedStreamBuf streambuf(buffer.data(),
                                                      buffer.size());
  auto body = Aws::MakeShared<Aws::IOStream>(ALLOC_TAG, &streambuf);

  Aws::S3::Model::UploadPartRequest req;
  req.SetBucket(aws_string(bucket_));
  req.SetKey(aws_string(key));
  req.SetUploadId(aws_string(upload_id));
  req.SetPartNumber(part_number);
  req.SetContentLength(static_cast<long long>(length));
  req.SetBody(body);

  auto outcome = client_->UploadPart(req);
  if (!outcome.IsSuccess())
    return failure("UploadPart", key, outcome.GetError());

  etag = std_string(outcome.GetResult().GetETag());
  if (etag.empty()) {
    return StoreResult::fail(StoreErrorClass::Transient,
                             fmt::format("Part {} returned no ETag",
                                         part_number));
  }
  return StoreResult{};
}

StoreResult
S3ObjectStore::complete_multipart(const std::string &key,
                                  const std::string &upload_id,
                                  const std::vector<CompletedPart> &parts) {
  Aws::S3::Model::CompletedMultipartUpload done;
  for (const auto &p : parts) {
    Aws::S3::Model::CompletedPart part;
    part.SetPartNumber(p.part_number);
    part.SetETag(aws_string(p.etag));
    done.AddParts(part);
  }

  Aws::S3::Model::CompleteMultipartUploadRequest req;
  req.SetBucket(aws_string(bucket_));
  req.SetKey(aws_string(key));
  req.SetUploadId(aws_string(upload_id));
  req.SetMultipartUpload(done);

  auto outcome = client_->CompleteMultipartUpload(req);
  if (!outcome.IsSuccess())
    return failure("CompleteMultipartUpload", key, outcome.GetError());
  return StoreResult{};
}

StoreResult S3ObjectStore::abort_multipart(const std::string &key,
                                           const std::string &upload_id) {
  Aws::S3::Model::AbortMultipartUploadRequest req;
  req.SetBucket(aws_string(bucket_));
  req.SetKey(aws_string(key));
  req.SetUploadId(aws_string(upload_id));

  auto outcome = client_->AbortMultipartUpload(req);
  if (!outcome.IsSuccess())
    return failure("AbortMultipartUpload", key, outcome.GetError());
  return StoreResult{};
}

StoreResult S3ObjectStore::head_object(const std::string &key,
                                       ObjectInfo &info) {
  Aws::S3::Model::HeadObjectRequest req;
  req.SetBucket(aws_string(bucket_));
  req.SetKey(aws_string(key));

  info = ObjectInfo{};
  auto outcome = client_->HeadObject(req);
  if (!outcome.IsSuccess()) {
    StoreResult r = failure("HeadObject", key, outcome.GetError());
    if (r.error == StoreErrorClass::NotFound)
      return StoreResult{};
    return r;
  }

  info.exists = true;
  info.size = static_cast<uint64_t>(outcome.GetResult().GetContentLength());
  return StoreResult{};
}

StoreResult S3ObjectStore::head_container() {
  Aws::S3::Model::HeadBucketRequest req;
  req.SetBucket(aws_string(bucket_));

  auto outcome = client_->HeadBucket(req);
  if (!outcome.IsSuccess())
    return failure("HeadBucket", bucket_, outcome.GetError());
  return StoreResult{};
}

StoreResult S3ObjectStore::get_object_range(const std::string &key,
                                            const std::string &path,
                                            uint64_t offset) {
  /// The body lands beside the target first: error bodies never reach the
  /// target, and a server that ignores Range cannot corrupt a resume
  std::string staging = path + ".range";

  Aws::S3::Model::GetObjectRequest req;
  req.SetBucket(aws_string(bucket_));
  req.SetKey(aws_string(key));
  if (offset > 0)
    req.SetRange(aws_string(fmt::format("bytes={}-", offset)));
  req.SetResponseStreamFactory([staging]() {
    return Aws::New<Aws::FStream>(ALLOC_TAG, staging.c_str(),
                                  std::ios_base::out | std::ios_base::binary |
                                      std::ios_base::trunc);
  });

  StoreResult result;
  long status = 0;
  bool ranged = false;
  {
    auto outcome = client_->GetObject(req);
    if (outcome.IsSuccess()) {
      ranged = !outcome.GetResult().GetContentRange().empty();
      status = ranged ? 206 : 200;
    } else {
      result = failure("GetObject", key, outcome.GetError());
      status = result.http_status;
    }
  } // closes the staging stream

  std::error_code ec;
  /// A failure after 200/206 left a valid prefix of the body in staging
  if (!result.ok() && status != 200 && status != 206) {
    fs::remove(staging, ec);
    return result;
  }

  bool append = offset > 0 && (result.ok() ? ranged : status == 206);
  if (!commit_download(staging, path, append)) {
    fs::remove(staging, ec);
    return StoreResult::fail(StoreErrorClass::Terminal,
                             fmt::format("Cannot write {}", path));
  }
  return result;
}

std::string S3ObjectStore::presign_get(const std::string &key,
                                       std::chrono::seconds expires) {
  return std_string(client_->GeneratePresignedUrl(
      aws_string(bucket_), aws_string(key), Aws::Http::HttpMethod::HTTP_GET,
      static_cast<uint64_t>(expires.count())));
}

} // namespace multicam
