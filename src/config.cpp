/**
 * @file config.cpp
 * @brief StorageConfig loading and validation
 */

#include "multicam/config.hpp"

namespace multicam {

StorageConfig StorageConfig::from_env() {
  StorageConfig cfg;
  cfg.access_key = Config::get_env_string("AWS_ACCESS_KEY_ID", "");
  cfg.secret_key = Config::get_env_string("AWS_SECRET_ACCESS_KEY", "");
  cfg.container = Config::get_env_string("S3_BUCKET", cfg.container);
  cfg.region = Config::get_env_string("AWS_REGION", cfg.region);
  cfg.endpoint = Config::get_env_string("S3_ENDPOINT", "");
  cfg.accelerator_enabled = Config::get_env_bool("ACCELERATOR_ENABLED", false);
  return cfg;
}

Status StorageConfig::validate() const {
  if (access_key.empty() || secret_key.empty()) {
    return Status::error(ErrorKind::Validation,
                         "Storage credentials not configured");
  }
  if (container.empty()) {
    return Status::error(ErrorKind::Validation,
                         "Storage container not configured");
  }
  if (region.empty()) {
    return Status::error(ErrorKind::Validation, "Storage region not configured");
  }
  return Status::success();
}

} // namespace multicam
