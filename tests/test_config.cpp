// Unit tests for storage configuration loading and pre-flight validation

#include <gtest/gtest.h>

#include <cstdlib>

#include "multicam/config.hpp"

namespace multicam {
namespace {

class StorageConfigTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const char *name :
         {"AWS_ACCESS_KEY_ID", "AWS_SECRET_ACCESS_KEY", "S3_BUCKET",
          "AWS_REGION", "S3_ENDPOINT", "ACCELERATOR_ENABLED"}) {
      unsetenv(name);
    }
  }
};

TEST_F(StorageConfigTest, ReadsEnvironment) {
  setenv("AWS_ACCESS_KEY_ID", "AKID", 1);
  setenv("AWS_SECRET_ACCESS_KEY", "shh", 1);
  setenv("S3_BUCKET", "games", 1);
  setenv("AWS_REGION", "ap-south-1", 1);
  setenv("S3_ENDPOINT", "http://minio:9000", 1);
  setenv("ACCELERATOR_ENABLED", "true", 1);

  StorageConfig cfg = StorageConfig::from_env();
  EXPECT_EQ(cfg.access_key, "AKID");
  EXPECT_EQ(cfg.secret_key, "shh");
  EXPECT_EQ(cfg.container, "games");
  EXPECT_EQ(cfg.region, "ap-south-1");
  EXPECT_EQ(cfg.endpoint, "http://minio:9000");
  EXPECT_TRUE(cfg.accelerator_enabled);
  EXPECT_TRUE(cfg.validate().ok());
}

TEST_F(StorageConfigTest, DefaultsWithoutCredentialsFailValidation) {
  unsetenv("AWS_ACCESS_KEY_ID");
  unsetenv("AWS_SECRET_ACCESS_KEY");
  unsetenv("AWS_REGION");
  unsetenv("ACCELERATOR_ENABLED");

  StorageConfig cfg = StorageConfig::from_env();
  EXPECT_EQ(cfg.region, "us-east-1");
  EXPECT_FALSE(cfg.accelerator_enabled);

  Status s = cfg.validate();
  EXPECT_EQ(s.kind, ErrorKind::Validation);
  EXPECT_EQ(s.message, "Storage credentials not configured");
}

TEST_F(StorageConfigTest, EmptyContainerOrRegionFailValidation) {
  StorageConfig cfg;
  cfg.access_key = "AKID";
  cfg.secret_key = "shh";
  EXPECT_TRUE(cfg.validate().ok());

  cfg.container.clear();
  EXPECT_EQ(cfg.validate().kind, ErrorKind::Validation);

  cfg.container = "games";
  cfg.region.clear();
  EXPECT_EQ(cfg.validate().kind, ErrorKind::Validation);
}

TEST(ConfigTest, EnvBoolAcceptsCommonSpellings) {
  setenv("MULTICAM_TEST_FLAG", "yes", 1);
  EXPECT_TRUE(Config::get_env_bool("MULTICAM_TEST_FLAG", false));
  setenv("MULTICAM_TEST_FLAG", "0", 1);
  EXPECT_FALSE(Config::get_env_bool("MULTICAM_TEST_FLAG", true));
  unsetenv("MULTICAM_TEST_FLAG");
  EXPECT_TRUE(Config::get_env_bool("MULTICAM_TEST_FLAG", true));
}

}  // namespace
}  // namespace multicam
