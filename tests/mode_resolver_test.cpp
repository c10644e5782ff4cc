#include <gtest/gtest.h>
#include "mode_resolver.hpp"
#include "local_storage_backend.hpp"
#include "object_storage_backend.hpp"
#include "test_support.hpp"

class ModeResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.backupRoot = (dir_ / "backups").string();
        log_ = std::make_shared<BackupLog>();
        store_ = std::make_shared<FakeObjectStore>();
        factory_ = [this](const RemoteStorageConfig&) -> std::unique_ptr<ObjectStoreClient> {
            ++factoryCalls_;
            return std::make_unique<FakeObjectStoreClient>(store_);
        };
    }

    TempDir dir_;
    BackupConfig config_;
    std::shared_ptr<BackupLog> log_;
    std::shared_ptr<FakeObjectStore> store_;
    ObjectStoreClientFactory factory_;
    int factoryCalls_ = 0;
};

TEST_F(ModeResolverTest, RecognizedSchemes) {
    EXPECT_TRUE(hasRecognizedScheme("https://project.supabase.co"));
    EXPECT_TRUE(hasRecognizedScheme("HTTP://localhost:54321"));
    EXPECT_FALSE(hasRecognizedScheme("https://"));
    EXPECT_FALSE(hasRecognizedScheme("ftp://host"));
    EXPECT_FALSE(hasRecognizedScheme("project.supabase.co"));
    EXPECT_FALSE(hasRecognizedScheme(""));
}

TEST_F(ModeResolverTest, NothingConfiguredIsLocal) {
    auto mode = decideMode(config_.remote);
    ASSERT_TRUE(mode);
    EXPECT_EQ(*mode, DeploymentMode::Local);
}

TEST_F(ModeResolverTest, EmptyStringsCountAsAbsent) {
    config_.remote.url = "";
    config_.remote.key = "";
    auto mode = decideMode(config_.remote);
    ASSERT_TRUE(mode);
    EXPECT_EQ(*mode, DeploymentMode::Local);
}

TEST_F(ModeResolverTest, CompleteSettingsAreCloud) {
    config_.remote.url = "https://project.supabase.co";
    config_.remote.key = "service-key";
    auto mode = decideMode(config_.remote);
    ASSERT_TRUE(mode);
    EXPECT_EQ(*mode, DeploymentMode::Cloud);
}

TEST_F(ModeResolverTest, HalfConfiguredIsConfigError) {
    config_.remote.url = "https://project.supabase.co";
    auto missingKey = decideMode(config_.remote);
    ASSERT_FALSE(missingKey);
    EXPECT_EQ(missingKey.error().code, BackupErrorCode::ConfigError);

    config_.remote.url.reset();
    config_.remote.key = "service-key";
    auto missingUrl = decideMode(config_.remote);
    ASSERT_FALSE(missingUrl);
    EXPECT_EQ(missingUrl.error().code, BackupErrorCode::ConfigError);
}

TEST_F(ModeResolverTest, ResolveWithoutRemoteUsesLocalBackend) {
    auto resolution = resolveStorage(config_, factory_, "application/zip", log_);
    EXPECT_EQ(resolution.mode, DeploymentMode::Local);
    ASSERT_TRUE(resolution.backend);
    EXPECT_EQ(resolution.backend->mode(), DeploymentMode::Local);
    EXPECT_NE(dynamic_cast<LocalStorageBackend*>(resolution.backend.get()), nullptr);
    EXPECT_FALSE(resolution.configError);
    EXPECT_EQ(factoryCalls_, 0);
    EXPECT_TRUE(fs::is_directory(dir_ / "backups"));
}

TEST_F(ModeResolverTest, ResolveWithRemoteUsesObjectStorage) {
    config_.remote.url = "https://project.supabase.co";
    config_.remote.key = "service-key";
    config_.remote.bucket = "tenant-backups";

    auto resolution = resolveStorage(config_, factory_, "application/zip", log_);
    EXPECT_EQ(resolution.mode, DeploymentMode::Cloud);
    EXPECT_FALSE(resolution.configError);
    EXPECT_EQ(factoryCalls_, 1);
    auto* objectBackend = dynamic_cast<ObjectStorageBackend*>(resolution.backend.get());
    ASSERT_NE(objectBackend, nullptr);
    EXPECT_EQ(objectBackend->container(), "tenant-backups");
}

TEST_F(ModeResolverTest, MalformedUrlFallsBackWithError) {
    config_.remote.url = "project.supabase.co";
    config_.remote.key = "service-key";

    auto resolution = resolveStorage(config_, factory_, "application/zip", log_);
    EXPECT_EQ(resolution.mode, DeploymentMode::Local);
    ASSERT_TRUE(resolution.backend);
    ASSERT_TRUE(resolution.configError);
    EXPECT_EQ(resolution.configError->code, BackupErrorCode::ConfigError);
    EXPECT_EQ(factoryCalls_, 0);
}

TEST_F(ModeResolverTest, FailingFactoryFallsBackWithError) {
    config_.remote.url = "https://project.supabase.co";
    config_.remote.key = "service-key";
    ObjectStoreClientFactory throwing = [](const RemoteStorageConfig&) -> std::unique_ptr<ObjectStoreClient> {
        throw std::runtime_error("curl_easy_init failed");
    };

    auto resolution = resolveStorage(config_, throwing, "application/zip", log_);
    EXPECT_EQ(resolution.mode, DeploymentMode::Local);
    ASSERT_TRUE(resolution.configError);
    EXPECT_NE(resolution.configError->message.find("curl_easy_init failed"), std::string::npos);
}

TEST_F(ModeResolverTest, NullClientFallsBackWithError) {
    config_.remote.url = "https://project.supabase.co";
    config_.remote.key = "service-key";
    ObjectStoreClientFactory empty = [](const RemoteStorageConfig&) -> std::unique_ptr<ObjectStoreClient> {
        return nullptr;
    };

    auto resolution = resolveStorage(config_, empty, "application/zip", log_);
    EXPECT_EQ(resolution.mode, DeploymentMode::Local);
    EXPECT_TRUE(resolution.configError);
}

TEST_F(ModeResolverTest, HttpClientRequiresCredentials) {
    RemoteStorageConfig remote;
    remote.url = "https://project.supabase.co";
    EXPECT_THROW(HttpObjectStoreClient client(remote), std::invalid_argument);
}
