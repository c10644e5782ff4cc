#include <gtest/gtest.h>
#include "backup_api.hpp"
#include "local_storage_backend.hpp"
#include "test_support.hpp"

class BackupAPITest : public ::testing::Test {
protected:
    void SetUp() override {
        databasePath_ = dir_ / "database.db";
        writeFile(databasePath_, "rows");
        auto log = std::make_shared<BackupLog>();
        usage_ = std::make_shared<RecordingUsage>();
        BackupServiceOptions options;
        options.databasePath = databasePath_;
        options.stagingDir = dir_ / "staging";
        service_ = std::make_unique<BackupService>(std::move(options),
                                                   std::make_unique<LocalStorageBackend>(dir_ / "backups", log),
                                                   usage_, log);
        api_ = std::make_unique<BackupAPI>(*service_);
    }

    TempDir dir_;
    fs::path databasePath_;
    std::shared_ptr<RecordingUsage> usage_;
    std::unique_ptr<BackupService> service_;
    std::unique_ptr<BackupAPI> api_;
};

TEST_F(BackupAPITest, CreateReturnsOutcome) {
    ApiResponse response = api_->createBackup("owner-a");
    EXPECT_EQ(response.status, 200);
    EXPECT_TRUE(response.body["success"].asBool());
    EXPECT_GT(response.body["size"].asUInt64(), 0u);
    EXPECT_EQ(response.body["message"].asString(), "Backup successful (local)");
}

TEST_F(BackupAPITest, CreateFailureIsBadRequest) {
    fs::remove(databasePath_);
    ApiResponse response = api_->createBackup("owner-a");
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body["message"].asString(), "Database file (database.db) not found");
}

TEST_F(BackupAPITest, ListReturnsRecordArray) {
    ApiResponse empty = api_->listBackups("owner-a");
    EXPECT_EQ(empty.status, 200);
    ASSERT_TRUE(empty.body.isArray());
    EXPECT_EQ(empty.body.size(), 0u);

    ASSERT_EQ(api_->createBackup("owner-a").status, 200);
    ApiResponse response = api_->listBackups("owner-a");
    EXPECT_EQ(response.status, 200);
    ASSERT_EQ(response.body.size(), 1u);
    const Json::Value& record = response.body[0];
    EXPECT_TRUE(record["id"].asString().starts_with("backup_"));
    EXPECT_EQ(record["name"], record["id"]);
    EXPECT_GT(record["size"].asUInt64(), 0u);
    EXPECT_TRUE(parseIso8601(record["created_at"].asString()).has_value());
}

TEST_F(BackupAPITest, RecordJsonShape) {
    BackupRecord record;
    record.id = "backup_2024-03-05T07-08-09_GMT.zip";
    record.name = record.id;
    record.sizeBytes = 1234;
    record.createdAt = std::chrono::system_clock::from_time_t(1709622489);

    Json::Value json = BackupAPI::toJson(record);
    EXPECT_EQ(json["id"].asString(), record.id);
    EXPECT_EQ(json["name"].asString(), record.name);
    EXPECT_EQ(json["size"].asUInt64(), 1234u);
    EXPECT_EQ(json["created_at"].asString(), "2024-03-05T07:08:09.000Z");
}

TEST_F(BackupAPITest, RestoreRequiresBackupId) {
    Json::Value missing(Json::objectValue);
    EXPECT_EQ(api_->restoreBackup("owner-a", missing).status, 400);
    EXPECT_EQ(api_->restoreBackup("owner-a", missing).body["message"].asString(), "backupId is required");

    Json::Value wrongType;
    wrongType["backupId"] = 5;
    EXPECT_EQ(api_->restoreBackup("owner-a", wrongType).status, 400);

    Json::Value blank;
    blank["backupId"] = "";
    EXPECT_EQ(api_->restoreBackup("owner-a", blank).status, 400);

    EXPECT_EQ(api_->restoreBackup("owner-a", Json::Value("backup.zip")).status, 400);
}

TEST_F(BackupAPITest, RestoreOutcomes) {
    Json::Value unknown;
    unknown["backupId"] = "backup_missing.zip";
    ApiResponse failed = api_->restoreBackup("owner-a", unknown);
    EXPECT_EQ(failed.status, 400);
    EXPECT_EQ(failed.body["message"].asString(), "Restore failed");

    ASSERT_EQ(api_->createBackup("owner-a").status, 200);
    Json::Value request;
    request["backupId"] = api_->listBackups("owner-a").body[0]["id"];
    ApiResponse response = api_->restoreBackup("owner-a", request);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body["message"].asString(), "Restore initiated");
}

TEST_F(BackupAPITest, StorageUsageReflectsLatestBackup) {
    EXPECT_EQ(api_->storageUsage("owner-a").body["storage_used"].asUInt64(), 0u);

    ApiResponse created = api_->createBackup("owner-a");
    ASSERT_EQ(created.status, 200);
    ApiResponse usage = api_->storageUsage("owner-a");
    EXPECT_EQ(usage.status, 200);
    EXPECT_EQ(usage.body["storage_used"].asUInt64(), created.body["size"].asUInt64());
}

// Usage store that is unreachable.
class BrokenUsage : public UsageAccounting {
public:
    std::uint64_t getOwnerStorageUsage(const std::string&) override { throw std::runtime_error("ledger offline"); }
    void setOwnerStorageUsage(const std::string&, std::uint64_t) override { throw std::runtime_error("ledger offline"); }
};

TEST(BackupAPIErrorTest, UnexpectedExceptionIsInternalError) {
    TempDir dir;
    auto log = std::make_shared<BackupLog>();
    BackupServiceOptions options;
    options.databasePath = dir / "database.db";
    options.stagingDir = dir / "staging";
    BackupService service(std::move(options), std::make_unique<LocalStorageBackend>(dir / "backups", log),
                          std::make_shared<BrokenUsage>(), log);
    BackupAPI api(service);

    ApiResponse response = api.storageUsage("owner-a");
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(response.body["message"].asString(), "Internal server error");
}
