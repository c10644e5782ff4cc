#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <gtest/gtest.h>
#include "backup_time.hpp"
#include "object_store_client.hpp"
#include "usage_ledger.hpp"

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed with its contents.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("ledgervault-test-" + std::to_string(rd()) + "-" + std::to_string(counter_++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
    static inline std::atomic<int> counter_{0};
};

inline void writeFile(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline size_t countFiles(const fs::path& dir) {
    size_t count = 0;
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return 0;
    }
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            ++count;
        }
    }
    return count;
}

// In-memory stand-in for the remote storage service.
class FakeObjectStore {
public:
    struct Object {
        std::string data;
        std::string contentType;
        std::chrono::system_clock::time_point createdAt;
    };

    std::mutex mutex;
    std::map<std::string, BucketPolicy> buckets;
    std::map<std::string, std::map<std::string, Object>> objects;
    int getBucketCalls = 0;
    int createBucketCalls = 0;
    int uploadCalls = 0;
    std::optional<ObjectStoreError> getBucketError;
    std::optional<ObjectStoreError> createBucketError;
    std::optional<ObjectStoreError> uploadError;
    std::optional<ObjectStoreError> listError;
    std::optional<ObjectStoreError> downloadError;
    std::chrono::system_clock::time_point nextCreatedAt =
        std::chrono::system_clock::from_time_t(1767225600); // 2026-01-01T00:00:00Z
};

class FakeObjectStoreClient : public ObjectStoreClient {
public:
    explicit FakeObjectStoreClient(std::shared_ptr<FakeObjectStore> store) : store_(std::move(store)) {}

    std::expected<void, ObjectStoreError> getBucket(const std::string& bucket) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        ++store_->getBucketCalls;
        if (store_->getBucketError) {
            return std::unexpected(*store_->getBucketError);
        }
        if (!store_->buckets.contains(bucket)) {
            // The service answers 400 with statusCode "404" in the body.
            return std::unexpected(ObjectStoreError{404, "Bucket not found"});
        }
        return {};
    }

    std::expected<void, ObjectStoreError> createBucket(const std::string& bucket, const BucketPolicy& policy) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        ++store_->createBucketCalls;
        if (store_->createBucketError) {
            return std::unexpected(*store_->createBucketError);
        }
        if (store_->buckets.contains(bucket)) {
            return std::unexpected(ObjectStoreError{409, "The resource already exists"});
        }
        store_->buckets[bucket] = policy;
        return {};
    }

    std::expected<void, ObjectStoreError> upload(const std::string& bucket,
                                                 const std::string& key,
                                                 const std::string& data,
                                                 const std::string& contentType,
                                                 bool upsert) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        ++store_->uploadCalls;
        if (store_->uploadError) {
            return std::unexpected(*store_->uploadError);
        }
        if (!store_->buckets.contains(bucket)) {
            return std::unexpected(ObjectStoreError{404, "Bucket not found"});
        }
        auto& bucketObjects = store_->objects[bucket];
        if (!upsert && bucketObjects.contains(key)) {
            return std::unexpected(ObjectStoreError{409, "The resource already exists"});
        }
        bucketObjects[key] = FakeObjectStore::Object{data, contentType, store_->nextCreatedAt};
        store_->nextCreatedAt += std::chrono::seconds(1);
        return {};
    }

    std::expected<std::vector<ObjectInfo>, ObjectStoreError> list(const std::string& bucket,
                                                                  const std::string& prefix,
                                                                  const ListOptions& options) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        lastListOptions = options;
        if (store_->listError) {
            return std::unexpected(*store_->listError);
        }
        std::vector<std::pair<std::string, const FakeObjectStore::Object*>> matches;
        const std::string folder = prefix + "/";
        for (const auto& [key, object] : store_->objects[bucket]) {
            if (key.starts_with(folder) && key.find('/', folder.size()) == std::string::npos) {
                matches.emplace_back(key.substr(folder.size()), &object);
            }
        }
        std::ranges::sort(matches, [&options](const auto& a, const auto& b) {
            return options.descending ? a.second->createdAt > b.second->createdAt
                                      : a.second->createdAt < b.second->createdAt;
        });
        std::vector<ObjectInfo> result;
        for (size_t i = static_cast<size_t>(options.offset);
             i < matches.size() && result.size() < static_cast<size_t>(options.limit); ++i) {
            ObjectInfo info;
            info.name = matches[i].first;
            info.id = "id-" + matches[i].first;
            info.size = matches[i].second->data.size();
            info.createdAt = formatIso8601(matches[i].second->createdAt);
            result.push_back(std::move(info));
        }
        return result;
    }

    std::expected<std::string, ObjectStoreError> download(const std::string& bucket, const std::string& key) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        if (store_->downloadError) {
            return std::unexpected(*store_->downloadError);
        }
        auto& bucketObjects = store_->objects[bucket];
        auto it = bucketObjects.find(key);
        if (it == bucketObjects.end()) {
            return std::unexpected(ObjectStoreError{400, "Object not found"});
        }
        return it->second.data;
    }

    ListOptions lastListOptions;

private:
    std::shared_ptr<FakeObjectStore> store_;
};

// Usage collaborator that remembers every call.
class RecordingUsage : public UsageAccounting {
public:
    std::uint64_t getOwnerStorageUsage(const std::string& ownerId) override {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = usage.find(ownerId);
        return it == usage.end() ? 0 : it->second;
    }

    void setOwnerStorageUsage(const std::string& ownerId, std::uint64_t bytes) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (failWith) {
            throw std::runtime_error(*failWith);
        }
        usage[ownerId] = bytes;
        ++calls;
    }

    std::mutex mutex;
    std::map<std::string, std::uint64_t> usage;
    int calls = 0;
    std::optional<std::string> failWith;
};

#endif // TEST_SUPPORT_HPP
