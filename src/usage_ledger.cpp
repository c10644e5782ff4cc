#include "usage_ledger.hpp"
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <json/json.h>

namespace fs = std::filesystem;

JsonUsageLedger::JsonUsageLedger(std::string ledgerFile) : ledgerPath(std::move(ledgerFile)) {
    std::ifstream file(ledgerPath);
    if (!file.is_open()) {
        return;
    }

    Json::Value ledgerJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &ledgerJson, &errors) || !ledgerJson.isObject()) {
        throw std::runtime_error(std::format("Failed to parse usage ledger: {} ({})", ledgerPath, errors));
    }
    for (const auto& owner : ledgerJson.getMemberNames()) {
        const Json::Value& bytes = ledgerJson[owner];
        if (!bytes.isUInt64()) {
            throw std::runtime_error(std::format("Invalid usage for owner {} in {}", owner, ledgerPath));
        }
        usage[owner] = bytes.asUInt64();
    }
}

std::uint64_t JsonUsageLedger::getOwnerStorageUsage(const std::string& ownerId) {
    std::lock_guard<std::mutex> lock(ledgerMutex);
    auto it = usage.find(ownerId);
    return it == usage.end() ? 0 : it->second;
}

void JsonUsageLedger::setOwnerStorageUsage(const std::string& ownerId, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(ledgerMutex);
    auto previous = usage.find(ownerId);
    std::optional<std::uint64_t> old;
    if (previous != usage.end()) {
        old = previous->second;
    }
    usage[ownerId] = bytes;
    try {
        save();
    } catch (...) {
        if (old) {
            usage[ownerId] = *old;
        } else {
            usage.erase(ownerId);
        }
        throw;
    }
}

void JsonUsageLedger::save() const {
    Json::Value ledgerJson(Json::objectValue);
    for (const auto& [owner, bytes] : usage) {
        ledgerJson[owner] = Json::Value::UInt64(bytes);
    }

    fs::path path(ledgerPath);
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    fs::path temp = path;
    temp += ".tmp";

    std::ofstream outFile(temp, std::ios::trunc);
    if (!outFile.is_open()) {
        throw std::runtime_error(std::format("Failed to open usage ledger for writing: {}", temp.string()));
    }
    Json::StreamWriterBuilder builder;
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(ledgerJson, &outFile);
    outFile.close();
    if (!outFile) {
        throw std::runtime_error(std::format("Failed to write usage ledger: {}", temp.string()));
    }
    fs::rename(temp, path);
}
