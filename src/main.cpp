#include <iostream>
#include <memory>
#include <print>
#include <string>
#include <vector>
#include "backup_api.hpp"

namespace {

void printUsage(const char* program) {
    std::println(stderr, "Usage: {} [--config <path>] {{create <owner> | list <owner> | restore <owner> <backupId> | usage <owner>}}",
                 program);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = "backup_config.json";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.size() < 2) {
        printUsage(argv[0]);
        return 1;
    }
    const std::string& command = args[0];
    const std::string& ownerId = args[1];
    if ((command == "restore" && args.size() != 3) || (command != "restore" && args.size() != 2)) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        BackupConfig config(configFile);
        auto log = std::make_shared<BackupLog>(config.logDir);
        auto usage = std::make_shared<JsonUsageLedger>(config.usageLedger);
        auto service = BackupService::create(config, makeHttpObjectStoreClient, usage, log);
        BackupAPI api(*service);

        ApiResponse response;
        if (command == "create") {
            response = api.createBackup(ownerId);
        } else if (command == "list") {
            response = api.listBackups(ownerId);
        } else if (command == "restore") {
            Json::Value request;
            request["backupId"] = args[2];
            response = api.restoreBackup(ownerId, request);
        } else if (command == "usage") {
            response = api.storageUsage(ownerId);
        } else {
            printUsage(argv[0]);
            return 1;
        }

        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::cout << Json::writeString(builder, response.body) << std::endl;
        return response.status >= 200 && response.status < 300 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
