/**
 * @file usage_ledger.hpp
 * @brief Owner storage-usage accounting.
 *
 * The orchestrator records the size of each successful backup through the
 * UsageAccounting interface. The recorded figure is the latest snapshot size,
 * not a running total.
 */

#ifndef USAGE_LEDGER_HPP
#define USAGE_LEDGER_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

/**
 * @brief Interface for the owner storage-usage collaborator.
 */
class UsageAccounting {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~UsageAccounting() = default;

    /**
     * @brief Returns the bytes recorded for an owner, 0 if none.
     */
    virtual std::uint64_t getOwnerStorageUsage(const std::string& ownerId) = 0;

    /**
     * @brief Records the bytes used by an owner, replacing any previous value.
     *
     * @throws std::runtime_error If the value cannot be persisted.
     */
    virtual void setOwnerStorageUsage(const std::string& ownerId, std::uint64_t bytes) = 0;
};

/**
 * @brief Usage ledger persisted as a JSON object mapping owner id to bytes.
 *
 * The file is rewritten on every update through a temporary sibling and a
 * rename, so readers never see a half written ledger.
 */
class JsonUsageLedger : public UsageAccounting {
public:
    /**
     * @brief Opens or creates a ledger file.
     *
     * @param ledgerFile Path of the JSON ledger.
     * @throws std::runtime_error If an existing ledger cannot be parsed.
     */
    explicit JsonUsageLedger(std::string ledgerFile);

    std::uint64_t getOwnerStorageUsage(const std::string& ownerId) override;
    void setOwnerStorageUsage(const std::string& ownerId, std::uint64_t bytes) override;

private:
    void save() const;

    std::string ledgerPath;
    std::map<std::string, std::uint64_t> usage;
    std::mutex ledgerMutex;
};

#endif // USAGE_LEDGER_HPP
