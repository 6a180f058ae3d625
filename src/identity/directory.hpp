#pragma once

#include "shyradar/types.hpp"
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace shyradar {
namespace identity {

// Thrown by a Directory when the backing store cannot be reached
class DirectoryError : public std::runtime_error {
public:
    explicit DirectoryError(const std::string& what) : std::runtime_error(what) {}
};

// External user directory. Implementations must be callable from resolver
// worker threads.
class Directory {
public:
    virtual ~Directory() = default;

    // Exact, case-sensitive token match
    virtual std::optional<UserRecord> findByToken(const std::string& token) = 0;

    // Full candidate set, used only for the case-insensitive fallback
    virtual std::vector<UserRecord> listAll() = 0;
};

// Thread-safe in-memory directory with an outage switch
class InMemoryDirectory : public Directory {
public:
    InMemoryDirectory() = default;

    // Replaces any record with the same user_id
    void add(const UserRecord& record);
    bool remove(const UserId& user_id);
    void clear();
    size_t size() const;

    // While unavailable every lookup throws DirectoryError
    void setAvailable(bool available);

    // Reads [User] sections (user_id, token, display_name, photo_ref,
    // verified, status). Returns false if the file cannot be opened.
    bool loadFromFile(const std::string& path);

    std::optional<UserRecord> findByToken(const std::string& token) override;
    std::vector<UserRecord> listAll() override;

    int findCalls() const;
    int listCalls() const;

private:
    mutable std::mutex mutex_;
    std::vector<UserRecord> records_;
    bool available_ = true;
    int find_calls_ = 0;
    int list_calls_ = 0;
};

} // namespace identity
} // namespace shyradar
