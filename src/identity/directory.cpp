#include "directory.hpp"
#include "shyradar/logging.hpp"
#include <algorithm>
#include <fstream>

namespace shyradar {
namespace identity {

void InMemoryDirectory::add(const UserRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const UserRecord& r) { return r.user_id == record.user_id; });
    if (it != records_.end()) {
        *it = record;
    } else {
        records_.push_back(record);
    }
}

bool InMemoryDirectory::remove(const UserId& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const UserRecord& r) { return r.user_id == user_id; });
    if (it == records_.end()) {
        return false;
    }
    records_.erase(it);
    return true;
}

void InMemoryDirectory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

size_t InMemoryDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void InMemoryDirectory::setAvailable(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
}

std::optional<UserRecord> InMemoryDirectory::findByToken(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    find_calls_++;
    if (!available_) {
        throw DirectoryError("directory offline");
    }
    for (const auto& record : records_) {
        if (record.token == token) {
            return record;
        }
    }
    return std::nullopt;
}

std::vector<UserRecord> InMemoryDirectory::listAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    list_calls_++;
    if (!available_) {
        throw DirectoryError("directory offline");
    }
    return records_;
}

int InMemoryDirectory::findCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_calls_;
}

int InMemoryDirectory::listCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return list_calls_;
}

bool InMemoryDirectory::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_RESOLVE(ERROR, "Cannot open directory file %s", path.c_str());
        return false;
    }

    std::vector<UserRecord> loaded;
    std::optional<UserRecord> current;

    auto flush = [&]() {
        if (!current) return;
        if (current->user_id.empty() || current->token.empty()) {
            LOG_RESOLVE(WARN, "Skipping directory entry without user_id/token in %s",
                        path.c_str());
        } else {
            loaded.push_back(*current);
        }
        current.reset();
    };

    std::string line;
    while (std::getline(file, line)) {
        line = trimCopy(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            flush();
            if (toLowerCopy(line) == "[user]") {
                current = UserRecord{};
            }
            continue;
        }

        if (!current) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trimCopy(line.substr(0, eq));
        std::string value = trimCopy(line.substr(eq + 1));

        if (key == "user_id") {
            current->user_id = value;
        } else if (key == "token") {
            current->token = value;
        } else if (key == "display_name") {
            current->display_name = value;
        } else if (key == "photo_ref") {
            if (!value.empty()) current->photo_ref = value;
        } else if (key == "verified") {
            current->is_verified = (value == "1" || value == "true");
        } else if (key == "status") {
            current->status = value;
        }
    }
    flush();

    for (const auto& record : loaded) {
        add(record);
    }
    LOG_RESOLVE(INFO, "Loaded %zu directory entries from %s", loaded.size(), path.c_str());
    return true;
}

} // namespace identity
} // namespace shyradar
