#pragma once

#include "ports/output/IPasswordHistoryRepository.hpp"
#include <mutex>

namespace clinic::tests::mocks {

class InMemoryPasswordHistoryRepository : public ports::output::IPasswordHistoryRepository {
public:
    void record(const ports::output::PasswordHistoryEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }

    std::vector<std::string> recentHashes(const std::string& userId, int depth) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (auto it = entries_.rbegin(); it != entries_.rend() && static_cast<int>(result.size()) < depth; ++it) {
            if (it->userId == userId) {
                result.push_back(it->passwordHash);
            }
        }
        return result;
    }

    // Test helpers
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<ports::output::PasswordHistoryEntry> entries_;
};

} // namespace clinic::tests::mocks
