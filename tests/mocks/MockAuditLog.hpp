#pragma once

#include "ports/output/IAuditLog.hpp"
#include <vector>
#include <string>
#include <mutex>
#include <algorithm>

namespace clinic::tests::mocks {

/**
 * @brief Аудит в памяти: записи доступны тестам
 */
class MockAuditLog : public ports::output::IAuditLog {
public:
    void record(const domain::AuditRecord& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(entry);
    }

    size_t count(const std::string& action) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::count_if(records_.begin(), records_.end(),
            [&action](const domain::AuditRecord& r) { return r.action == action; });
    }

    std::vector<domain::AuditRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::AuditRecord> records_;
};

} // namespace clinic::tests::mocks
