#pragma once

#include "domain/AuditRecord.hpp"

namespace clinic::ports::output {

/**
 * @brief Журнал аудита безопасности (только запись)
 */
class IAuditLog {
public:
    virtual ~IAuditLog() = default;

    virtual void record(const domain::AuditRecord& entry) = 0;
};

} // namespace clinic::ports::output
