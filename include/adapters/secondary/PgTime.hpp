#pragma once

#include <pqxx/pqxx>
#include <chrono>
#include <optional>
#include <cstdint>
#include <string>
#include <vector>
#include <sstream>

namespace clinic::adapters::secondary::pg {

using TimePoint = std::chrono::system_clock::time_point;

/// Время передаётся в SQL как epoch-секунды: to_timestamp($n)
inline int64_t toEpoch(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline std::optional<int64_t> toEpoch(const std::optional<TimePoint>& tp) {
    if (!tp) return std::nullopt;
    return toEpoch(*tp);
}

/// Колонка вида EXTRACT(EPOCH FROM ...)::bigint
inline TimePoint epochField(const pqxx::field& field) {
    return TimePoint(std::chrono::seconds(field.as<int64_t>()));
}

inline std::optional<TimePoint> optionalEpochField(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return epochField(field);
}

inline std::optional<std::string> optionalText(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return field.as<std::string>();
}

/**
 * @brief Значения text[] читаются через array_to_string(col, ',')
 *
 * Годится только для значений без запятых (hex-хэши).
 */
inline std::vector<std::string> splitList(const pqxx::field& field) {
    std::vector<std::string> items;
    if (field.is_null()) return items;
    std::stringstream ss(field.as<std::string>());
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

inline std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ",";
        out += items[i];
    }
    return out;
}

} // namespace clinic::adapters::secondary::pg
