// SPDX-License-Identifier: MIT
/**
 * @file record.hpp
 * @brief Ordered key/value records for metrics handed to reporting layers
 *
 * A Record preserves insertion order so that serializers (the Python
 * module, report printers) emit keys in a stable, documented order.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace hedgelab {

/// Value stored in a record field
using FieldValue = std::variant<double, int64_t, std::string>;

/// Ordered list of named fields
using Record = std::vector<std::pair<std::string, FieldValue>>;

/// Find a field by key, nullptr if absent
inline const FieldValue* find_field(const Record& record, std::string_view key) {
    for (const auto& [name, value] : record) {
        if (name == key) return &value;
    }
    return nullptr;
}

/// Numeric view of a field (integers are widened to double)
inline std::optional<double> get_number(const Record& record, std::string_view key) {
    const FieldValue* field = find_field(record, key);
    if (field == nullptr) return std::nullopt;
    if (const auto* d = std::get_if<double>(field)) return *d;
    if (const auto* i = std::get_if<int64_t>(field)) return static_cast<double>(*i);
    return std::nullopt;
}

}  // namespace hedgelab
