#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>

namespace envsync::sync {

/**
 * @brief Recursive merge of a source document into a target document
 *
 * - object + object: union of keys, common keys merged recursively
 * - array + array: distinct elements of both, compared by canonical dump();
 *   target order first, a source duplicate replaces its target twin in place,
 *   remaining source elements appended in source order
 * - anything else: the source value
 */
nlohmann::json deep_merge(const nlohmann::json& source, const nlohmann::json& target);

/// Top-level keys present in both objects with unequal values; 0 unless both are objects
std::uint32_t count_conflicts(const nlohmann::json& source, const nlohmann::json& target);

} // namespace envsync::sync
