#pragma once

#include "envsync/core/result.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace envsync::diff {

/**
 * @brief Read and parse a JSON document
 *
 * Errors: NotFound when the file is missing, Io when it cannot be read,
 * Parse when the content is not valid JSON.
 */
Result<nlohmann::json> load_json_document(const std::filesystem::path& path);

/**
 * @brief Structural equality of two JSON files
 *
 * Object key order does not matter. A parse failure on either side is logged
 * as a warning and reported as "not equal" so that a sync is attempted.
 */
bool json_documents_equal(const std::filesystem::path& lhs, const std::filesystem::path& rhs);

} // namespace envsync::diff
