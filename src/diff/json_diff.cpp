#include "envsync/diff/json_diff.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace envsync::diff {

Result<json> load_json_document(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Err<json>(ErrorCode::NotFound, "JSON file not found: " + path.string());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<json>(ErrorCode::Io, "Failed to open JSON file: " + path.string());
    }

    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<json>(ErrorCode::Parse, "Invalid JSON file: " + path.string());
    }
    return Ok(std::move(document));
}

bool json_documents_equal(const fs::path& lhs, const fs::path& rhs) {
    auto left = load_json_document(lhs);
    if (left.is_error()) {
        spdlog::warn("Cannot compare {} and {}: {}", lhs.string(), rhs.string(), left.message());
        return false;
    }
    auto right = load_json_document(rhs);
    if (right.is_error()) {
        spdlog::warn("Cannot compare {} and {}: {}", lhs.string(), rhs.string(), right.message());
        return false;
    }
    return left.value() == right.value();
}

} // namespace envsync::diff
