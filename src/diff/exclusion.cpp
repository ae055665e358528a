#include "envsync/diff/exclusion.hpp"

#include <algorithm>

namespace envsync::diff {

const std::vector<std::string>& default_exclude_patterns() {
    static const std::vector<std::string> patterns{
        R"(\.git$)",
        R"(\.github$)",
        R"(__pycache__$)",
        R"(\.pyc$)",
        R"(\.pyo$)",
        R"(\.pyd$)",
        R"(\.pytest_cache$)",
        R"(\.venv$)",
        R"(venv$)",
        R"(\.env$)",
        R"(\.idea$)",
        R"(\.vscode$)",
        R"(\.DS_Store$)",
        R"(\.sass-cache$)",
        R"(\.tox$)",
        R"(\.coverage$)",
        R"(\.coverage\.)",
        R"(htmlcov$)",
        R"(\.hypothesis$)",
    };
    return patterns;
}

ExclusionFilter::ExclusionFilter(const std::vector<std::string>& patterns,
                                 bool include_hidden,
                                 std::vector<std::string> reserved_names)
    : include_hidden_(include_hidden), reserved_names_(std::move(reserved_names)) {
    patterns_.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
    }
}

bool ExclusionFilter::is_excluded(const std::filesystem::path& path) const {
    const std::string leaf = path.filename().string();
    if (std::find(reserved_names_.begin(), reserved_names_.end(), leaf) != reserved_names_.end()) {
        return true;
    }

    const std::string text = path.string();
    for (const auto& pattern : patterns_) {
        if (std::regex_search(text, pattern)) {
            return true;
        }
    }

    // "." and ".." name a directory by position, not a hidden entry
    if (leaf == "." || leaf == "..") {
        return false;
    }
    return !include_hidden_ && !leaf.empty() && leaf.front() == '.';
}

} // namespace envsync::diff
