#include "envsync/diff/tree_scan.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace envsync::diff {

Result<std::set<fs::path>> list_files(const fs::path& root, const ExclusionFilter& filter) {
    std::set<fs::path> files;

    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec)) {
        return Ok(std::move(files));
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Err<std::set<fs::path>>(ErrorCode::Io,
                                       "Cannot list " + root.string() + ": " + ec.message());
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (filter.is_excluded(entry.path())) {
            if (entry.is_directory(entry_ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }

        auto relative = entry.path().lexically_relative(root);
        if (!relative.empty()) {
            files.insert(std::move(relative));
        }
    }

    if (ec) {
        return Err<std::set<fs::path>>(ErrorCode::Io,
                                       "Error while listing " + root.string() + ": " + ec.message());
    }
    return Ok(std::move(files));
}

} // namespace envsync::diff
