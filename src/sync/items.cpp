#include "envsync/sync/items.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <type_traits>

namespace envsync::sync {
namespace fs = std::filesystem;

bool is_structured_config(const fs::path& path) {
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension == ".json";
}

SyncResult make_result(ItemKind kind, const fs::path& source, const SyncConfiguration& config) {
    SyncResult result;
    result.item_path = source.string();
    result.item_kind = kind;
    result.direction = config.direction();
    return result;
}

ItemKind kind_of(const SyncItem& item) {
    return std::visit([](const auto& concrete) {
        return std::decay_t<decltype(concrete)>::kKind;
    }, item);
}

bool needs_sync(const SyncItem& item) {
    return std::visit([](const auto& concrete) { return concrete.needs_sync(); }, item);
}

SyncResult synchronize(const SyncItem& item) {
    return std::visit([](const auto& concrete) { return concrete.synchronize(); }, item);
}

} // namespace envsync::sync
