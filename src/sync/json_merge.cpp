#include "envsync/sync/json_merge.hpp"

#include <string>
#include <unordered_map>

namespace envsync::sync {
using json = nlohmann::json;

namespace {

json merge_arrays(const json& source, const json& target) {
    json merged = json::array();
    std::unordered_map<std::string, std::size_t> positions;

    for (const auto& element : target) {
        auto key = element.dump();
        if (positions.count(key) == 0) {
            positions.emplace(std::move(key), merged.size());
            merged.push_back(element);
        }
    }

    for (const auto& element : source) {
        auto key = element.dump();
        auto it = positions.find(key);
        if (it != positions.end()) {
            merged[it->second] = element;
            continue;
        }
        positions.emplace(std::move(key), merged.size());
        merged.push_back(element);
    }

    return merged;
}

} // namespace

json deep_merge(const json& source, const json& target) {
    if (source.is_object() && target.is_object()) {
        json merged = target;
        for (auto it = source.begin(); it != source.end(); ++it) {
            auto existing = merged.find(it.key());
            if (existing == merged.end()) {
                merged[it.key()] = it.value();
            } else {
                *existing = deep_merge(it.value(), *existing);
            }
        }
        return merged;
    }

    if (source.is_array() && target.is_array()) {
        return merge_arrays(source, target);
    }

    return source;
}

std::uint32_t count_conflicts(const json& source, const json& target) {
    if (!source.is_object() || !target.is_object()) {
        return 0;
    }

    std::uint32_t conflicts = 0;
    for (auto it = source.begin(); it != source.end(); ++it) {
        auto other = target.find(it.key());
        if (other != target.end() && *other != it.value()) {
            ++conflicts;
        }
    }
    return conflicts;
}

} // namespace envsync::sync
