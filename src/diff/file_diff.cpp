#include "envsync/diff/file_diff.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace envsync::diff {
namespace {

const std::unordered_set<std::string>& binary_extensions() {
    static const std::unordered_set<std::string> extensions{
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".ico", ".pdf",
        ".zip", ".tar", ".gz", ".bz2", ".xz", ".7z", ".rar",
        ".exe", ".dll", ".so", ".dylib", ".jar", ".war", ".ear",
        ".pyc", ".pyo", ".pyd", ".obj", ".o",
    };
    return extensions;
}

std::string lowercase_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// A multi-byte sequence cut off by the end of the probe window is accepted.
bool is_valid_utf8(const unsigned char* data, std::size_t size) {
    std::size_t i = 0;
    while (i < size) {
        const unsigned char lead = data[i];
        std::size_t continuation = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            continuation = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            continuation = 2;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            continuation = 3;
        } else {
            return false;
        }

        for (std::size_t k = 1; k <= continuation; ++k) {
            if (i + k >= size) {
                return true;
            }
            if ((data[i + k] & 0xC0) != 0x80) {
                return false;
            }
        }
        i += continuation + 1;
    }
    return true;
}

// Reads one line; returns false at end of input. terminated reports whether
// the line was followed by '\n'.
bool next_line(std::istream& input, std::string& line, bool& terminated) {
    line.clear();
    if (!std::getline(input, line)) {
        return false;
    }
    terminated = !input.eof();
    return true;
}

} // namespace

bool is_binary_file(const fs::path& path) {
    if (binary_extensions().count(lowercase_extension(path)) > 0) {
        return true;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        spdlog::warn("Cannot open {} to probe its content, treating as binary", path.string());
        return true;
    }

    std::array<unsigned char, kBinaryProbeSize> probe{};
    input.read(reinterpret_cast<char*>(probe.data()), static_cast<std::streamsize>(probe.size()));
    const auto count = static_cast<std::size_t>(input.gcount());

    if (std::find(probe.begin(), probe.begin() + count, 0) != probe.begin() + count) {
        return true;
    }
    return !is_valid_utf8(probe.data(), count);
}

std::string hash_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return {};
    }
    const std::uint64_t offset = 0xcbf29ce484222325ULL;
    const std::uint64_t prime  = 0x100000001b3ULL;
    std::uint64_t hash = offset;
    char buffer[4096];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const std::streamsize count = input.gcount();
        for (std::streamsize i = 0; i < count; ++i) {
            hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(buffer[i]));
            hash *= prime;
        }
    }
    if (input.bad()) {
        return {};
    }
    std::ostringstream hex;
    hex << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return hex.str();
}

bool text_files_equal(const fs::path& lhs, const fs::path& rhs) {
    std::ifstream left(lhs, std::ios::binary);
    std::ifstream right(rhs, std::ios::binary);
    if (!left || !right) {
        return false;
    }

    std::string left_line;
    std::string right_line;
    bool left_terminated = false;
    bool right_terminated = false;
    while (true) {
        const bool has_left = next_line(left, left_line, left_terminated);
        const bool has_right = next_line(right, right_line, right_terminated);
        if (!has_left || !has_right) {
            return has_left == has_right;
        }
        if (left_line != right_line || left_terminated != right_terminated) {
            return false;
        }
    }
}

bool files_equal(const fs::path& lhs, const fs::path& rhs) {
    std::error_code ec;
    const auto lhs_size = fs::file_size(lhs, ec);
    if (ec) {
        return false;
    }
    const auto rhs_size = fs::file_size(rhs, ec);
    if (ec) {
        return false;
    }
    if (lhs_size != rhs_size) {
        return false;
    }

    const auto lhs_time = fs::last_write_time(lhs, ec);
    if (ec) {
        return false;
    }
    const auto rhs_time = fs::last_write_time(rhs, ec);
    if (ec) {
        return false;
    }
    const auto delta = lhs_time > rhs_time ? lhs_time - rhs_time : rhs_time - lhs_time;
    if (delta < kModifiedTimeTolerance) {
        return true;
    }

    if (is_binary_file(lhs) || is_binary_file(rhs)) {
        const auto lhs_hash = hash_file(lhs);
        const auto rhs_hash = hash_file(rhs);
        return !lhs_hash.empty() && lhs_hash == rhs_hash;
    }
    return text_files_equal(lhs, rhs);
}

} // namespace envsync::diff
