#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace envsync::diff {

/// Equal-size files whose mtimes are closer than this are assumed identical
constexpr std::chrono::seconds kModifiedTimeTolerance{2};

/// Number of leading bytes inspected when sniffing binary content
constexpr std::size_t kBinaryProbeSize = 1024;

/**
 * @brief Classify a file as binary
 *
 * Known binary extensions (images, archives, executables, object files,
 * byte-compiled code) are binary without opening the file. Otherwise the
 * first kBinaryProbeSize bytes are probed: a NUL byte or invalid UTF-8 means
 * binary. Files that cannot be read are treated as binary.
 */
bool is_binary_file(const std::filesystem::path& path);

/**
 * @brief FNV-1a 64-bit digest of the whole file as 16 hex characters
 *
 * @return Empty string if the file cannot be read
 */
std::string hash_file(const std::filesystem::path& path);

/**
 * @brief Line-by-line comparison of two text files
 *
 * Differs on the first unequal line, when one file has more lines, or when
 * only one of them ends with a newline.
 */
bool text_files_equal(const std::filesystem::path& lhs, const std::filesystem::path& rhs);

/**
 * @brief Content equality with a metadata fast path
 *
 * 1. Sizes differ                          -> not equal
 * 2. Sizes equal, |mtime delta| < 2s       -> equal, content not read
 * 3. Either side binary                    -> compare hash_file()
 * 4. Otherwise                             -> text_files_equal()
 *
 * Step 2 can report equal for same-size edits made within the tolerance
 * window. Any filesystem error yields "not equal".
 */
bool files_equal(const std::filesystem::path& lhs, const std::filesystem::path& rhs);

} // namespace envsync::diff
