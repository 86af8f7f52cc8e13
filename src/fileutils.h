#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace fileutils {
// Unique hidden sibling path ".<crc32><pid><time><seq>.part" used as a copy target
// before the finished file is renamed into place.
std::string makeTempPartPath(const std::string& path, bool pathIsDir);

using HashProgressCallback = std::function<void(std::uintmax_t total_bytes,
                                                std::uintmax_t processed_bytes)>;
// Generic file hash using Botan-2.
//
// Parameters:
//   file_path   - path to the file to hash
//   buffer_size - temporary read buffer size; if 0, std::logic_error is thrown
//   algorithm   - hash algorithm name understood by Botan (e.g. "SHA-256",
//                 "SHA-3(256)", "CRC32", ...)
//   progress_cb - optional progress callback
//
// Throws:
//   std::logic_error   - if buffer_size == 0 (programming error)
//   std::runtime_error - if file operations fail or algorithm is unsupported
//
// Returns:
//   Lower-case hexadecimal string with the digest.
//
std::string compute_file_hash(const std::filesystem::path& file_path,
                              std::size_t buffer_size,
                              std::string_view algorithm,
                              HashProgressCallback progress_cb = {});

// Size check first, then digest comparison. Throws like compute_file_hash.
bool files_have_same_hash(const std::filesystem::path& a,
                          const std::filesystem::path& b,
                          std::string_view algorithm,
                          std::size_t buffer_size = 64 * 1024);
}
