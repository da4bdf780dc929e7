#pragma once
#include <filesystem>
#include <string>
#include <sys/types.h>

namespace warden::util {

// Write content to a temp file beside path, fsync it, then rename over path.
// Readers see either the old file or the new one, never a partial write.
// On failure returns false, fills *err (if given) and leaves path untouched.
bool write_file_atomic(const std::filesystem::path& path, const std::string& content,
                       mode_t mode = 0644, std::string* err = nullptr);

} // namespace warden::util
