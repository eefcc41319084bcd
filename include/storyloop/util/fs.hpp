#pragma once

#include "storyloop/core/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace storyloop {

// Writes `content` to a sibling temp file, fsyncs it and renames it over
// `path`. Readers observe either the old file or the new one.
[[nodiscard]] auto write_file_atomic(const std::filesystem::path& path,
                                     std::string_view content) -> Result<void>;

// Appends one line with a single O_APPEND write. A trailing newline is added
// when missing.
[[nodiscard]] auto append_line(const std::filesystem::path& path,
                               std::string_view line) -> Result<void>;

[[nodiscard]] auto read_file(const std::filesystem::path& path)
    -> Result<std::string>;

// Non-empty lines of a text file. A missing file yields an empty vector.
[[nodiscard]] auto read_lines(const std::filesystem::path& path)
    -> Result<std::vector<std::string>>;

[[nodiscard]] auto ensure_directory(const std::filesystem::path& dir)
    -> Result<void>;

}  // namespace storyloop
