#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <filesystem>

#include "../error/error.hpp"

struct entry_t {
    // forward slash separated, no leading slash
    std::string archive_path;
    std::filesystem::path file_path;
};

// shell glob against an archive-relative path, '*' does not cross '/'
bool glob_match(const std::string &pattern, const std::string &archive_path);

// Walks input (file or directory) and returns regular files and symlinks in walk order.
// Symlinks are listed as entries and never followed.
// With includes set, a path is kept only if any include glob matches it (empty list keeps nothing).
// With excludes set, a path matching any exclude glob is dropped afterwards.
std::variant<std::vector<entry_t>, archive_error_t> build_manifest(
    const std::filesystem::path &input,
    const std::optional<std::vector<std::string>> &includes = std::nullopt,
    const std::optional<std::vector<std::string>> &excludes = std::nullopt);
