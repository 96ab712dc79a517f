#include <fnmatch.h>

#include "../path/path_utils.hpp"
#include "./manifest.hpp"

bool glob_match(const std::string &pattern, const std::string &archive_path) {
    return fnmatch(pattern.c_str(), archive_path.c_str(), FNM_PATHNAME) == 0;
}

static bool matches_any(const std::vector<std::string> &patterns, const std::string &archive_path) {
    for (const auto &p : patterns) {
        if (glob_match(p, archive_path)) {
            return true;
        }
    }
    return false;
}

static bool is_selected(
    const std::string &archive_path,
    const std::optional<std::vector<std::string>> &includes,
    const std::optional<std::vector<std::string>> &excludes) {
    if (includes.has_value() && !matches_any(includes.value(), archive_path)) {
        return false;
    }
    if (excludes.has_value() && matches_any(excludes.value(), archive_path)) {
        return false;
    }
    return true;
}

std::variant<std::vector<entry_t>, archive_error_t> build_manifest(
    const std::filesystem::path &input,
    const std::optional<std::vector<std::string>> &includes,
    const std::optional<std::vector<std::string>> &excludes) {
    std::error_code ec;
    const auto input_status = std::filesystem::symlink_status(input, ec);
    if (ec || !std::filesystem::exists(input_status)) {
        return io_error("stat", input, ec ? ec.message() : "path does not exist");
    }

    std::vector<entry_t> entries;
    if (!std::filesystem::is_directory(input_status)) {
        auto root = input.parent_path();
        if (root.empty()) {
            root = ".";
        }
        const auto archive_path = path_to_relative(input, root);
        if (is_selected(archive_path, includes, excludes)) {
            entries.push_back(entry_t { archive_path, input });
        }
        return entries;
    }

    std::filesystem::recursive_directory_iterator it(input, ec);
    if (ec) {
        return io_error("walk", input, ec.message());
    }
    for (const auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return io_error("walk", input, ec.message());
        }
        const auto &entry = *it;
        std::error_code entry_ec;
        // symlinks (to directories too) are not followed, they are stored as symlinks
        const auto status = entry.symlink_status(entry_ec);
        if (entry_ec) {
            return io_error("stat", entry.path(), entry_ec.message());
        }
        if (!std::filesystem::is_regular_file(status) && !std::filesystem::is_symlink(status)) {
            continue;
        }
        const auto archive_path = path_to_relative(entry.path(), input);
        if (!is_selected(archive_path, includes, excludes)) {
            continue;
        }
        entries.push_back(entry_t { archive_path, entry.path() });
    }
    if (ec) {
        return io_error("walk", input, ec.message());
    }
    return entries;
}
