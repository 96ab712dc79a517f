#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <variant>
#include <optional>
#include <filesystem>
#include <unordered_map>

#include "../error/error.hpp"

struct archive;

#define READ_BLOCK_SIZE 10240

typedef std::vector<char> bytes_t;

struct read_archive_deleter_t {
    void operator()(struct archive *a) const;
};

struct write_archive_deleter_t {
    void operator()(struct archive *a) const;
};

typedef std::unique_ptr<struct archive, read_archive_deleter_t> read_archive_t;
typedef std::unique_ptr<struct archive, write_archive_deleter_t> write_archive_t;

// libarchive error string or a placeholder if none is set
std::string archive_error_message(struct archive *a);

std::variant<bytes_t, archive_error_t> read_file_bytes(const std::filesystem::path &file_path);

std::optional<archive_error_t> write_file_bytes(const std::filesystem::path &file_path, const bytes_t &contents);

// Maps an entry name onto output_directory. Returns false for names that would
// escape it (parent references) or are empty.
bool sanitize_entry_path(const std::string &entry_name, const std::filesystem::path &output_directory, std::filesystem::path &out_path);

// True if a directory between output_directory and destination is a symlink on disk,
// so writing destination could land outside output_directory.
bool has_symlink_parent(const std::filesystem::path &output_directory, const std::filesystem::path &destination);

// Writes every entry of reader below output_directory.
// renames maps an entry name onto an explicit destination path instead.
// source is used for error messages only.
std::optional<archive_error_t> extract_to_directory(
    struct archive *reader,
    const std::filesystem::path &source,
    const std::filesystem::path &output_directory,
    const std::unordered_map<std::string, std::filesystem::path> &renames = {});

// Packs files into a tar stream kept in memory
class TarBuilder {
public:
    static std::variant<std::unique_ptr<TarBuilder>, archive_error_t> create();

    // symlinks are stored as symlink entries, regular files with their contents
    std::optional<archive_error_t> append_file(const std::string &archive_path, const std::filesystem::path &file_path);

    // finishes the tar stream and hands over its bytes, no appends are possible afterwards
    std::variant<bytes_t, archive_error_t> into_bytes();

    // newest modification time of the appended files, 0 while empty
    int64_t get_newest_mtime() const;

private:
    TarBuilder();

    // declared before writer: closing the writer still flushes into it
    bytes_t buffer;
    write_archive_t writer;
    int64_t newest_mtime;
    bool finished;
};

std::optional<archive_error_t> unpack_tar_bytes(const bytes_t &tar_bytes, const std::filesystem::path &output_directory);
