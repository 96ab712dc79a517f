#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sys/stat.h>

#include "./archive.hpp"

#define EXTRACT_FLAGS (ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_SECURE_SYMLINKS | ARCHIVE_EXTRACT_SECURE_NODOTDOT)

void read_archive_deleter_t::operator()(struct archive *a) const {
    archive_read_free(a);
}

void write_archive_deleter_t::operator()(struct archive *a) const {
    archive_write_free(a);
}

std::string archive_error_message(struct archive *a) {
    const auto err_string = archive_error_string(a);
    if (err_string == nullptr) {
        return "unknown libarchive error";
    }
    return std::string(err_string);
}

std::variant<bytes_t, archive_error_t> read_file_bytes(const std::filesystem::path &file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        return io_error("open", file_path, std::strerror(errno));
    }
    bytes_t contents;
    std::error_code ec;
    const auto file_size = std::filesystem::file_size(file_path, ec);
    if (!ec) {
        contents.reserve(file_size);
    }
    contents.assign(std::istreambuf_iterator<char>(file_stream), std::istreambuf_iterator<char>());
    if (file_stream.bad()) {
        return io_error("read", file_path, "failed to read file");
    }
    return contents;
}

std::optional<archive_error_t> write_file_bytes(const std::filesystem::path &file_path, const bytes_t &contents) {
    std::ofstream file_stream(file_path, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        return io_error("create", file_path, std::strerror(errno));
    }
    file_stream.write(contents.data(), contents.size());
    file_stream.close();
    if (!file_stream) {
        return io_error("write", file_path, "failed to write file");
    }
    return std::nullopt;
}

bool sanitize_entry_path(const std::string &entry_name, const std::filesystem::path &output_directory, std::filesystem::path &out_path) {
    if (entry_name.empty() || entry_name.find('\0') != std::string::npos) {
        return false;
    }
    // drop absolute path leading '/'
    size_t start = 0;
    while (start < entry_name.size() && entry_name[start] == '/') {
        start++;
    }
    const auto relative = std::filesystem::path(entry_name.substr(start)).lexically_normal();
    if (relative.empty() || relative == ".") {
        return false;
    }
    for (const auto &part : relative) {
        if (part == "..") {
            return false;
        }
    }
    out_path = output_directory / relative;
    return true;
}

bool has_symlink_parent(const std::filesystem::path &output_directory, const std::filesystem::path &destination) {
    const auto relative = destination.lexically_relative(output_directory);
    if (relative.empty() || relative.begin() == relative.end()) {
        return false;
    }
    auto current = output_directory;
    auto last = relative.end();
    last--;
    for (auto it = relative.begin(); it != last; it++) {
        current /= *it;
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(current, ec);
        if (ec) {
            // nothing on disk yet below this point
            return false;
        }
        if (std::filesystem::is_symlink(status)) {
            return true;
        }
    }
    return false;
}

static std::variant<std::filesystem::path, archive_error_t> resolve_path(const std::filesystem::path &path) {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return io_error("resolve", path, ec.message());
    }
    const auto resolved = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return io_error("resolve", path, ec.message());
    }
    return resolved;
}

static std::string copy_data(archive *ar, archive *aw) {
    size_t size;
    la_int64_t offset;

    while (true) {
        const void *buff = nullptr;
        const auto read_ret = archive_read_data_block(ar, &buff, &size, &offset);
        if (read_ret == ARCHIVE_EOF)
            return "";
        if (read_ret != ARCHIVE_OK) {
            return archive_error_message(ar);
        }
        const auto write_ret = archive_write_data_block(aw, buff, size, offset);
        if (write_ret == ARCHIVE_OK)
            continue;
        return archive_error_message(aw);
    }
}

std::optional<archive_error_t> extract_to_directory(
    struct archive *reader,
    const std::filesystem::path &source,
    const std::filesystem::path &output_directory,
    const std::unordered_map<std::string, std::filesystem::path> &renames) {
    write_archive_t write_disk(archive_write_disk_new());
    if (!write_disk) {
        return codec_error("extract", source, "could not allocate disk writer");
    }
    archive_write_disk_set_options(write_disk.get(), EXTRACT_FLAGS);
    // the secure flags reject ".." and symlinks anywhere in the written path,
    // so entries are placed under the resolved directory
    const auto root_ret = resolve_path(output_directory);
    if (std::holds_alternative<archive_error_t>(root_ret)) {
        return std::get<archive_error_t>(root_ret);
    }
    const auto &root = std::get<std::filesystem::path>(root_ret);

    while (true) {
        archive_entry *entry = nullptr;
        const auto read_result = archive_read_next_header(reader, &entry);
        if (read_result == ARCHIVE_EOF)
            break;
        if (read_result < ARCHIVE_WARN) {
            return codec_error("read header", source, archive_error_message(reader));
        }
        bool is_utf8 = false;
        auto *entry_file_name = archive_entry_pathname(entry);
        if (entry_file_name == nullptr) {
            entry_file_name = archive_entry_pathname_utf8(entry);
            is_utf8 = true;
        }
        if (entry_file_name == nullptr) {
            return codec_error("read header", source, "could not get name of file in archive");
        }
        const auto extracted_file_name = std::string(entry_file_name);
        std::filesystem::path new_extracted_file_name;
        const auto rename = renames.find(extracted_file_name);
        if (rename != renames.end()) {
            const auto rename_ret = resolve_path(rename->second);
            if (std::holds_alternative<archive_error_t>(rename_ret)) {
                return std::get<archive_error_t>(rename_ret);
            }
            new_extracted_file_name = std::get<std::filesystem::path>(rename_ret);
        } else if (!sanitize_entry_path(extracted_file_name, root, new_extracted_file_name)) {
            fprintf(stderr, "Extracting file \"%s\": skipping unsafe entry \"%s\"\n", source.string().c_str(), extracted_file_name.c_str());
            archive_read_data_skip(reader);
            continue;
        }
        if (has_symlink_parent(root, new_extracted_file_name)) {
            fprintf(stderr, "Extracting file \"%s\": skipping entry \"%s\" below a symlink\n", source.string().c_str(), extracted_file_name.c_str());
            archive_read_data_skip(reader);
            continue;
        }
        if (is_utf8) {
            archive_entry_set_pathname_utf8(entry, new_extracted_file_name.string().c_str());
        } else {
            archive_entry_copy_pathname(entry, new_extracted_file_name.string().c_str());
        }
        // hardlink targets are archive names too
        const auto *hardlink = archive_entry_hardlink(entry);
        if (hardlink != nullptr) {
            std::filesystem::path hardlink_path;
            if (!sanitize_entry_path(hardlink, root, hardlink_path)) {
                fprintf(stderr, "Extracting file \"%s\": skipping unsafe link \"%s\"\n", source.string().c_str(), hardlink);
                archive_read_data_skip(reader);
                continue;
            }
            archive_entry_copy_hardlink(entry, hardlink_path.string().c_str());
        }
        if (archive_write_header(write_disk.get(), entry) < ARCHIVE_WARN) {
            return io_error("write", new_extracted_file_name, archive_error_message(write_disk.get()));
        }
        const auto copy_error = copy_data(reader, write_disk.get());
        if (copy_error.length() > 0) {
            return codec_error("extract", new_extracted_file_name, copy_error);
        }
        if (archive_write_finish_entry(write_disk.get()) < ARCHIVE_WARN) {
            return io_error("write", new_extracted_file_name, archive_error_message(write_disk.get()));
        }
    }
    if (archive_write_close(write_disk.get()) != ARCHIVE_OK) {
        return io_error("close", output_directory, archive_error_message(write_disk.get()));
    }
    return std::nullopt;
}

static la_ssize_t append_to_buffer(struct archive *, void *client_data, const void *buff, size_t length) {
    auto *buffer = static_cast<bytes_t *>(client_data);
    const auto *bytes = static_cast<const char *>(buff);
    buffer->insert(buffer->end(), bytes, bytes + length);
    return static_cast<la_ssize_t>(length);
}

TarBuilder::TarBuilder() :
    buffer {},
    writer {archive_write_new()},
    newest_mtime {0},
    finished {false} {}

std::variant<std::unique_ptr<TarBuilder>, archive_error_t> TarBuilder::create() {
    std::unique_ptr<TarBuilder> builder(new TarBuilder());
    auto *a = builder->writer.get();
    if (a == nullptr) {
        return codec_error("create tar", "", "could not allocate tar writer");
    }
    if (archive_write_set_format_pax_restricted(a) != ARCHIVE_OK) {
        return codec_error("create tar", "", archive_error_message(a));
    }
    // no padding of the last block to the full record size
    archive_write_set_bytes_in_last_block(a, 1);
    if (archive_write_open(a, &builder->buffer, nullptr, append_to_buffer, nullptr) != ARCHIVE_OK) {
        return codec_error("create tar", "", archive_error_message(a));
    }
    return std::move(builder);
}

std::optional<archive_error_t> TarBuilder::append_file(const std::string &archive_path, const std::filesystem::path &file_path) {
    if (finished) {
        return codec_error("append", file_path, "tar stream is already finished");
    }
    struct stat st;
    if (lstat(file_path.c_str(), &st) != 0) {
        return io_error("stat", file_path, std::strerror(errno));
    }
    std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), archive_entry_free);
    archive_entry_copy_stat(entry.get(), &st);
    archive_entry_copy_pathname(entry.get(), archive_path.c_str());
    // access and change times differ between runs over the same files
    archive_entry_unset_atime(entry.get());
    archive_entry_unset_ctime(entry.get());
    archive_entry_unset_birthtime(entry.get());
    newest_mtime = std::max<int64_t>(newest_mtime, static_cast<int64_t>(st.st_mtime));

    if (S_ISLNK(st.st_mode)) {
        std::error_code ec;
        const auto target = std::filesystem::read_symlink(file_path, ec);
        if (ec) {
            return io_error("read link", file_path, ec.message());
        }
        archive_entry_copy_symlink(entry.get(), target.string().c_str());
        archive_entry_set_size(entry.get(), 0);
        if (archive_write_header(writer.get(), entry.get()) < ARCHIVE_WARN) {
            return codec_error("append", file_path, archive_error_message(writer.get()));
        }
        return std::nullopt;
    }
    if (!S_ISREG(st.st_mode)) {
        return io_error("append", file_path, "not a regular file or symlink");
    }

    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        return io_error("open", file_path, std::strerror(errno));
    }
    if (archive_write_header(writer.get(), entry.get()) < ARCHIVE_WARN) {
        return codec_error("append", file_path, archive_error_message(writer.get()));
    }
    std::vector<char> block(READ_BLOCK_SIZE);
    while (file_stream) {
        file_stream.read(block.data(), block.size());
        const auto bytes_read = file_stream.gcount();
        if (bytes_read <= 0) {
            break;
        }
        if (archive_write_data(writer.get(), block.data(), static_cast<size_t>(bytes_read)) < 0) {
            return codec_error("append", file_path, archive_error_message(writer.get()));
        }
    }
    if (file_stream.bad()) {
        return io_error("read", file_path, "failed to read file");
    }
    if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
        return codec_error("append", file_path, archive_error_message(writer.get()));
    }
    return std::nullopt;
}

std::variant<bytes_t, archive_error_t> TarBuilder::into_bytes() {
    if (finished) {
        return codec_error("finish tar", "", "tar stream is already finished");
    }
    finished = true;
    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        return codec_error("finish tar", "", archive_error_message(writer.get()));
    }
    return std::move(buffer);
}

int64_t TarBuilder::get_newest_mtime() const {
    return newest_mtime;
}

std::optional<archive_error_t> unpack_tar_bytes(const bytes_t &tar_bytes, const std::filesystem::path &output_directory) {
    read_archive_t reader(archive_read_new());
    if (!reader) {
        return codec_error("unpack", output_directory, "could not allocate tar reader");
    }
    archive_read_support_format_tar(reader.get());
    if (archive_read_open_memory(reader.get(), tar_bytes.data(), tar_bytes.size()) != ARCHIVE_OK) {
        return codec_error("unpack", output_directory, archive_error_message(reader.get()));
    }
    return extract_to_directory(reader.get(), "<tar stream>", output_directory);
}
