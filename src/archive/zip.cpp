#include <archive.h>
#include <archive_entry.h>

#include <ctime>
#include <cstdio>
#include <fstream>
#include <sys/stat.h>

#include "./zip.hpp"

static std::variant<read_archive_t, archive_error_t> open_zip(const std::filesystem::path &input_path) {
    read_archive_t reader(archive_read_new());
    if (!reader) {
        return codec_error("open zip", input_path, "could not allocate reader");
    }
    archive_read_support_format_zip(reader.get());
    if (archive_read_open_filename(reader.get(), input_path.c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
        return codec_error("open zip", input_path, archive_error_message(reader.get()));
    }
    return std::move(reader);
}

ZipWriter::ZipWriter(const std::filesystem::path &output_path_) :
    writer {archive_write_new()},
    output_path {output_path_} {}

std::variant<std::unique_ptr<ZipWriter>, archive_error_t> ZipWriter::create(const std::filesystem::path &output_path) {
    std::unique_ptr<ZipWriter> zip(new ZipWriter(output_path));
    auto *a = zip->writer.get();
    if (a == nullptr) {
        return codec_error("create zip", output_path, "could not allocate writer");
    }
    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
        return codec_error("create zip", output_path, archive_error_message(a));
    }
    if (archive_write_set_options(a, "zip:compression=deflate") < ARCHIVE_WARN) {
        return codec_error("create zip", output_path, archive_error_message(a));
    }
    if (archive_write_open_filename(a, output_path.c_str()) != ARCHIVE_OK) {
        return io_error("create", output_path, archive_error_message(a));
    }
    return std::move(zip);
}

std::optional<archive_error_t> ZipWriter::append_file(const std::string &archive_path, const std::filesystem::path &file_path) {
    const auto contents_ret = read_file_bytes(file_path);
    if (std::holds_alternative<archive_error_t>(contents_ret)) {
        return std::get<archive_error_t>(contents_ret);
    }
    const auto &contents = std::get<bytes_t>(contents_ret);

    std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), archive_entry_free);
    archive_entry_copy_pathname(entry.get(), archive_path.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), ZIP_ENTRY_PERMISSIONS);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(contents.size()));
    struct stat st;
    if (stat(file_path.c_str(), &st) == 0) {
        archive_entry_set_mtime(entry.get(), st.st_mtime, 0);
    } else {
        archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);
    }

    if (archive_write_header(writer.get(), entry.get()) < ARCHIVE_WARN) {
        return codec_error("append", file_path, archive_error_message(writer.get()));
    }
    if (!contents.empty() && archive_write_data(writer.get(), contents.data(), contents.size()) < 0) {
        return codec_error("append", file_path, archive_error_message(writer.get()));
    }
    if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
        return codec_error("append", file_path, archive_error_message(writer.get()));
    }
    return std::nullopt;
}

std::optional<archive_error_t> ZipWriter::finish() {
    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        return io_error("close", output_path, archive_error_message(writer.get()));
    }
    return std::nullopt;
}

std::variant<std::vector<zip_entry_info_t>, archive_error_t> read_zip_index(const std::filesystem::path &input_path) {
    auto reader_ret = open_zip(input_path);
    if (std::holds_alternative<archive_error_t>(reader_ret)) {
        return std::get<archive_error_t>(reader_ret);
    }
    auto reader = std::move(std::get<read_archive_t>(reader_ret));

    std::vector<zip_entry_info_t> index;
    while (true) {
        archive_entry *entry = nullptr;
        const auto read_result = archive_read_next_header(reader.get(), &entry);
        if (read_result == ARCHIVE_EOF)
            break;
        if (read_result < ARCHIVE_WARN) {
            return codec_error("read zip index", input_path, archive_error_message(reader.get()));
        }
        const auto *name = archive_entry_pathname(entry);
        index.push_back(zip_entry_info_t {
            name == nullptr ? std::string() : std::string(name),
            archive_entry_filetype(entry) == AE_IFREG
        });
        archive_read_data_skip(reader.get());
    }
    return index;
}

std::optional<archive_error_t> write_zip_files(
    const std::filesystem::path &input_path,
    const std::filesystem::path &output_directory,
    const std::function<void(const std::string &)> &on_entry) {
    auto reader_ret = open_zip(input_path);
    if (std::holds_alternative<archive_error_t>(reader_ret)) {
        return std::get<archive_error_t>(reader_ret);
    }
    auto reader = std::move(std::get<read_archive_t>(reader_ret));

    std::vector<char> block(READ_BLOCK_SIZE);
    while (true) {
        archive_entry *entry = nullptr;
        const auto read_result = archive_read_next_header(reader.get(), &entry);
        if (read_result == ARCHIVE_EOF)
            break;
        if (read_result < ARCHIVE_WARN) {
            return codec_error("read header", input_path, archive_error_message(reader.get()));
        }
        const auto *name_ptr = archive_entry_pathname(entry);
        const auto name = name_ptr == nullptr ? std::string() : std::string(name_ptr);
        on_entry(name);

        if (archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(reader.get());
            continue;
        }
        std::filesystem::path destination_path;
        if (!sanitize_entry_path(name, output_directory, destination_path)) {
            fprintf(stderr, "Extracting file \"%s\": skipping unsafe entry \"%s\"\n", input_path.string().c_str(), name.c_str());
            archive_read_data_skip(reader.get());
            continue;
        }
        std::error_code link_ec;
        if (has_symlink_parent(output_directory, destination_path) || std::filesystem::is_symlink(std::filesystem::symlink_status(destination_path, link_ec))) {
            fprintf(stderr, "Extracting file \"%s\": skipping entry \"%s\" below a symlink\n", input_path.string().c_str(), name.c_str());
            archive_read_data_skip(reader.get());
            continue;
        }
        std::error_code ec;
        std::filesystem::create_directories(destination_path.parent_path(), ec);
        if (ec) {
            return io_error("create directory", destination_path.parent_path(), ec.message());
        }
        std::ofstream file_stream(destination_path, std::ios::binary | std::ios::trunc);
        if (!file_stream) {
            return io_error("create", destination_path, "failed to create file");
        }
        while (true) {
            const auto bytes_read = archive_read_data(reader.get(), block.data(), block.size());
            if (bytes_read < 0) {
                return codec_error("read zip", destination_path, archive_error_message(reader.get()));
            }
            if (bytes_read == 0) {
                break;
            }
            file_stream.write(block.data(), bytes_read);
        }
        file_stream.close();
        if (!file_stream) {
            return io_error("write", destination_path, "failed to write file");
        }
    }
    return std::nullopt;
}

std::optional<archive_error_t> extract_zip(const std::filesystem::path &input_path, const std::filesystem::path &output_directory) {
    auto reader_ret = open_zip(input_path);
    if (std::holds_alternative<archive_error_t>(reader_ret)) {
        return std::get<archive_error_t>(reader_ret);
    }
    auto reader = std::move(std::get<read_archive_t>(reader_ret));
    return extract_to_directory(reader.get(), input_path, output_directory);
}
