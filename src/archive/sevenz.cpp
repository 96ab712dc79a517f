#include <archive.h>
#include <archive_entry.h>

#include <ctime>
#include <cerrno>
#include <cstring>
#include <fstream>

#include "./sevenz.hpp"

std::optional<archive_error_t> sevenz_compress_file(const std::filesystem::path &tar_file, const std::filesystem::path &output_path, int64_t mtime) {
    std::error_code ec;
    const auto tar_size = std::filesystem::file_size(tar_file, ec);
    if (ec) {
        return io_error("stat", tar_file, ec.message());
    }
    std::ifstream file_stream(tar_file, std::ios::binary);
    if (!file_stream) {
        return io_error("open", tar_file, std::strerror(errno));
    }

    write_archive_t writer(archive_write_new());
    if (!writer) {
        return codec_error("compress 7z", output_path, "could not allocate writer");
    }
    if (archive_write_set_format_7zip(writer.get()) != ARCHIVE_OK) {
        return codec_error("compress 7z", output_path, archive_error_message(writer.get()));
    }
    if (archive_write_open_filename(writer.get(), output_path.c_str()) != ARCHIVE_OK) {
        return io_error("create", output_path, archive_error_message(writer.get()));
    }

    std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), archive_entry_free);
    archive_entry_set_pathname(entry.get(), SEVEN_Z_TAR_FILENAME);
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(tar_size));
    archive_entry_set_mtime(entry.get(), static_cast<time_t>(mtime), 0);
    if (archive_write_header(writer.get(), entry.get()) < ARCHIVE_WARN) {
        return codec_error("compress 7z", output_path, archive_error_message(writer.get()));
    }

    std::vector<char> block(READ_BLOCK_SIZE);
    while (file_stream) {
        file_stream.read(block.data(), block.size());
        const auto bytes_read = file_stream.gcount();
        if (bytes_read <= 0) {
            break;
        }
        if (archive_write_data(writer.get(), block.data(), static_cast<size_t>(bytes_read)) < 0) {
            return codec_error("compress 7z", output_path, archive_error_message(writer.get()));
        }
    }
    if (file_stream.bad()) {
        return io_error("read", tar_file, "failed to read file");
    }
    if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
        return codec_error("compress 7z", output_path, archive_error_message(writer.get()));
    }
    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        return io_error("close", output_path, archive_error_message(writer.get()));
    }
    return std::nullopt;
}

std::optional<archive_error_t> sevenz_extract(const std::filesystem::path &input_path, const std::filesystem::path &output_directory, const std::filesystem::path &tar_file) {
    read_archive_t reader(archive_read_new());
    if (!reader) {
        return codec_error("extract 7z", input_path, "could not allocate reader");
    }
    archive_read_support_format_7zip(reader.get());
    if (archive_read_open_filename(reader.get(), input_path.c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
        return codec_error("extract 7z", input_path, archive_error_message(reader.get()));
    }
    return extract_to_directory(reader.get(), input_path, output_directory, {{ SEVEN_Z_TAR_FILENAME, tar_file }});
}
