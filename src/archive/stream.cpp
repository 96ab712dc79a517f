#include <archive.h>
#include <archive_entry.h>

#include "./stream.hpp"

static int add_write_filter(struct archive *a, driver_t driver) {
    switch (driver) {
    case DRIVER_GZIP:
        return archive_write_add_filter_gzip(a);
    case DRIVER_BZIP2:
        return archive_write_add_filter_bzip2(a);
    case DRIVER_XZ:
        return archive_write_add_filter_xz(a);
    default:
        return ARCHIVE_FATAL;
    }
}

static int add_read_filter(struct archive *a, driver_t driver) {
    switch (driver) {
    case DRIVER_GZIP:
        return archive_read_support_filter_gzip(a);
    case DRIVER_BZIP2:
        return archive_read_support_filter_bzip2(a);
    case DRIVER_XZ:
        return archive_read_support_filter_xz(a);
    default:
        return ARCHIVE_FATAL;
    }
}

static int filter_code(driver_t driver) {
    switch (driver) {
    case DRIVER_GZIP:
        return ARCHIVE_FILTER_GZIP;
    case DRIVER_BZIP2:
        return ARCHIVE_FILTER_BZIP2;
    case DRIVER_XZ:
        return ARCHIVE_FILTER_XZ;
    default:
        return ARCHIVE_FILTER_NONE;
    }
}

StreamCompressor::StreamCompressor(const std::filesystem::path &output_path_) :
    writer {archive_write_new()},
    output_path {output_path_} {}

std::variant<std::unique_ptr<StreamCompressor>, archive_error_t> StreamCompressor::create(const std::filesystem::path &output_path, driver_t driver, uint64_t content_size) {
    std::unique_ptr<StreamCompressor> compressor(new StreamCompressor(output_path));
    auto *a = compressor->writer.get();
    if (a == nullptr) {
        return codec_error("compress", output_path, "could not allocate writer");
    }
    // raw format stores the data of exactly one file without a container
    if (archive_write_set_format_raw(a) != ARCHIVE_OK) {
        return codec_error("compress", output_path, archive_error_message(a));
    }
    if (add_write_filter(a, driver) < ARCHIVE_WARN) {
        return codec_error("compress", output_path, std::string("no stream filter for ") + driver_extension(driver));
    }
    // gzip stores the current time in its header otherwise
    if (driver == DRIVER_GZIP && archive_write_set_filter_option(a, "gzip", "timestamp", nullptr) < ARCHIVE_WARN) {
        return codec_error("compress", output_path, archive_error_message(a));
    }
    if (archive_write_open_filename(a, output_path.c_str()) != ARCHIVE_OK) {
        return io_error("create", output_path, archive_error_message(a));
    }
    std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), archive_entry_free);
    archive_entry_set_pathname(entry.get(), "data");
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(content_size));
    if (archive_write_header(a, entry.get()) < ARCHIVE_WARN) {
        return codec_error("compress", output_path, archive_error_message(a));
    }
    return std::move(compressor);
}

std::optional<archive_error_t> StreamCompressor::write(const char *data, size_t size) {
    size_t written = 0;
    while (written < size) {
        const auto ret = archive_write_data(writer.get(), data + written, size - written);
        if (ret <= 0) {
            return codec_error("compress", output_path, archive_error_message(writer.get()));
        }
        written += static_cast<size_t>(ret);
    }
    return std::nullopt;
}

std::optional<archive_error_t> StreamCompressor::finish() {
    if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
        return codec_error("compress", output_path, archive_error_message(writer.get()));
    }
    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        return io_error("close", output_path, archive_error_message(writer.get()));
    }
    return std::nullopt;
}

StreamDecompressor::StreamDecompressor(const std::filesystem::path &input_path_, driver_t driver_) :
    reader {archive_read_new()},
    input_path {input_path_},
    driver {driver_},
    started {false},
    eof {false} {}

std::variant<std::unique_ptr<StreamDecompressor>, archive_error_t> StreamDecompressor::open(const std::filesystem::path &input_path, driver_t driver) {
    std::unique_ptr<StreamDecompressor> decompressor(new StreamDecompressor(input_path, driver));
    auto *a = decompressor->reader.get();
    if (a == nullptr) {
        return codec_error("decompress", input_path, "could not allocate reader");
    }
    if (add_read_filter(a, driver) < ARCHIVE_WARN) {
        return codec_error("decompress", input_path, std::string("no stream filter for ") + driver_extension(driver));
    }
    archive_read_support_format_raw(a);
    if (archive_read_open_filename(a, input_path.c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
        return io_error("open", input_path, archive_error_message(a));
    }
    return std::move(decompressor);
}

std::optional<archive_error_t> StreamDecompressor::start() {
    started = true;
    archive_entry *entry = nullptr;
    const auto ret = archive_read_next_header(reader.get(), &entry);
    if (ret == ARCHIVE_EOF) {
        eof = true;
        return std::nullopt;
    }
    if (ret < ARCHIVE_WARN) {
        return codec_error("decompress", input_path, archive_error_message(reader.get()));
    }
    // the raw format accepts anything, so make sure the expected filter was detected
    if (archive_filter_code(reader.get(), 0) != filter_code(driver)) {
        return codec_error("decompress", input_path, std::string("input is not a ") + driver_extension(driver) + " stream");
    }
    return std::nullopt;
}

std::variant<size_t, archive_error_t> StreamDecompressor::read(char *buffer, size_t size) {
    if (!started) {
        const auto start_error = start();
        if (start_error.has_value()) {
            return start_error.value();
        }
    }
    if (eof) {
        return static_cast<size_t>(0);
    }
    const auto ret = archive_read_data(reader.get(), buffer, size);
    if (ret < 0) {
        return codec_error("decompress", input_path, archive_error_message(reader.get()));
    }
    if (ret == 0) {
        eof = true;
    }
    return static_cast<size_t>(ret);
}

uint64_t StreamDecompressor::compressed_bytes_read() const {
    const auto ret = archive_filter_bytes(reader.get(), -1);
    return ret < 0 ? 0 : static_cast<uint64_t>(ret);
}
