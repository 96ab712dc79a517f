#pragma once

#include <cstdint>
#include <memory>
#include <variant>
#include <optional>
#include <filesystem>

#include "../driver/driver.hpp"
#include "./archive.hpp"

// Single byte stream compressor (gzip, bzip2, xz) writing to a file
class StreamCompressor {
public:
    // content_size is the exact number of bytes that will be written
    static std::variant<std::unique_ptr<StreamCompressor>, archive_error_t> create(const std::filesystem::path &output_path, driver_t driver, uint64_t content_size);

    std::optional<archive_error_t> write(const char *data, size_t size);
    std::optional<archive_error_t> finish();

private:
    StreamCompressor(const std::filesystem::path &output_path_);

    write_archive_t writer;
    std::filesystem::path output_path;
};

// Single byte stream decompressor (gzip, bzip2, xz) reading from a file
class StreamDecompressor {
public:
    // opens the file, the stream itself is validated on the first read
    static std::variant<std::unique_ptr<StreamDecompressor>, archive_error_t> open(const std::filesystem::path &input_path, driver_t driver);

    // returns 0 at end of stream
    std::variant<size_t, archive_error_t> read(char *buffer, size_t size);

    // compressed bytes consumed so far
    uint64_t compressed_bytes_read() const;

private:
    StreamDecompressor(const std::filesystem::path &input_path_, driver_t driver_);
    std::optional<archive_error_t> start();

    read_archive_t reader;
    std::filesystem::path input_path;
    driver_t driver;
    bool started;
    bool eof;
};
