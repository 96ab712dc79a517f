#pragma once

#include <string>
#include <vector>
#include <memory>
#include <variant>
#include <optional>
#include <filesystem>

#include "../error/error.hpp"
#include "../driver/driver.hpp"
#include "../status/status.hpp"
#include "../manifest/manifest.hpp"
#include "../archive/archive.hpp"
#include "../archive/zip.hpp"

// number of progress steps the compression of a tar stream is split into
#define COMPRESS_PROGRESS_STEPS 100

// zip writes entries straight into the output file, every other format
// collects them in an in-memory tar stream first
typedef std::variant<std::unique_ptr<TarBuilder>, std::unique_ptr<ZipWriter>> encoder_backend_t;

// Finished archive file. The digest is only computed on request.
class EncodedArchive {
public:
    EncodedArchive(std::filesystem::path output_path_, driver_t driver_);

    const std::filesystem::path &get_path() const;
    driver_t get_driver() const;

    // SHA-256 of the archive file, computed on a background task while ticking sink
    std::variant<std::string, archive_error_t> digest(StatusSink *sink = nullptr) const;

private:
    std::filesystem::path output_path;
    driver_t driver;
};

// NOTE: Encoder is not thread-safe

class Encoder {
public:
    // format is taken from output_filename suffix
    static std::variant<Encoder, archive_error_t> create(const std::filesystem::path &output_directory, const std::string &output_filename);

    Encoder(Encoder &&) = default;
    Encoder &operator=(Encoder &&) = default;

    std::optional<archive_error_t> add_file(const std::string &archive_path, const std::filesystem::path &file_path, StatusSink *sink = nullptr);

    // adds entries in order, progress total is the number of entries
    std::optional<archive_error_t> add_entries(const std::vector<entry_t> &entries, StatusSink *sink = nullptr);

    // finalizes the archive, the encoder can not be used afterwards
    std::variant<EncodedArchive, archive_error_t> compress(StatusSink *sink = nullptr) &&;

    driver_t get_driver() const;
    std::filesystem::path get_output_path() const;

private:
    Encoder(
        driver_t driver_,
        std::filesystem::path output_directory_,
        std::string output_filename_,
        encoder_backend_t backend_);

    std::optional<archive_error_t> encode_in_chunks(const bytes_t &contents, StatusSink *sink);
    std::optional<archive_error_t> encode_seven_z(bytes_t contents, int64_t mtime, StatusSink *sink);

    driver_t driver;
    std::filesystem::path output_directory;
    std::string output_filename;
    encoder_backend_t backend;
};
