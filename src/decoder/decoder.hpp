#pragma once

#include <string>
#include <vector>
#include <memory>
#include <variant>
#include <optional>
#include <filesystem>
#include <unordered_set>

#include "../error/error.hpp"
#include "../driver/driver.hpp"
#include "../status/status.hpp"
#include "../archive/archive.hpp"
#include "../archive/stream.hpp"
#include "../archive/zip.hpp"

// number of progress steps for decompressing a tar stream
#define DECOMPRESS_PROGRESS_STEPS 100

struct extracted_t {
    // paths relative to the output directory, directories excluded
    std::unordered_set<std::string> files;
};

// 7z archives are opened by the codec itself during extraction
struct sevenz_input_t {
    std::filesystem::path input_path;
};

typedef std::variant<std::unique_ptr<StreamDecompressor>, std::vector<zip_entry_info_t>, sevenz_input_t> decoder_backend_t;

// NOTE: Decoder is not thread-safe

class Decoder {
public:
    // format is taken from input_file_path suffix, an empty output_directory means the current one.
    // With sha256 set, extract() verifies the input before anything is written
    static std::variant<Decoder, archive_error_t> create(
        const std::filesystem::path &input_file_path,
        std::optional<std::string> sha256,
        const std::filesystem::path &output_directory);

    Decoder(Decoder &&) = default;
    Decoder &operator=(Decoder &&) = default;

    // extracts everything below output directory, the decoder can not be used afterwards.
    // Returned files are collected by walking the output directory.
    std::variant<extracted_t, archive_error_t> extract(StatusSink *sink = nullptr) &&;

    driver_t get_driver() const;

private:
    Decoder(
        decoder_backend_t backend_,
        std::filesystem::path input_file_path_,
        std::filesystem::path output_directory_,
        uint64_t reader_size_,
        driver_t driver_,
        std::optional<std::string> sha256_);

    std::variant<bytes_t, archive_error_t> extract_to_tar_bytes(StreamDecompressor &decompressor, StatusSink *sink);
    std::optional<archive_error_t> extract_zip_entries(const std::vector<zip_entry_info_t> &index, StatusSink *sink);
    std::variant<bytes_t, archive_error_t> extract_seven_z(StatusSink *sink);

    decoder_backend_t backend;
    std::filesystem::path input_file_path;
    std::filesystem::path output_directory;
    uint64_t reader_size;
    driver_t driver;
    std::optional<std::string> sha256;
    bool extracted;
};

// every non-directory entry below directory, relative with forward slashes
std::variant<std::unordered_set<std::string>, archive_error_t> scan_directory(const std::filesystem::path &directory);
