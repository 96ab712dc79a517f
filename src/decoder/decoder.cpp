#include <algorithm>
#include <cctype>
#include <fstream>

#include "../archive/sevenz.hpp"
#include "../digest/digest.hpp"
#include "../path/path_utils.hpp"
#include "../task/task.hpp"
#include "./decoder.hpp"

static std::string to_lower_copy(std::string s) {
    for (auto &c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

Decoder::Decoder(
    decoder_backend_t backend_,
    std::filesystem::path input_file_path_,
    std::filesystem::path output_directory_,
    uint64_t reader_size_,
    driver_t driver_,
    std::optional<std::string> sha256_) :
    backend {std::move(backend_)},
    input_file_path {input_file_path_},
    output_directory {output_directory_.empty() ? std::filesystem::path(".") : output_directory_},
    reader_size {reader_size_},
    driver {driver_},
    sha256 {sha256_},
    extracted {false} {}

std::variant<Decoder, archive_error_t> Decoder::create(
    const std::filesystem::path &input_file_path,
    std::optional<std::string> sha256,
    const std::filesystem::path &output_directory) {
    const auto driver_ret = resolve_driver(input_file_path.filename().string());
    if (std::holds_alternative<archive_error_t>(driver_ret)) {
        return std::get<archive_error_t>(driver_ret);
    }
    const auto driver = std::get<driver_t>(driver_ret);

    std::error_code ec;
    const auto reader_size = std::filesystem::file_size(input_file_path, ec);
    if (ec) {
        return io_error("stat", input_file_path, ec.message());
    }

    decoder_backend_t backend;
    switch (driver) {
    case DRIVER_GZIP:
    case DRIVER_BZIP2:
    case DRIVER_XZ: {
        auto decompressor_ret = StreamDecompressor::open(input_file_path, driver);
        if (std::holds_alternative<archive_error_t>(decompressor_ret)) {
            return std::get<archive_error_t>(decompressor_ret);
        }
        backend = std::move(std::get<std::unique_ptr<StreamDecompressor>>(decompressor_ret));
        break;
    }
    case DRIVER_ZIP: {
        auto index_ret = read_zip_index(input_file_path);
        if (std::holds_alternative<archive_error_t>(index_ret)) {
            return std::get<archive_error_t>(index_ret);
        }
        backend = std::move(std::get<std::vector<zip_entry_info_t>>(index_ret));
        break;
    }
    case DRIVER_SEVEN_Z: {
        std::ifstream input_stream(input_file_path, std::ios::binary);
        if (!input_stream) {
            return io_error("open", input_file_path, "could not open archive");
        }
        backend = sevenz_input_t { input_file_path };
        break;
    }
    }

    return Decoder(std::move(backend), input_file_path, output_directory, reader_size, driver, sha256);
}

driver_t Decoder::get_driver() const {
    return driver;
}

std::variant<bytes_t, archive_error_t> Decoder::extract_to_tar_bytes(StreamDecompressor &decompressor, StatusSink *sink) {
    bytes_t result;
    result.reserve(reader_size);

    update_status(sink, update_status_t {
        std::string("Extracting ") + driver_extension(driver),
        std::string("creating tar as binary blob"),
        std::nullopt,
        static_cast<uint64_t>(DECOMPRESS_PROGRESS_STEPS)
    });

    std::vector<char> buffer(READ_BLOCK_SIZE);
    uint64_t reported = 0;
    while (true) {
        const auto read_ret = decompressor.read(buffer.data(), buffer.size());
        if (std::holds_alternative<archive_error_t>(read_ret)) {
            return std::get<archive_error_t>(read_ret);
        }
        const auto bytes_read = std::get<size_t>(read_ret);
        if (bytes_read == 0) {
            break;
        }
        result.insert(result.end(), buffer.data(), buffer.data() + bytes_read);

        if (reader_size > 0) {
            const auto progress = std::min<uint64_t>(DECOMPRESS_PROGRESS_STEPS, decompressor.compressed_bytes_read() * DECOMPRESS_PROGRESS_STEPS / reader_size);
            if (progress > reported) {
                update_status(sink, update_status_t { std::nullopt, std::nullopt, progress - reported, std::nullopt });
                reported = progress;
            }
        }
    }
    if (reported < DECOMPRESS_PROGRESS_STEPS) {
        update_status(sink, update_status_t { std::nullopt, std::nullopt, DECOMPRESS_PROGRESS_STEPS - reported, std::nullopt });
    }
    return result;
}

std::optional<archive_error_t> Decoder::extract_zip_entries(const std::vector<zip_entry_info_t> &index, StatusSink *sink) {
    update_status(sink, update_status_t {
        std::string("Extracting (zip)"),
        std::nullopt,
        std::nullopt,
        static_cast<uint64_t>(index.size())
    });

    // the manual pass reports progress per entry
    size_t ticks = 0;
    const auto write_error = write_zip_files(input_file_path, output_directory, [&](const std::string &name) {
        if (ticks >= index.size()) {
            return;
        }
        update_status(sink, update_status_t { std::nullopt, name, 1, std::nullopt });
        ticks++;
    });
    if (write_error.has_value()) {
        return write_error;
    }

    // bulk extraction brings directories, permissions and skipped entries
    return extract_zip(input_file_path, output_directory);
}

std::variant<bytes_t, archive_error_t> Decoder::extract_seven_z(StatusSink *sink) {
    update_status(sink, update_status_t {
        std::string("Extracting ") + driver_extension(driver),
        std::string("creating tar as binary blob"),
        std::nullopt,
        std::nullopt
    });

    const auto input = input_file_path;
    const auto destination = output_directory;
    const auto temporary_tar_path = temporary_file_path(output_directory, SEVEN_Z_TEMP_STEM, "tar");
    BackgroundTask<bytes_t> task([input, destination, temporary_tar_path]() -> std::variant<bytes_t, archive_error_t> {
        const auto extract_error = sevenz_extract(input, destination, temporary_tar_path);
        std::error_code ec;
        if (extract_error.has_value()) {
            std::filesystem::remove(temporary_tar_path, ec);
            return extract_error.value();
        }
        auto ret = read_file_bytes(temporary_tar_path);
        std::filesystem::remove(temporary_tar_path, ec);
        if (std::holds_alternative<archive_error_t>(ret)) {
            return ret;
        }
        if (ec) {
            return io_error("remove", temporary_tar_path, ec.message());
        }
        return ret;
    });
    return wait_task(task, sink);
}

std::variant<extracted_t, archive_error_t> Decoder::extract(StatusSink *sink) && {
    if (extracted) {
        return codec_error("extract", input_file_path, "archive is already extracted");
    }
    extracted = true;

    // nothing may be written before the digest is verified
    if (sha256.has_value()) {
        const auto digest_ret = digest_file_polling(input_file_path, sink);
        if (std::holds_alternative<archive_error_t>(digest_ret)) {
            return std::get<archive_error_t>(digest_ret);
        }
        const auto &actual_digest = std::get<std::string>(digest_ret);
        if (to_lower_copy(sha256.value()) != actual_digest) {
            return digest_mismatch_error(sha256.value(), actual_digest);
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(output_directory, ec);
    if (ec) {
        return io_error("create directory", output_directory, ec.message());
    }

    std::optional<bytes_t> tar_bytes;
    if (std::holds_alternative<std::unique_ptr<StreamDecompressor>>(backend)) {
        auto decompressor = std::move(std::get<std::unique_ptr<StreamDecompressor>>(backend));
        if (!decompressor) {
            return codec_error("extract", input_file_path, "archive is already extracted");
        }
        auto bytes_ret = extract_to_tar_bytes(*decompressor, sink);
        if (std::holds_alternative<archive_error_t>(bytes_ret)) {
            return std::get<archive_error_t>(bytes_ret);
        }
        tar_bytes = std::move(std::get<bytes_t>(bytes_ret));
    } else if (std::holds_alternative<std::vector<zip_entry_info_t>>(backend)) {
        const auto index = std::move(std::get<std::vector<zip_entry_info_t>>(backend));
        const auto zip_error = extract_zip_entries(index, sink);
        if (zip_error.has_value()) {
            return zip_error.value();
        }
    } else {
        auto bytes_ret = extract_seven_z(sink);
        if (std::holds_alternative<archive_error_t>(bytes_ret)) {
            return std::get<archive_error_t>(bytes_ret);
        }
        tar_bytes = std::move(std::get<bytes_t>(bytes_ret));
    }

    if (tar_bytes.has_value()) {
        update_status(sink, update_status_t { std::string("Unpacking (tar)"), std::nullopt, std::nullopt, std::nullopt });
        const auto destination = output_directory;
        BackgroundTask<std::monostate> task([bytes = std::move(tar_bytes.value()), destination]() -> std::variant<std::monostate, archive_error_t> {
            const auto unpack_error = unpack_tar_bytes(bytes, destination);
            if (unpack_error.has_value()) {
                return unpack_error.value();
            }
            return std::monostate {};
        });
        const auto unpack_ret = wait_task(task, sink);
        if (std::holds_alternative<archive_error_t>(unpack_ret)) {
            return std::get<archive_error_t>(unpack_ret);
        }
    }

    const auto files_ret = scan_directory(output_directory);
    if (std::holds_alternative<archive_error_t>(files_ret)) {
        return std::get<archive_error_t>(files_ret);
    }
    return extracted_t { std::get<std::unordered_set<std::string>>(files_ret) };
}

std::variant<std::unordered_set<std::string>, archive_error_t> scan_directory(const std::filesystem::path &directory) {
    std::unordered_set<std::string> files;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(directory, ec);
    if (ec) {
        return io_error("walk", directory, ec.message());
    }
    for (const auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return io_error("walk", directory, ec.message());
        }
        std::error_code entry_ec;
        const auto status = it->symlink_status(entry_ec);
        if (entry_ec) {
            return io_error("stat", it->path(), entry_ec.message());
        }
        if (std::filesystem::is_directory(status)) {
            continue;
        }
        files.insert(path_to_relative(it->path(), directory));
    }
    if (ec) {
        return io_error("walk", directory, ec.message());
    }
    return files;
}
