#include <algorithm>

#include "../archive/stream.hpp"
#include "../archive/sevenz.hpp"
#include "../digest/digest.hpp"
#include "../path/path_utils.hpp"
#include "../task/task.hpp"
#include "./encoder.hpp"

EncodedArchive::EncodedArchive(std::filesystem::path output_path_, driver_t driver_) :
    output_path {output_path_},
    driver {driver_} {}

const std::filesystem::path &EncodedArchive::get_path() const {
    return output_path;
}

driver_t EncodedArchive::get_driver() const {
    return driver;
}

std::variant<std::string, archive_error_t> EncodedArchive::digest(StatusSink *sink) const {
    return digest_file_polling(output_path, sink);
}

Encoder::Encoder(
    driver_t driver_,
    std::filesystem::path output_directory_,
    std::string output_filename_,
    encoder_backend_t backend_) :
    driver {driver_},
    output_directory {output_directory_},
    output_filename {output_filename_},
    backend {std::move(backend_)} {}

std::variant<Encoder, archive_error_t> Encoder::create(const std::filesystem::path &output_directory, const std::string &output_filename) {
    // resolve the format before touching the filesystem
    const auto driver_ret = resolve_driver(output_filename);
    if (std::holds_alternative<archive_error_t>(driver_ret)) {
        return std::get<archive_error_t>(driver_ret);
    }
    const auto driver = std::get<driver_t>(driver_ret);

    if (!output_directory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(output_directory, ec);
        if (ec) {
            return io_error("create directory", output_directory, ec.message());
        }
    }

    if (!is_tar_backed(driver)) {
        auto zip_ret = ZipWriter::create(output_directory / output_filename);
        if (std::holds_alternative<archive_error_t>(zip_ret)) {
            return std::get<archive_error_t>(zip_ret);
        }
        return Encoder(driver, output_directory, output_filename, std::move(std::get<std::unique_ptr<ZipWriter>>(zip_ret)));
    }

    auto tar_ret = TarBuilder::create();
    if (std::holds_alternative<archive_error_t>(tar_ret)) {
        return std::get<archive_error_t>(tar_ret);
    }
    return Encoder(driver, output_directory, output_filename, std::move(std::get<std::unique_ptr<TarBuilder>>(tar_ret)));
}

driver_t Encoder::get_driver() const {
    return driver;
}

std::filesystem::path Encoder::get_output_path() const {
    return output_directory / output_filename;
}

std::optional<archive_error_t> Encoder::add_file(const std::string &archive_path, const std::filesystem::path &file_path, StatusSink *sink) {
    update_status(sink, update_status_t { std::nullopt, archive_path, 1, std::nullopt });

    if (std::holds_alternative<std::unique_ptr<ZipWriter>>(backend)) {
        auto &zip = std::get<std::unique_ptr<ZipWriter>>(backend);
        if (!zip) {
            return codec_error("append", get_output_path(), "archive is already finished");
        }
        return zip->append_file(archive_path, file_path);
    }
    auto &tar = std::get<std::unique_ptr<TarBuilder>>(backend);
    if (!tar) {
        return codec_error("append", get_output_path(), "archive is already finished");
    }
    return tar->append_file(archive_path, file_path);
}

std::optional<archive_error_t> Encoder::add_entries(const std::vector<entry_t> &entries, StatusSink *sink) {
    update_status(sink, update_status_t {
        std::string("Archiving (") + driver_extension(driver) + ")",
        std::nullopt,
        std::nullopt,
        static_cast<uint64_t>(entries.size())
    });

    for (const auto &entry : entries) {
        const auto add_error = add_file(entry.archive_path, entry.file_path, sink);
        if (add_error.has_value()) {
            return add_error;
        }
    }

    update_status(sink, update_status_t { std::nullopt, std::string("..."), std::nullopt, std::nullopt });
    return std::nullopt;
}

std::optional<archive_error_t> Encoder::encode_in_chunks(const bytes_t &contents, StatusSink *sink) {
    const auto output_path = get_output_path();
    auto compressor_ret = StreamCompressor::create(output_path, driver, contents.size());
    if (std::holds_alternative<archive_error_t>(compressor_ret)) {
        return std::get<archive_error_t>(compressor_ret);
    }
    auto compressor = std::move(std::get<std::unique_ptr<StreamCompressor>>(compressor_ret));

    // chunk size is chosen so every chunk is one progress step
    const size_t chunk_size = std::max<size_t>(1, (contents.size() + COMPRESS_PROGRESS_STEPS - 1) / COMPRESS_PROGRESS_STEPS);
    const size_t total_chunks = (contents.size() + chunk_size - 1) / chunk_size;

    update_status(sink, update_status_t {
        std::string("Compressing (") + driver_extension(driver) + ")",
        std::nullopt,
        std::nullopt,
        static_cast<uint64_t>(total_chunks)
    });

    for (size_t offset = 0; offset < contents.size(); offset += chunk_size) {
        update_status(sink, update_status_t { std::nullopt, std::nullopt, 1, std::nullopt });
        const auto write_error = compressor->write(contents.data() + offset, std::min(chunk_size, contents.size() - offset));
        if (write_error.has_value()) {
            return write_error;
        }
    }
    return compressor->finish();
}

std::optional<archive_error_t> Encoder::encode_seven_z(bytes_t contents, int64_t mtime, StatusSink *sink) {
    update_status(sink, update_status_t {
        std::string("Compressing (") + driver_extension(driver) + ")",
        std::string("..."),
        std::nullopt,
        std::nullopt
    });

    const auto output_path = get_output_path();
    const auto temporary_tar_path = temporary_file_path(output_directory.empty() ? std::filesystem::path(".") : output_directory, SEVEN_Z_TEMP_STEM, "tar");
    // the 7z writer works on a file, so the tar stream goes to disk first
    BackgroundTask<std::monostate> task([contents = std::move(contents), temporary_tar_path, output_path, mtime]() -> std::variant<std::monostate, archive_error_t> {
        auto compress_error = write_file_bytes(temporary_tar_path, contents);
        if (!compress_error.has_value()) {
            compress_error = sevenz_compress_file(temporary_tar_path, output_path, mtime);
        }
        std::error_code ec;
        std::filesystem::remove(temporary_tar_path, ec);
        if (compress_error.has_value()) {
            return compress_error.value();
        }
        if (ec) {
            return io_error("remove", temporary_tar_path, ec.message());
        }
        return std::monostate {};
    });

    const auto ret = wait_task(task, sink);
    if (std::holds_alternative<archive_error_t>(ret)) {
        return std::get<archive_error_t>(ret);
    }
    return std::nullopt;
}

std::variant<EncodedArchive, archive_error_t> Encoder::compress(StatusSink *sink) && {
    const auto output_path = get_output_path();

    if (std::holds_alternative<std::unique_ptr<ZipWriter>>(backend)) {
        auto zip = std::move(std::get<std::unique_ptr<ZipWriter>>(backend));
        if (!zip) {
            return codec_error("finish", output_path, "archive is already finished");
        }
        // entries are already written, only the central directory is left
        const auto finish_error = zip->finish();
        if (finish_error.has_value()) {
            return finish_error.value();
        }
        return EncodedArchive(output_path, driver);
    }

    auto tar = std::move(std::get<std::unique_ptr<TarBuilder>>(backend));
    if (!tar) {
        return codec_error("finish", output_path, "archive is already finished");
    }
    const auto newest_mtime = tar->get_newest_mtime();
    auto contents_ret = tar->into_bytes();
    if (std::holds_alternative<archive_error_t>(contents_ret)) {
        return std::get<archive_error_t>(contents_ret);
    }
    auto contents = std::move(std::get<bytes_t>(contents_ret));

    const auto encode_error = driver == DRIVER_SEVEN_Z
        ? encode_seven_z(std::move(contents), newest_mtime, sink)
        : encode_in_chunks(contents, sink);
    if (encode_error.has_value()) {
        return encode_error.value();
    }
    return EncodedArchive(output_path, driver);
}
