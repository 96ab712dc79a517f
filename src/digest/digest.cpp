#include <fstream>
#include <memory>
#include <vector>

#include <openssl/evp.h>

#include "../task/task.hpp"
#include "./digest.hpp"

#define DIGEST_BLOCK_SIZE 65536

std::string to_hex(const unsigned char *data, size_t size) {
    static const char digits[] = "0123456789abcdef";
    std::string ret;
    ret.reserve(size * 2);
    for (size_t i = 0; i < size; i++) {
        ret += digits[data[i] >> 4];
        ret += digits[data[i] & 0x0f];
    }
    return ret;
}

std::variant<std::string, archive_error_t> digest_file(const std::filesystem::path &file_path) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream) {
        return io_error("open", file_path, "could not open file for digest");
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        return codec_error("digest", file_path, "SHA-256 context allocation failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return codec_error("digest", file_path, "SHA-256 init failed");
    }

    std::vector<char> buffer(DIGEST_BLOCK_SIZE);
    while (file_stream) {
        file_stream.read(buffer.data(), buffer.size());
        const auto bytes_read = file_stream.gcount();
        if (bytes_read <= 0) {
            break;
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(bytes_read)) != 1) {
            return codec_error("digest", file_path, "SHA-256 update failed");
        }
    }
    if (file_stream.bad()) {
        return io_error("read", file_path, "failed to read file for digest");
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        return codec_error("digest", file_path, "SHA-256 final failed");
    }
    return to_hex(out, out_len);
}

std::variant<std::string, archive_error_t> digest_file_polling(const std::filesystem::path &file_path, StatusSink *sink) {
    update_status(sink, update_status_t { std::string("Digesting"), file_path.filename().string(), std::nullopt, std::nullopt });
    const auto path = file_path;
    BackgroundTask<std::string> task([path]() {
        return digest_file(path);
    });
    return wait_task(task, sink);
}
