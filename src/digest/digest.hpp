#pragma once

#include <string>
#include <variant>
#include <filesystem>

#include "../error/error.hpp"
#include "../status/status.hpp"

// lowercase hex SHA-256 of the file contents
std::variant<std::string, archive_error_t> digest_file(const std::filesystem::path &file_path);

// same as digest_file, but runs on a background task while ticking the sink
std::variant<std::string, archive_error_t> digest_file_polling(const std::filesystem::path &file_path, StatusSink *sink);

std::string to_hex(const unsigned char *data, size_t size);
