#pragma once

#include <string>
#include <filesystem>

enum error_kind_t {
    ERROR_UNSUPPORTED_FORMAT = 0,
    ERROR_DIGEST_MISMATCH = 1,
    ERROR_IO_FAILURE = 2,
    ERROR_CODEC_FAILURE = 3,
    ERROR_TASK_FAILURE = 4
};

struct archive_error_t {
    error_kind_t kind;
    std::string message;
    // operation that failed, e.g. "open", "write", "create directory"
    std::string operation;
    // offending file or directory, empty if not applicable
    std::string path;
    // only set for ERROR_DIGEST_MISMATCH
    std::string expected_digest;
    std::string actual_digest;
};

archive_error_t unsupported_format_error(const std::string &file_name);

archive_error_t digest_mismatch_error(const std::string &expected, const std::string &actual);

archive_error_t io_error(const std::string &operation, const std::filesystem::path &path, const std::string &reason);

archive_error_t codec_error(const std::string &operation, const std::filesystem::path &path, const std::string &reason);

archive_error_t task_error(const std::string &reason);

const char *error_kind_name(error_kind_t kind);

std::string error_to_string(const archive_error_t &error);
