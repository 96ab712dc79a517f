#include "./error.hpp"

archive_error_t unsupported_format_error(const std::string &file_name) {
    return archive_error_t {
        ERROR_UNSUPPORTED_FORMAT,
        std::string("could not determine compression type from \"") + file_name + "\" suffix",
        "resolve format",
        file_name,
        "",
        ""
    };
}

archive_error_t digest_mismatch_error(const std::string &expected, const std::string &actual) {
    return archive_error_t {
        ERROR_DIGEST_MISMATCH,
        std::string("digest mismatch: expected: ") + expected + " actual: " + actual,
        "verify digest",
        "",
        expected,
        actual
    };
}

archive_error_t io_error(const std::string &operation, const std::filesystem::path &path, const std::string &reason) {
    return archive_error_t { ERROR_IO_FAILURE, reason, operation, path.string(), "", "" };
}

archive_error_t codec_error(const std::string &operation, const std::filesystem::path &path, const std::string &reason) {
    return archive_error_t { ERROR_CODEC_FAILURE, reason, operation, path.string(), "", "" };
}

archive_error_t task_error(const std::string &reason) {
    return archive_error_t { ERROR_TASK_FAILURE, reason, "background task", "", "", "" };
}

const char *error_kind_name(error_kind_t kind) {
    switch (kind) {
    case ERROR_UNSUPPORTED_FORMAT:
        return "unsupported format";
    case ERROR_DIGEST_MISMATCH:
        return "digest mismatch";
    case ERROR_IO_FAILURE:
        return "I/O failure";
    case ERROR_CODEC_FAILURE:
        return "codec failure";
    case ERROR_TASK_FAILURE:
        return "task failure";
    default:
        return "<>";
    }
}

std::string error_to_string(const archive_error_t &error) {
    auto ret = std::string(error_kind_name(error.kind));
    if (!error.operation.empty()) {
        ret += std::string(" (") + error.operation + ")";
    }
    if (!error.path.empty()) {
        ret += std::string(" \"") + error.path + "\"";
    }
    if (!error.message.empty()) {
        ret += std::string(": ") + error.message;
    }
    return ret;
}
