#pragma once

#include <string>
#include <variant>
#include <optional>

#include "../error/error.hpp"

enum driver_t {
    DRIVER_GZIP = 0,
    DRIVER_BZIP2 = 1,
    DRIVER_ZIP = 2,
    DRIVER_SEVEN_Z = 3,
    DRIVER_XZ = 4
};

// canonical suffix used for generated file names, without leading dot
std::string driver_extension(driver_t driver);

// exact match against canonical extensions and accepted aliases (tgz, tar.bz)
std::optional<driver_t> driver_from_extension(const std::string &extension);

// longest known suffix of the file name wins
std::optional<driver_t> driver_from_filename(const std::string &file_name);

std::variant<driver_t, archive_error_t> resolve_driver(const std::string &file_name);

// true for drivers that compress a single tar stream
bool is_tar_backed(driver_t driver);
