#include <algorithm>
#include <vector>

#include "./driver.hpp"

struct driver_suffix_t {
    std::string suffix;
    driver_t driver;
};

static const std::vector<driver_suffix_t> &known_suffixes() {
    static const std::vector<driver_suffix_t> suffixes = {
        { "tar.gz", DRIVER_GZIP },
        { "tgz", DRIVER_GZIP },
        { "tar.bz", DRIVER_BZIP2 },
        { "tar.bz2", DRIVER_BZIP2 },
        { "zip", DRIVER_ZIP },
        { "tar.7z", DRIVER_SEVEN_Z },
        { "tar.xz", DRIVER_XZ },
    };
    return suffixes;
}

static inline bool ends_with(std::string const &value, std::string const &ending) {
    if (ending.size() > value.size()) return false;
    return std::equal(ending.rbegin(), ending.rend(), value.rbegin());
}

std::string driver_extension(driver_t driver) {
    switch (driver) {
    case DRIVER_GZIP:
        return "tar.gz";
    case DRIVER_BZIP2:
        return "tar.bz2";
    case DRIVER_ZIP:
        return "zip";
    case DRIVER_SEVEN_Z:
        return "tar.7z";
    case DRIVER_XZ:
        return "tar.xz";
    }
    return "";
}

std::optional<driver_t> driver_from_extension(const std::string &extension) {
    const auto ext = extension.find('.') == 0 ? extension.substr(1) : extension;
    for (const auto &s : known_suffixes()) {
        if (s.suffix == ext) {
            return s.driver;
        }
    }
    return std::nullopt;
}

std::optional<driver_t> driver_from_filename(const std::string &file_name) {
    std::optional<driver_t> ret;
    size_t matched_length = 0;
    for (const auto &s : known_suffixes()) {
        const auto dotted = std::string(".") + s.suffix;
        if (dotted.size() <= matched_length) {
            continue;
        }
        if (ends_with(file_name, dotted)) {
            ret = s.driver;
            matched_length = dotted.size();
        }
    }
    return ret;
}

std::variant<driver_t, archive_error_t> resolve_driver(const std::string &file_name) {
    const auto driver = driver_from_filename(file_name);
    if (!driver.has_value()) {
        return unsupported_format_error(file_name);
    }
    return driver.value();
}

bool is_tar_backed(driver_t driver) {
    return driver != DRIVER_ZIP;
}
