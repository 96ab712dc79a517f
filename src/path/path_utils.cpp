#include <random>

#include "../driver/driver.hpp"
#include "./path_utils.hpp"

std::filesystem::path folder_for_unpacked_file(const std::filesystem::path file_name) {
    const auto name = file_name.filename().string();
    const auto driver = driver_from_filename(name);
    if (driver.has_value()) {
        const auto suffix = std::string(".") + driver_extension(driver.value());
        // aliases (.tgz, .tar.bz) are shorter or longer than the canonical suffix
        for (const auto &candidate : {suffix, std::string(".tgz"), std::string(".tar.bz")}) {
            if (name.size() > candidate.size() && name.compare(name.size() - candidate.size(), candidate.size(), candidate) == 0) {
                return file_name.parent_path() / name.substr(0, name.size() - candidate.size());
            }
        }
    }
    auto ext = file_name.extension().string();
    if(ext.find_last_of(".") != std::string::npos) {
        ext = ext.substr(ext.find_last_of(".") + 1);
    }
    return file_name.parent_path() / (file_name.stem().string() + "_" + ext);
}

std::string path_to_relative(const std::filesystem::path file_name, const std::filesystem::path root) {
    const auto from = std::filesystem::absolute(file_name).lexically_normal();
    const auto base = std::filesystem::absolute(root).lexically_normal();
    auto from_it = from.begin();
    for (auto base_it = base.begin(); base_it != base.end(); base_it++) {
        // trailing separator of a directory path yields an empty element
        if (base_it->empty()) {
            continue;
        }
        if (from_it == from.end() || *from_it != *base_it) {
            return file_name.generic_string();
        }
        from_it++;
    }
    std::filesystem::path relative;
    while (from_it != from.end()) {
        relative /= *from_it;
        from_it++;
    }
    return relative.generic_string();
}

std::string random_suffix(const int len) {
    static const char alphanum[] =
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 generator {std::random_device{}()};
    std::uniform_int_distribution<size_t> distribution(0, sizeof(alphanum) - 2);
    std::string tmp_s;
    tmp_s.reserve(len);
    for (int i = 0; i < len; ++i) {
        tmp_s += alphanum[distribution(generator)];
    }
    return tmp_s;
}

std::filesystem::path temporary_file_path(const std::filesystem::path directory, const std::string &stem, const std::string &extension) {
    return directory / (stem + "." + random_suffix(12) + "." + extension);
}
