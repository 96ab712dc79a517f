#include <fstream>
#include <sstream>

#include "./test_utils.hpp"

std::string get_tmp_dir() {
    return std::string("./tmp-") + APP_NAME;
}

std::filesystem::path make_test_dir(const std::string &name) {
    const auto dir = std::filesystem::path(get_tmp_dir()) / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void write_text_file(const std::filesystem::path &file_path, const std::string &contents) {
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path());
    }
    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    out << contents;
}

std::string read_text_file(const std::filesystem::path &file_path) {
    std::ifstream in(file_path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void RecordingStatusSink::update(const update_status_t &status) {
    updates.push_back(status);
}

bool RecordingStatusSink::phases_complete() const {
    std::optional<uint64_t> total;
    uint64_t position = 0;
    for (const auto &status : updates) {
        if (status.total.has_value()) {
            if (total.has_value() && position != total.value()) {
                return false;
            }
            total = status.total;
            position = 0;
        } else if (status.brief.has_value()) {
            // indeterminate phase
            if (total.has_value() && position != total.value()) {
                return false;
            }
            total = std::nullopt;
            position = 0;
        }
        if (status.increment.has_value()) {
            position += status.increment.value();
            if (total.has_value() && position > total.value()) {
                return false;
            }
        }
    }
    return !total.has_value() || position == total.value();
}
