#include <gtest/gtest.h>

#include "../src/path/path_utils.hpp"

TEST(path_utils_test, folder_for_unpacked_file) {
    EXPECT_EQ(folder_for_unpacked_file("release-1.0.tar.gz").string(), "release-1.0");
    EXPECT_EQ(folder_for_unpacked_file("dir/backup.tgz").string(), "dir/backup");
    EXPECT_EQ(folder_for_unpacked_file("backup.tar.bz").string(), "backup");
    EXPECT_EQ(folder_for_unpacked_file("backup.tar.bz2").string(), "backup");
    EXPECT_EQ(folder_for_unpacked_file("photos.zip").string(), "photos");
    EXPECT_EQ(folder_for_unpacked_file("a.tar.7z").string(), "a");
    EXPECT_EQ(folder_for_unpacked_file("a.tar.xz").string(), "a");
    EXPECT_EQ(folder_for_unpacked_file("notes.rar").string(), "notes_rar");
}

TEST(path_utils_test, path_to_relative) {
    EXPECT_EQ(path_to_relative("root/a/b.txt", "root"), "a/b.txt");
    EXPECT_EQ(path_to_relative("./root/a.txt", "root/"), "a.txt");
    EXPECT_EQ(path_to_relative("other/a.txt", "root"), "other/a.txt");
}

TEST(path_utils_test, random_suffix) {
    const auto first = random_suffix(12);
    const auto second = random_suffix(12);
    EXPECT_EQ(first.size(), 12);
    EXPECT_NE(first, second);
    for (const auto c : first) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z'));
    }
}

TEST(path_utils_test, temporary_file_path) {
    const auto path = temporary_file_path("out", "stem", "tar");
    EXPECT_EQ(path.parent_path().string(), "out");
    const auto name = path.filename().string();
    EXPECT_EQ(name.rfind("stem.", 0), 0);
    EXPECT_EQ(name.substr(name.size() - 4), ".tar");
    EXPECT_NE(temporary_file_path("out", "stem", "tar"), path);
}
