#include <set>
#include <gtest/gtest.h>

#include "./test_utils.hpp"

#include "../src/manifest/manifest.hpp"

static std::filesystem::path make_tree(const std::string &name) {
    const auto dir = make_test_dir(name);
    for (const auto &file : {"a/a.txt", "a/b.txt", "b/a.txt", "b/b.txt", "a.txt", "b.txt"}) {
        write_text_file(dir / file, file);
    }
    return dir;
}

static std::set<std::string> archive_paths(const std::variant<std::vector<entry_t>, archive_error_t> &ret) {
    std::set<std::string> paths;
    if (!std::holds_alternative<std::vector<entry_t>>(ret)) {
        return paths;
    }
    for (const auto &entry : std::get<std::vector<entry_t>>(ret)) {
        paths.insert(entry.archive_path);
    }
    return paths;
}

TEST(manifest_test, glob_does_not_cross_separator) {
    EXPECT_TRUE(glob_match("*.txt", "a.txt"));
    EXPECT_FALSE(glob_match("*.txt", "a/a.txt"));
    EXPECT_TRUE(glob_match("a/*", "a/b.txt"));
    EXPECT_FALSE(glob_match("a/*", "b/a.txt"));
    EXPECT_TRUE(glob_match("*/*.txt", "b/a.txt"));
    EXPECT_TRUE(glob_match("?.txt", "b.txt"));
}

TEST(manifest_test, no_filters) {
    const auto dir = make_tree("manifest_no_filters");
    const auto ret = build_manifest(dir);
    ASSERT_TRUE(std::holds_alternative<std::vector<entry_t>>(ret));
    EXPECT_EQ(archive_paths(ret), std::set<std::string>({"a/a.txt", "a/b.txt", "b/a.txt", "b/b.txt", "a.txt", "b.txt"}));
    for (const auto &entry : std::get<std::vector<entry_t>>(ret)) {
        EXPECT_TRUE(std::filesystem::exists(entry.file_path));
    }
    std::filesystem::remove_all(dir);
}

TEST(manifest_test, excludes_top_level_only) {
    const auto dir = make_tree("manifest_excludes");
    const auto ret = build_manifest(dir, std::nullopt, std::vector<std::string>{"*.txt"});
    EXPECT_EQ(archive_paths(ret), std::set<std::string>({"a/a.txt", "a/b.txt", "b/a.txt", "b/b.txt"}));
    std::filesystem::remove_all(dir);
}

TEST(manifest_test, includes_one_folder) {
    const auto dir = make_tree("manifest_includes");
    const auto ret = build_manifest(dir, std::vector<std::string>{"a/*"}, std::nullopt);
    EXPECT_EQ(archive_paths(ret), std::set<std::string>({"a/a.txt", "a/b.txt"}));
    std::filesystem::remove_all(dir);
}

TEST(manifest_test, excludes_after_includes) {
    const auto dir = make_tree("manifest_includes_excludes");
    const auto ret = build_manifest(dir, std::vector<std::string>{"a/*", "*.txt"}, std::vector<std::string>{"a/b.txt"});
    EXPECT_EQ(archive_paths(ret), std::set<std::string>({"a/a.txt", "a.txt", "b.txt"}));
    std::filesystem::remove_all(dir);
}

TEST(manifest_test, empty_includes_keep_nothing) {
    const auto dir = make_tree("manifest_empty_includes");
    const auto ret = build_manifest(dir, std::vector<std::string>{}, std::nullopt);
    ASSERT_TRUE(std::holds_alternative<std::vector<entry_t>>(ret));
    EXPECT_TRUE(std::get<std::vector<entry_t>>(ret).empty());
    std::filesystem::remove_all(dir);
}

TEST(manifest_test, single_file) {
    const auto dir = make_tree("manifest_single_file");
    const auto ret = build_manifest(dir / "a" / "b.txt");
    ASSERT_TRUE(std::holds_alternative<std::vector<entry_t>>(ret));
    const auto &entries = std::get<std::vector<entry_t>>(ret);
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].archive_path, "b.txt");
    std::filesystem::remove_all(dir);
}

TEST(manifest_test, symlinks_are_entries) {
    const auto dir = make_tree("manifest_symlinks");
    std::filesystem::create_symlink("a.txt", dir / "link.txt");
    std::filesystem::create_directory_symlink("a", dir / "link_dir");
    const auto ret = build_manifest(dir);
    const auto paths = archive_paths(ret);
    EXPECT_EQ(paths.size(), 8);
    EXPECT_EQ(paths.count("link.txt"), 1);
    EXPECT_EQ(paths.count("link_dir"), 1);
    EXPECT_EQ(paths.count("link_dir/a.txt"), 0);
    std::filesystem::remove_all(dir);
}

TEST(manifest_test, missing_input) {
    const auto ret = build_manifest(std::filesystem::path(get_tmp_dir()) / "manifest_missing_input");
    ASSERT_TRUE(std::holds_alternative<archive_error_t>(ret));
    EXPECT_EQ(std::get<archive_error_t>(ret).kind, ERROR_IO_FAILURE);
}
