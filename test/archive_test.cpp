#include <filesystem>
#include <gtest/gtest.h>

#include "./test_utils.hpp"

#include "../src/archive/archive.hpp"
#include "../src/archive/stream.hpp"
#include "../src/archive/zip.hpp"

TEST(archive_test, sanitize_entry_path) {
    std::filesystem::path out;
    EXPECT_TRUE(sanitize_entry_path("a/b.txt", "dest", out));
    EXPECT_EQ(out, std::filesystem::path("dest/a/b.txt"));
    EXPECT_TRUE(sanitize_entry_path("/etc/passwd", "dest", out));
    EXPECT_EQ(out, std::filesystem::path("dest/etc/passwd"));
    EXPECT_TRUE(sanitize_entry_path("a/./b.txt", "dest", out));
    EXPECT_EQ(out, std::filesystem::path("dest/a/b.txt"));
    EXPECT_FALSE(sanitize_entry_path("../evil.txt", "dest", out));
    EXPECT_FALSE(sanitize_entry_path("a/../../evil.txt", "dest", out));
    EXPECT_FALSE(sanitize_entry_path("", "dest", out));
    EXPECT_FALSE(sanitize_entry_path("/", "dest", out));
}

TEST(archive_test, read_missing_file) {
    const auto ret = read_file_bytes(std::filesystem::path(get_tmp_dir()) / "archive_missing_file");
    ASSERT_TRUE(std::holds_alternative<archive_error_t>(ret));
    EXPECT_EQ(std::get<archive_error_t>(ret).kind, ERROR_IO_FAILURE);
}

TEST(archive_test, tar_pack_unpack) {
    const auto dir = make_test_dir("archive_tar_pack_unpack");
    write_text_file(dir / "src" / "one.txt", "first file");
    write_text_file(dir / "src" / "nested" / "two.txt", std::string(30000, 'z'));

    auto builder_ret = TarBuilder::create();
    ASSERT_TRUE(std::holds_alternative<std::unique_ptr<TarBuilder>>(builder_ret));
    auto builder = std::move(std::get<std::unique_ptr<TarBuilder>>(builder_ret));
    EXPECT_EQ(builder->append_file("one.txt", dir / "src" / "one.txt"), std::nullopt);
    EXPECT_EQ(builder->append_file("nested/two.txt", dir / "src" / "nested" / "two.txt"), std::nullopt);
    const auto bytes_ret = builder->into_bytes();
    ASSERT_TRUE(std::holds_alternative<bytes_t>(bytes_ret));
    const auto &bytes = std::get<bytes_t>(bytes_ret);
    EXPECT_GT(bytes.size(), 30000);

    // no appends after the stream is finished
    const auto late_error = builder->append_file("late.txt", dir / "src" / "one.txt");
    ASSERT_TRUE(late_error.has_value());
    EXPECT_EQ(late_error->kind, ERROR_CODEC_FAILURE);

    const auto out = dir / "out";
    std::filesystem::create_directories(out);
    EXPECT_EQ(unpack_tar_bytes(bytes, out), std::nullopt);
    EXPECT_EQ(read_text_file(out / "one.txt"), "first file");
    EXPECT_EQ(read_text_file(out / "nested" / "two.txt"), std::string(30000, 'z'));
    std::filesystem::remove_all(dir);
}

TEST(archive_test, tar_keeps_symlink) {
    const auto dir = make_test_dir("archive_tar_keeps_symlink");
    write_text_file(dir / "src" / "target.txt", "target");
    std::filesystem::create_symlink("target.txt", dir / "src" / "link.txt");

    auto builder_ret = TarBuilder::create();
    ASSERT_TRUE(std::holds_alternative<std::unique_ptr<TarBuilder>>(builder_ret));
    auto builder = std::move(std::get<std::unique_ptr<TarBuilder>>(builder_ret));
    EXPECT_EQ(builder->append_file("target.txt", dir / "src" / "target.txt"), std::nullopt);
    EXPECT_EQ(builder->append_file("link.txt", dir / "src" / "link.txt"), std::nullopt);
    const auto bytes_ret = builder->into_bytes();
    ASSERT_TRUE(std::holds_alternative<bytes_t>(bytes_ret));

    const auto out = dir / "out";
    std::filesystem::create_directories(out);
    EXPECT_EQ(unpack_tar_bytes(std::get<bytes_t>(bytes_ret), out), std::nullopt);
    EXPECT_TRUE(std::filesystem::is_symlink(out / "link.txt"));
    EXPECT_EQ(std::filesystem::read_symlink(out / "link.txt"), std::filesystem::path("target.txt"));
    EXPECT_EQ(read_text_file(out / "link.txt"), "target");
    std::filesystem::remove_all(dir);
}

TEST(archive_test, tar_rejects_directory) {
    const auto dir = make_test_dir("archive_tar_rejects_directory");
    std::filesystem::create_directories(dir / "sub");
    auto builder_ret = TarBuilder::create();
    ASSERT_TRUE(std::holds_alternative<std::unique_ptr<TarBuilder>>(builder_ret));
    auto builder = std::move(std::get<std::unique_ptr<TarBuilder>>(builder_ret));
    const auto error = builder->append_file("sub", dir / "sub");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ERROR_IO_FAILURE);
    std::filesystem::remove_all(dir);
}

TEST(archive_test, unpack_garbage) {
    const auto dir = make_test_dir("archive_unpack_garbage");
    const bytes_t garbage(2048, 'q');
    const auto error = unpack_tar_bytes(garbage, dir);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ERROR_CODEC_FAILURE);
    std::filesystem::remove_all(dir);
}

TEST(archive_test, stream_roundtrip) {
    const auto dir = make_test_dir("archive_stream_roundtrip");
    const std::string contents(50000, 'k');
    for (const auto driver : {DRIVER_GZIP, DRIVER_BZIP2, DRIVER_XZ}) {
        const auto file = dir / (std::string("data.") + driver_extension(driver));
        {
            auto compressor_ret = StreamCompressor::create(file, driver, contents.size());
            ASSERT_TRUE(std::holds_alternative<std::unique_ptr<StreamCompressor>>(compressor_ret));
            auto compressor = std::move(std::get<std::unique_ptr<StreamCompressor>>(compressor_ret));
            EXPECT_EQ(compressor->write(contents.data(), contents.size()), std::nullopt);
            EXPECT_EQ(compressor->finish(), std::nullopt);
        }
        auto decompressor_ret = StreamDecompressor::open(file, driver);
        ASSERT_TRUE(std::holds_alternative<std::unique_ptr<StreamDecompressor>>(decompressor_ret));
        auto decompressor = std::move(std::get<std::unique_ptr<StreamDecompressor>>(decompressor_ret));
        std::string result;
        std::vector<char> buffer(4096);
        while (true) {
            const auto read_ret = decompressor->read(buffer.data(), buffer.size());
            ASSERT_TRUE(std::holds_alternative<size_t>(read_ret));
            const auto n = std::get<size_t>(read_ret);
            if (n == 0) {
                break;
            }
            result.append(buffer.data(), n);
        }
        EXPECT_EQ(result, contents);
        EXPECT_GT(decompressor->compressed_bytes_read(), 0);
    }
    std::filesystem::remove_all(dir);
}

TEST(archive_test, stream_wrong_filter) {
    const auto dir = make_test_dir("archive_stream_wrong_filter");
    const auto file = dir / "data.tar.gz";
    write_text_file(file, "this is not gzip data at all");
    auto decompressor_ret = StreamDecompressor::open(file, DRIVER_GZIP);
    ASSERT_TRUE(std::holds_alternative<std::unique_ptr<StreamDecompressor>>(decompressor_ret));
    auto decompressor = std::move(std::get<std::unique_ptr<StreamDecompressor>>(decompressor_ret));
    char buffer[64];
    const auto read_ret = decompressor->read(buffer, sizeof(buffer));
    ASSERT_TRUE(std::holds_alternative<archive_error_t>(read_ret));
    EXPECT_EQ(std::get<archive_error_t>(read_ret).kind, ERROR_CODEC_FAILURE);
    std::filesystem::remove_all(dir);
}

TEST(archive_test, zip_index) {
    const auto dir = make_test_dir("archive_zip_index");
    write_text_file(dir / "a.txt", "alpha");
    write_text_file(dir / "b.txt", "beta");
    {
        auto zip_ret = ZipWriter::create(dir / "x.zip");
        ASSERT_TRUE(std::holds_alternative<std::unique_ptr<ZipWriter>>(zip_ret));
        auto zip = std::move(std::get<std::unique_ptr<ZipWriter>>(zip_ret));
        EXPECT_EQ(zip->append_file("a.txt", dir / "a.txt"), std::nullopt);
        EXPECT_EQ(zip->append_file("sub/b.txt", dir / "b.txt"), std::nullopt);
        EXPECT_EQ(zip->finish(), std::nullopt);
    }
    const auto index_ret = read_zip_index(dir / "x.zip");
    ASSERT_TRUE(std::holds_alternative<std::vector<zip_entry_info_t>>(index_ret));
    const auto &index = std::get<std::vector<zip_entry_info_t>>(index_ret);
    ASSERT_EQ(index.size(), 2);
    EXPECT_EQ(index[0].name, "a.txt");
    EXPECT_TRUE(index[0].is_file);
    EXPECT_EQ(index[1].name, "sub/b.txt");

    std::vector<std::string> seen;
    EXPECT_EQ(write_zip_files(dir / "x.zip", dir / "out", [&](const std::string &name) { seen.push_back(name); }), std::nullopt);
    EXPECT_EQ(seen, std::vector<std::string>({"a.txt", "sub/b.txt"}));
    EXPECT_EQ(read_text_file(dir / "out" / "sub" / "b.txt"), "beta");
    std::filesystem::remove_all(dir);
}

TEST(archive_test, symlink_parent) {
    const auto dir = make_test_dir("archive_symlink_parent");
    const auto out = dir / "out";
    std::filesystem::create_directories(out / "real");
    std::filesystem::create_directories(dir / "outside");
    std::filesystem::create_directory_symlink(std::filesystem::absolute(dir / "outside"), out / "link");
    std::filesystem::create_symlink("real", out / "file_link");
    EXPECT_FALSE(has_symlink_parent(out, out / "real" / "a.txt"));
    EXPECT_FALSE(has_symlink_parent(out, out / "new" / "deeper" / "a.txt"));
    EXPECT_FALSE(has_symlink_parent(out, out / "link"));
    EXPECT_TRUE(has_symlink_parent(out, out / "link" / "a.txt"));
    EXPECT_TRUE(has_symlink_parent(out, out / "link" / "sub" / "a.txt"));
    EXPECT_TRUE(has_symlink_parent(out, out / "file_link" / "a.txt"));
    std::filesystem::remove_all(dir);
}
