#include <gtest/gtest.h>

#include "./test_utils.hpp"

#include "../src/digest/digest.hpp"

TEST(digest_test, known_value) {
    const auto dir = make_test_dir("digest_known_value");
    write_text_file(dir / "abc.txt", "abc");
    const auto ret = digest_file(dir / "abc.txt");
    ASSERT_TRUE(std::holds_alternative<std::string>(ret));
    EXPECT_EQ(std::get<std::string>(ret), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    std::filesystem::remove_all(dir);
}

TEST(digest_test, empty_file) {
    const auto dir = make_test_dir("digest_empty_file");
    write_text_file(dir / "empty", "");
    const auto ret = digest_file(dir / "empty");
    ASSERT_TRUE(std::holds_alternative<std::string>(ret));
    EXPECT_EQ(std::get<std::string>(ret), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    std::filesystem::remove_all(dir);
}

TEST(digest_test, larger_than_block) {
    const auto dir = make_test_dir("digest_larger_than_block");
    write_text_file(dir / "big", std::string(200000, 'x'));
    write_text_file(dir / "big_copy", std::string(200000, 'x'));
    write_text_file(dir / "other", std::string(200000, 'y'));
    const auto first = digest_file(dir / "big");
    const auto second = digest_file(dir / "big_copy");
    const auto third = digest_file(dir / "other");
    ASSERT_TRUE(std::holds_alternative<std::string>(first));
    ASSERT_TRUE(std::holds_alternative<std::string>(second));
    ASSERT_TRUE(std::holds_alternative<std::string>(third));
    EXPECT_EQ(std::get<std::string>(first), std::get<std::string>(second));
    EXPECT_NE(std::get<std::string>(first), std::get<std::string>(third));
    EXPECT_EQ(std::get<std::string>(first).size(), 64);
    std::filesystem::remove_all(dir);
}

TEST(digest_test, missing_file) {
    const auto ret = digest_file(std::filesystem::path(get_tmp_dir()) / "no_such_file");
    ASSERT_TRUE(std::holds_alternative<archive_error_t>(ret));
    EXPECT_EQ(std::get<archive_error_t>(ret).kind, ERROR_IO_FAILURE);
}

TEST(digest_test, polling_matches_direct) {
    const auto dir = make_test_dir("digest_polling");
    write_text_file(dir / "abc.txt", "abc");
    RecordingStatusSink sink;
    const auto ret = digest_file_polling(dir / "abc.txt", &sink);
    ASSERT_TRUE(std::holds_alternative<std::string>(ret));
    EXPECT_EQ(std::get<std::string>(ret), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    ASSERT_FALSE(sink.updates.empty());
    EXPECT_EQ(sink.updates[0].brief, "Digesting");
    std::filesystem::remove_all(dir);
}

TEST(digest_test, hex) {
    const unsigned char data[] = { 0x00, 0x0f, 0xa0, 0xff };
    EXPECT_EQ(to_hex(data, sizeof(data)), "000fa0ff");
}
