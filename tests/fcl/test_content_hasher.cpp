#include <gtest/gtest.h>
#include <fcl/content_hasher.hpp>
#include <fcl/core_types.hpp>

#include <filesystem>
#include <fstream>

using namespace fcl;
namespace fs = std::filesystem;

class ContentHasherTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
            ("fcl_hasher_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        fs::path path = test_dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    fs::path test_dir_;
};

TEST_F(ContentHasherTest, KnownDigests) {
    auto empty = ContentHasher::hash(write_file("empty", ""));
    ASSERT_TRUE(empty.ok()) << empty.error().to_string();
    EXPECT_EQ(empty.value(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    auto abc = ContentHasher::hash(write_file("abc.txt", "abc"));
    ASSERT_TRUE(abc.ok());
    EXPECT_EQ(abc.value(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ContentHasherTest, FileAndBufferAgree) {
    std::string content = "The quick brown fox jumps over the lazy dog";
    auto from_file = ContentHasher::hash(write_file("fox.txt", content));
    auto from_bytes = ContentHasher::hash_bytes(content);

    ASSERT_TRUE(from_file.ok());
    ASSERT_TRUE(from_bytes.ok());
    EXPECT_EQ(from_file.value(), from_bytes.value());
    EXPECT_EQ(from_file.value(), "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

TEST_F(ContentHasherTest, LargerThanOneBlock) {
    // Spans several blocks with a partial tail
    std::string content;
    content.reserve(HASH_BLOCK_SIZE * 3 + 17);
    for (size_t i = 0; i < HASH_BLOCK_SIZE * 3 + 17; ++i) {
        content.push_back(static_cast<char>(i * 31 % 251));
    }

    auto from_file = ContentHasher::hash(write_file("big.bin", content));
    auto from_bytes = ContentHasher::hash_bytes(content);
    ASSERT_TRUE(from_file.ok());
    ASSERT_TRUE(from_bytes.ok());
    EXPECT_EQ(from_file.value(), from_bytes.value());
}

TEST_F(ContentHasherTest, SameContentSameFingerprint) {
    auto a = ContentHasher::hash(write_file("a.txt", "duplicate"));
    auto b = ContentHasher::hash(write_file("b.dat", "duplicate"));
    auto c = ContentHasher::hash(write_file("c.txt", "duplicatE"));

    ASSERT_TRUE(a.ok() && b.ok() && c.ok());
    EXPECT_EQ(a.value(), b.value());
    EXPECT_NE(a.value(), c.value());
    EXPECT_EQ(a.value().size(), 64u);
}

TEST_F(ContentHasherTest, MissingFile) {
    auto result = ContentHasher::hash(test_dir_ / "gone.txt");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::NOT_FOUND);
}

TEST_F(ContentHasherTest, DirectoryIsRejected) {
    auto result = ContentHasher::hash(test_dir_);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);
}
