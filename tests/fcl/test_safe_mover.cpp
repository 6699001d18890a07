#include <gtest/gtest.h>
#include <fcl/safe_mover.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace fcl;
namespace fs = std::filesystem;

class SafeMoverTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
            ("fcl_mover_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path write_file(const fs::path& relative, const std::string& content) {
        fs::path path = test_dir_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    NullLogger logger_;
    fs::path test_dir_;
};

TEST_F(SafeMoverTest, MoveCreatesParentDirectories) {
    SafeMover mover(logger_);
    auto source = write_file("a.txt", "alpha");
    auto destination = test_dir_ / "nested" / "deeper" / "a.txt";

    auto result = mover.move(source, destination);
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    EXPECT_EQ(result.value(), destination);
    EXPECT_FALSE(fs::exists(source));
    EXPECT_EQ(read_file(destination), "alpha");
}

TEST_F(SafeMoverTest, CollisionsGetCounterBeforeExtension) {
    SafeMover mover(logger_);
    auto first = write_file("in/one/report.pdf", "first");
    auto second = write_file("in/two/report.pdf", "second");
    auto third = write_file("in/three/report.pdf", "third");
    auto destination = test_dir_ / "out" / "report.pdf";

    auto r1 = mover.move(first, destination);
    auto r2 = mover.move(second, destination);
    auto r3 = mover.move(third, destination);
    ASSERT_TRUE(r1.ok() && r2.ok() && r3.ok());

    EXPECT_EQ(r1.value(), test_dir_ / "out" / "report.pdf");
    EXPECT_EQ(r2.value(), test_dir_ / "out" / "report_1.pdf");
    EXPECT_EQ(r3.value(), test_dir_ / "out" / "report_2.pdf");

    EXPECT_EQ(read_file(r1.value()), "first");
    EXPECT_EQ(read_file(r2.value()), "second");
    EXPECT_EQ(read_file(r3.value()), "third");
}

TEST_F(SafeMoverTest, ResolveCollisionWithoutExtension) {
    write_file("Makefile", "all:");
    write_file("Makefile_1", "all:");

    auto resolved = SafeMover::resolve_collision(test_dir_ / "Makefile");
    ASSERT_TRUE(resolved.ok());
    EXPECT_EQ(resolved.value(), test_dir_ / "Makefile_2");

    auto free_name = SafeMover::resolve_collision(test_dir_ / "README");
    ASSERT_TRUE(free_name.ok());
    EXPECT_EQ(free_name.value(), test_dir_ / "README");
}

TEST_F(SafeMoverTest, MissingSourceIsNotFound) {
    SafeMover mover(logger_);
    auto result = mover.move(test_dir_ / "ghost.txt", test_dir_ / "out" / "ghost.txt");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::NOT_FOUND);
    EXPECT_FALSE(fs::exists(test_dir_ / "out" / "ghost.txt"));
}

TEST_F(SafeMoverTest, MoveExactRefusesOccupiedDestination) {
    SafeMover mover(logger_);
    auto source = write_file("a.txt", "new");
    auto occupied = write_file("b.txt", "old");

    auto result = mover.move_exact(source, occupied);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::ALREADY_EXISTS);
    EXPECT_EQ(read_file(source), "new");
    EXPECT_EQ(read_file(occupied), "old");
}

TEST_F(SafeMoverTest, MoveExactRestoresOriginalPath) {
    SafeMover mover(logger_);
    auto source = write_file("moved/a.txt", "payload");
    auto original = test_dir_ / "was" / "here" / "a.txt";

    auto result = mover.move_exact(source, original);
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    EXPECT_FALSE(fs::exists(source));
    EXPECT_EQ(read_file(original), "payload");
}
