/**
 * @file UniqueFdTest.cpp
 * @brief Unit tests for UniqueFd RAII wrapper
 */

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <fwfile/util/UniqueFd.hpp>

using namespace FwFile::detail;

class UniqueFdTest : public ::testing::Test {
  protected:
    void SetUp() override {
        testFile_ = "./test_uniquefd.tmp";
        ::remove(testFile_.c_str());
    }

    void TearDown() override { ::remove(testFile_.c_str()); }

    std::string testFile_;
};

TEST_F(UniqueFdTest, DefaultConstructor) {
    UniqueFd fd;
    EXPECT_EQ(fd.get(), -1);
    EXPECT_FALSE(fd.valid());
    EXPECT_FALSE(static_cast<bool>(fd));
}

TEST_F(UniqueFdTest, DestructorClosesFd) {
    int rawFd = ::open(testFile_.c_str(), O_CREAT | O_RDWR, 0644);
    ASSERT_GE(rawFd, 0);

    {
        UniqueFd fd(rawFd);
        EXPECT_TRUE(fd.valid());
    }

    EXPECT_EQ(::write(rawFd, "x", 1), -1);
}

TEST_F(UniqueFdTest, MoveConstructor) {
    int rawFd = ::open(testFile_.c_str(), O_CREAT | O_RDWR, 0644);
    ASSERT_GE(rawFd, 0);

    UniqueFd fd1(rawFd);
    UniqueFd fd2(std::move(fd1));

    EXPECT_EQ(fd1.get(), -1);
    EXPECT_EQ(fd2.get(), rawFd);
}

TEST_F(UniqueFdTest, Release) {
    int rawFd = ::open(testFile_.c_str(), O_CREAT | O_RDWR, 0644);
    ASSERT_GE(rawFd, 0);

    UniqueFd fd(rawFd);
    int released = fd.release();

    EXPECT_EQ(released, rawFd);
    EXPECT_FALSE(fd.valid());
    ::close(released);
}

TEST_F(UniqueFdTest, OpenSetsCloexec) {
    std::error_code ec;
    UniqueFd fd = UniqueFd::open(testFile_, O_CREAT | O_RDWR, 0644, ec);
    ASSERT_TRUE(fd) << ec.message();

    int flags = ::fcntl(fd.get(), F_GETFD);
    ASSERT_GE(flags, 0);
    EXPECT_TRUE(flags & FD_CLOEXEC);
}

TEST_F(UniqueFdTest, OpenMissingFileReportsErrno) {
    std::error_code ec;
    UniqueFd fd = UniqueFd::open("./no_such_dir/none.tmp", O_RDONLY, 0, ec);

    EXPECT_FALSE(fd);
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

TEST_F(UniqueFdTest, WriteAllThenReadAll) {
    std::error_code ec;
    std::string payload(10000, 'x');
    payload += "\r\nend";
    {
        UniqueFd fd = UniqueFd::open(testFile_, O_CREAT | O_WRONLY | O_TRUNC, 0644, ec);
        ASSERT_TRUE(fd) << ec.message();
        ASSERT_TRUE(fd.writeAll(payload, ec)) << ec.message();
        ASSERT_TRUE(fd.close(ec)) << ec.message();
        EXPECT_FALSE(fd.valid());
    }

    UniqueFd fd = UniqueFd::open(testFile_, O_RDONLY, 0, ec);
    ASSERT_TRUE(fd) << ec.message();
    std::string back;
    ASSERT_TRUE(fd.readAll(back, ec)) << ec.message();
    EXPECT_EQ(back, payload);
}

TEST_F(UniqueFdTest, CloseOnInvalidIsNoop) {
    UniqueFd fd;
    std::error_code ec;
    EXPECT_TRUE(fd.close(ec));
    EXPECT_FALSE(ec);
}
