#include <gtest/gtest.h>
#include "io/Reader.hpp"
#include "test_utils.hpp"

#include <fstream>
#include <unistd.h>

static fs::path write_tmp(const std::string& name, const std::string& data) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream file(path, std::ios::binary);
    file.write(data.data(), data.size());
    return path;
}

TEST(Reader, open_not_existing_file) {
    EXPECT_THROW(Reader reader("not_existing_file"), std::runtime_error);
}

TEST(Reader, open_directory) {
    EXPECT_THROW(Reader reader(fs::temp_directory_path()), std::runtime_error);
}

TEST(Reader, normal_read) {
    const fs::path path = write_tmp("ccfinder_reader_test.txt", "hello\nworld\n");
    Reader reader(path);
    EXPECT_EQ(path.string(), reader.name());
    EXPECT_EQ(12u, reader.size());

    char buf[0x100];
    bool eof = true;
    EXPECT_EQ(12u, reader.read(buf, sizeof(buf), eof));
    EXPECT_FALSE(eof);
    EXPECT_EQ("hello\nworld\n", std::string(buf, 12));

    EXPECT_EQ(0u, reader.read(buf, sizeof(buf), eof));
    EXPECT_TRUE(eof);
}

TEST(Reader, partial_read) {
    const fs::path path = write_tmp("ccfinder_reader_test.txt", "0123456789");
    Reader reader(path);

    char buf[4];
    bool eof = false;
    std::string result;
    while (size_t n = reader.read(buf, sizeof(buf), eof)) {
        result.append(buf, n);
    }
    EXPECT_TRUE(eof);
    EXPECT_EQ("0123456789", result);
}

TEST(Reader, empty_file) {
    const fs::path path = write_tmp("ccfinder_reader_empty.txt", "");
    Reader reader(path);
    EXPECT_EQ(0u, reader.size());

    char buf[16];
    bool eof = false;
    EXPECT_EQ(0u, reader.read(buf, sizeof(buf), eof));
    EXPECT_TRUE(eof);
}

TEST(Reader, pipe) {
    int fds[2];
    ASSERT_EQ(0, pipe(fds));
    ASSERT_EQ(3, write(fds[1], "abc", 3));
    close(fds[1]);

    {
        Reader reader(fds[0], "<pipe>");
        EXPECT_EQ("<pipe>", reader.name());
        EXPECT_EQ(0u, reader.size());

        char buf[16];
        bool eof = false;
        EXPECT_EQ(3u, reader.read(buf, sizeof(buf), eof));
        EXPECT_EQ(0u, reader.read(buf, sizeof(buf), eof));
        EXPECT_TRUE(eof);
    }

    // not owned, still open
    EXPECT_EQ(0, close(fds[0]));
}

TEST(Reader, bad_fd) {
    EXPECT_THROW(Reader reader(-1, "<bad fd>"), std::runtime_error);
}

TEST(Reader, regular_file_fd_has_size) {
    const fs::path path = write_tmp("ccfinder_reader_test.txt", "0123456789");
    int fd = open(path.c_str(), O_RDONLY);
    ASSERT_NE(-1, fd);
    {
        Reader reader(fd, "<fd>");
        EXPECT_EQ(10u, reader.size());
    }
    EXPECT_EQ(0, close(fd));
}

TEST(Reader, read_error) {
    // open() on a directory succeeds, read() fails with EISDIR
    int fd = open(fs::temp_directory_path().c_str(), O_RDONLY | O_DIRECTORY);
    ASSERT_NE(-1, fd);
    {
        Reader reader(fd, "<dir>");
        char buf[16];
        bool eof = false;
        EXPECT_THROW(reader.read(buf, sizeof(buf), eof), Reader::ReadError);
    }
    close(fd);
}
