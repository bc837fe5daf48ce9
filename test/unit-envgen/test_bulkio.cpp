#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <ostream>
#include <sstream>
#include <string>

#include "io/bulkio.hpp"

TEST(bulkio, stream) {
    std::stringstream in("line one\nline two\n");
    EXPECT_EQ("line one\nline two\n", io::read_all(in));

    std::stringstream out;
    io::write_all("abc", out);
    EXPECT_EQ("abc", out.str());
}

TEST(bulkio, write_if_changed) {
    std::string path = ::testing::TempDir() + "envgen_write_if_changed.hpp";
    std::remove(path.c_str());

    EXPECT_TRUE(io::write_if_changed("first\n", path));
    EXPECT_EQ("first\n", io::read_all(path));

    // Same content: left alone.
    EXPECT_FALSE(io::write_if_changed("first\n", path));

    EXPECT_TRUE(io::write_if_changed("second\n", path));
    EXPECT_EQ("second\n", io::read_all(path));

    std::remove(path.c_str());
}

TEST(bulkio, errors) {
    EXPECT_THROW(io::read_all(std::string("no/such/directory/file")), io::bulkio_error);
    EXPECT_THROW(io::write_all("x", std::string("no/such/directory/file")), io::bulkio_error);
}

TEST(bulkio, short_write) {
    // A stream with no buffer accepts nothing.
    std::ostream nowhere(nullptr);
    EXPECT_THROW(io::write_all("abc", nowhere), io::bulkio_error);

    // Writes to /dev/full fail with ENOSPC once flushed.
    if (std::ifstream("/dev/full")) {
        EXPECT_THROW(io::write_all(std::string(1<<16, 'x'), std::string("/dev/full")), io::bulkio_error);
    }
}
