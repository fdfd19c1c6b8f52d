#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "io/Reader.hpp"

#include <cstring>

TEST(Reader, open_not_existing_file) {
    EXPECT_THROW(Reader reader("not_existing_file"), Reader::ReadError);
}

TEST(Reader, size_of_regular_file) {
    auto fname = write_temp_file("hexlines_reader_size.bin", std::string(0x1234, 'x'));
    Reader reader(fname);
    EXPECT_FALSE(reader.is_stream());
    EXPECT_EQ(0x1234, reader.size());
}

TEST(Reader, read_all) {
    std::string data("\x00\x01\x02\x03\x04\x05\x06\x07", 8);
    auto fname = write_temp_file("hexlines_reader_all.bin", data);
    Reader reader(fname);
    std::vector<uint8_t> buf = reader.read_all();
    ASSERT_EQ(8, buf.size());
    EXPECT_EQ(0, memcmp(buf.data(), data.data(), 8));
}

TEST(Reader, read_window) {
    auto fname = write_temp_file("hexlines_reader_window.bin", "0123456789");
    Reader reader(fname);
    std::vector<uint8_t> buf = reader.read_all(2, 3);
    EXPECT_EQ(std::string("234"), std::string(buf.begin(), buf.end()));
}

TEST(Reader, read_window_past_eof) {
    auto fname = write_temp_file("hexlines_reader_past.bin", "0123456789");
    Reader reader(fname);
    std::vector<uint8_t> buf = reader.read_all(8, 0x100);
    EXPECT_EQ(std::string("89"), std::string(buf.begin(), buf.end()));
    EXPECT_TRUE(reader.read_all(10).empty());
    EXPECT_TRUE(reader.read_all(0x1000).empty());
}

TEST(Reader, empty_file) {
    auto fname = write_temp_file("hexlines_reader_empty.bin", "");
    Reader reader(fname);
    EXPECT_EQ(0, reader.size());
    EXPECT_TRUE(reader.read_all().empty());
}

TEST(Reader, partial_read_at) {
    auto fname = write_temp_file("hexlines_reader_partial.bin", std::string(0x1000, 'a'));
    Reader reader(fname);
    char buf[0x2000];
    EXPECT_EQ(0x1000, reader.read_at(0, buf, sizeof(buf)));
    EXPECT_EQ(0x0f00, reader.read_at(0x100, buf, sizeof(buf)));
    EXPECT_EQ(0, reader.read_at(0x1000, buf, sizeof(buf)));
}

TEST(Reader, stdin_pipe_is_stream) {
    with_stdin_pipe("0123456789", [](){
        Reader reader("-");
        EXPECT_TRUE(reader.is_stream());
        EXPECT_EQ(0, reader.size());
        std::vector<uint8_t> buf = reader.read_all();
        EXPECT_EQ(std::string("0123456789"), std::string(buf.begin(), buf.end()));
    });
}

TEST(Reader, stdin_pipe_window) {
    with_stdin_pipe("0123456789", [](){
        Reader reader("-");
        std::vector<uint8_t> buf = reader.read_all(2, 3);
        EXPECT_EQ(std::string("234"), std::string(buf.begin(), buf.end()));
    });
}

TEST(Reader, stdin_pipe_window_to_end) {
    with_stdin_pipe("0123456789", [](){
        Reader reader("-");
        std::vector<uint8_t> buf = reader.read_all(8, 0x100);
        EXPECT_EQ(std::string("89"), std::string(buf.begin(), buf.end()));
    });
}

TEST(Reader, stdin_pipe_offset_past_end) {
    with_stdin_pipe("0123456789", [](){
        Reader reader("-");
        EXPECT_TRUE(reader.read_all(10).empty());
    });
}

TEST(Reader, stdin_pipe_empty) {
    with_stdin_pipe("", [](){
        Reader reader("-");
        EXPECT_TRUE(reader.is_stream());
        EXPECT_TRUE(reader.read_all().empty());
    });
}

TEST(Reader, stdin_pipe_window_at_tail) {
    std::string data(0x8000, 'z');
    data += std::string(0x10, 'y');
    with_stdin_pipe(data, [&](){
        Reader reader("-");
        std::vector<uint8_t> buf = reader.read_all(0x7ff8);
        EXPECT_EQ(std::string(8, 'z') + std::string(0x10, 'y'), std::string(buf.begin(), buf.end()));
    });
}

TEST(Reader, read_at_on_stream) {
    with_stdin_pipe("0123", [](){
        Reader reader("-");
        char buf[4];
        EXPECT_THROW(reader.read_at(0, buf, sizeof(buf)), Reader::ReadError);
    });
}
