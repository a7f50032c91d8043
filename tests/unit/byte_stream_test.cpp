#include <dropshade/io/byte_stream.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace dropshade::io;
using dropshade::core::ErrorCode;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() /
            ("dropshade_" + std::to_string(::getpid()) + "_" + name)).string();
}

}  // namespace

TEST(ByteStreamTest, ReadStreamReturnsAllBytes) {
    std::istringstream in(std::string("\x89PNG\0\x01\x02", 7));
    auto result = read_stream(in);
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.bytes.size(), 7u);
    EXPECT_EQ(result.bytes[0], 0x89);
    EXPECT_EQ(result.bytes[4], 0x00);
}

TEST(ByteStreamTest, EmptyStreamIsEmptyInput) {
    std::istringstream in("");
    auto result = read_stream(in);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.code, ErrorCode::EmptyInput);
}

TEST(ByteStreamTest, MissingFileIsReadFailure) {
    auto result = read_file(temp_path("does_not_exist.png"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.code, ErrorCode::ReadFailed);
    EXPECT_NE(result.error.message.find("does_not_exist"), std::string::npos);
}

TEST(ByteStreamTest, WriteThenReadFile) {
    const std::string path = temp_path("roundtrip.bin");
    const std::vector<std::uint8_t> bytes = {0, 1, 2, 255, 254, 10, 13};
    ASSERT_FALSE(write_file(path, bytes).is_error());

    auto result = read_file(path);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.bytes, bytes);
    std::filesystem::remove(path);
}

TEST(ByteStreamTest, WriteIntoMissingDirectoryFails) {
    const std::string path = temp_path("no_such_dir") + "/out.png";
    const auto error = write_file(path, {1, 2, 3});
    EXPECT_TRUE(error.is_error());
    EXPECT_EQ(error.code, ErrorCode::WriteFailed);
}

TEST(ByteStreamTest, WriteStream) {
    std::ostringstream out;
    const auto error = write_stream(out, {'a', 'b', 'c'});
    EXPECT_FALSE(error.is_error());
    EXPECT_EQ(out.str(), "abc");
}
