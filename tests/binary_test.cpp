#include <binary.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <vector>

namespace {

TEST(ByteCursor, ReadsBytesInOrder) {
    std::vector<uint8_t> data{0x12, 0x34};
    binary::ByteCursor cursor(data);
    EXPECT_EQ(cursor.nextByte(), 0x12);
    EXPECT_EQ(cursor.position(), 1u);
    EXPECT_EQ(cursor.nextUnsigned8(), 0x34);
    EXPECT_TRUE(cursor.done());
}

TEST(ByteCursor, WideSignedReadIsLittleEndian) {
    std::vector<uint8_t> data{0xFE, 0xFF, 0x10, 0x27};
    binary::ByteCursor cursor(data);
    EXPECT_EQ(cursor.nextSigned16(true), -2);
    EXPECT_EQ(cursor.nextSigned16(true), 10000);
    EXPECT_EQ(cursor.position(), 4u);
}

TEST(ByteCursor, NarrowSignedReadSignExtends) {
    std::vector<uint8_t> data{0x80, 0x7F};
    binary::ByteCursor cursor(data);
    EXPECT_EQ(cursor.nextSigned16(false), -128);
    EXPECT_EQ(cursor.nextSigned16(false), 127);
    EXPECT_EQ(cursor.position(), 2u);
}

TEST(ByteCursor, UnsignedWideRead) {
    std::vector<uint8_t> data{0x78, 0x56};
    binary::ByteCursor cursor(data);
    EXPECT_EQ(cursor.nextUnsigned16(), 0x5678);
}

TEST(ByteCursor, ReadPastEndThrows) {
    std::vector<uint8_t> data{0x01};
    binary::ByteCursor cursor(data);
    try {
        cursor.nextSigned16(true);
        FAIL() << "expected TruncatedStream";
    } catch (const binary::TruncatedStream &e) {
        EXPECT_EQ(e.position(), 1u);
    }
}

TEST(ByteCursor, EmptyInputIsDone) {
    binary::ByteCursor cursor(std::span<const uint8_t>{});
    EXPECT_TRUE(cursor.done());
    EXPECT_THROW(cursor.nextByte(), binary::TruncatedStream);
}

TEST(FromFile, ReadsWholeFile) {
    auto path = std::filesystem::temp_directory_path() / "disasm86_from_file.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out.put(static_cast<char>(0x89));
        out.put(static_cast<char>(0xD8));
    }
    auto data = binary::fromFile(path.string());
    std::filesystem::remove(path);
    EXPECT_EQ(data, (std::vector<uint8_t>{0x89, 0xD8}));
}

TEST(FromFile, MissingFileThrows) {
    EXPECT_THROW(binary::fromFile("/nonexistent/disasm86/input.bin"),
                 std::runtime_error);
}

} // namespace
