#include <binary.hpp>

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <string>

namespace binary {

TruncatedStream::TruncatedStream(size_t position)
    : std::runtime_error(fmt::format(
          "Unexpected end of input at byte {}", position)),
      position_(position) {}

size_t TruncatedStream::position() const noexcept { return position_; }

ByteCursor::ByteCursor(std::span<const uint8_t> data) noexcept : data_(data) {}

bool   ByteCursor::done()     const noexcept { return position_ >= data_.size(); }
size_t ByteCursor::position() const noexcept { return position_; }

uint8_t ByteCursor::nextByte() {
    if (done()) {
        throw TruncatedStream(position_);
    }
    return data_[position_++];
}

uint8_t ByteCursor::nextUnsigned8() { return nextByte(); }

uint16_t ByteCursor::nextUnsigned16() {
    uint16_t lo = nextByte();
    uint16_t hi = nextByte();
    return static_cast<uint16_t>(lo | (hi << 8));
}

int16_t ByteCursor::nextSigned16(bool wide) {
    if (wide) {
        return static_cast<int16_t>(nextUnsigned16());
    }
    return static_cast<int8_t>(nextByte());
}

[[nodiscard]] std::vector<uint8_t> fromFile(std::string_view filepath) {
    std::string path(filepath);
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Unable to open file: " + path);
    }
    return std::vector<uint8_t>(
        std::istreambuf_iterator<char>(input),
        std::istreambuf_iterator<char>{}
    );
}

} // namespace binary
