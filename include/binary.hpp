#ifndef _BINARY_HPP_
#define _BINARY_HPP_

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace binary {

class TruncatedStream : public std::runtime_error {
  public:
    explicit TruncatedStream(size_t position);

    [[nodiscard]] size_t position() const noexcept;

  private:
    size_t position_;
};

// Forward-only reader over an in-memory byte sequence. Every read advances
// the position by exactly the number of bytes it consumed.
class ByteCursor {
  public:
    explicit ByteCursor(std::span<const uint8_t> data) noexcept;

    [[nodiscard]] bool done() const noexcept;
    [[nodiscard]] size_t position() const noexcept;

    uint8_t nextByte();
    uint8_t nextUnsigned8();
    uint16_t nextUnsigned16();

    // wide: two bytes little-endian; otherwise one byte sign-extended.
    int16_t nextSigned16(bool wide);

  private:
    std::span<const uint8_t> data_;
    size_t position_ = 0;
};

[[nodiscard]] std::vector<uint8_t> fromFile(std::string_view filepath);

} // namespace binary

#endif
