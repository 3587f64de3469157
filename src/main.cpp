#include <binary.hpp>
#include <disassemble.hpp>

#include <fmt/core.h>

#include <cstdio>
#include <exception>

int main(int argc, char *argv[]) {
    if (argc < 2) {
        fmt::print(stderr, "Usage: {} <filename>\n", argv[0]);
        return 1;
    }
    try {
        auto code = binary::fromFile(argv[1]);
        fmt::print("{}", disassemble::disassemble8086(code));
    } catch (const std::exception &e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
    return 0;
}
