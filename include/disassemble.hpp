#ifndef _DISASSEMBLE_HPP_
#define _DISASSEMBLE_HPP_

#include <cstdint>
#include <span>
#include <string>

namespace disassemble {

// Assembler source for an 8086 byte stream, starting with "bits 16".
std::string disassemble8086(const std::span<const uint8_t> code);

};

#endif
