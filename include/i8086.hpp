#ifndef _I8086_HPP_
#define _I8086_HPP_

#include <binary.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace disassemble {

namespace I8086 {

// clang-format off
constexpr std::string_view registerNames[2][8] = {
	{ "al", "cl", "dl", "bl", "ah", "ch", "dh", "bh" },
	{ "ax", "cx", "dx", "bx", "sp", "bp", "si", "di" },
};
constexpr std::string_view baseRegisterNames[8] = {
	"bx + si", "bx + di", "bp + si", "bp + di", "si", "di", "bp", "bx",
};
constexpr std::string_view segmentNames[4] = { "es", "cs", "ss", "ds" };
constexpr std::string_view arithmeticNames[8] = { "add", "or", "adc", "sbb", "and", "sub", "xor", "cmp" };
constexpr std::string_view shiftNames[8]      = { "rol", "ror", "rcl", "rcr", "shl", "shr", "", "sar" };
constexpr std::string_view unaryNames[8]      = { "test", "", "not", "neg", "mul", "imul", "div", "idiv" };
constexpr std::string_view registerOpNames[4] = { "inc", "dec", "push", "pop" };
constexpr std::string_view conditionalJumpNames[16] = {
	"jo", "jno", "jb", "jnb", "je", "jne", "jbe", "jnbe",
	"js", "jns", "jp", "jnp", "jl", "jnl", "jle", "jnle",
};
constexpr std::string_view loopNames[4] = { "loopnz", "loopz", "loop", "jcxz" };
// clang-format on

constexpr std::string_view registerName(bool wide, uint8_t idx) {
	return registerNames[wide ? 1 : 0][idx & 0x7];
}

// Base name of a string operation (movs, cmps, stos, lods, scas), or an
// empty view when the byte is not one.
constexpr std::string_view stringOpName(uint8_t opcode) {
	constexpr std::string_view names[8] = {"",	   "",	   "movs", "cmps",
										   "",	   "stos", "lods", "scas"};
	if ((opcode & 0xF0) != 0xA0)
		return "";
	return names[(opcode >> 1) & 0x7];
}

struct ModRM {
	uint8_t mod;
	uint8_t reg;
	uint8_t rm;

	static ModRM decode(uint8_t byte) {
		return {
			.mod = static_cast<uint8_t>((byte >> 6) & 0x3),
			.reg = static_cast<uint8_t>((byte >> 3) & 0x7),
			.rm = static_cast<uint8_t>(byte & 0x7),
		};
	}

	bool isDirectRegister() const { return mod == 3; }
	bool isDirectAddress() const { return mod == 0 && rm == 6; }
};

class InvalidEncoding : public std::runtime_error {
  public:
	InvalidEncoding(size_t position, uint8_t byte, std::string_view reason);

	[[nodiscard]] size_t position() const noexcept;
	[[nodiscard]] uint8_t byte() const noexcept;

  private:
	size_t position_;
	uint8_t byte_;
};

// Operand text for a mod/rm pair. Consumes the displacement bytes, if any.
// A non-empty segment is written as an override inside the brackets.
std::string effectiveAddress(binary::ByteCursor &cursor, bool wide,
							 const ModRM &modrm, std::string_view segment = {});

// Modifiers that apply to the next decoded instruction only.
class PrefixState {
  public:
	void setSegment(std::string_view name) noexcept;
	void setLock() noexcept;

	[[nodiscard]] bool pending() const noexcept;

	// Each take returns the pending value and clears it.
	std::string_view takeSegment() noexcept;
	bool takeLock() noexcept;

	// Whatever was not taken, as leading prefix words ("lock ", "es ").
	// Clears the state.
	std::string takeRemaining();

  private:
	std::optional<std::string_view> segment_;
	bool lock_ = false;
};

struct Branch {
	int64_t target;
	int16_t displacement;
};

struct DecodedInstruction {
	// Complete line without terminator. For branches this is the part in
	// front of the target operand.
	std::string text;
	size_t length = 0;
	std::optional<Branch> branch;
};

enum class Family : uint8_t {
	RegMemory,
	LoadAddress,
	SegmentMove,
	ImmediateRegMemory,
	Shift,
	Unary,
	Group,
	ImmediateRegister,
	Accumulator,
	Register,
	ExchangeAccumulator,
	SegmentStack,
	SegmentPrefix,
	LockPrefix,
	Repeat,
	ShortBranch,
	NearBranch,
	FarBranch,
	PortDx,
	ReturnImmediate,
	Interrupt,
	AsciiAdjust,
	Fixed,
};

// First family in priority order whose (mask, pattern) matches the byte.
// Never fails: the last entry matches everything.
Family classify(uint8_t opcode);

class InstructionDecoder {
  public:
	explicit InstructionDecoder(std::span<const uint8_t> code) : cursor_(code) {}

	bool done() const { return cursor_.done(); }
	size_t offset() const { return cursor_.position(); }

	// Decodes one instruction together with any prefixes in front of it.
	DecodedInstruction decode();

  private:
	binary::ByteCursor cursor_;
	PrefixState prefixes_;
	size_t start_ = 0;

	std::string rmOperand(const ModRM &modrm, bool wide);
	[[noreturn]] void invalid(uint8_t byte, std::string_view reason) const;

	DecodedInstruction decodeRegMemory(uint8_t opcode, bool locked);
	DecodedInstruction decodeLoadAddress(uint8_t opcode);
	DecodedInstruction decodeSegmentMove(uint8_t opcode);
	DecodedInstruction decodeImmediateRegMemory(uint8_t opcode);
	DecodedInstruction decodeShift(uint8_t opcode);
	DecodedInstruction decodeUnary(uint8_t opcode);
	DecodedInstruction decodeGroup(uint8_t opcode);
	DecodedInstruction decodeImmediateRegister(uint8_t opcode);
	DecodedInstruction decodeAccumulator(uint8_t opcode);
	DecodedInstruction decodeRepeat(uint8_t opcode);
	DecodedInstruction decodeShortBranch(uint8_t opcode);
	DecodedInstruction decodeNearBranch(uint8_t opcode);
	DecodedInstruction decodeFarBranch(uint8_t opcode);
	DecodedInstruction decodeAsciiAdjust(uint8_t opcode);
	DecodedInstruction decodeFixed(uint8_t opcode);
};

// Target position -> symbolic name, named in first-seen order.
class LabelTable {
  public:
	std::string_view request(int64_t target);

	[[nodiscard]] const std::string *find(int64_t target) const noexcept;
	[[nodiscard]] size_t size() const noexcept;

  private:
	std::map<int64_t, std::string> names_;
};

class Listing {
  public:
	void insert(size_t position, DecodedInstruction instruction);

	LabelTable &labels() noexcept;
	[[nodiscard]] const LabelTable &labels() const noexcept;
	[[nodiscard]] const std::map<size_t, DecodedInstruction> &
	instructions() const noexcept;

	// A target resolves when it is the start of a decoded instruction.
	[[nodiscard]] const std::string *resolve(int64_t target) const noexcept;

	[[nodiscard]] std::string emit() const;

  private:
	std::map<size_t, DecodedInstruction> instructions_;
	LabelTable labels_;
};

Listing decode(std::span<const uint8_t> code);

}; // namespace I8086

}; // namespace disassemble

#endif
