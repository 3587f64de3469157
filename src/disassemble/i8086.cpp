#include <i8086.hpp>

#include <fmt/format.h>

namespace disassemble {

namespace I8086 {

struct OpcodeFamily {
	uint8_t mask;
	uint8_t pattern;
	Family family;
};

// Priority order matters: several patterns are subsets of later ones
// (nop inside xchg-with-ax, everything inside the final catch-all).
// clang-format off
constexpr OpcodeFamily opcodeTable[] = {
	// --- Register/memory with register ---
	{0xFC, 0x88, Family::RegMemory},           // 100010dw mov
	{0xC4, 0x00, Family::RegMemory},           // 00ooo0dw add, or, adc, sbb, and, sub, xor, cmp
	{0xFE, 0x84, Family::RegMemory},           // 1000010w test
	{0xFE, 0x86, Family::RegMemory},           // 1000011w xchg
	{0xFF, 0x8D, Family::LoadAddress},         // lea
	{0xFF, 0xC5, Family::LoadAddress},         // lds
	{0xFF, 0xC4, Family::LoadAddress},         // les
	{0xFD, 0x8C, Family::SegmentMove},         // 100011d0 mov sreg

	// --- Immediate to register/memory, grouped ops ---
	{0xFE, 0xC6, Family::ImmediateRegMemory},  // 1100011w mov
	{0xFC, 0x80, Family::ImmediateRegMemory},  // 100000sw add, or, ...
	{0xFC, 0xD0, Family::Shift},               // 110100vw rol, ror, ...
	{0xFE, 0xF6, Family::Unary},               // 1111011w test, not, neg, mul, ...
	{0xFE, 0xFE, Family::Group},               // 1111111w inc, dec, call, jmp, push
	{0xFF, 0x8F, Family::Group},               // pop r/m

	// --- Immediate to register ---
	{0xF0, 0xB0, Family::ImmediateRegister},   // 1011wreg mov

	// --- Accumulator forms ---
	{0xFC, 0xA0, Family::Accumulator},         // 101000dw mov direct address
	{0xC6, 0x04, Family::Accumulator},         // 00ooo10w add, or, ...
	{0xFE, 0xA8, Family::Accumulator},         // 1010100w test
	{0xFC, 0xE4, Family::Accumulator},         // 111001dw in, out

	// --- Register in the opcode byte ---
	{0xE0, 0x40, Family::Register},            // 010oo reg inc, dec, push, pop
	{0xFF, 0x90, Family::Fixed},               // nop
	{0xF8, 0x90, Family::ExchangeAccumulator}, // 10010reg xchg ax

	// --- Segment registers and prefixes ---
	{0xE6, 0x06, Family::SegmentStack},        // 000ss11o push/pop sreg
	{0xE7, 0x26, Family::SegmentPrefix},       // 001ss110 es, cs, ss, ds
	{0xFF, 0xF0, Family::LockPrefix},
	{0xFE, 0xF2, Family::Repeat},              // repne, rep

	// --- Control transfer ---
	{0xF0, 0x70, Family::ShortBranch},         // jcc
	{0xFC, 0xE0, Family::ShortBranch},         // loopnz, loopz, loop, jcxz
	{0xFF, 0xEB, Family::ShortBranch},         // jmp short
	{0xFE, 0xE8, Family::NearBranch},          // call, jmp near
	{0xFF, 0x9A, Family::FarBranch},           // call seg:off
	{0xFF, 0xEA, Family::FarBranch},           // jmp seg:off

	// --- Remaining forms with operands ---
	{0xFC, 0xEC, Family::PortDx},              // 111011ow in/out dx
	{0xF7, 0xC2, Family::ReturnImmediate},     // ret, retf imm16
	{0xFF, 0xCD, Family::Interrupt},           // int imm8
	{0xFE, 0xD4, Family::AsciiAdjust},         // aam, aad

	{0x00, 0x00, Family::Fixed},
};

struct FixedEntry {
	uint8_t opcode;
	std::string_view mnemonic;
};

constexpr FixedEntry fixedTable[] = {
	{0x27, "daa"},   {0x2F, "das"},   {0x37, "aaa"},   {0x3F, "aas"},
	{0x90, "nop"},   {0x98, "cbw"},   {0x99, "cwd"},   {0x9B, "wait"},
	{0x9C, "pushf"}, {0x9D, "popf"},  {0x9E, "sahf"},  {0x9F, "lahf"},
	{0xA4, "movsb"}, {0xA5, "movsw"}, {0xA6, "cmpsb"}, {0xA7, "cmpsw"},
	{0xAA, "stosb"}, {0xAB, "stosw"}, {0xAC, "lodsb"}, {0xAD, "lodsw"},
	{0xAE, "scasb"}, {0xAF, "scasw"},
	{0xC3, "ret"},   {0xCB, "retf"},  {0xCC, "int3"},  {0xCE, "into"},
	{0xCF, "iret"},  {0xD7, "xlat"},
	{0xF4, "hlt"},   {0xF5, "cmc"},   {0xF8, "clc"},   {0xF9, "stc"},
	{0xFA, "cli"},   {0xFB, "sti"},   {0xFC, "cld"},   {0xFD, "std"},
};
// clang-format on

Family classify(uint8_t opcode) {
	for (const auto &e : opcodeTable) {
		if ((opcode & e.mask) == e.pattern)
			return e.family;
	}
	return Family::Fixed;
}

static std::string_view unitName(bool wide) { return wide ? "word" : "byte"; }

InvalidEncoding::InvalidEncoding(size_t position, uint8_t byte,
								 std::string_view reason)
	: std::runtime_error(fmt::format(
		  "Invalid encoding at byte {}: {:#04x} ({})", position, byte, reason)),
	  position_(position), byte_(byte) {}

size_t InvalidEncoding::position() const noexcept { return position_; }
uint8_t InvalidEncoding::byte() const noexcept { return byte_; }

void InstructionDecoder::invalid(uint8_t byte, std::string_view reason) const {
	throw InvalidEncoding(start_, byte, reason);
}

std::string InstructionDecoder::rmOperand(const ModRM &modrm, bool wide) {
	// A register operand leaves any segment override pending.
	std::string_view segment =
		modrm.isDirectRegister() ? std::string_view{} : prefixes_.takeSegment();
	return effectiveAddress(cursor_, wide, modrm, segment);
}

DecodedInstruction InstructionDecoder::decode() {
	start_ = cursor_.position();

	uint8_t opcode = cursor_.nextByte();
	Family family = classify(opcode);
	while (family == Family::SegmentPrefix || family == Family::LockPrefix) {
		if (family == Family::SegmentPrefix)
			prefixes_.setSegment(segmentNames[(opcode >> 3) & 0x3]);
		else
			prefixes_.setLock();
		opcode = cursor_.nextByte();
		family = classify(opcode);
	}

	bool locked = prefixes_.takeLock();
	bool wide = (opcode & 1) != 0;

	DecodedInstruction inst;
	switch (family) {
	case Family::RegMemory:
		inst = decodeRegMemory(opcode, locked);
		break;
	case Family::LoadAddress:
		inst = decodeLoadAddress(opcode);
		break;
	case Family::SegmentMove:
		inst = decodeSegmentMove(opcode);
		break;
	case Family::ImmediateRegMemory:
		inst = decodeImmediateRegMemory(opcode);
		break;
	case Family::Shift:
		inst = decodeShift(opcode);
		break;
	case Family::Unary:
		inst = decodeUnary(opcode);
		break;
	case Family::Group:
		inst = decodeGroup(opcode);
		break;
	case Family::ImmediateRegister:
		inst = decodeImmediateRegister(opcode);
		break;
	case Family::Accumulator:
		inst = decodeAccumulator(opcode);
		break;
	case Family::Register:
		inst.text = fmt::format("{} {}", registerOpNames[(opcode >> 3) & 0x3],
								registerName(true, opcode));
		break;
	case Family::ExchangeAccumulator:
		inst.text = fmt::format("xchg ax, {}", registerName(true, opcode));
		break;
	case Family::SegmentStack:
		inst.text = fmt::format("{} {}", (opcode & 1) ? "pop" : "push",
								segmentNames[(opcode >> 3) & 0x3]);
		break;
	case Family::Repeat:
		inst = decodeRepeat(opcode);
		break;
	case Family::ShortBranch:
		inst = decodeShortBranch(opcode);
		break;
	case Family::NearBranch:
		inst = decodeNearBranch(opcode);
		break;
	case Family::FarBranch:
		inst = decodeFarBranch(opcode);
		break;
	case Family::PortDx:
		if (opcode & 0x2)
			inst.text = fmt::format("out dx, {}", registerName(wide, 0));
		else
			inst.text = fmt::format("in {}, dx", registerName(wide, 0));
		break;
	case Family::ReturnImmediate:
		inst.text = fmt::format("{} {}", (opcode & 0x8) ? "retf" : "ret",
								cursor_.nextSigned16(true));
		break;
	case Family::Interrupt:
		inst.text = fmt::format("int {}", cursor_.nextUnsigned8());
		break;
	case Family::AsciiAdjust:
		inst = decodeAsciiAdjust(opcode);
		break;
	case Family::SegmentPrefix:
	case Family::LockPrefix:
	case Family::Fixed:
		inst = decodeFixed(opcode);
		break;
	}

	std::string leading = locked ? "lock " : "";
	leading += prefixes_.takeRemaining();
	inst.text.insert(0, leading);
	inst.length = cursor_.position() - start_;
	return inst;
}

DecodedInstruction InstructionDecoder::decodeRegMemory(uint8_t opcode,
													   bool locked) {
	bool direction = (opcode & 0x2) != 0;
	bool wide = (opcode & 0x1) != 0;
	auto modrm = ModRM::decode(cursor_.nextByte());

	std::string_view mnemonic;
	switch (opcode & 0xFE) {
	case 0x84:
		mnemonic = "test";
		break;
	case 0x86:
		mnemonic = "xchg";
		// LOCK needs the memory operand first; both orders share one
		// encoding, so the swap is invisible to the assembler.
		if (locked)
			direction = false;
		break;
	case 0x88:
	case 0x8A:
		mnemonic = "mov";
		break;
	default:
		mnemonic = arithmeticNames[(opcode >> 3) & 0x7];
		break;
	}

	std::string_view reg = registerName(wide, modrm.reg);
	std::string rm = rmOperand(modrm, wide);
	DecodedInstruction inst;
	if (direction)
		inst.text = fmt::format("{} {}, {}", mnemonic, reg, rm);
	else
		inst.text = fmt::format("{} {}, {}", mnemonic, rm, reg);
	return inst;
}

DecodedInstruction InstructionDecoder::decodeLoadAddress(uint8_t opcode) {
	// Register is always the word-sized destination.
	std::string_view mnemonic = opcode == 0x8D   ? "lea"
								: opcode == 0xC5 ? "lds"
												 : "les";
	auto modrm = ModRM::decode(cursor_.nextByte());
	if (modrm.isDirectRegister())
		invalid(opcode, "memory operand required");
	std::string rm = rmOperand(modrm, true);
	return {.text = fmt::format("{} {}, {}", mnemonic,
								registerName(true, modrm.reg), rm)};
}

DecodedInstruction InstructionDecoder::decodeSegmentMove(uint8_t opcode) {
	auto modrm = ModRM::decode(cursor_.nextByte());
	if (modrm.reg > 3)
		invalid(opcode, "segment register field out of range");
	std::string_view segment = segmentNames[modrm.reg];
	std::string rm = rmOperand(modrm, true);
	if (opcode & 0x2)
		return {.text = fmt::format("mov {}, {}", segment, rm)};
	return {.text = fmt::format("mov {}, {}", rm, segment)};
}

DecodedInstruction InstructionDecoder::decodeImmediateRegMemory(uint8_t opcode) {
	bool mov = (opcode & 0xFE) == 0xC6;
	bool signExtend = (opcode & 0x2) != 0;
	bool wide = (opcode & 0x1) != 0;
	auto modrm = ModRM::decode(cursor_.nextByte());
	if (mov && modrm.reg != 0)
		invalid(opcode, "mov immediate requires reg field 0");

	std::string_view mnemonic = mov ? "mov" : arithmeticNames[modrm.reg];
	std::string rm = rmOperand(modrm, wide);
	// mov always carries full-width data; the arithmetic group sign-extends
	// a single data byte when s is set.
	int16_t data = cursor_.nextSigned16(wide && (mov || !signExtend));
	return {.text = fmt::format("{} {}, {} {}", mnemonic, rm, unitName(wide),
								data)};
}

DecodedInstruction InstructionDecoder::decodeShift(uint8_t opcode) {
	bool byCl = (opcode & 0x2) != 0;
	bool wide = (opcode & 0x1) != 0;
	auto modrm = ModRM::decode(cursor_.nextByte());
	std::string_view mnemonic = shiftNames[modrm.reg];
	if (mnemonic.empty())
		invalid(opcode, "reserved shift operation");

	std::string rm = rmOperand(modrm, wide);
	std::string_view count = byCl ? "cl" : "1";
	if (modrm.isDirectRegister())
		return {.text = fmt::format("{} {}, {}", mnemonic, rm, count)};
	return {.text = fmt::format("{} {} {}, {}", mnemonic, unitName(wide), rm,
								count)};
}

DecodedInstruction InstructionDecoder::decodeUnary(uint8_t opcode) {
	bool wide = (opcode & 0x1) != 0;
	auto modrm = ModRM::decode(cursor_.nextByte());
	std::string_view mnemonic = unaryNames[modrm.reg];
	if (mnemonic.empty())
		invalid(opcode, "reserved unary operation");

	std::string rm = rmOperand(modrm, wide);
	// TEST shares this leading byte but is the only one with data.
	if (modrm.reg == 0) {
		int16_t data = cursor_.nextSigned16(wide);
		return {.text = fmt::format("test {}, {} {}", rm, unitName(wide),
									data)};
	}
	if (modrm.isDirectRegister())
		return {.text = fmt::format("{} {}", mnemonic, rm)};
	return {.text = fmt::format("{} {} {}", mnemonic, unitName(wide), rm)};
}

DecodedInstruction InstructionDecoder::decodeGroup(uint8_t opcode) {
	bool wide = (opcode & 0x1) != 0;
	auto modrm = ModRM::decode(cursor_.nextByte());

	std::string_view mnemonic;
	bool far = false;
	if (opcode == 0x8F) {
		if (modrm.reg != 0)
			invalid(opcode, "pop requires reg field 0");
		mnemonic = "pop";
	} else if (!wide) {
		if (modrm.reg > 1)
			invalid(opcode, "byte group allows only inc and dec");
		mnemonic = registerOpNames[modrm.reg];
	} else {
		switch (modrm.reg) {
		case 0:
			mnemonic = "inc";
			break;
		case 1:
			mnemonic = "dec";
			break;
		case 3:
			far = true;
			[[fallthrough]];
		case 2:
			mnemonic = "call";
			break;
		case 5:
			far = true;
			[[fallthrough]];
		case 4:
			mnemonic = "jmp";
			break;
		case 6:
			mnemonic = "push";
			break;
		default:
			invalid(opcode, "reserved group operation");
		}
	}
	if (far && modrm.isDirectRegister())
		invalid(opcode, "memory operand required");

	std::string rm = rmOperand(modrm, wide);
	if (far)
		return {.text = fmt::format("{} far {}", mnemonic, rm)};
	if (modrm.isDirectRegister())
		return {.text = fmt::format("{} {}", mnemonic, rm)};
	return {.text = fmt::format("{} {} {}", mnemonic, unitName(wide), rm)};
}

DecodedInstruction InstructionDecoder::decodeImmediateRegister(uint8_t opcode) {
	bool wide = (opcode & 0x8) != 0;
	int16_t data = cursor_.nextSigned16(wide);
	return {.text = fmt::format("mov {}, {}", registerName(wide, opcode),
								data)};
}

DecodedInstruction InstructionDecoder::decodeAccumulator(uint8_t opcode) {
	bool mov = (opcode & 0xFC) == 0xA0;
	bool port = (opcode & 0xFC) == 0xE4;
	bool accumulatorFirst = (opcode & 0x2) == 0;
	bool wide = (opcode & 0x1) != 0;

	std::string_view mnemonic;
	if (mov)
		mnemonic = "mov";
	else if (port)
		mnemonic = accumulatorFirst ? "in" : "out";
	else if ((opcode & 0xFE) == 0xA8)
		mnemonic = "test";
	else
		mnemonic = arithmeticNames[(opcode >> 3) & 0x7];

	std::string value;
	if (port) {
		value = fmt::format("{}", cursor_.nextUnsigned8());
	} else if (mov) {
		std::string_view segment = prefixes_.takeSegment();
		int16_t address = cursor_.nextSigned16(true);
		if (segment.empty())
			value = fmt::format("[{}]", address);
		else
			value = fmt::format("[{}:{}]", segment, address);
	} else {
		value = fmt::format("{}", cursor_.nextSigned16(wide));
	}

	std::string_view accumulator = registerName(wide, 0);
	if (accumulatorFirst)
		return {.text = fmt::format("{} {}, {}", mnemonic, accumulator, value)};
	return {.text = fmt::format("{} {}, {}", mnemonic, value, accumulator)};
}

DecodedInstruction InstructionDecoder::decodeRepeat(uint8_t opcode) {
	uint8_t operation = cursor_.nextByte();
	// Segment and lock prefixes may sit between the repeat byte and the
	// string operation; they lead the line like any other prefix.
	for (Family family = classify(operation);
		 family == Family::SegmentPrefix || family == Family::LockPrefix;
		 family = classify(operation)) {
		if (family == Family::SegmentPrefix)
			prefixes_.setSegment(segmentNames[(operation >> 3) & 0x3]);
		else
			prefixes_.setLock();
		operation = cursor_.nextByte();
	}
	std::string_view name = stringOpName(operation);
	if (name.empty())
		invalid(operation, "repeat prefix without string operation");
	return {.text = fmt::format("{} {}{}", (opcode & 1) ? "rep" : "repne",
								name, (operation & 1) ? 'w' : 'b')};
}

DecodedInstruction InstructionDecoder::decodeShortBranch(uint8_t opcode) {
	std::string_view mnemonic;
	if ((opcode & 0xF0) == 0x70)
		mnemonic = conditionalJumpNames[opcode & 0xF];
	else if (opcode == 0xEB)
		mnemonic = "jmp short";
	else
		mnemonic = loopNames[opcode & 0x3];

	int16_t displacement = cursor_.nextSigned16(false);
	int64_t target = static_cast<int64_t>(cursor_.position()) + displacement;
	return {.text = std::string(mnemonic),
			.branch = Branch{.target = target, .displacement = displacement}};
}

DecodedInstruction InstructionDecoder::decodeNearBranch(uint8_t opcode) {
	int16_t displacement = cursor_.nextSigned16(true);
	int64_t target = static_cast<int64_t>(cursor_.position()) + displacement;
	return {.text = (opcode & 1) ? "jmp near" : "call",
			.branch = Branch{.target = target, .displacement = displacement}};
}

DecodedInstruction InstructionDecoder::decodeFarBranch(uint8_t opcode) {
	// Absolute address: offset first, then segment. No label.
	uint16_t offset = cursor_.nextUnsigned16();
	uint16_t segment = cursor_.nextUnsigned16();
	return {.text = fmt::format("{} {}:{}", opcode == 0x9A ? "call" : "jmp",
								segment, offset)};
}

DecodedInstruction InstructionDecoder::decodeAsciiAdjust(uint8_t opcode) {
	uint8_t sentinel = cursor_.nextByte();
	if (sentinel != 0x0A)
		invalid(sentinel, "ascii adjust expects 0x0a");
	return {.text = (opcode & 1) ? "aad" : "aam"};
}

DecodedInstruction InstructionDecoder::decodeFixed(uint8_t opcode) {
	for (const auto &e : fixedTable) {
		if (e.opcode == opcode)
			return {.text = std::string(e.mnemonic)};
	}
	// Unknown byte: keep going from the next one.
	return {.text = fmt::format("; unknown opcode {:08b}", opcode)};
}

}; // namespace I8086

}; // namespace disassemble
