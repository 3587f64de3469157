#include <i8086.hpp>

#include <fmt/format.h>

namespace disassemble {

namespace I8086 {

std::string effectiveAddress(binary::ByteCursor &cursor, bool wide,
							 const ModRM &modrm, std::string_view segment) {
	if (modrm.isDirectRegister())
		return std::string(registerName(wide, modrm.rm));

	std::string segmentText;
	if (!segment.empty())
		segmentText = fmt::format("{}:", segment);

	// mod 00 with r/m 110 is a direct address, not [bp].
	if (modrm.isDirectAddress())
		return fmt::format("[{}{}]", segmentText, cursor.nextSigned16(true));

	int16_t displacement = 0;
	if (modrm.mod == 1)
		displacement = cursor.nextSigned16(false);
	else if (modrm.mod == 2)
		displacement = cursor.nextSigned16(true);

	std::string_view base = baseRegisterNames[modrm.rm];
	if (displacement > 0)
		return fmt::format("[{}{} + {}]", segmentText, base, displacement);
	if (displacement < 0)
		return fmt::format("[{}{} - {}]", segmentText, base,
						   -static_cast<int32_t>(displacement));
	return fmt::format("[{}{}]", segmentText, base);
}

void PrefixState::setSegment(std::string_view name) noexcept {
	segment_ = name;
}

void PrefixState::setLock() noexcept { lock_ = true; }

bool PrefixState::pending() const noexcept {
	return segment_.has_value() || lock_;
}

std::string_view PrefixState::takeSegment() noexcept {
	std::string_view name = segment_.value_or(std::string_view{});
	segment_.reset();
	return name;
}

bool PrefixState::takeLock() noexcept {
	bool lock = lock_;
	lock_ = false;
	return lock;
}

std::string PrefixState::takeRemaining() {
	std::string result;
	if (takeLock())
		result += "lock ";
	std::string_view segment = takeSegment();
	if (!segment.empty()) {
		result += segment;
		result += ' ';
	}
	return result;
}

}; // namespace I8086

}; // namespace disassemble
