#include <disassemble.hpp>
#include <i8086.hpp>

#include <fmt/format.h>

#include <utility>

namespace disassemble {

namespace I8086 {

std::string_view LabelTable::request(int64_t target) {
	auto it = names_.find(target);
	if (it == names_.end())
		it = names_.emplace(target, fmt::format("label{}", names_.size())).first;
	return it->second;
}

const std::string *LabelTable::find(int64_t target) const noexcept {
	auto it = names_.find(target);
	return it == names_.end() ? nullptr : &it->second;
}

size_t LabelTable::size() const noexcept { return names_.size(); }

void Listing::insert(size_t position, DecodedInstruction instruction) {
	if (instruction.branch)
		labels_.request(instruction.branch->target);
	instructions_.insert_or_assign(position, std::move(instruction));
}

LabelTable &Listing::labels() noexcept { return labels_; }
const LabelTable &Listing::labels() const noexcept { return labels_; }

const std::map<size_t, DecodedInstruction> &
Listing::instructions() const noexcept {
	return instructions_;
}

const std::string *Listing::resolve(int64_t target) const noexcept {
	if (target < 0 || !instructions_.contains(static_cast<size_t>(target)))
		return nullptr;
	return labels_.find(target);
}

std::string Listing::emit() const {
	std::string result = "bits 16\n";
	for (const auto &[position, inst] : instructions_) {
		if (const std::string *label = resolve(static_cast<int64_t>(position)))
			result += fmt::format("{}:\n", *label);

		result += inst.text;
		if (inst.branch) {
			// A target inside another instruction's bytes has no label
			// line to point at; write the absolute position instead.
			const auto &branch = *inst.branch;
			if (const std::string *label = resolve(branch.target))
				result += fmt::format(" {} ; {}", *label, branch.displacement);
			else
				result += fmt::format(" {} ; {}", branch.target,
									  branch.displacement);
		}
		result += '\n';
	}
	return result;
}

Listing decode(std::span<const uint8_t> code) {
	Listing listing;
	InstructionDecoder decoder(code);
	while (!decoder.done()) {
		size_t start = decoder.offset();
		listing.insert(start, decoder.decode());
	}
	return listing;
}

}; // namespace I8086

std::string disassemble8086(const std::span<const uint8_t> code) {
	return I8086::decode(code).emit();
}

}; // namespace disassemble
