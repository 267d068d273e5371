#include "unique_id.h"

#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace Shepherd {

namespace {

std::array<uint8_t, 16> RandomBytes() {
	thread_local std::mt19937_64 gen(std::random_device{}());
	std::array<uint8_t, 16> bytes;
	for (size_t i = 0; i < bytes.size(); i += 8) {
		uint64_t word = gen();
		for (size_t j = 0; j < 8; ++j) {
			bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
		}
	}
	return bytes;
}

} // namespace

std::string GenerateUuid() {
	std::array<uint8_t, 16> bytes = RandomBytes();
	bytes[6] = (bytes[6] & 0x0f) | 0x40;
	bytes[8] = (bytes[8] & 0x3f) | 0x80;

	std::stringstream ss;
	ss << std::hex << std::setfill('0');
	for (size_t i = 0; i < bytes.size(); ++i) {
		if (i == 4 || i == 6 || i == 8 || i == 10) {
			ss << '-';
		}
		ss << std::setw(2) << static_cast<int>(bytes[i]);
	}
	return ss.str();
}

std::string GenerateExecutionId() {
	return GenerateUuid();
}

} // namespace Shepherd
