#pragma once
#include <bit> //std::rotr
#include <chrono>
#include <cstdint>
#include <random> //for std::random_device

// Keys for permutations.
//
// A Permutation never interprets its seed; any 64-bit pattern is a valid key.
// This header holds the two things the library needs around keys:
// - a strong mixer, used to derive round keys and to fill the S-box tables
// - a runtime key source for Permutation::from_range()
namespace seed {
	using u64 = std::uint64_t;
	using u32 = std::uint32_t;

	// xNASAM mixing function by Pelle Evensen (2020).
	// https://mostlymangling.blogspot.com/2020/01/nasam-not-another-strange-acronym-mixer.html
	//
	// `c` separates uses of the mixer: each round index and each S-box table
	// gets its own key, so their outputs are unrelated. Must be non-zero.
	[[nodiscard]] constexpr u64 xnasam(u64 x, u64 c) noexcept{
		x ^= c;
		x ^= std::rotr(x, 25) ^ std::rotr(x, 47);
		x *= 0x9E6C63D0676A9A99ULL;
		x ^= (x >> 23) ^ (x >> 51);
		x *= 0x9E6D62D06F6A9A9BULL;
		x ^= (x >> 23) ^ (x >> 51);
		return x;
	}

	// XOR-fold to 32 bits; every input bit reaches the result.
	[[nodiscard]] constexpr u32 to_32(u64 v) noexcept{
		return static_cast<u32>(v ^ (v >> 32));
	}

	// Fresh key for an unseeded permutation: 64 bits from std::random_device,
	// mixed with a clock reading so that two keys drawn back to back still differ
	// where the device is deterministic. Store Permutation::seed() to replay an order.
	inline u64 from_entropy() noexcept{
		std::random_device rd;
		const u64 device = (static_cast<u64>(rd()) << 32) | rd();
		const auto ticks = static_cast<u64>(std::chrono::steady_clock::now().time_since_epoch().count());
		return xnasam(device ^ xnasam(ticks, 0x5449434B53ULL), 0x4B45592D3031ULL); // "TICKS", "KEY-01"
	}
}
