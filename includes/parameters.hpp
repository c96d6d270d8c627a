#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include "detail.hpp" // for split_domain

namespace perm{
	// Immutable description of one permutation: the caller's inputs plus the
	// Feistel geometry derived from the range. Computed once, never changed.
	struct parameters final{
		std::uint64_t range;   // domain size N, > 0
		std::uint64_t seed;    // opaque key
		std::size_t rounds;    // Feistel rounds, >= 1 (3-4 recommended)
		unsigned a_bits;       // invariant: a_bits >= b_bits, 2^(a_bits + b_bits) >= range
		unsigned b_bits;
		std::uint64_t a_mask;  // 2^a_bits - 1
		std::uint64_t b_mask;  // 2^b_bits - 1

		constexpr bool operator==(const parameters&) const noexcept = default;
	};

	// Validates the caller's configuration and derives the half widths.
	// Throws std::invalid_argument for an empty range or a zero round count; no
	// degenerate parameter set is ever produced.
	[[nodiscard]] constexpr parameters make_parameters(std::uint64_t range, std::uint64_t seed, std::size_t rounds){
		if(range == 0){
			throw std::invalid_argument("perm::make_parameters: range must be greater than zero");
		}
		if(rounds == 0){
			throw std::invalid_argument("perm::make_parameters: rounds must be at least 1");
		}
		const auto split = detail::split_domain(range);
		return {range, seed, rounds, split.a_bits, split.b_bits, split.a_mask, split.b_mask};
	}
} // namespace perm
