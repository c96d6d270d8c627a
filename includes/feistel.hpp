#pragma once
#include <cstddef>
#include <cstdint>
#include "concepts.hpp" //for RoundFunction
#include "detail.hpp" //for superset_size
#include "parameters.hpp"

// An unbalanced Feistel network over the power-of-two superset of a range.
//
// The value is split into a low half of a_bits and a high half of b_bits.
// Each round adds the round function of one half into the other, modulo the
// width of the half being written, and swaps the two. Adding then swapping is
// invertible whatever the round function returns, so encrypt() is a bijection
// on [0, 2^(a_bits + b_bits)) for every seed and round count.
namespace perm{
	template <RoundFunction R>
	class Feistel final{
		using u64 = std::uint64_t;
		parameters _p;
		R _round{};

	public:
		using round_type = R;

		// Throws std::invalid_argument if range or rounds is zero (see make_parameters).
		explicit constexpr Feistel(u64 range, u64 seed, std::size_t rounds)
			: _p(make_parameters(range, seed, rounds)){}

		constexpr const parameters& params() const noexcept{
			return _p;
		}

		// number of values encrypt() permutes. 0 stands for 2^64.
		constexpr u64 domain_size() const noexcept{
			return detail::superset_size({_p.a_bits, _p.b_bits, _p.a_mask, _p.b_mask});
		}

		// m must be below domain_size()
		constexpr u64 encrypt(u64 m) const noexcept{
			u64 left = m & _p.a_mask;
			u64 right = m >> _p.a_bits;

			// odd rounds write the a_bits wide half, even rounds the b_bits wide one.
			// After an odd number of rounds, the a half sits in right.
			for(std::size_t j = 1; j <= _p.rounds; ++j){
				if(j & 1){
					const u64 next = (left + _round(_p.seed, j, right)) & _p.a_mask;
					left = right;
					right = next;
				} else{
					const u64 next = (left + _round(_p.seed, j, right)) & _p.b_mask;
					left = right;
					right = next;
				}
			}

			if(_p.rounds & 1){
				return (left << _p.a_bits) + right;
			} else{
				return (right << _p.a_bits) + left;
			}
		}

		constexpr bool operator==(const Feistel&) const noexcept = default;
	};
} // namespace perm
