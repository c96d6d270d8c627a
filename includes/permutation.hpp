#pragma once
#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <exception> //for std::terminate
#include <ranges>
#include "concepts.hpp" //for RoundFunction
#include "feistel.hpp"
#include "parameters.hpp"
#include "rounds/sbox.hpp"
#include "rounds/siprounds.hpp"
#include "seeding.hpp" //for from_range()

// Permutation<R>: a random ordering of [0, range) for any range, without storing it.
//
// shuffle(i) returns the i-th element of the ordering. As i runs over [0, range),
// every value of [0, range) comes out exactly once. Memory is O(1) and each call
// costs a couple of Feistel encryptions on average.
//
// The Feistel network permutes the power-of-two superset of the range. Values that
// fall outside the range are encrypted again ("cycle walking") until they land inside.
// Since encrypt() is a bijection, the walk from any i < range follows i's own cycle
// and must reach a value below range before it could come back around to i.
//
// Same (range, seed, rounds, R) gives the same ordering, on every run and platform.
// A Permutation is immutable after construction: share it freely between threads.
//
// Not a cipher. The round counts are tuned for dispersion, not security.
namespace perm{
	// rounds used by from_range()
	inline constexpr std::size_t DEFAULT_ROUNDS = 3;

	template <RoundFunction R = SipRounds>
	class Permutation final{
		using u64 = std::uint64_t;
		Feistel<R> _feistel;

		constexpr void expects_in_range(u64 i) const noexcept{
			if(i >= range()) [[unlikely]]{
				assert(false && "Permutation::shuffle(i): i must be in [0, range())");
				std::terminate();
			}
		}

	public:
		using round_type = R;

		// shuffle() plus the number of encryptions the cycle walk took.
		struct walk_result final{
			u64 value;
			std::size_t steps;

			constexpr bool operator==(const walk_result&) const noexcept = default;
		};

		// Throws std::invalid_argument if range or rounds is zero.
		explicit constexpr Permutation(u64 range, u64 seed, std::size_t rounds = DEFAULT_ROUNDS)
			: _feistel(range, seed, rounds){}

		// random seed from seed::from_entropy(), default rounds.
		// Print or store seed() to reproduce the ordering later.
		[[nodiscard]] static Permutation from_range(u64 range){
			return Permutation(range, seed::from_entropy(), DEFAULT_ROUNDS);
		}

		constexpr bool operator==(const Permutation&) const noexcept = default;

		constexpr u64 range() const noexcept{
			return _feistel.params().range;
		}

		constexpr u64 seed() const noexcept{
			return _feistel.params().seed;
		}

		constexpr std::size_t rounds() const noexcept{
			return _feistel.params().rounds;
		}

		constexpr const parameters& params() const noexcept{
			return _feistel.params();
		}

		// size of the power-of-two domain the Feistel network permutes. 0 stands for 2^64.
		constexpr u64 domain_size() const noexcept{
			return _feistel.domain_size();
		}

		constexpr const Feistel<R>& feistel() const noexcept{
			return _feistel;
		}

		// Precondition: i < range(). Violations terminate the program.
		constexpr walk_result walk(u64 i) const noexcept{
			expects_in_range(i);
			u64 c = _feistel.encrypt(i);
			std::size_t steps = 1;
			while(c >= range()){
				c = _feistel.encrypt(c);
				++steps;
			}
			return {c, steps};
		}

		// Precondition: i < range(). Violations terminate the program.
		[[nodiscard]] constexpr u64 shuffle(u64 i) const noexcept{
			return walk(i).value;
		}

		constexpr u64 operator()(u64 i) const noexcept{
			return shuffle(i);
		}

		// lazy view of shuffle(0), shuffle(1), ..., shuffle(range() - 1)
		// the view holds its own copy of the permutation.
		constexpr auto view() const{
			return std::views::iota(u64{0}, range()) | std::views::transform(*this);
		}
	};

	using SipPermutation = Permutation<SipRounds>;
	using SBoxPermutation = Permutation<SBoxRounds>;
} // namespace perm

#if PERM_VALIDATE_ROUNDS
namespace perm::detail::selftest {
	// Both strategies must yield a permutation of small ranges, for odd and even
	// round counts, during constant evaluation.
	template <RoundFunction R>
	constexpr bool permutes(std::uint64_t range, std::uint64_t seed, std::size_t rounds){
		const Permutation<R> p(range, seed, rounds);
		std::array<bool, 128> seen{};
		if(range > seen.size()){
			return false;
		}
		for(std::uint64_t i = 0; i < range; ++i){
			const auto v = p.shuffle(i);
			if(v >= range || seen[v]){
				return false;
			}
			seen[v] = true;
		}
		return true;
	}
	static_assert(permutes<SipRounds>(10, 0, 3));
	static_assert(permutes<SipRounds>(100, 0, 4));
	static_assert(permutes<SipRounds>(127, 0xFEEDFACECAFEBEEFULL, 1));
	static_assert(permutes<SBoxRounds>(10, 0, 3));
	static_assert(permutes<SBoxRounds>(100, 0xFEEDFACECAFEBEEFULL, 4));
	static_assert(permutes<SBoxRounds>(127, 0, 2));
	static_assert(Permutation<SipRounds>(1, 0, 3).shuffle(0) == 0);
	static_assert(Permutation<SBoxRounds>(1, 0, 4).shuffle(0) == 0);
} // namespace perm::detail::selftest
#endif // PERM_VALIDATE_ROUNDS
