#pragma once
#include "../concepts.hpp" //for RoundFunction
#include <bit> //std::rotl
#include <cstdint>

/*
  SipRounds - ARX round function for the Feistel permutation.

  Mixes (round index, half value, seed) with the SipRound permutation from
  SipHash by Jean-Philippe Aumasson and Daniel J. Bernstein (public domain)
  https://github.com/veorq/SipHash

  The blackrock cipher used by masscan does the same job with DES S-boxes;
  the SipRound is cheaper and needs no tables.
*/
namespace perm{
	class SipRounds final{
		using u64 = std::uint64_t;
		// keeps the state away from all zeros when seed == 0 and right == 0,
		// since the SipRound maps the zero state onto itself.
		static constexpr u64 NONZERO = 0xF3016D19BC9AD940ULL;
		static constexpr int MIX_ROUNDS = 4;

		struct state final{
			u64 v0, v1, v2, v3;
		};

		static constexpr void sipround(state& s) noexcept{
			s.v0 += s.v1;
			s.v2 += s.v3;
			s.v1 = std::rotl(s.v1, 13) ^ s.v0;
			s.v3 = std::rotl(s.v3, 16) ^ s.v2;
			s.v0 = std::rotl(s.v0, 32);

			s.v2 += s.v1;
			s.v0 += s.v3;
			s.v1 = std::rotl(s.v1, 17) ^ s.v2;
			s.v3 = std::rotl(s.v3, 21) ^ s.v0;
			s.v2 = std::rotl(s.v2, 32);
		}

	public:
		constexpr u64 operator()(u64 seed, u64 j, u64 right) const noexcept{
			state s{j, right, seed, NONZERO};
			for(int i = 0; i < MIX_ROUNDS; ++i){
				sipround(s);
			}
			return s.v0;
		}

		//exposed for validation against the reference SIPROUND below.
		static constexpr state mix(u64 v0, u64 v1, u64 v2, u64 v3) noexcept{
			state s{v0, v1, v2, v3};
			sipround(s);
			return s;
		}

		constexpr bool operator==(const SipRounds&) const noexcept = default;
	};
	static_assert(RoundFunction<SipRounds>);
} // namespace perm

#if PERM_VALIDATE_ROUNDS
// SIPROUND as written in the SipHash reference implementation (siphash.c),
// adjusted for constexpr evaluation, but otherwise unchanged
#define PERM_ROTL(x, b) (std::uint64_t)(((x) << (b)) | ((x) >> (64 - (b))))
namespace perm::detail::selftest {
	constexpr bool matches_reference_sipround(std::uint64_t v0, std::uint64_t v1, std::uint64_t v2, std::uint64_t v3) noexcept{
		const auto s = SipRounds::mix(v0, v1, v2, v3);
		v0 += v1; v1 = PERM_ROTL(v1, 13); v1 ^= v0; v0 = PERM_ROTL(v0, 32);
		v2 += v3; v3 = PERM_ROTL(v3, 16); v3 ^= v2;
		v0 += v3; v3 = PERM_ROTL(v3, 21); v3 ^= v0;
		v2 += v1; v1 = PERM_ROTL(v1, 17); v1 ^= v2; v2 = PERM_ROTL(v2, 32);
		return s.v0 == v0 && s.v1 == v1 && s.v2 == v2 && s.v3 == v3;
	}
	static_assert(matches_reference_sipround(0, 0, 0, 0xF3016D19BC9AD940ULL));
	static_assert(matches_reference_sipround(1, 2, 3, 4));
	static_assert(matches_reference_sipround(0x736F6D6570736575ULL, 0x646F72616E646F6DULL, 0x6C7967656E657261ULL, 0x7465646279746573ULL));
	static_assert(matches_reference_sipround(UINT64_MAX, UINT64_MAX, UINT64_MAX, UINT64_MAX));
} // namespace perm::detail::selftest
#undef PERM_ROTL
#endif // PERM_VALIDATE_ROUNDS
