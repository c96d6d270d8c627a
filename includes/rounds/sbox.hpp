#pragma once
#include "../concepts.hpp" //for RoundFunction
#include "../seeding.hpp" //for seed::xnasam, seed::to_32
#include <array>
#include <cstddef>
#include <cstdint>

/*
  SBoxRounds - substitution-table round function for the Feistel permutation.

  Follows the shape of the round in masscan's blackrock cipher
  (https://github.com/robertdavidgraham/masscan, crypto-blackrock2.c):
  key the half value with a per-round key, cut it into four groups,
  look each group up in a substitution table and XOR the results together.
  Odd and even rounds use disjoint sets of four tables.

  Blackrock uses the eight DES S-boxes. These tables are instead filled at
  compile time by the xNASAM mixer, one domain-separation key per table,
  and are indexed by whole bytes (256 entries instead of 64).
*/
namespace perm{
	namespace detail {
		inline constexpr std::size_t SBOX_COUNT = 8;
		inline constexpr std::size_t SBOX_SIZE = 256;
		using sbox_table = std::array<std::array<std::uint32_t, SBOX_SIZE>, SBOX_COUNT>;

		// process-wide constant data, evaluated once by the compiler.
		inline constexpr sbox_table SBOXES = []{
			sbox_table tables{};
			for(std::size_t t = 0; t < SBOX_COUNT; ++t){
				const std::uint64_t key = 0x53424F582D3030ULL + t; // "SBOX-00" .. "SBOX-07"
				for(std::size_t i = 0; i < SBOX_SIZE; ++i){
					tables[t][i] = seed::to_32(seed::xnasam(i, key));
				}
			}
			return tables;
			}();
	} //detail namespace

	class SBoxRounds final{
		using u64 = std::uint64_t;
		using u32 = std::uint32_t;
		static constexpr u64 ROUND_KEY = 0x524F554E442D3030ULL; // "ROUND-00"

		static constexpr u32 lookup(std::size_t first_table, u32 t) noexcept{
			const auto& sb = detail::SBOXES;
			return sb[first_table + 0][t & 0xFF]
				^ sb[first_table + 1][(t >> 8) & 0xFF]
				^ sb[first_table + 2][(t >> 16) & 0xFF]
				^ sb[first_table + 3][(t >> 24) & 0xFF];
		}

	public:
		// the result is at most 32 bits wide, which covers the widest half (a_bits <= 32).
		constexpr u64 operator()(u64 seed, u64 j, u64 right) const noexcept{
			// mixed before folding; a linear fold maps seeds with equal 32-bit halves to 0.
			const u32 round_key = seed::to_32(seed::xnasam(seed, ROUND_KEY + j));
			const u32 t = static_cast<u32>(right) ^ round_key; // right < 2^32
			return lookup((j & 1) ? 0 : 4, t);
		}

		constexpr bool operator==(const SBoxRounds&) const noexcept = default;
	};
	static_assert(RoundFunction<SBoxRounds>);
} // namespace perm
