#pragma once
// detail.hpp: private helpers for deriving the Feistel domain from a range.
// The Feistel network works on two halves of a power-of-two superset of [0, range).
// split_domain() picks the smallest such superset and divides its bits as evenly as possible,
// which keeps the superset below 2 * range and the expected cycle walk below two encryptions.
#include <bit> // std::bit_width
#include <cassert>
#include <cstdint>

#ifndef PERM_ENABLE_SELFTESTS
#define PERM_ENABLE_SELFTESTS 0 // define to enable compile-time self-tests for the domain split helpers.
#endif

namespace perm{
	namespace detail {
		struct domain_split final{
			unsigned a_bits; // width of the low half, gets the odd leftover bit
			unsigned b_bits; // width of the high half
			std::uint64_t a_mask;
			std::uint64_t b_mask;

			constexpr bool operator==(const domain_split&) const noexcept = default;
		};

		// ceil(log2(range)): the number of bits needed to represent range - 1.
		// 0 for range == 1, 64 for any range above 2^63.
		[[nodiscard]] constexpr unsigned bits_for(std::uint64_t range) noexcept{
			assert(range > 0 && "bits_for(range): range must be non-zero");
			return static_cast<unsigned>(std::bit_width(range - 1));
		}

		// all-ones mask of the given width. Only called with bits <= 32.
		[[nodiscard]] constexpr std::uint64_t low_mask(unsigned bits) noexcept{
			assert(bits < 64);
			return (std::uint64_t{1} << bits) - 1;
		}

		[[nodiscard]] constexpr domain_split split_domain(std::uint64_t range) noexcept{
			const unsigned bits = bits_for(range);
			const unsigned b_bits = bits / 2;
			const unsigned a_bits = bits - b_bits;
			return {a_bits, b_bits, low_mask(a_bits), low_mask(b_bits)};
		}

		// 2^(a_bits + b_bits), saturated to 0 when the superset is the whole 64-bit space.
		[[nodiscard]] constexpr std::uint64_t superset_size(const domain_split& d) noexcept{
			const unsigned bits = d.a_bits + d.b_bits;
			return bits >= 64 ? 0 : (std::uint64_t{1} << bits);
		}
	} //detail namespace

#if PERM_ENABLE_SELFTESTS
	namespace detail::selftest {
		// 1. Widths
		static_assert(bits_for(1) == 0);
		static_assert(bits_for(2) == 1);
		static_assert(bits_for(10) == 4);
		static_assert(bits_for(16) == 4);
		static_assert(bits_for(17) == 5);
		static_assert(bits_for(1ULL << 32) == 32);
		static_assert(bits_for(UINT64_MAX) == 64);

		// 2. The leftover bit goes to a
		static_assert(split_domain(1) == domain_split{0, 0, 0, 0});
		static_assert(split_domain(10) == domain_split{2, 2, 0x3, 0x3});
		static_assert(split_domain(100) == domain_split{4, 3, 0xF, 0x7});
		static_assert(split_domain(1ULL << 32) == domain_split{16, 16, 0xFFFF, 0xFFFF});
		static_assert(split_domain(UINT64_MAX) == domain_split{32, 32, 0xFFFF'FFFFull, 0xFFFF'FFFFull});

		// 3. The superset encloses the range, but never doubles it
		constexpr bool tight(std::uint64_t range){
			const auto size = superset_size(split_domain(range));
			return size >= range && (range == 1 || size < 2 * range);
		}
		static_assert(tight(1) && tight(2) && tight(3) && tight(10) && tight(9045) && tight(65536));
	} // namespace detail::selftest
#endif
} // namespace perm
