#pragma once
#include <concepts>
#include <cstdint>

// Concept: RoundFunction
//
// This concept defines the "round contract" used by the Feistel network.
//
// A round function is a keyed mixing primitive:
//   r(seed, round_index, half_value) -> pseudo random 64-bit value
//
// Requirements:
// - stateless in practice: default constructible, copyable and comparable,
//   so a Permutation stays a plain value type.
// - the call operator is const and noexcept: the same (seed, j, right) always
//   gives the same result, and concurrent readers need no locking.
// - the result must depend on all three inputs. Consecutive round indices
//   must give decorrelated outputs, or the network collapses into (nearly)
//   the identity map.
//
// The function does NOT need to be invertible. The Feistel construction is a
// bijection regardless, and the caller truncates the result to the width of
// the half it is combining into.
template<typename R>
concept RoundFunction =
std::default_initializable<R> &&
std::copy_constructible<R> &&
std::equality_comparable<R> &&
	requires(const R& r, std::uint64_t seed, std::uint64_t j, std::uint64_t right){
		{ r(seed, j, right) } noexcept -> std::same_as<std::uint64_t>;
};

#ifndef PERM_VALIDATE_ROUNDS
// Define PERM_VALIDATE_ROUNDS to 0 to skip the compile-time validation of the round functions
// (see the end of permutation.hpp).
#define PERM_VALIDATE_ROUNDS 1
#endif
