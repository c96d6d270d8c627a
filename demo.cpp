#include "permutation.hpp" // the Permutation interface
#include <cstdint>
#include <print>
#include <ranges>

// Walks the IPv4 address space in a random order, the way a scanner would,
// then shows that a stored seed reproduces the same order.

static void print_ipv4(std::uint64_t i, std::uint64_t v){
   const auto ip = static_cast<std::uint32_t>(v);
   std::println("  {}: {}.{}.{}.{}", i, ip >> 24, (ip >> 16) & 0xFF, (ip >> 8) & 0xFF, ip & 0xFF);
}

int main(){
   using namespace perm;

   const auto addresses = Permutation<>::from_range(std::uint64_t{1} << 32); //random seed, default rounds
   std::println("Permutation<SipRounds> over 2^32 addresses, seed {:#x}:", addresses.seed());
   for(std::uint64_t i = 0; i < 10; ++i){
      print_ipv4(i, addresses.shuffle(i));
   }

   //same range, seed and rounds give the same order
   const Permutation<> again(addresses.range(), addresses.seed(), addresses.rounds());
   bool same = true;
   for(std::uint64_t i = 0; i < 1000; ++i){
      same = same && (again(i) == addresses(i));
   }
   std::println("\n  Replay with stored seed matches: {}\n", same);

   //ports, with the table-based round function and a fixed seed
   const SBoxPermutation ports(65536, 0x504F525453ULL, 4);
   std::print("SBoxPermutation over 65536 ports, seed {:#x}:\n ", ports.seed());
   for(const auto port : ports.view() | std::views::take(16)){
      std::print(" {}", port);
   }
   std::println("");

   const auto w = ports.walk(0);
   std::println("\n  shuffle(0) = {} after {} encryption(s)", w.value, w.steps);
   return 0;
}
