#pragma once

#include <cstdint>
#include <cstddef>
#include <random>
#include <vector>
#include <initializer_list>

namespace theory_validator
{
  namespace rng_utils
  {
    // SplitMix64 finalizer.
    inline uint64_t splitmix64(uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    // Order-sensitive fold of several 64-bit values into one seed.
    inline uint64_t hash_combine64(std::initializer_list<uint64_t> parts)
    {
      uint64_t state = 0x6a09e667f3bcc909ull;
      for (uint64_t part : parts)
	state = splitmix64(state ^ part);
      return state;
    }

    /**
     * @brief Engine for one replicate of a resampling run.
     *
     * The 64-bit replicate seed is stretched into eight 32-bit seed words so
     * the whole mt19937_64 state is initialized. The seed depends only on
     * (masterSeed, replicate), so a replicate draws the same sequence no
     * matter which worker thread runs it.
     */
    inline std::mt19937_64 make_replicate_engine(uint64_t masterSeed, std::size_t replicate)
    {
      uint64_t state = hash_combine64({masterSeed, static_cast<uint64_t>(replicate)});
      std::vector<uint32_t> words;
      words.reserve(8);
      for (int i = 0; i < 4; ++i)
	{
	  words.push_back(static_cast<uint32_t>(state));
	  words.push_back(static_cast<uint32_t>(state >> 32));
	  state = splitmix64(state);
	}
      std::seed_seq seq(words.begin(), words.end());
      return std::mt19937_64(seq);
    }

    /**
     * @brief Uniform index in [0, size) for drawing with replacement.
     *
     * Returns 0 for an empty range.
     */
    template <typename Rng>
    inline std::size_t draw_index(Rng& rng, std::size_t size)
    {
      if (size == 0)
	return 0;
      std::uniform_int_distribution<std::size_t> dist(0, size - 1);
      return dist(rng);
    }
  }
}
