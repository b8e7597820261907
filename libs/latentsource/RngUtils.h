// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __LATENT_SOURCE_RNG_UTILS_H
#define __LATENT_SOURCE_RNG_UTILS_H 1

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>

namespace mkc_latentsource
{
  namespace rng_utils
  {
    // Simple 64-bit splitmix hash (deterministic, good avalanche)
    inline uint64_t splitmix64(uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    // Combine several 64-bit values into one seed
    inline uint64_t hash_combine64(std::initializer_list<uint64_t> parts)
    {
      uint64_t h = 0x6a09e667f3bcc909ull;
      for (auto v : parts)
	h = splitmix64(h ^ v);
      return h;
    }

    /**
     * @brief Derive an independent stream seed from a master seed and a
     * sequence of tags (e.g. scale index, restart number).
     *
     * The same (master, tags) always produces the same seed, so every random
     * decision of a run is pinned by the caller's master seed alone.
     */
    inline uint64_t derive_seed(uint64_t masterSeed, std::initializer_list<uint64_t> tags)
    {
      uint64_t h = masterSeed;
      for (auto t : tags)
	h = hash_combine64({h, t});
      return h;
    }

    // Expand a 64-bit seed into eight 32-bit words for std::seed_seq
    inline std::seed_seq make_seed_seq(uint64_t seed64)
    {
      const uint64_t s0 = seed64;
      const uint64_t s1 = splitmix64(s0);
      const uint64_t s2 = splitmix64(s0 ^ 0x9e3779b97f4a7c15ull);
      const uint64_t s3 = splitmix64(s1 + 0xd1342543de82ef95ull);

      std::array<uint32_t, 8> words = {
	static_cast<uint32_t>(s0), static_cast<uint32_t>(s0 >> 32),
	static_cast<uint32_t>(s1), static_cast<uint32_t>(s1 >> 32),
	static_cast<uint32_t>(s2), static_cast<uint32_t>(s2 >> 32),
	static_cast<uint32_t>(s3), static_cast<uint32_t>(s3 >> 32)
      };

      return std::seed_seq(words.begin(), words.end());
    }

    template <class Eng = std::mt19937_64>
    inline Eng make_engine(uint64_t seed64)
    {
      std::seed_seq sseq = make_seed_seq(seed64);
      return Eng(sseq);
    }

    /**
     * @brief Random index in [0, hiExclusive).
     *
     * @pre hiExclusive > 0
     */
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t hiExclusive)
    {
      if (hiExclusive == 0)
	return 0;

      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(rng);
    }

    // Random double in [0, 1)
    template <typename Rng>
    inline double get_random_uniform_01(Rng& rng)
    {
      std::uniform_real_distribution<double> dist(0.0, 1.0);
      return dist(rng);
    }
  }
}

#endif
