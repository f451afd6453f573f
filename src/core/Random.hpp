//
// Random.hpp: injectable random source for slot assignment and tie-breaks
//

#ifndef LUPUS_RANDOM_HPP
#define LUPUS_RANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <random>

namespace lupus::core
{
    class RandomSource
    {
    public:
        virtual ~RandomSource() = default;

        // Uniform index in [0, n). n must be > 0.
        virtual auto Pick(std::size_t n) -> std::size_t = 0;
    };

    class SeededRandom final : public RandomSource
    {
    public:
        explicit SeededRandom(uint64_t seed) : rng_{seed} {}

        auto Pick(std::size_t n) -> std::size_t override
        {
            return std::uniform_int_distribution<std::size_t>{0, n - 1}(rng_);
        }

    private:
        std::mt19937_64 rng_;
    };
}

#endif //LUPUS_RANDOM_HPP
