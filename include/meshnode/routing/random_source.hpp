#pragma once
/**
 * @file random_source.hpp
 * @brief Pluggable randomness for fault sampling.
 * @details The executor only asks for "a uniform integer in [lo, hi)". Production
 *          uses a Mersenne Twister seeded from std::random_device (or a fixed seed
 *          for reproducible runs); tests inject scripted sources.
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>

namespace meshnode::routing {

    class RandomSource {
    public:
        virtual ~RandomSource() = default;

        /**
         * @brief Uniform integer in the half-open range [lo, hi).
         * @pre lo < hi
         */
        virtual int uniform_int(int lo, int hi) = 0;
    };

    /**
     * @class Mt19937RandomSource
     * @brief Process-wide generator shared by all request threads.
     * @note Draws are serialized by an internal mutex; the critical section is a
     *       single engine step.
     */
    class Mt19937RandomSource final : public RandomSource {
    public:
        /// Seed from std::random_device when @p seed is empty.
        explicit Mt19937RandomSource(std::optional<std::uint64_t> seed = std::nullopt);

        int uniform_int(int lo, int hi) override;

    private:
        std::mutex   mu_;
        std::mt19937 engine_;
    };

    /// Factory used by the app wiring.
    std::shared_ptr<RandomSource> make_random_source(std::optional<std::uint64_t> seed);

} // namespace meshnode::routing
