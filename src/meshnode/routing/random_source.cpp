/**
 * @file random_source.cpp
 * @brief Mersenne Twister backed RandomSource.
 */
#include "meshnode/routing/random_source.hpp"

namespace meshnode::routing {

    namespace {
    std::mt19937 seeded_engine(std::optional<std::uint64_t> seed) {
        if (seed) {
            std::seed_seq seq{static_cast<std::uint32_t>(*seed),
                              static_cast<std::uint32_t>(*seed >> 32)};
            return std::mt19937{seq};
        }
        return std::mt19937{std::random_device{}()};
    }
    } // namespace

    Mt19937RandomSource::Mt19937RandomSource(std::optional<std::uint64_t> seed)
        : engine_(seeded_engine(seed)) {}

    int Mt19937RandomSource::uniform_int(int lo, int hi) {
        std::uniform_int_distribution<int> dist(lo, hi - 1);
        std::lock_guard<std::mutex> lk(mu_);
        return dist(engine_);
    }

    std::shared_ptr<RandomSource> make_random_source(std::optional<std::uint64_t> seed) {
        return std::make_shared<Mt19937RandomSource>(seed);
    }

} // namespace meshnode::routing
