#pragma once

#include <random>
#include <optional>
#include <cstdint>

namespace gridedge {

/**
 * Explicit random stream for Monte Carlo sampling.
 * Seeded sources replay bit-identical draws; unseeded ones pull a seed
 * from std::random_device. Not shared between threads.
 */
class RandomSource {
public:
    explicit RandomSource(std::optional<uint64_t> seed = std::nullopt)
        : engine_(seed ? *seed : static_cast<uint64_t>(std::random_device{}()))
        , seeded_(seed.has_value())
    {}

    bool is_seeded() const { return seeded_; }

    std::mt19937_64& engine() { return engine_; }

private:
    std::mt19937_64 engine_;
    bool seeded_{false};
};

} // namespace gridedge
