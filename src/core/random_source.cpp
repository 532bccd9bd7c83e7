#include "meal_balancer/random_source.hpp"

namespace meal_balancer {

Mt19937RandomSource::Mt19937RandomSource(uint32_t seed)
    : rng_(seed) {}

size_t Mt19937RandomSource::pick(size_t n) {
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(rng_);
}

SequenceRandomSource::SequenceRandomSource(std::vector<size_t> sequence)
    : sequence_(std::move(sequence)) {}

size_t SequenceRandomSource::pick(size_t n) {
    size_t call = calls_++;
    if (sequence_.empty()) {
        return 0;
    }
    return sequence_[call % sequence_.size()] % n;
}

uint32_t make_seed() {
    std::random_device rd;
    return static_cast<uint32_t>(rd());
}

RandomSourcePtr make_default_random_source() {
    return std::make_shared<Mt19937RandomSource>(make_seed());
}

} // namespace meal_balancer
