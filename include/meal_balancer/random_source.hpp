/**
 * @file random_source.hpp
 * @brief 同点処理用の乱数源
 */
#ifndef MEAL_BALANCER_RANDOM_SOURCE_HPP
#define MEAL_BALANCER_RANDOM_SOURCE_HPP

#include <memory>
#include <random>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace meal_balancer {

/**
 * @brief 乱数源のインターフェース
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief [0, n) から一様に1つ選ぶ
     * @pre n > 0
     */
    virtual size_t pick(size_t n) = 0;
};

using RandomSourcePtr = std::shared_ptr<RandomSource>;

/**
 * @brief std::mt19937 による乱数源
 */
class Mt19937RandomSource : public RandomSource {
public:
    explicit Mt19937RandomSource(uint32_t seed);

    size_t pick(size_t n) override;

private:
    std::mt19937 rng_;
};

/**
 * @brief 固定列を順に返す乱数源
 *
 * 列を使い切ったら先頭に戻る。値は n で剰余を取る。
 * 空の列は常に 0 を返す。
 */
class SequenceRandomSource : public RandomSource {
public:
    explicit SequenceRandomSource(std::vector<size_t> sequence);

    size_t pick(size_t n) override;

    /**
     * @brief pick() が呼ばれた回数
     */
    size_t calls() const { return calls_; }

private:
    std::vector<size_t> sequence_;
    size_t calls_ = 0;
};

/**
 * @brief std::random_device から新しいシードを得る
 */
uint32_t make_seed();

/**
 * @brief make_seed() でシードした乱数源を作成
 */
RandomSourcePtr make_default_random_source();

} // namespace meal_balancer

#endif // MEAL_BALANCER_RANDOM_SOURCE_HPP
