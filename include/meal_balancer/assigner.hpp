/**
 * @file assigner.hpp
 * @brief 貪欲法による均衡割当エンジン
 */
#ifndef MEAL_BALANCER_ASSIGNER_HPP
#define MEAL_BALANCER_ASSIGNER_HPP

#include "meal_balancer/assignment.hpp"
#include "meal_balancer/random_source.hpp"
#include "meal_balancer/tie_break.hpp"
#include <vector>
#include <cstdint>

namespace meal_balancer {

/**
 * @brief 割当の統計情報
 */
struct AssignerStats {
    size_t fixed_count = 0;
    size_t flexible_count = 0;
    size_t overflow_count = 0;       // 上限を超えて置いた固定参加者の数
    size_t random_tie_breaks = 0;    // 乱数で同点を解消した回数
    size_t saturated_picks = 0;      // 全グループが上限に達していた回数
};

/**
 * @brief 均衡割当エンジン
 *
 * 1. 参加者を fixed（全グループの真部分集合）と flexible（全グループ）に分ける
 * 2. fixed を参加可能集合の小さい順（同点は入力順）に、
 *    参加可能なグループのうち最も優先されるグループへ置く。
 *    上限を超えても置き、そのグループに CapacityExceeded の印を付ける
 * 3. flexible を入力順に、上限未満のグループ（なければ全グループ）のうち
 *    最も優先されるグループへ置く。同点が残れば乱数源で選ぶ
 */
class Assigner {
public:
    Assigner();

    /**
     * @brief 割当を実行
     * @param persons 解決済みの参加者（入力順）
     * @param groups グループ集合（メンバーは空であること）
     * @param plan サイズ計画（groups と同じ長さ）
     * @throws NoGroupsDefined グループが空の場合
     * @throws std::invalid_argument 計画や参加可能集合がグループ集合と合わない場合
     */
    Assignment assign(const std::vector<Person>& persons,
                      const GroupUniverse& groups,
                      const SizePlan& plan);

    /**
     * @brief 乱数源を差し替える
     *
     * 設定しなければ、初めて同点を乱数で解消するときに
     * std::random_device でシードした乱数源を作る。
     */
    void set_random_source(RandomSourcePtr source);

    /**
     * @brief 乱数源を seed 付きの std::mt19937 にする
     */
    void set_seed(uint32_t seed);

    const RandomSourcePtr& random_source() const { return random_; }

    /**
     * @brief flexible な参加者の同点処理を設定
     */
    void set_tie_break(TieBreak mode) { tie_break_ = mode; }

    TieBreak tie_break() const { return tie_break_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    const AssignerStats& stats() const { return stats_; }

private:
    /**
     * @brief fixed な参加者を置くグループを選ぶ
     */
    size_t select_fixed_group(const Assignment& result, const Person& person) const;

    /**
     * @brief flexible な参加者を置くグループを選ぶ
     */
    size_t select_flexible_group(const Assignment& result);

    void check_inputs(const std::vector<Person>& persons,
                      const GroupUniverse& groups,
                      const SizePlan& plan) const;

    bool verbose_ = false;
    TieBreak tie_break_ = TieBreak::DeclarationOrder;
    RandomSourcePtr random_;
    AssignerStats stats_;
};

} // namespace meal_balancer

#endif // MEAL_BALANCER_ASSIGNER_HPP
