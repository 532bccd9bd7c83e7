/**
 * @file tie_break.hpp
 * @brief 割当順序とグループ選択の比較関数
 *
 * 参加者は (参加可能集合のサイズ, 入力順)、
 * グループは (現在のサイズ, 食事の種類の優先順位, 宣言順) の辞書式順序で比較する。
 */
#ifndef MEAL_BALANCER_TIE_BREAK_HPP
#define MEAL_BALANCER_TIE_BREAK_HPP

#include "meal_balancer/group.hpp"
#include "meal_balancer/person.hpp"
#include <vector>
#include <cstddef>

namespace meal_balancer {

/**
 * @brief flexible な参加者の同点処理
 */
enum class TieBreak {
    DeclarationOrder,  // 宣言順で決定（乱数は使わない）
    Randomized         // 同サイズ・同種類のグループから乱数で選ぶ
};

/**
 * @brief 参加者の割当順序（制約の強い順）
 *
 * persons のインデックス同士を比較する。std::stable_sort 用。
 */
class FewerOptionsFirst {
public:
    explicit FewerOptionsFirst(const std::vector<Person>& persons) : persons_(&persons) {}

    bool operator()(size_t a, size_t b) const;

private:
    const std::vector<Person>* persons_;
};

/**
 * @brief グループの優先順位
 *
 * operator() は a が b より優先されるとき true。
 * Randomized では宣言順をキーから外し、残った同点は乱数に委ねる。
 */
class GroupPreference {
public:
    explicit GroupPreference(TieBreak mode = TieBreak::DeclarationOrder) : mode_(mode) {}

    bool operator()(const Group& a, const Group& b) const;

    /**
     * @brief どちらも優先されない（同点）
     */
    bool tied(const Group& a, const Group& b) const {
        return !(*this)(a, b) && !(*this)(b, a);
    }

    TieBreak mode() const { return mode_; }

private:
    TieBreak mode_;
};

/**
 * @brief 候補の中で最も優先されるグループを全て返す（宣言順）
 * @param groups グループ配列
 * @param candidates 候補のインデックス（空でないこと）
 */
std::vector<size_t> best_groups(const std::vector<Group>& groups,
                                const std::vector<size_t>& candidates,
                                const GroupPreference& preference);

} // namespace meal_balancer

#endif // MEAL_BALANCER_TIE_BREAK_HPP
