/**
 * @file group.hpp
 * @brief 食事グループ（昼食・夕食枠）とグループ集合
 */
#ifndef MEAL_BALANCER_GROUP_HPP
#define MEAL_BALANCER_GROUP_HPP

#include <string>
#include <vector>
#include <map>
#include <cstddef>

namespace meal_balancer {

/**
 * @brief 食事の種類
 *
 * 列挙順がタイブレーク時の優先順位（Lunch が先）。
 */
enum class MealKind {
    Lunch,
    Dinner
};

/**
 * @brief 食事の種類の優先順位（小さいほど優先）
 */
inline int meal_rank(MealKind kind) { return kind == MealKind::Lunch ? 0 : 1; }

/**
 * @brief 食事の種類の表示名
 */
const char* to_string(MealKind kind);

/**
 * @brief グループ宣言（入力境界で受け取る形）
 */
struct GroupDecl {
    std::string id;
    MealKind kind;
    int day = 0;
};

/**
 * @brief 食事グループ
 *
 * members はメンバーのインデックス（Person 配列内）を割当順に保持する。
 */
class Group {
public:
    Group(std::string id, MealKind kind, int day, size_t index);

    const std::string& id() const { return id_; }
    MealKind kind() const { return kind_; }
    int day() const { return day_; }

    /**
     * @brief 宣言順インデックス
     */
    size_t index() const { return index_; }

    bool is_lunch() const { return kind_ == MealKind::Lunch; }

    size_t size() const { return members_.size(); }

    const std::vector<size_t>& members() const { return members_; }

    /**
     * @brief メンバーを末尾に追加（割当時のみ使用）
     */
    void add_member(size_t person_idx) { members_.push_back(person_idx); }

private:
    std::string id_;
    MealKind kind_;
    int day_;
    size_t index_;
    std::vector<size_t> members_;
};

/**
 * @brief グループ集合（宣言順を保持）
 *
 * グループIDは集合内で一意。空集合は許可するが、
 * サイズ計画の段階で NoGroupsDefined となる。
 */
class GroupUniverse {
public:
    GroupUniverse() = default;

    /**
     * @brief グループ宣言のリストから構築
     * @throws DuplicateGroup 同じIDが2回宣言された場合
     */
    explicit GroupUniverse(const std::vector<GroupDecl>& decls);

    /**
     * @brief グループを末尾に追加
     * @return 追加されたグループの宣言順インデックス
     * @throws DuplicateGroup 同じIDが既に存在する場合
     */
    size_t add(const GroupDecl& decl);

    size_t size() const { return groups_.size(); }
    bool empty() const { return groups_.empty(); }

    const Group& at(size_t idx) const { return groups_[idx]; }
    Group& at(size_t idx) { return groups_[idx]; }

    const std::vector<Group>& groups() const { return groups_; }

    /**
     * @brief IDからインデックスを検索
     * @return 見つかればインデックス、なければ SIZE_MAX
     */
    size_t find(const std::string& id) const;

    /**
     * @brief 全グループのインデックス（= 制限なしの参加可能集合）
     */
    std::vector<size_t> all_indices() const;

private:
    std::vector<Group> groups_;
    std::map<std::string, size_t> id_to_index_;
};

} // namespace meal_balancer

#endif // MEAL_BALANCER_GROUP_HPP
