/**
 * @file roster.hpp
 * @brief テキストメッセージの中間表現（名簿）
 */
#ifndef MEAL_BALANCER_TEXT_ROSTER_HPP
#define MEAL_BALANCER_TEXT_ROSTER_HPP

#include "meal_balancer/group.hpp"
#include "meal_balancer/person.hpp"
#include <string>
#include <vector>
#include <set>
#include <optional>

namespace meal_balancer {
namespace text {

/**
 * @brief グループ見出しとその下に並んだ名前
 */
struct GroupBlock {
    GroupDecl group;
    std::vector<std::string> names;
};

/**
 * @brief 名簿
 *
 * パーサーが見出しと名前の行を順に流し込む。
 * 制限なしブロック（TODO:）の名前はどのグループにも参加でき、
 * グループ見出しの下だけに現れる名前はそれらのグループに限られる。
 */
class Roster {
public:
    Roster() = default;

    /**
     * @brief 制限なしブロックを開始
     */
    void begin_unrestricted();

    /**
     * @brief グループ見出し（"- Comida 9" など）のブロックを開始
     * @return 見出しを解釈できなければ false
     */
    bool begin_group(const std::string& header);

    /**
     * @brief 名前の行を現在のブロックに追加
     *
     * 前後の空白を除き、連続する空白を1つにまとめる。
     * "-" や "•" だけの行、ブロック開始前の行は無視する。
     */
    void add_line(const std::string& raw);

    void add_unrestricted(const std::string& name);
    void add_to_group(const GroupDecl& group, const std::string& name);

    const std::vector<std::string>& unrestricted() const { return unrestricted_; }
    const std::vector<GroupBlock>& blocks() const { return blocks_; }

    bool empty() const { return appearance_order_.empty(); }

    /**
     * @brief 一意な参加者名（大文字小文字を区別せず整列）
     */
    std::vector<std::string> participants() const;

    /**
     * @brief base に、base にない見出しを出現順に追加したグループ集合
     */
    std::vector<GroupDecl> group_universe(const std::vector<GroupDecl>& base) const;

    /**
     * @brief コアに渡す (名前, 制約) のリスト（初出順）
     */
    std::vector<PersonDecl> person_decls() const;

private:
    void note_name(const std::string& name);

    enum class Section { None, Unrestricted, Group };
    Section section_ = Section::None;
    size_t current_block_ = 0;

    std::vector<std::string> unrestricted_;
    std::set<std::string> unrestricted_set_;
    std::vector<GroupBlock> blocks_;
    std::vector<std::string> appearance_order_;
    std::set<std::string> seen_;
};

/**
 * @brief 名前を正規化（trim と空白の圧縮）
 */
std::string normalize_name(const std::string& raw);

/**
 * @brief "Comida 9" / "cena 10" / "Lunch 3" 形式のラベルを解釈
 *
 * 先頭の "-" は無視する。種類の語は先頭だけ大文字にしてIDに使う。
 * @return 解釈できなければ std::nullopt
 */
std::optional<GroupDecl> parse_group_label(const std::string& label);

/**
 * @brief カンマ区切りのグループラベル列を解釈
 * @throws std::runtime_error 解釈できないラベルがある場合
 */
std::vector<GroupDecl> parse_group_list(const std::string& list);

/**
 * @brief 既定のグループ集合（Comida 9, Cena 9, Comida 10, Cena 10, Comida 11, Comida 12）
 */
std::vector<GroupDecl> default_groups();

} // namespace text
} // namespace meal_balancer

#endif // MEAL_BALANCER_TEXT_ROSTER_HPP
