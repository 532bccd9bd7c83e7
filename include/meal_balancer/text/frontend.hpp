/**
 * @file frontend.hpp
 * @brief mealbal の入出力（メッセージの読み込み、結果の表示、統計）
 */
#ifndef MEAL_BALANCER_TEXT_FRONTEND_HPP
#define MEAL_BALANCER_TEXT_FRONTEND_HPP

#include "meal_balancer/balancer.hpp"
#include "meal_balancer/text/roster.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace meal_balancer {
namespace text {

/**
 * @brief メッセージを読む
 *
 * EOF、"FIN" だけの行、または連続する2つの空行で終わる。
 * 終端の行は結果に含めない。
 */
std::string read_message(std::istream& in);

/**
 * @brief 乱数の設定を確定する
 *
 * シードが指定されていれば乱択モードにする。乱択モードでシードがなければ
 * make_seed() で生成して options に書き戻す。
 * @return 乱択モードなら使用するシード
 */
std::optional<uint32_t> settle_seed(BalanceOptions& options);

/**
 * @brief 目標との差とグループ間のサイズ差
 */
struct BalanceSummary {
    size_t deviation = 0;   // 各グループの |サイズ - 目標| の合計
    size_t spread = 0;      // 最大グループと最小グループのサイズ差
};

BalanceSummary summarize(const Assignment& assignment);

/**
 * @brief 名前を大文字小文字を区別せずに整列
 */
void sort_names(std::vector<std::string>& names);

void print_participants(std::ostream& out, const Roster& roster);

/**
 * @brief サイズの一覧 "<group>: <size> (target <ceiling>)" と各グループのメンバー
 */
void print_assignment(std::ostream& out, const Assignment& assignment);

void print_warnings(std::ostream& out, const std::vector<Warning>& warnings);

void print_stats(std::ostream& out, const BalanceResult& result);

} // namespace text
} // namespace meal_balancer

#endif // MEAL_BALANCER_TEXT_FRONTEND_HPP
