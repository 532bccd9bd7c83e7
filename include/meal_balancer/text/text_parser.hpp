/**
 * @file text_parser.hpp
 * @brief 名簿メッセージのパーサー
 *
 * flex/bison が利用可能な場合のみ meal_balancer_text に含まれる。
 */
#ifndef MEAL_BALANCER_TEXT_TEXT_PARSER_HPP
#define MEAL_BALANCER_TEXT_TEXT_PARSER_HPP

#include "meal_balancer/text/roster.hpp"
#include <memory>
#include <string>

namespace meal_balancer {
namespace text {

/**
 * @brief テキストファイルをパース
 * @throws std::runtime_error ファイルを開けない場合、パースエラー時
 */
std::unique_ptr<Roster> parse_file(const std::string& filename);

/**
 * @brief テキスト文字列をパース
 * @throws std::runtime_error パースエラー時
 */
std::unique_ptr<Roster> parse_string(const std::string& input);

} // namespace text
} // namespace meal_balancer

#endif // MEAL_BALANCER_TEXT_TEXT_PARSER_HPP
