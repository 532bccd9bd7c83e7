/**
 * @file errors.hpp
 * @brief エラー型（設定エラーと内部不変条件違反）
 *
 * 設定エラーは入力に起因し、割当開始前に送出される。
 * InvariantViolation はエンジンの欠陥を示し、利用者のエラーとは区別する。
 */
#ifndef MEAL_BALANCER_ERRORS_HPP
#define MEAL_BALANCER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace meal_balancer {

/**
 * @brief 設定エラーの基底クラス
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief 制約が存在しないグループを参照している
 */
class UnknownGroupReference : public ConfigurationError {
public:
    UnknownGroupReference(const std::string& person, const std::string& group)
        : ConfigurationError("Unknown group '" + group + "' referenced by '" + person + "'")
        , person_(person)
        , group_(group) {}

    const std::string& person() const { return person_; }
    const std::string& group() const { return group_; }

private:
    std::string person_;
    std::string group_;
};

/**
 * @brief グループが1つも定義されていない
 */
class NoGroupsDefined : public ConfigurationError {
public:
    NoGroupsDefined()
        : ConfigurationError("No groups defined") {}
};

/**
 * @brief 制限付き制約がグループを1つも指定していない
 */
class EmptyRestriction : public ConfigurationError {
public:
    explicit EmptyRestriction(const std::string& person)
        : ConfigurationError("Restriction of '" + person + "' names no group")
        , person_(person) {}

    const std::string& person() const { return person_; }

private:
    std::string person_;
};

/**
 * @brief 同じ名前の人が2回宣言された
 */
class DuplicatePerson : public ConfigurationError {
public:
    explicit DuplicatePerson(const std::string& person)
        : ConfigurationError("Person declared twice: " + person)
        , person_(person) {}

    const std::string& person() const { return person_; }

private:
    std::string person_;
};

/**
 * @brief 同じIDのグループが2回宣言された
 */
class DuplicateGroup : public ConfigurationError {
public:
    explicit DuplicateGroup(const std::string& group)
        : ConfigurationError("Group declared twice: " + group)
        , group_(group) {}

    const std::string& group() const { return group_; }

private:
    std::string group_;
};

/**
 * @brief 割当結果が不変条件を満たさない（エンジンの欠陥）
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& message)
        : std::logic_error("Internal error: " + message) {}
};

} // namespace meal_balancer

#endif // MEAL_BALANCER_ERRORS_HPP
