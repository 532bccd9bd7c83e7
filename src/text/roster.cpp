#include "meal_balancer/text/roster.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace meal_balancer {
namespace text {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

} // namespace

std::string normalize_name(const std::string& raw) {
    std::string result;
    bool pending_space = false;
    for (char c : raw) {
        if (is_space(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }
    return result;
}

std::optional<GroupDecl> parse_group_label(const std::string& label) {
    std::string s = normalize_name(label);
    if (!s.empty() && s[0] == '-') {
        s = normalize_name(s.substr(1));
    }

    auto space = s.find(' ');
    if (space == std::string::npos) {
        return std::nullopt;
    }
    std::string word = to_lower(s.substr(0, space));
    std::string digits = s.substr(space + 1);

    // int に収まる桁数のみ
    if (digits.empty() || digits.size() > 9 ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    MealKind kind;
    if (word == "comida" || word == "lunch") {
        kind = MealKind::Lunch;
    } else if (word == "cena" || word == "dinner") {
        kind = MealKind::Dinner;
    } else {
        return std::nullopt;
    }

    word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
    return GroupDecl{word + " " + digits, kind, std::stoi(digits)};
}

std::vector<GroupDecl> parse_group_list(const std::string& list) {
    std::vector<GroupDecl> result;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) {
            comma = list.size();
        }
        std::string item = normalize_name(list.substr(start, comma - start));
        if (!item.empty()) {
            auto decl = parse_group_label(item);
            if (!decl) {
                throw std::runtime_error("Invalid group label: " + item);
            }
            result.push_back(*decl);
        }
        start = comma + 1;
    }
    return result;
}

std::vector<GroupDecl> default_groups() {
    return {
        {"Comida 9", MealKind::Lunch, 9},
        {"Cena 9", MealKind::Dinner, 9},
        {"Comida 10", MealKind::Lunch, 10},
        {"Cena 10", MealKind::Dinner, 10},
        {"Comida 11", MealKind::Lunch, 11},
        {"Comida 12", MealKind::Lunch, 12},
    };
}

// ============================================================================
// Roster
// ============================================================================

void Roster::begin_unrestricted() {
    section_ = Section::Unrestricted;
}

bool Roster::begin_group(const std::string& header) {
    auto decl = parse_group_label(header);
    if (!decl) {
        return false;
    }

    // 同じ見出しが再び現れたら既存のブロックに追記する
    auto it = std::find_if(blocks_.begin(), blocks_.end(),
                           [&](const GroupBlock& b) { return b.group.id == decl->id; });
    if (it == blocks_.end()) {
        blocks_.push_back(GroupBlock{*decl, {}});
        current_block_ = blocks_.size() - 1;
    } else {
        current_block_ = static_cast<size_t>(it - blocks_.begin());
    }
    section_ = Section::Group;
    return true;
}

void Roster::add_line(const std::string& raw) {
    std::string name = normalize_name(raw);
    if (name.empty() || name == "-" || name == "•") {
        return;
    }

    switch (section_) {
        case Section::Unrestricted:
            add_unrestricted(name);
            break;
        case Section::Group:
            add_to_group(blocks_[current_block_].group, name);
            break;
        case Section::None:
            // ブロック外の行は無視
            break;
    }
}

void Roster::add_unrestricted(const std::string& name) {
    if (unrestricted_set_.insert(name).second) {
        unrestricted_.push_back(name);
    }
    note_name(name);
}

void Roster::add_to_group(const GroupDecl& group, const std::string& name) {
    auto it = std::find_if(blocks_.begin(), blocks_.end(),
                           [&](const GroupBlock& b) { return b.group.id == group.id; });
    if (it == blocks_.end()) {
        blocks_.push_back(GroupBlock{group, {}});
        it = blocks_.end() - 1;
    }
    if (std::find(it->names.begin(), it->names.end(), name) == it->names.end()) {
        it->names.push_back(name);
    }
    note_name(name);
}

void Roster::note_name(const std::string& name) {
    if (seen_.insert(name).second) {
        appearance_order_.push_back(name);
    }
}

std::vector<std::string> Roster::participants() const {
    std::vector<std::string> result = appearance_order_;
    std::stable_sort(result.begin(), result.end(),
                     [](const std::string& a, const std::string& b) {
                         return to_lower(a) < to_lower(b);
                     });
    return result;
}

std::vector<GroupDecl> Roster::group_universe(const std::vector<GroupDecl>& base) const {
    std::vector<GroupDecl> result = base;
    for (const auto& block : blocks_) {
        bool known = std::any_of(result.begin(), result.end(),
                                 [&](const GroupDecl& g) { return g.id == block.group.id; });
        if (!known) {
            result.push_back(block.group);
        }
    }
    return result;
}

std::vector<PersonDecl> Roster::person_decls() const {
    std::map<std::string, std::vector<std::string>> restricted;
    for (const auto& block : blocks_) {
        for (const auto& name : block.names) {
            restricted[name].push_back(block.group.id);
        }
    }

    std::vector<PersonDecl> result;
    result.reserve(appearance_order_.size());
    for (const auto& name : appearance_order_) {
        if (unrestricted_set_.count(name)) {
            result.push_back(PersonDecl{name, ConstraintSpec::unrestricted()});
        } else {
            result.push_back(PersonDecl{name, ConstraintSpec::restricted(restricted[name])});
        }
    }
    return result;
}

} // namespace text
} // namespace meal_balancer
