#include "meal_balancer/text/frontend.hpp"
#include "meal_balancer/text/text_parser.hpp"
#include "meal_balancer/balancer.hpp"
#include "meal_balancer/errors.hpp"
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

namespace {

bool g_print_stats = false;
bool g_verbose = false;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-s] [-v] [-R] [-r SEED] [-g LIST] [file]\n";
    std::cerr << "  -s       Print assignment statistics to stderr\n";
    std::cerr << "  -v       Verbose mode (print size plan and assignment progress)\n";
    std::cerr << "  -R       Break ties between equal groups at random\n";
    std::cerr << "  -r SEED  Seed for the random tie-break (implies -R)\n";
    std::cerr << "  -g LIST  Comma-separated groups, e.g. \"Comida 9,Cena 9\"\n";
    std::cerr << "           (default: Comida 9, Cena 9, Comida 10, Cena 10, Comida 11, Comida 12)\n";
    std::cerr << "  file     Message file (stdin if omitted; ends at EOF, 'FIN' or two blank lines)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace meal_balancer;

    const char* filename = nullptr;
    const char* group_list = nullptr;
    BalanceOptions options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-R") == 0) {
            options.tie_break = TieBreak::Randomized;
        } else if (std::strcmp(argv[i], "-r") == 0 && i + 1 < argc) {
            options.seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "-g") == 0 && i + 1 < argc) {
            group_list = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    options.verbose = g_verbose;

    try {
        std::unique_ptr<text::Roster> roster;
        if (filename) {
            roster = text::parse_file(filename);
        } else {
            if (isatty(STDIN_FILENO)) {
                std::cerr << "Paste the message. Finish with two blank lines or a line 'FIN'.\n";
            }
            std::string message = text::read_message(std::cin);
            if (text::normalize_name(message).empty()) {
                std::cerr << "No text received.\n";
                return 1;
            }
            roster = text::parse_string(message);
        }

        if (roster->empty()) {
            std::cerr << "No participants found. Check the message format.\n";
            return 2;
        }

        // -g 指定時は見出しを追加しない（未知の見出しは UnknownGroupReference）
        std::vector<GroupDecl> groups;
        if (group_list) {
            groups = text::parse_group_list(group_list);
        } else {
            groups = roster->group_universe(text::default_groups());
        }

        if (auto seed = text::settle_seed(options)) {
            std::cerr << "% Seed: " << *seed << "\n";
        }

        text::print_participants(std::cout, *roster);

        auto result = balance(roster->person_decls(), groups, options);
        text::print_assignment(std::cout, result.assignment);
        text::print_warnings(std::cerr, result.warnings);
        if (g_print_stats) {
            text::print_stats(std::cerr, result);
        }
    } catch (const InvariantViolation& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
