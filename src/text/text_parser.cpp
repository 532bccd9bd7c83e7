#include "meal_balancer/text/text_parser.hpp"
#include "parser.hpp"
#include <cstdio>
#include <stdexcept>

// flex の再入可能スキャナ API（lexer.cpp で定義）
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;
int yylex_init(yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
void yyset_in(FILE* in, yyscan_t scanner);
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);

namespace meal_balancer {
namespace text {

namespace {

struct ScannerDeleter {
    void operator()(void* scanner) const { yylex_destroy(scanner); }
};

struct BufferDeleter {
    yyscan_t scanner;
    void operator()(yy_buffer_state* buffer) const { yy_delete_buffer(buffer, scanner); }
};

struct FileCloser {
    void operator()(FILE* file) const { std::fclose(file); }
};

using ScannerPtr = std::unique_ptr<void, ScannerDeleter>;
using BufferPtr = std::unique_ptr<yy_buffer_state, BufferDeleter>;
using FilePtr = std::unique_ptr<FILE, FileCloser>;

ScannerPtr make_scanner() {
    yyscan_t scanner = nullptr;
    if (yylex_init(&scanner) != 0) {
        throw std::runtime_error("Cannot initialize the scanner");
    }
    return ScannerPtr(scanner);
}

/**
 * @brief 入力の設定済みスキャナで構文解析し、名簿を取り出す
 *
 * パーサーの動作中に例外が出ても、スキャナ・バッファ・ファイルは
 * 呼び出し側のガードが解放する。
 */
std::unique_ptr<Roster> run_parser(yyscan_t scanner) {
    ParserContext ctx;
    int result = yyparse(scanner, &ctx);
    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }
    return std::move(ctx.model);
}

} // namespace

std::unique_ptr<Roster> parse_file(const std::string& filename) {
    FilePtr file(std::fopen(filename.c_str(), "r"));
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    ScannerPtr scanner = make_scanner();
    yyset_in(file.get(), scanner.get());
    return run_parser(scanner.get());
}

std::unique_ptr<Roster> parse_string(const std::string& input) {
    ScannerPtr scanner = make_scanner();
    BufferPtr buffer(yy_scan_string(input.c_str(), scanner.get()),
                     BufferDeleter{scanner.get()});
    if (!buffer) {
        throw std::runtime_error("Cannot allocate the scanner buffer");
    }
    return run_parser(scanner.get());
}

} // namespace text
} // namespace meal_balancer
