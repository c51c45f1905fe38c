#include "text_parser.hpp"
#include "parser.hpp"
#include <stdexcept>
#include <cstdio>

namespace lr_puzzle {
namespace text {

namespace {

/**
 * @brief スキャナの寿命を管理する
 */
class Scanner {
public:
    Scanner() { yylex_init(&scanner_); }
    ~Scanner() { yylex_destroy(scanner_); }

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    yyscan_t get() const { return scanner_; }

private:
    yyscan_t scanner_ = nullptr;
};

std::unique_ptr<Document> run_parser(yyscan_t scanner, const std::string& source) {
    ParserContext ctx;
    int result = yyparse(scanner, &ctx);
    if (result != 0 || ctx.has_error) {
        std::string message = ctx.error_message.empty() ? "parser failed" : ctx.error_message;
        throw std::runtime_error("Parse error: " + source + message);
    }
    return std::move(ctx.document);
}

} // namespace

std::unique_ptr<Document> parse_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::unique_ptr<Document> document;
    try {
        Scanner scanner;
        yyset_in(file, scanner.get());
        document = run_parser(scanner.get(), filename + ": ");
    } catch (...) {
        fclose(file);
        throw;
    }
    fclose(file);
    return document;
}

std::unique_ptr<Document> parse_string(const std::string& input) {
    Scanner scanner;
    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner.get());
    try {
        auto document = run_parser(scanner.get(), "");
        yy_delete_buffer(buffer, scanner.get());
        return document;
    } catch (...) {
        yy_delete_buffer(buffer, scanner.get());
        throw;
    }
}

} // namespace text
} // namespace lr_puzzle
