// tools/simplangc/src/driver/Runner.cpp
#include <simplangc/driver/Runner.hpp>

#include <simplang/diag/Diagnostic.hpp>
#include <simplang/diag/Render.hpp>
#include <simplang/lex/TokenList.hpp>
#include <simplang/os/File.hpp>
#include <simplang/parse/Parser.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace simplangc::driver {

    namespace {

        using simplang::Token;
        using K = simplang::syntax::TokenKind;

        /// @brief 진단을 stderr로 출력한다.
        void flush_diags(const simplang::diag::Bag& bag, simplang::diag::Language lang, std::string_view name) {
            for (const auto& d : bag.diags()) {
                std::cerr << simplang::diag::render_one(d, lang, name) << "\n";
            }
        }

        void dump_tokens(const std::vector<Token>& tokens) {
            std::cout << "TOKENS:\n";
            for (const auto& t : tokens) {
                std::cout << "  " << simplang::syntax::token_kind_name(t.kind) << " @" << t.line << "\n";
            }
        }

        /// @brief 토큰 목록 텍스트 하나를 검사한다.
        int run_listing(std::string_view text, std::string_view name, const cli::Options& opt) {
            simplang::diag::Bag bag;

            auto tokens = simplang::read_token_list(text, &bag);
            if (bag.has_error()) {
                flush_diags(bag, opt.lang, name);
                return 1;
            }

            if (opt.dump_tokens) dump_tokens(tokens);

            simplang::Parser p(std::move(tokens), &bag, opt.parser_flags);
            const bool accepted = p.parse_program();

            flush_diags(bag, opt.lang, name);
            return accepted ? 0 : 1;
        }

        int run_file(const std::string& path, const cli::Options& opt) {
            std::string content;
            std::string err;
            if (!simplang::open_file(path, content, err)) {
                std::cerr << "error: " << err << " (" << path << ")\n";
                return 1;
            }
            return run_listing(content, path, opt);
        }

        struct Sample {
            const char* name;
            bool expect_error;
            std::vector<Token> tokens;
        };

        std::vector<Sample> make_samples() {
            std::vector<Sample> s;

            s.push_back({"Valid program", false, {
                {K::kKwInt, 1}, {K::kIdent, 1}, {K::kSemicolon, 1},
                {K::kIdent, 2}, {K::kAssign, 2}, {K::kNumberLit, 2}, {K::kSemicolon, 2},
                {K::kKwIf, 3}, {K::kLParen, 3}, {K::kIdent, 3}, {K::kGt, 3}, {K::kNumberLit, 3},
                {K::kRParen, 3}, {K::kLBrace, 3},
                {K::kIdent, 4}, {K::kAssign, 4}, {K::kIdent, 4}, {K::kMinus, 4}, {K::kNumberLit, 4},
                {K::kSemicolon, 4},
                {K::kRBrace, 5},
                {K::kEof, 6},
            }});

            s.push_back({"Invalid declaration", true, {
                {K::kKwInt, 1}, {K::kSemicolon, 1}, {K::kEof, 2},
            }});

            s.push_back({"Missing brace", true, {
                {K::kKwIf, 1}, {K::kLParen, 1}, {K::kIdent, 1}, {K::kGt, 1}, {K::kNumberLit, 1},
                {K::kRParen, 1}, {K::kLBrace, 1},
                {K::kIdent, 2}, {K::kAssign, 2}, {K::kNumberLit, 2}, {K::kSemicolon, 2},
                {K::kEof, 3},
            }});

            s.push_back({"Invalid assignment", true, {
                {K::kIdent, 1}, {K::kNumberLit, 1}, {K::kSemicolon, 1}, {K::kEof, 2},
            }});

            s.push_back({"Invalid control structure", true, {
                {K::kKwFor, 1}, {K::kKwInt, 1}, {K::kIdent, 1}, {K::kAssign, 1},
                {K::kNumberLit, 1}, {K::kSemicolon, 1}, {K::kEof, 2},
            }});

            return s;
        }

        /// @brief 내장 예제 프로그램들을 검사하고 기대 결과와 비교한다.
        int run_demo(const cli::Options& opt) {
            std::cout << "Running SimpleLang Parser Tests...\n\n";

            int mismatched = 0;
            int index = 0;
            for (auto& sample : make_samples()) {
                ++index;
                const auto r = simplang::validate_tokens(std::move(sample.tokens), opt.parser_flags);

                if (!sample.expect_error) {
                    if (r.accepted) {
                        std::cout << "Test " << index << " Passed: " << sample.name << "\n";
                    } else {
                        ++mismatched;
                        std::cout << "Test " << index << " FAILED: " << sample.name << "\n";
                        if (r.error) {
                            std::cout << "  " << simplang::diag::render_one(*r.error, opt.lang, "<demo>") << "\n";
                        }
                    }
                    continue;
                }

                if (r.accepted) {
                    ++mismatched;
                    std::cout << sample.name << ": FAILED (error not detected)\n";
                } else {
                    std::cout << sample.name << ": Error correctly detected";
                    if (r.error) std::cout << " (" << simplang::diag::render_message(*r.error, opt.lang) << ")";
                    std::cout << "\n";
                }
            }

            std::cout << "\nAll tests executed.\n";
            return mismatched == 0 ? 0 : 1;
        }

    } // namespace

    int run(const cli::Options& opt) {
        switch (opt.mode) {
            case cli::Mode::kFile:
                return run_file(opt.payload, opt);
            case cli::Mode::kTokens:
                return run_listing(opt.payload, "<tokens>", opt);
            case cli::Mode::kDemo:
                return run_demo(opt);
            case cli::Mode::kUsage:
            case cli::Mode::kVersion:
            default:
                return 0;
        }
    }

} // namespace simplangc::driver
