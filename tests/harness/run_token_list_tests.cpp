#include <simplang/lex/TokenList.hpp>
#include <simplang/diag/Render.hpp>
#include <simplang/os/File.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

    using K = simplang::syntax::TokenKind;
    using Code = simplang::diag::Code;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool test_kind_spellings_round_trip() {
        bool ok = true;
        for (uint16_t i = 0; i <= static_cast<uint16_t>(K::kRBrace); ++i) {
            const auto k = static_cast<K>(i);
            const auto got = simplang::token_kind_from_name(simplang::syntax::token_kind_name(k));
            ok &= require_(got.has_value() && *got == k, "every token_kind_name spelling must map back to its kind");
        }
        return ok;
    }

    static bool test_aliases_accepted() {
        bool ok = true;
        ok &= require_(simplang::token_kind_from_name("Identifier") == K::kIdent, "Identifier alias");
        ok &= require_(simplang::token_kind_from_name("Greater") == K::kGt, "Greater alias");
        ok &= require_(simplang::token_kind_from_name("And") == K::kAmpAmp, "And alias");
        ok &= require_(simplang::token_kind_from_name("Or") == K::kPipePipe, "Or alias");
        ok &= require_(simplang::token_kind_from_name("EOF") == K::kEof, "EOF alias");
        ok &= require_(!simplang::token_kind_from_name("while").has_value(), "unknown keyword must not map");
        ok &= require_(!simplang::token_kind_from_name("").has_value(), "empty spelling must not map");
        return ok;
    }

    static bool test_listing_with_comments_and_blank_lines() {
        const std::string text =
            "# header comment\n"
            "\n"
            "int 1\n"
            "  identifier\t1   # trailing comment\n"
            "; 1\r\n"
            "&& 2\n"
            "eof 3";

        simplang::diag::Bag bag;
        const auto toks = simplang::read_token_list(text, &bag);

        bool ok = true;
        ok &= require_(bag.diags().empty(), "well-formed listing must not emit diagnostics");
        ok &= require_(toks.size() == 5, "five tokens expected");
        if (!ok) return false;

        ok &= require_(toks[0].kind == K::kKwInt && toks[0].line == 1, "token 0");
        ok &= require_(toks[1].kind == K::kIdent && toks[1].line == 1, "token 1");
        ok &= require_(toks[2].kind == K::kSemicolon && toks[2].line == 1, "token 2");
        ok &= require_(toks[3].kind == K::kAmpAmp && toks[3].line == 2, "token 3");
        ok &= require_(toks[4].kind == K::kEof && toks[4].line == 3, "token 4");
        return ok;
    }

    static bool test_bad_lines_reported_with_listing_line() {
        const std::string text =
            "int 1\n"
            "while 2\n"    // listing line 2: unknown kind
            "identifier\n" // listing line 3: missing line field
            "; 0\n"        // listing line 4: line must be >= 1
            "= x\n"        // listing line 5: not a number
            "number 2\n";

        simplang::diag::Bag bag;
        const auto toks = simplang::read_token_list(text, &bag);

        bool ok = true;
        ok &= require_(toks.size() == 2, "only the two valid lines must produce tokens");
        ok &= require_(bag.diags().size() == 4, "each malformed line must produce one diagnostic");
        if (!ok) return false;

        const auto& d = bag.diags();
        ok &= require_(d[0].code() == Code::kTokenListUnknownKind && d[0].line() == 2, "unknown kind at line 2");
        ok &= require_(d[1].code() == Code::kTokenListBadLine && d[1].line() == 3, "missing line field at line 3");
        ok &= require_(d[2].code() == Code::kTokenListBadLine && d[2].line() == 4, "zero line at line 4");
        ok &= require_(d[3].code() == Code::kTokenListBadLine && d[3].line() == 5, "non-numeric line at line 5");

        ok &= require_(simplang::diag::render_message(d[0], simplang::diag::Language::kEn)
                           == "unknown token kind 'while'",
                       "unknown kind message must quote the spelling");
        return ok;
    }

    static bool test_tokens_after_eof_warn() {
        const std::string text =
            "int 1\n"
            "eof 1\n"
            "identifier 2\n";

        simplang::diag::Bag bag;
        const auto toks = simplang::read_token_list(text, &bag);

        bool ok = true;
        ok &= require_(toks.size() == 3, "tokens after eof must stay in the listing");
        ok &= require_(!bag.has_error(), "tokens after eof must not be an error");
        ok &= require_(bag.diags().size() == 1, "one warning expected");
        if (!ok) return false;

        const auto& d = bag.diags()[0];
        ok &= require_(d.severity() == simplang::diag::Severity::kWarning, "diagnostic must be a warning");
        ok &= require_(d.code() == Code::kTokenListAfterEof && d.line() == 3, "warning at listing line 3");

        const std::string s = simplang::diag::render_one(d, simplang::diag::Language::kEn, "t");
        ok &= require_(s.rfind("warning[TokenListAfterEof]: token 'identifier' after 'eof' is ignored", 0) == 0,
                       "warning must render with the warning prefix");
        return ok;
    }

    static bool test_open_file_normalizes_newlines() {
        const auto path = std::filesystem::temp_directory_path() / "simplang_crlf_listing.tokens";
        {
            std::ofstream f(path, std::ios::binary | std::ios::trunc);
            f << "int 1\r\nidentifier 1\r; 1\r\n";
        }

        std::string content;
        std::string err;
        bool ok = require_(simplang::open_file(path.string(), content, err), "open_file must read the temp file");
        std::filesystem::remove(path);
        if (!ok) return false;

        ok &= require_(err.empty(), "successful read must leave the error empty");
        ok &= require_(content.find('\r') == std::string::npos, "no carriage return may survive");
        ok &= require_(content == "int 1\nidentifier 1; 1\n", "CRLF becomes LF and a lone CR is dropped");
        return ok;
    }

    static bool test_open_file_missing_path() {
        const auto path = std::filesystem::temp_directory_path() / "simplang_no_such_dir" / "missing.tokens";

        std::string content = "stale";
        std::string err;
        bool ok = true;
        ok &= require_(!simplang::open_file(path.string(), content, err), "missing file must fail");
        ok &= require_(!err.empty(), "missing file must report an error");
        ok &= require_(content.empty(), "output must be cleared on failure");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*def)();
    };

    const Case cases[] = {
        {"kind_spellings_round_trip", test_kind_spellings_round_trip},
        {"aliases_accepted", test_aliases_accepted},
        {"listing_with_comments_and_blank_lines", test_listing_with_comments_and_blank_lines},
        {"bad_lines_reported_with_listing_line", test_bad_lines_reported_with_listing_line},
        {"tokens_after_eof_warn", test_tokens_after_eof_warn},
        {"open_file_normalizes_newlines", test_open_file_normalizes_newlines},
        {"open_file_missing_path", test_open_file_missing_path},
    };

    int failed = 0;
    for (const auto& tc : cases) {
        std::cout << "[TEST] " << tc.name << "\n";
        const bool ok = tc.def();
        if (!ok) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "FAILED: " << failed << " test(s)\n";
        return 1;
    }

    std::cout << "ALL TESTS PASSED\n";
    return 0;
}
