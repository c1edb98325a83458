// frontend/src/parse/parse_common.cpp
#include <simplang/parse/Parser.hpp>
#include <simplang/diag/DiagCode.hpp>


namespace simplang {

    void Parser::advance() {
        // 중단 이후에는 어떤 토큰도 더 읽지 않는다
        if (aborted_) return;
        current_ = cursor_.advance();
    }

    bool Parser::fail(diag::Code code) {
        if (aborted_) return false;
        aborted_ = true;

        if (diags_) {
            diags_->add(diag::Diagnostic(diag::Severity::kError, code, current_.line));
        }
        return false;
    }

    bool Parser::expect(syntax::TokenKind k, diag::Code code) {
        if (aborted_) return false;
        if (!at(k)) return fail(code);

        advance();
        return true;
    }

    ParseResult validate_tokens(std::vector<Token> tokens, ParserFeatureFlags feature_flags) {
        diag::Bag bag;
        Parser p(std::move(tokens), &bag, feature_flags);

        ParseResult r{};
        r.accepted = p.parse_program();
        if (!bag.diags().empty()) r.error = bag.diags().front();
        return r;
    }

} // namespace simplang
