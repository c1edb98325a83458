// frontend/src/parse/parse_stmt.cpp
#include <simplang/parse/Parser.hpp>
#include <simplang/diag/DiagCode.hpp>


namespace simplang {

    bool Parser::parse_statement() {
        if (aborted_) return false;

        switch (current_.kind) {
            case syntax::TokenKind::kIdent: return parse_assignment();
            case syntax::TokenKind::kKwIf:  return parse_if();
            case syntax::TokenKind::kKwFor: return parse_for();
            default:
                return fail(diag::Code::kInvalidStatement);
        }
    }

    // ident '=' expr ';'
    bool Parser::parse_assignment() {
        advance(); // identifier

        if (!expect(syntax::TokenKind::kAssign, diag::Code::kAssignExpectedEq)) return false;
        if (!parse_expression()) return false;
        return expect(syntax::TokenKind::kSemicolon, diag::Code::kAssignExpectedSemicolon);
    }

    // 'if' '(' expr ')' '{' stmt* '}'
    bool Parser::parse_if() {
        advance(); // 'if'

        if (!expect(syntax::TokenKind::kLParen, diag::Code::kIfHeaderExpectedLParen)) return false;
        if (!parse_expression()) return false;
        if (!expect(syntax::TokenKind::kRParen, diag::Code::kHeaderExpectedRParen)) return false;
        if (!expect(syntax::TokenKind::kLBrace, diag::Code::kBodyExpectedLBrace)) return false;

        return parse_body();
    }

    // 'for' '(' decl expr ';' assignment ')' '{' stmt* '}'
    // init 절은 항상 'type ident ;' 선언이고, step 절의 대입은 자기 ';'까지 소비한다.
    bool Parser::parse_for() {
        advance(); // 'for'

        if (!expect(syntax::TokenKind::kLParen, diag::Code::kForHeaderExpectedLParen)) return false;

        if (!parse_declaration()) return false;
        if (!parse_expression()) return false;
        if (!expect(syntax::TokenKind::kSemicolon, diag::Code::kForHeaderExpectedSemicolon)) return false;

        if (!parse_assignment()) return false;

        if (!expect(syntax::TokenKind::kRParen, diag::Code::kHeaderExpectedRParen)) return false;
        if (!expect(syntax::TokenKind::kLBrace, diag::Code::kBodyExpectedLBrace)) return false;

        return parse_body();
    }

    bool Parser::parse_body() {
        // 빈 본문 허용: 조건을 먼저 검사한다
        while (!at(syntax::TokenKind::kRBrace)) {
            if (parser_features_.strict_block_close && at(syntax::TokenKind::kEof)) {
                return fail(diag::Code::kBodyExpectedRBrace);
            }
            if (!parse_statement()) return false;
        }

        advance(); // '}'
        return true;
    }

} // namespace simplang
