// frontend/src/parse/parse_decl.cpp
#include <simplang/parse/Parser.hpp>
#include <simplang/diag/DiagCode.hpp>


namespace simplang {

    bool Parser::parse_program() {
        if (aborted_) return false;

        while (!at(syntax::TokenKind::kEof)) {
            const bool ok = syntax::is_type_keyword(current_.kind)
                ? parse_declaration()
                : parse_statement();
            if (!ok) return false;
        }
        return true;
    }

    // for 헤더의 init 절에서도 호출되므로 첫 토큰 종류는 검사하지 않는다.
    bool Parser::parse_declaration() {
        if (aborted_) return false;
        advance(); // type keyword

        if (!expect(syntax::TokenKind::kIdent, diag::Code::kDeclExpectedIdent)) return false;
        return expect(syntax::TokenKind::kSemicolon, diag::Code::kDeclExpectedSemicolon);
    }

} // namespace simplang
