// frontend/include/simplang/lex/TokenList.hpp
#pragma once
#include <simplang/lex/Token.hpp>
#include <simplang/diag/Diagnostic.hpp>

#include <optional>
#include <string_view>
#include <vector>


namespace simplang {

    /// @brief 토큰 종류 표기를 TokenKind로 변환
    /// @details token_kind_name() 표기("int", "identifier", "&&", ";", "eof")와
    ///          이름 별칭("Int", "Identifier", "And", "Semicolon", "EOF")을 모두 받는다.
    std::optional<syntax::TokenKind> token_kind_from_name(std::string_view name);

    /// @brief 외부 lexer가 만든 토큰 목록 텍스트를 읽는다
    /// @details 한 줄에 `<kind> <line>` 하나. 빈 줄과 '#' 주석은 무시한다.
    ///          잘못된 줄은 목록의 줄 번호로 진단을 남기고 건너뛴다.
    ///          'eof' 뒤에 오는 토큰은 목록에 넣되 warning을 남긴다.
    std::vector<Token> read_token_list(std::string_view text, diag::Bag* bag);

} // namespace simplang
