// frontend/include/simplang/lex/Token.hpp
#pragma once
#include <cstdint>
#include <simplang/syntax/TokenKind.hpp>


namespace simplang {

    // 입력 끝을 지나 읽었을 때 합성되는 EOF 토큰의 line 값
    inline constexpr uint32_t k_eof_line = 0;

    struct Token {
        syntax::TokenKind kind = syntax::TokenKind::kEof;
        uint32_t line = k_eof_line; // 1-based, 진단 전용
    };

} // namespace simplang
