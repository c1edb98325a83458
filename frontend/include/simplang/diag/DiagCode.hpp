// frontend/include/simplang/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace simplang::diag {

    enum class Severity : uint8_t {
        kError,
        kWarning,
    };

    enum class Language : uint8_t {
        kEn,
        kKo,
    };

    enum class Code : uint16_t {
        // ---- decl parsing ----
        kDeclExpectedIdent,          // type 키워드 뒤에 identifier 없음
        kDeclExpectedSemicolon,      // 'type ident' 뒤에 ';' 없음

        // ---- stmt parsing ----
        kInvalidStatement,           // identifier/if/for 이외의 토큰으로 문장이 시작됨
        kAssignExpectedEq,           // ident 뒤에 '=' 없음
        kAssignExpectedSemicolon,    // ident '=' expr 뒤에 ';' 없음

        // ---- if / for header ----
        kIfHeaderExpectedLParen,     // if ( ... ) 에서 '(' 없음
        kForHeaderExpectedLParen,    // for ( ... ) 에서 '(' 없음
        kForHeaderExpectedSemicolon, // for (decl cond ; step) 에서 cond 뒤 ';' 없음
        kHeaderExpectedRParen,       // if/for 헤더를 닫는 ')' 없음

        // ---- body ----
        kBodyExpectedLBrace,         // if/for 본문이 '{'로 시작하지 않음
        kBodyExpectedRBrace,         // 본문이 닫히기 전에 EOF 도달

        // ---- expr ----
        kExprOperandExpected,        // strict operand 모드: 피연산자 자리에 ident/number/boolean 이외

        // ---- token listing ----
        kTokenListUnknownKind,       // args[0] = kind spelling
        kTokenListBadLine,           // args[0] = line field
        kTokenListAfterEof,          // warning: 'eof' 이후의 토큰은 파서가 읽지 않음
    };

} // namespace simplang::diag
