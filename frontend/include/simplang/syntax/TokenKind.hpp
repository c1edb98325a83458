// frontend/include/simplang/syntax/TokenKind.hpp
#pragma once
#include <string_view>
#include <cstdint>


namespace simplang::syntax {

    enum class TokenKind : uint16_t {
        // special
        kEof = 0,

        // type keywords
        kKwInt,
        kKwBool,
        kKwString,

        // control keywords
        kKwIf,
        kKwFor,

        // identifiers / literals
        kIdent,
        kNumberLit,
        kBoolLit,

        // operators
        kPlus,     // +
        kMinus,    // -
        kAssign,   // =
        kGt,       // >
        kLt,       // <
        kAmpAmp,   // &&
        kPipePipe, // ||

        // punct / delimiters
        kSemicolon, // ;
        kLParen,    // (
        kRParen,    // )
        kLBrace,    // {
        kRBrace,    // }
    };

    constexpr std::string_view token_kind_name(TokenKind k) {
        switch (k) {
            case TokenKind::kEof: return "eof";

            case TokenKind::kKwInt: return "int";
            case TokenKind::kKwBool: return "bool";
            case TokenKind::kKwString: return "string";
            case TokenKind::kKwIf: return "if";
            case TokenKind::kKwFor: return "for";

            case TokenKind::kIdent: return "identifier";
            case TokenKind::kNumberLit: return "number";
            case TokenKind::kBoolLit: return "boolean";

            case TokenKind::kPlus: return "+";
            case TokenKind::kMinus: return "-";
            case TokenKind::kAssign: return "=";
            case TokenKind::kGt: return ">";
            case TokenKind::kLt: return "<";
            case TokenKind::kAmpAmp: return "&&";
            case TokenKind::kPipePipe: return "||";

            case TokenKind::kSemicolon: return ";";
            case TokenKind::kLParen: return "(";
            case TokenKind::kRParen: return ")";
            case TokenKind::kLBrace: return "{";
            case TokenKind::kRBrace: return "}";
        }

        return "unknown";
    }

    /// @brief 선언을 시작하는 타입 키워드(int/bool/string)인지 판정
    constexpr bool is_type_keyword(TokenKind k) {
        return k == TokenKind::kKwInt || k == TokenKind::kKwBool || k == TokenKind::kKwString;
    }

    /// @brief expression 안에서 피연산자 사이에 올 수 있는 이항 연산자인지 판정
    constexpr bool is_binary_op(TokenKind k) {
        switch (k) {
            case TokenKind::kPlus:
            case TokenKind::kMinus:
            case TokenKind::kGt:
            case TokenKind::kLt:
            case TokenKind::kAmpAmp:
            case TokenKind::kPipePipe:
                return true;
            default:
                return false;
        }
    }

    // strict operand 모드에서 허용되는 피연산자 토큰
    constexpr bool is_operand(TokenKind k) {
        return k == TokenKind::kIdent || k == TokenKind::kNumberLit || k == TokenKind::kBoolLit;
    }

} // namespace simplang::syntax
