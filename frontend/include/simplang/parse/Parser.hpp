// frontend/include/simplang/parse/Parser.hpp
#pragma once
#include <simplang/parse/Cursor.hpp>
#include <simplang/diag/Diagnostic.hpp>

#include <cstddef>
#include <optional>
#include <vector>


namespace simplang {

    struct ParserFeatureFlags {
        // if/for 본문이 '}' 없이 EOF에 닿으면 kBodyExpectedRBrace로 거부.
        // false면 EOF를 statement로 넘겨 kInvalidStatement로 거부된다.
        bool strict_block_close = true;
        // expression의 피연산자를 ident/number/boolean으로 제한
        bool strict_operands = false;
    };

    /// @brief 단일 토큰 lookahead 재귀 하강 문법 검사기
    /// @details 모든 production은 bool을 반환한다. false는 첫 에러로 파싱이 중단되었음을 뜻하며,
    ///          호출자는 더 이상 토큰을 읽지 않고 즉시 false를 전파한다.
    ///          에러 진단은 정확히 1개만 diags에 기록된다.
    class Parser {
    public:
        explicit Parser(std::vector<Token> tokens,
                        diag::Bag* diags = nullptr,
                        ParserFeatureFlags feature_flags = {})
            : cursor_(std::move(tokens)), diags_(diags), parser_features_(feature_flags) {
            advance();
        }

        // EOF까지 decl/stmt를 반복 검사
        bool parse_program();

        // 'type ident ;' (현재 토큰이 type 키워드라고 가정하고 무조건 소비)
        bool parse_declaration();

        // identifier/if/for로 분기하는 문장 1개
        bool parse_statement();

        // operand (op operand)*
        bool parse_expression();

        const Token& current() const    {  return current_;        }
        uint32_t line() const           {  return current_.line;   }
        bool is_aborted() const         {  return aborted_;        }

        /// @brief cursor에서 지금까지 꺼낸 토큰 수 (current 포함)
        size_t consumed() const         {  return cursor_.pos();   }

        const ParserFeatureFlags& feature_flags() const { return parser_features_; }

    private:
        // --------------------
        // token & diag helpers
        // --------------------

        //  cursor에서 다음 토큰을 읽어 current/line을 교체
        void advance();

        bool at(syntax::TokenKind k) const { return current_.kind == k; }

        //  현재 line으로 진단을 기록하고 파싱을 중단. 항상 false 반환
        bool fail(diag::Code code);

        //  현재 토큰이 k이면 소비, 아니면 fail(code)
        bool expect(syntax::TokenKind k, diag::Code code);

        // --------------------
        // stmt
        // --------------------

        bool parse_assignment();
        bool parse_if();
        bool parse_for();

        //  '{' 다음부터 '}'까지의 문장 목록, 닫는 '}'까지 소비
        bool parse_body();

        //  피연산자 토큰 1개 소비
        bool parse_operand();

        Cursor cursor_;
        Token current_{};
        diag::Bag* diags_ = nullptr;

        bool aborted_ = false;
        ParserFeatureFlags parser_features_{};
    };

    struct ParseResult {
        bool accepted = false;
        std::optional<diag::Diagnostic> error{};
    };

    /// @brief 새 Parser로 토큰 시퀀스 전체를 검사하고 결과를 반환
    ParseResult validate_tokens(std::vector<Token> tokens, ParserFeatureFlags feature_flags = {});

} // namespace simplang
