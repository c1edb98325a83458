// frontend/include/simplang/parse/Cursor.hpp
#pragma once
#include <simplang/lex/Token.hpp>

#include <cstddef>
#include <utility>
#include <vector>


namespace simplang {

    /// @brief 토큰 시퀀스를 앞으로만 한 개씩 읽는 커서
    /// @details 입력이 소진되면 매 호출마다 합성 EOF(line = k_eof_line)를 돌려준다.
    ///          커서 자체는 에러를 보고하지 않는다.
    class Cursor {
    public:
        explicit Cursor(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

        Token advance() {
            if (pos_ >= tokens_.size()) return Token{syntax::TokenKind::kEof, k_eof_line}; // clamp
            return tokens_[pos_++];
        }

        bool exhausted() const  {  return pos_ >= tokens_.size();  }

        size_t pos() const      {  return pos_;  }

    private:
        std::vector<Token> tokens_;
        size_t pos_ = 0;
    };

} // namespace simplang
