// frontend/src/parse/parse_expr.cpp
#include <simplang/parse/Parser.hpp>
#include <simplang/diag/DiagCode.hpp>


namespace simplang {

    bool Parser::parse_operand() {
        if (parser_features_.strict_operands && !syntax::is_operand(current_.kind)) {
            return fail(diag::Code::kExprOperandExpected);
        }

        advance();
        return true;
    }

    // operand ( ('+'|'-'|'>'|'<'|'&&'|'||') operand )*
    // 기본 모드에서는 피연산자 토큰 종류를 검사하지 않는다.
    // 잘못된 피연산자는 뒤따르는 필수 토큰이 어긋날 때 간접적으로만 드러난다.
    bool Parser::parse_expression() {
        if (aborted_) return false;
        if (!parse_operand()) return false;

        while (syntax::is_binary_op(current_.kind)) {
            advance(); // operator
            if (!parse_operand()) return false;
        }
        return true;
    }

} // namespace simplang
