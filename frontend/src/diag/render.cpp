// frontend/src/diag/render.cpp
#include <simplang/diag/Render.hpp>
#include <simplang/lex/Token.hpp>

#include <sstream>


namespace simplang::diag {

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }

        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    static std::string_view code_name_sv_(Code c) {
        switch (c) {
            case Code::kDeclExpectedIdent: return "DeclExpectedIdent";
            case Code::kDeclExpectedSemicolon: return "DeclExpectedSemicolon";
            case Code::kInvalidStatement: return "InvalidStatement";
            case Code::kAssignExpectedEq: return "AssignExpectedEq";
            case Code::kAssignExpectedSemicolon: return "AssignExpectedSemicolon";
            case Code::kIfHeaderExpectedLParen: return "IfHeaderExpectedLParen";
            case Code::kForHeaderExpectedLParen: return "ForHeaderExpectedLParen";
            case Code::kForHeaderExpectedSemicolon: return "ForHeaderExpectedSemicolon";
            case Code::kHeaderExpectedRParen: return "HeaderExpectedRParen";
            case Code::kBodyExpectedLBrace: return "BodyExpectedLBrace";
            case Code::kBodyExpectedRBrace: return "BodyExpectedRBrace";
            case Code::kExprOperandExpected: return "ExprOperandExpected";
            case Code::kTokenListUnknownKind: return "TokenListUnknownKind";
            case Code::kTokenListBadLine: return "TokenListBadLine";
            case Code::kTokenListAfterEof: return "TokenListAfterEof";
        }
        return "Unknown";
    }

    static std::string template_en(Code c) {
        switch (c) {
            case Code::kDeclExpectedIdent: return "Expected identifier in declaration";
            case Code::kDeclExpectedSemicolon: return "Missing ';' in declaration";
            case Code::kInvalidStatement: return "Invalid statement";
            case Code::kAssignExpectedEq: return "Expected '=' in assignment";
            case Code::kAssignExpectedSemicolon: return "Missing ';' in assignment";
            case Code::kIfHeaderExpectedLParen: return "Expected '(' after if";
            case Code::kForHeaderExpectedLParen: return "Expected '(' after for";
            case Code::kForHeaderExpectedSemicolon: return "Missing ';' in for";
            case Code::kHeaderExpectedRParen: return "Expected ')'";
            case Code::kBodyExpectedLBrace: return "Expected '{'";
            case Code::kBodyExpectedRBrace: return "Expected '}'";
            case Code::kExprOperandExpected: return "Expected operand in expression";
            case Code::kTokenListUnknownKind: return "unknown token kind '{0}'";
            case Code::kTokenListBadLine: return "invalid line number '{0}'";
            case Code::kTokenListAfterEof: return "token '{0}' after 'eof' is ignored";
        }
        return "unknown diagnostic";
    }

    static std::string template_ko(Code c) {
        switch (c) {
            case Code::kDeclExpectedIdent: return "선언에 identifier가 필요합니다";
            case Code::kDeclExpectedSemicolon: return "선언 뒤에 ';'가 없습니다";
            case Code::kInvalidStatement: return "올바르지 않은 문장입니다";
            case Code::kAssignExpectedEq: return "대입문에 '='가 필요합니다";
            case Code::kAssignExpectedSemicolon: return "대입문 뒤에 ';'가 없습니다";
            case Code::kIfHeaderExpectedLParen: return "if 뒤에 '('가 필요합니다";
            case Code::kForHeaderExpectedLParen: return "for 뒤에 '('가 필요합니다";
            case Code::kForHeaderExpectedSemicolon: return "for 조건식 뒤에 ';'가 없습니다";
            case Code::kHeaderExpectedRParen: return "')'가 필요합니다";
            case Code::kBodyExpectedLBrace: return "'{'가 필요합니다";
            case Code::kBodyExpectedRBrace: return "'}'가 필요합니다";
            case Code::kExprOperandExpected: return "식에 피연산자가 필요합니다";
            case Code::kTokenListUnknownKind: return "알 수 없는 토큰 종류 '{0}'";
            case Code::kTokenListBadLine: return "올바르지 않은 줄 번호 '{0}'";
            case Code::kTokenListAfterEof: return "'eof' 뒤의 토큰 '{0}'은(는) 무시됩니다";
        }
        return "알 수 없는 진단";
    }

    std::string code_name(Code c) {
        return std::string(code_name_sv_(c));
    }

    std::string render_message(const Diagnostic& d, Language lang) {
        std::string msg = (lang == Language::kKo) ? template_ko(d.code()) : template_en(d.code());
        return format_template(std::move(msg), d.args());
    }

    std::string render_one(const Diagnostic& d, Language lang, std::string_view source_name) {
        std::ostringstream oss;
        const char* sev_name = (d.severity() == Severity::kWarning) ? "warning" : "error";

        oss << sev_name << "[" << code_name_sv_(d.code()) << "]: " << render_message(d, lang) << "\n";
        oss << " --> " << source_name << ":";

        // 입력 소진 후 합성된 EOF는 의미 있는 줄 번호가 없다
        if (d.line() == k_eof_line) oss << "<eof>";
        else oss << d.line();

        return oss.str();
    }

} // namespace simplang::diag
