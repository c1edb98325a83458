// frontend/src/lex/token_list.cpp
#include <simplang/lex/TokenList.hpp>
#include <simplang/diag/DiagCode.hpp>

#include <array>
#include <charconv>
#include <system_error>
#include <utility>


namespace simplang {

    namespace {

        constexpr std::array<std::pair<std::string_view, syntax::TokenKind>, 21> k_aliases{{
            {"Int", syntax::TokenKind::kKwInt},
            {"Bool", syntax::TokenKind::kKwBool},
            {"String", syntax::TokenKind::kKwString},
            {"If", syntax::TokenKind::kKwIf},
            {"For", syntax::TokenKind::kKwFor},
            {"Identifier", syntax::TokenKind::kIdent},
            {"Number", syntax::TokenKind::kNumberLit},
            {"Boolean", syntax::TokenKind::kBoolLit},
            {"Plus", syntax::TokenKind::kPlus},
            {"Minus", syntax::TokenKind::kMinus},
            {"Assign", syntax::TokenKind::kAssign},
            {"Greater", syntax::TokenKind::kGt},
            {"Less", syntax::TokenKind::kLt},
            {"And", syntax::TokenKind::kAmpAmp},
            {"Or", syntax::TokenKind::kPipePipe},
            {"Semicolon", syntax::TokenKind::kSemicolon},
            {"LParen", syntax::TokenKind::kLParen},
            {"RParen", syntax::TokenKind::kRParen},
            {"LBrace", syntax::TokenKind::kLBrace},
            {"RBrace", syntax::TokenKind::kRBrace},
            {"EOF", syntax::TokenKind::kEof},
        }};

        constexpr auto k_last_kind = syntax::TokenKind::kRBrace;

        bool is_space_(char c) {
            return c == ' ' || c == '\t' || c == '\r';
        }

        std::string_view trim_(std::string_view s) {
            while (!s.empty() && is_space_(s.front())) s.remove_prefix(1);
            while (!s.empty() && is_space_(s.back())) s.remove_suffix(1);
            return s;
        }

        void report_(diag::Bag* bag, diag::Code code, uint32_t listing_line, std::string_view arg,
                     diag::Severity sev = diag::Severity::kError) {
            if (!bag) return;
            diag::Diagnostic d(sev, code, listing_line);
            d.add_arg(arg);
            bag->add(std::move(d));
        }

    } // namespace

    std::optional<syntax::TokenKind> token_kind_from_name(std::string_view name) {
        const auto last = static_cast<uint16_t>(k_last_kind);
        for (uint16_t i = 0; i <= last; ++i) {
            const auto k = static_cast<syntax::TokenKind>(i);
            if (syntax::token_kind_name(k) == name) return k;
        }

        for (const auto& [alias, k] : k_aliases) {
            if (alias == name) return k;
        }
        return std::nullopt;
    }

    std::vector<Token> read_token_list(std::string_view text, diag::Bag* bag) {
        std::vector<Token> out;
        uint32_t listing_line = 0;
        bool seen_eof = false;

        while (!text.empty()) {
            const size_t nl = text.find('\n');
            std::string_view raw = text.substr(0, nl);
            text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
            ++listing_line;

            // '#' 이후는 주석
            if (const size_t hash = raw.find('#'); hash != std::string_view::npos) {
                raw = raw.substr(0, hash);
            }

            std::string_view ln = trim_(raw);
            if (ln.empty()) continue;

            size_t sep = 0;
            while (sep < ln.size() && !is_space_(ln[sep])) ++sep;
            const std::string_view kind_sv = ln.substr(0, sep);
            const std::string_view line_sv = trim_(ln.substr(sep));

            auto kind = token_kind_from_name(kind_sv);
            if (!kind) {
                report_(bag, diag::Code::kTokenListUnknownKind, listing_line, kind_sv);
                continue;
            }

            uint32_t src_line = 0;
            const char* first = line_sv.data();
            const char* last = line_sv.data() + line_sv.size();
            const auto [ptr, ec] = std::from_chars(first, last, src_line);
            if (line_sv.empty() || ec != std::errc{} || ptr != last || src_line == 0) {
                report_(bag, diag::Code::kTokenListBadLine, listing_line, line_sv);
                continue;
            }

            // 목록에는 남기되, 파서는 첫 eof에서 멈춘다
            if (seen_eof) {
                report_(bag, diag::Code::kTokenListAfterEof, listing_line, kind_sv, diag::Severity::kWarning);
            }
            if (*kind == syntax::TokenKind::kEof) seen_eof = true;

            out.push_back(Token{*kind, src_line});
        }

        return out;
    }

} // namespace simplang
