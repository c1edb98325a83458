// frontend/include/simplang/diag/Render.hpp
#pragma once
#include <simplang/diag/Diagnostic.hpp>

#include <string>
#include <string_view>


namespace simplang::diag {

    std::string code_name(Code c);

    /// @brief 진단 코드의 고정 메시지에 인자를 채워 반환
    std::string render_message(const Diagnostic& d, Language lang);

    /// @brief `error[Code]: msg` + ` --> name:line` 형태로 렌더링
    std::string render_one(const Diagnostic& d, Language lang, std::string_view source_name);

} // namespace simplang::diag
