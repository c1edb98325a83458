// tools/simplangc/include/simplangc/cli/Options.hpp
#pragma once

#include <simplang/diag/DiagCode.hpp>
#include <simplang/parse/Parser.hpp>

#include <cstdint>
#include <ostream>
#include <string>


namespace simplangc::cli {

    /// @brief `simplangc` 실행 모드.
    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kFile,
        kTokens,
        kDemo,
    };

    /// @brief `simplangc` 최종 실행 옵션.
    struct Options {
        Mode mode = Mode::kUsage;

        // kFile: 경로, kTokens: 인라인 토큰 목록
        std::string payload{};
        bool dump_tokens = false;

        simplang::diag::Language lang = simplang::diag::Language::kEn;
        simplang::ParserFeatureFlags parser_flags{};

        bool ok = true;
        std::string error{};
    };

    /// @brief `simplangc` CLI 사용법을 출력한다.
    void print_usage(std::ostream& os);

    /// @brief CLI 인자를 파싱해 실행 옵션 구조체로 변환한다.
    Options parse_options(int argc, char** argv);

} // namespace simplangc::cli
