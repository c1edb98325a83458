// tools/simplangc/include/simplangc/driver/Runner.hpp
#pragma once

#include <simplangc/cli/Options.hpp>

namespace simplangc::driver {

    /// @brief 토큰 목록을 읽어 문법 검사를 실행한다.
    int run(const cli::Options& opt);

} // namespace simplangc::driver
