// frontend/include/simplang/Version.hpp
#pragma once
#include <string_view>


namespace simplang {

    inline constexpr std::string_view k_version_string = "simplang v0.1.0 (bootstrap)";

} // namespace simplang
