// frontend/include/simplang/os/File.hpp
#pragma once
#include <string>


namespace simplang {

    /// @brief 파일을 열어서 내용을 문자열로 변환 (텍스트 모드)
    /// @details 내부에서 CRLF 정규화(\r\n -> \n, \r -> 제거) 수행
    bool open_file(const std::string& path, std::string& out_content, std::string& out_error);

} // namespace simplang
