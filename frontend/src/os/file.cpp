// frontend/src/os/file.cpp
#include <simplang/os/File.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>


namespace simplang {

    static void normalize_newlines_inplace(std::string& s) {
        std::string out;
        out.reserve(s.size());

        for (char c : s) {
            if (c == '\r') continue; // CRLF -> LF, 단독 CR 제거
            out.push_back(c);
        }

        s.swap(out);
    }

    bool open_file(const std::string& path, std::string& out_content, std::string& out_error) {
        out_error.clear();
        out_content.clear();

        std::FILE* fp = std::fopen(path.c_str(), "rb");
        if (!fp) {
            out_error = std::string("CANNOT open file: ") + std::strerror(errno);
            return false;
        }

        std::fseek(fp, 0, SEEK_END);
        long sz = std::ftell(fp);
        std::fseek(fp, 0, SEEK_SET);

        if (sz < 0) {
            std::fclose(fp);
            out_error = "파일 크기를 읽을 수 없습니다.";
            return false;
        }

        out_content.resize(static_cast<size_t>(sz));
        size_t n = std::fread(out_content.data(), 1, out_content.size(), fp);
        std::fclose(fp);

        if (n != out_content.size()) {
            out_error = "파일 읽기 중 일부만 읽혔습니다.";
            return false;
        }

        normalize_newlines_inplace(out_content);
        return true;
    }

} // namespace simplang
