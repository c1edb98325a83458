// frontend/include/simplang/diag/Diagnostic.hpp
#pragma once
#include <simplang/diag/DiagCode.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace simplang::diag {

    class Diagnostic {
    public:
        Diagnostic(Severity severity, Code code, uint32_t line)
            : severity_(severity), code_(code), line_(line) {}

        void add_arg(std::string_view s) {  args_.emplace_back(s);  }

        Severity severity() const   {  return severity_;    }
        Code code() const           {  return code_;        }
        uint32_t line() const       {  return line_;        }
        const std::vector<std::string>& args() const {  return args_;  }

    private:
        Severity severity_{Severity::kError};
        Code code_{Code::kInvalidStatement};
        uint32_t line_ = 0;
        std::vector<std::string> args_;
    };

    class Bag {
    public:
        void add(Diagnostic d) {
            if (d.severity() == Severity::kError) ++error_count_;
            diags_.push_back(std::move(d));
        }

        bool has_error() const {
            for (const auto& d : diags_) {
                if (d.severity() == Severity::kError) return true;
            }
            return false;
        }

        bool has_code(Code c) const {
            for (const auto& d : diags_) {
                if (d.code() == c) return true;
            }

            return false;
        }

        const std::vector<Diagnostic>& diags() const {  return diags_;  }

        uint32_t error_count() const {  return error_count_;  }

    private:
        std::vector<Diagnostic> diags_;
        uint32_t error_count_ = 0;
    };

} // namespace simplang::diag
