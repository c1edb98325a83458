// tools/simplangc/src/cli/Options.cpp
#include <simplangc/cli/Options.hpp>

#include <string_view>
#include <vector>


namespace simplangc::cli {

    namespace {

        /// @brief 모드를 지정하는 플래그와 그 값을 기록한다. 모드는 하나만 허용된다.
        bool set_mode(Options& opt, Mode m, std::string_view flag, std::string_view payload) {
            if (opt.mode != Mode::kUsage) {
                opt.ok = false;
                opt.error = std::string(flag) + " conflicts with another mode flag";
                return false;
            }
            opt.mode = m;
            opt.payload = std::string(payload);
            return true;
        }

        /// @brief 값이 필요한 플래그의 다음 인자를 꺼낸다.
        bool take_value(Options& opt, const std::vector<std::string_view>& args, size_t& i,
                        std::string_view what, std::string_view& out) {
            if (i + 1 >= args.size()) {
                opt.ok = false;
                opt.error = std::string(args[i]) + " requires " + std::string(what);
                return false;
            }
            out = args[++i];
            return true;
        }

    } // namespace

    void print_usage(std::ostream& os) {
        os
            << "simplangc\n"
            << "  --version\n"
            << "  --file <path>          [--lang en|ko] [--dump tokens]\n"
            << "  --tokens \"<listing>\"   [--lang en|ko] [--dump tokens]\n"
            << "  --demo\n"
            << "\n"
            << "Token listing: one `<kind> <line>` per line, '#' starts a comment.\n"
            << "\n"
            << "Options:\n"
            << "  -fstrict-operands        (operands must be identifier/number/boolean)\n"
            << "  -fstrict-block-close     (reject if/for body that hits EOF; default)\n"
            << "  -fno-strict-block-close  (let EOF reach the statement dispatcher)\n"
            << "  --dump tokens            (print the token stream before parsing)\n";
    }

    Options parse_options(int argc, char** argv) {
        Options opt{};

        if (argc <= 1) {
            opt.mode = Mode::kUsage;
            return opt;
        }

        std::vector<std::string_view> args;
        args.reserve(static_cast<size_t>(argc - 1));
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        for (auto a : args) {
            if (a == "--version") {
                opt.mode = Mode::kVersion;
                return opt;
            }
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string_view a = args[i];
            std::string_view v{};

            if (a == "--file") {
                if (!take_value(opt, args, i, "a path", v)) return opt;
                if (!set_mode(opt, Mode::kFile, a, v)) return opt;
            } else if (a == "--tokens") {
                if (!take_value(opt, args, i, "a token listing", v)) return opt;
                if (!set_mode(opt, Mode::kTokens, a, v)) return opt;
            } else if (a == "--demo") {
                if (!set_mode(opt, Mode::kDemo, a, {})) return opt;
            } else if (a == "--lang") {
                if (!take_value(opt, args, i, "en|ko", v)) return opt;
                if (v == "ko") opt.lang = simplang::diag::Language::kKo;
                else if (v == "en") opt.lang = simplang::diag::Language::kEn;
                else {
                    opt.ok = false;
                    opt.error = "unknown --lang value: " + std::string(v);
                    return opt;
                }
            } else if (a == "--dump") {
                if (!take_value(opt, args, i, "a dump target", v)) return opt;
                if (v != "tokens") {
                    opt.ok = false;
                    opt.error = "unknown --dump target: " + std::string(v);
                    return opt;
                }
                opt.dump_tokens = true;
            } else if (a == "-fstrict-operands") {
                opt.parser_flags.strict_operands = true;
            } else if (a == "-fstrict-block-close") {
                opt.parser_flags.strict_block_close = true;
            } else if (a == "-fno-strict-block-close") {
                opt.parser_flags.strict_block_close = false;
            } else {
                opt.ok = false;
                opt.error = "unknown option: " + std::string(a);
                return opt;
            }
        }

        return opt;
    }

} // namespace simplangc::cli
