#include "cellscrub/app/ScrubOptions.hpp"
#include "cellscrub/unicode/TextEncoder.hpp"
#include <fmt/format.h>

namespace cellscrub {
namespace app {

namespace {

core::Error usageError(const std::string& message) {
    return core::makeError(core::ErrorCode::InvalidArgument, message);
}

} // namespace

core::Result<ScrubOptions> ScrubOptionsParser::parse(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

core::Result<ScrubOptions> ScrubOptionsParser::parse(const std::vector<std::string>& args) {
    ScrubOptions options;
    std::vector<std::string> positional;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (options_done || arg.size() < 2 || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }

        // 支持 --name=value 与 --name value 两种写法
        std::string name = arg;
        std::string value;
        bool has_inline_value = false;
        size_t eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            has_inline_value = true;
        }

        auto takeValue = [&](std::string& out) -> bool {
            if (has_inline_value) {
                out = value;
                return true;
            }
            if (i + 1 >= args.size()) {
                return false;
            }
            out = args[++i];
            return true;
        };

        if (name == "--") {
            options_done = true;
        } else if (name == "-h" || name == "--help") {
            options.show_help = true;
        } else if (name == "--yes" || name == "-y") {
            options.auto_confirm = true;
        } else if (name == "--no-report") {
            options.write_report = false;
        } else if (name == "--log-console") {
            options.log_to_console = true;
        } else if (name == "--log-file") {
            if (!takeValue(options.log_file) || options.log_file.empty()) {
                return usageError("--log-file requires a path");
            }
        } else if (name == "--log-level") {
            std::string level;
            if (!takeValue(level)) {
                return usageError("--log-level requires a value");
            }
            if (!Logger::parseLevel(level, options.log_level)) {
                return usageError(fmt::format("Unknown log level '{}'", level));
            }
        } else if (name == "--report-encoding") {
            if (!takeValue(options.report_encoding) || options.report_encoding.empty()) {
                return usageError("--report-encoding requires an encoding name");
            }
            if (!unicode::TextEncoder::isSupported(options.report_encoding)) {
                return usageError(fmt::format("Unsupported report encoding '{}'", options.report_encoding));
            }
        } else {
            return usageError(fmt::format("Unknown option '{}'", arg));
        }
    }

    if (positional.size() > 2) {
        return usageError(fmt::format("Unexpected argument '{}'", positional[2]));
    }
    if (!positional.empty()) {
        options.input_path = positional[0];
    }
    if (positional.size() == 2) {
        options.pattern = positional[1];
    }
    return options;
}

std::string ScrubOptionsParser::usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [options] <workbook.xlsx> [pattern]\n"
        "\n"
        "Scans every sheet for problematic characters (default: U+0080..U+00FF and\n"
        "their \\xNN escape forms) and optionally cleans them into a new workbook.\n"
        "pattern may be a single character or an escape such as \\x81 or \\u00e9.\n"
        "\n"
        "Options:\n"
        "  --log-file <path>          log file (default logs/cellscrub.log)\n"
        "  --log-level <level>        trace|debug|info|warn|error|critical|off (default info)\n"
        "  --log-console              also print log lines to stderr\n"
        "  --report-encoding <name>   encoding of the text report and cleaning log (default UTF-8)\n"
        "  --no-report                do not write the text findings report\n"
        "  -y, --yes                  start cleaning without asking\n"
        "  -h, --help                 show this help\n"
        "\n"
        "Exit codes: 0 success or nothing found, 1 I/O failure, 2 usage error.\n",
        program);
}

}} // namespace cellscrub::app
