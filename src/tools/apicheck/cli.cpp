//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Argument parsing and the top-level run for `apicheck`. Compiled units can be
// named explicitly with their source (`--class Foo.class=src/Foo.java`) or
// passed bare, in which case the reported source comes from the class file's
// SourceFile attribute. Layouts are given with `--layout` or bare with an
// .xml extension.
//
//===----------------------------------------------------------------------===//

#include "tools/apicheck/cli.hpp"

#include "apicheck/ApiCheck.hpp"
#include "support/path_utils.hpp"
#include "support/trace.hpp"

#include <charconv>
#include <optional>
#include <ostream>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace apicheck::tools
{
namespace
{

using support::DiagCode;

support::Diag usageError(const std::string &msg)
{
    return support::makeError(DiagCode::Usage, "apicheck", msg);
}

/// Parse a non-negative decimal integer occupying all of @p text.
template <class T> bool parseNumber(std::string_view text, T &out)
{
    const char *const begin = text.data();
    const char *const end = begin + text.size();
    T parsed{};
    const auto fc = std::from_chars(begin, end, parsed);
    if (text.empty() || fc.ec != std::errc() || fc.ptr != end)
        return false;
    if constexpr (std::is_signed_v<T>)
    {
        if (parsed < 0)
            return false;
    }
    out = parsed;
    return true;
}

check::CompiledUnit classUnit(std::string_view text)
{
    check::CompiledUnit unit;
    const auto eq = text.find('=');
    if (eq == std::string_view::npos)
    {
        unit.artifactPath = std::string(text);
    }
    else
    {
        unit.artifactPath = std::string(text.substr(0, eq));
        unit.sourcePath = std::string(text.substr(eq + 1));
    }
    return unit;
}

} // namespace

void printUsage(std::ostream &os)
{
    os << "Usage: apicheck --catalog <api-versions.xml> --min <N> [options] [inputs...]\n"
          "\n"
          "Report references to platform APIs newer than the declared minimum.\n"
          "\n"
          "Options:\n"
          "  --catalog <file>          api-versions catalog (required)\n"
          "  --min <N>                 declared minimum platform version (required)\n"
          "  --jobs <N>                worker threads (default: hardware concurrency)\n"
          "  --base <dir>              report paths relative to <dir>\n"
          "  --class <f.class>[=<src>] compiled unit, optionally with its source path\n"
          "  --layout <file.xml>       layout document\n"
          "  --trace                   progress lines on stderr (also APICHECK_TRACE)\n"
          "  -h, --help                show this help\n"
          "\n"
          "Bare inputs ending in .class are compiled units, .xml are layouts.\n";
}

support::Expected<CliOptions> parseCommandLine(int argc, char **argv)
{
    CliOptions opts;
    bool haveMin = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help")
        {
            opts.showHelp = true;
        }
        else if (arg == "--trace")
        {
            opts.check.trace = true;
        }
        else if (arg == "--catalog" || arg == "--min" || arg == "--jobs" || arg == "--base" ||
                 arg == "--class" || arg == "--layout")
        {
            if (i + 1 >= argc)
                return usageError("missing value for " + std::string(arg));
            const char *value = argv[++i];

            if (arg == "--catalog")
                opts.catalogPath = value;
            else if (arg == "--base")
                opts.check.baseDir = value;
            else if (arg == "--class")
                opts.units.push_back(classUnit(value));
            else if (arg == "--layout")
                opts.resources.push_back({value, std::nullopt});
            else if (arg == "--min")
            {
                if (!parseNumber(value, opts.check.minVersion))
                    return usageError("invalid --min value '" + std::string(value) + "'");
                haveMin = true;
            }
            else if (!parseNumber(value, opts.check.jobs))
                return usageError("invalid --jobs value '" + std::string(value) + "'");
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            return usageError("unknown option " + std::string(arg));
        }
        else if (support::isClassFile(arg))
        {
            opts.units.push_back(classUnit(arg));
        }
        else if (support::isXmlFile(arg))
        {
            opts.resources.push_back({std::string(arg), std::nullopt});
        }
        else
        {
            return usageError("cannot classify input '" + std::string(arg) +
                              "' (expected .class or .xml)");
        }
    }

    if (opts.showHelp)
        return opts;
    if (opts.catalogPath.empty())
        return usageError("--catalog is required");
    if (!haveMin)
        return usageError("--min is required");
    return opts;
}

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    auto parsed = parseCommandLine(argc, argv);
    if (!parsed)
    {
        support::printDiag(parsed.error(), err);
        printUsage(err);
        return 2;
    }
    const CliOptions &opts = parsed.value();
    if (opts.showHelp)
    {
        printUsage(out);
        return 0;
    }

    if (opts.check.trace)
    {
        support::setTraceStream(err);
        support::setTraceEnabled(true);
    }

    auto result = runCheck(opts.catalogPath, opts.units, opts.resources, opts.check);
    if (!result)
    {
        support::printDiag(result.error(), err);
        return 2;
    }

    const check::ScanResult &scan = result.value();
    scan.diagnostics.printAll(err, &scan.sources);
    if (!scan.failedPaths.empty())
        err << "apicheck: " << report::parseFailureSummary(scan.failedPaths) << '\n';

    report::printReport(scan.violations, out);
    return scan.violations.empty() ? 0 : 1;
}

} // namespace apicheck::tools
