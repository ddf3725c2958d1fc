#include "deepsea/app/SimArgs.hpp"

#include <cctype>
#include <limits>
#include <sstream>

namespace deepsea::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Matches "--opt=value" and yields "value".
[[nodiscard]] bool ConsumeValue(std::string_view arg, std::string_view prefix, std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    const std::size_t n = prefix.size();
    if (arg.size() == n || arg[n] != '=')
        return false;

    outValue = arg.substr(n + 1);
    return true;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    int sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<long long>(c - '0');
        if (v > 1'000'000'000LL)
            return std::nullopt; // absurd
    }

    v *= sign;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return std::nullopt;

    return static_cast<int>(v);
}

[[nodiscard]] bool IsLogLevelName(std::string_view s)
{
    constexpr std::string_view kNames[] = { "trace", "debug", "info", "warn", "error", "critical", "off" };
    for (std::string_view n : kNames)
    {
        if (s == n)
            return true;
    }
    return false;
}

} // namespace

SimArgs ParseSimArgsFromArgv(const std::vector<std::string_view>& argv)
{
    SimArgs out;

    const std::size_t argc = argv.size();
    for (std::size_t i = 1; i < argc; ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        const std::string lowered = ToLower(raw);
        const std::string_view arg(lowered);

        auto addUnknown = [&] { out.unknown.emplace_back(raw); };

        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }
        if (arg == "--dump") { out.dumpSnapshots = true; continue; }

        std::string_view value;

        // Integers: "--opt N" or "--opt=N".
        const auto intOption = [&](std::string_view name, std::optional<int>& dst) -> bool {
            if (arg == name)
            {
                const auto parsed = (i + 1 < argc) ? ParseInt(argv[i + 1]) : std::nullopt;
                if (!parsed)
                {
                    addUnknown();
                    return true;
                }
                dst = *parsed;
                ++i;
                return true;
            }
            if (ConsumeValue(arg, name, value))
            {
                const auto parsed = ParseInt(value);
                if (parsed)
                    dst = *parsed;
                else
                    addUnknown();
                return true;
            }
            return false;
        };

        // Strings keep their original case.
        const auto stringOption = [&](std::string_view name, std::optional<std::string>& dst) -> bool {
            if (arg == name)
            {
                if (i + 1 >= argc)
                {
                    addUnknown();
                    return true;
                }
                dst = std::string(argv[i + 1]);
                ++i;
                return true;
            }
            if (ConsumeValue(arg, name, value))
            {
                dst = std::string(raw.substr(name.size() + 1));
                return true;
            }
            return false;
        };

        // Counts must be positive; a rejected value is reported and dropped.
        const auto positive = [&](std::optional<int>& dst) {
            if (dst && *dst < 1)
            {
                addUnknown();
                dst.reset();
            }
        };

        if (intOption("--sessions", out.sessions) || intOption("-n", out.sessions)) { positive(out.sessions); continue; }
        if (intOption("--haul", out.haul)) { positive(out.haul); continue; }
        if (intOption("--seed", out.seed)) continue;
        if (stringOption("--config", out.config) || stringOption("-c", out.config)) continue;
        if (stringOption("--log-file", out.logFile)) continue;
        if (stringOption("--log-level", out.logLevel))
        {
            if (out.logLevel)
            {
                *out.logLevel = ToLower(*out.logLevel);
                if (!IsLogLevelName(*out.logLevel))
                {
                    addUnknown();
                    out.logLevel.reset();
                }
            }
            continue;
        }

        addUnknown();
    }

    return out;
}

SimArgs ParseSimArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(static_cast<std::size_t>(argc > 0 ? argc : 0));
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i]);
    return ParseSimArgsFromArgv(v);
}

std::string BuildSimHelpText()
{
    std::ostringstream oss;
    oss << "deepsea_sim - headless dive sessions\n\n";
    oss << "Options\n";
    oss << "  --config, -c <file.json>     Session config (defaults: 25 oxygen, 2d3, 4 tiers)\n";
    oss << "  --sessions, -n <N>           Number of sessions to run (default 100)\n";
    oss << "  --haul <N>                   Tiles a diver collects before turning back (default 2)\n";
    oss << "  --seed <N>                   Override the config seed\n";
    oss << "  --log-level <level>          trace, debug, info, warn, error, critical, off (default info)\n";
    oss << "  --log-file <path>            Also write a rotating log file\n";
    oss << "  --dump                       Log each final dive snapshot as JSON\n";
    oss << "  --help, -h                   Show this help\n\n";

    oss << "Examples\n";
    oss << "  deepsea_sim --sessions 1000 --haul 3\n";
    oss << "  deepsea_sim -c config/deepsea.json --log-level debug\n";
    return oss.str();
}

} // namespace deepsea::app
