#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deepsea::app {

// Parsed command-line arguments for the deepsea_sim runner.
//
// Notes:
//   - Option names are case-insensitive.
//   - Both "--opt=value" and "--opt value" forms are supported.
struct SimArgs
{
    bool showHelp = false;               // --help / -h

    std::optional<std::string> config;   // --config <file.json>
    std::optional<std::string> logFile;  // --log-file <path>
    std::optional<std::string> logLevel; // --log-level <trace|debug|info|warn|error|critical|off>, lower-cased

    std::optional<int> sessions;         // --sessions <N>, N >= 1
    std::optional<int> haul;             // --haul <N> tiles before turning back, N >= 1
    std::optional<int> seed;             // --seed <N> overrides the config seed

    bool dumpSnapshots = false;          // --dump (log final dive snapshots as JSON)

    // Unknown options and options with bad values, in command-line order.
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] SimArgs ParseSimArgsFromArgv(const std::vector<std::string_view>& argv);

[[nodiscard]] SimArgs ParseSimArgs(int argc, char** argv);

[[nodiscard]] std::string BuildSimHelpText();

} // namespace deepsea::app
