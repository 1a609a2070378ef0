#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <vector>

#include "core/Options.hpp"
#include "util/Expected.hpp"

namespace trackr {

enum class Arity {
    Flag,       // presence only
    String,     // one value
    Integer,    // one value, decimal integer within [minValue, maxValue]
    Repeated,   // one value per occurrence, accumulated
    Choice      // one value from a closed set
};

/// Validated option argument handed to OptionSpec::apply
struct OptionValue {
    std::string text;
    int64_t integer{0};
};

/**
 * @brief Declaration of one command-line option
 */
struct OptionSpec {
    std::string longName;
    char shortName{0};              // 0 when there is no short alias
    Arity arity{Arity::Flag};
    std::string group;              // help section
    std::string valueName;          // placeholder shown in help ("<id>")
    std::string help;
    std::vector<std::string> choices;
    int64_t minValue{0};
    int64_t maxValue{std::numeric_limits<int64_t>::max()};
    std::function<void(Options&, const OptionValue&)> apply;
};

/**
 * @brief Parses process arguments into Options
 *
 * Accepted forms:
 *   --name            flag
 *   --name value      --name=value
 *   -x value          -xvalue
 *   -abc              combined short flags; a value-taking option ends the
 *                     group and takes the rest of it (or the next argument)
 *   --                end of options
 *
 * Positional arguments are not accepted. All failures are UsageError.
 */
class OptionParser {
public:
    OptionParser();

    Expected<Options> parse(const std::vector<std::string>& args) const;

    /// Option reference grouped by section, one line per option
    std::string describeOptions() const;

    const std::vector<OptionSpec>& specs() const { return table; }

private:
    const OptionSpec* findLong(const std::string& name) const;
    const OptionSpec* findShort(char name) const;
    Expected<void> applyValue(const OptionSpec& spec, const std::string& text, Options& options) const;

    std::vector<OptionSpec> table;
};

}
