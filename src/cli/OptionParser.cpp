#include "cli/OptionParser.hpp"

#include <charconv>
#include <sstream>

#include "util/Strings.hpp"

namespace trackr {

namespace {

using Apply = std::function<void(Options&, const OptionValue&)>;

OptionSpec flag(const char* longName, char shortName, const char* group, const char* help, Apply apply) {
    OptionSpec s;
    s.longName = longName;
    s.shortName = shortName;
    s.arity = Arity::Flag;
    s.group = group;
    s.help = help;
    s.apply = std::move(apply);
    return s;
}

OptionSpec valued(const char* longName, char shortName, Arity arity, const char* group,
                  const char* valueName, const char* help, Apply apply) {
    OptionSpec s = flag(longName, shortName, group, help, std::move(apply));
    s.arity = arity;
    s.valueName = valueName;
    return s;
}

OptionSpec integer(const char* longName, char shortName, const char* group, const char* valueName,
                   const char* help, int64_t minValue, int64_t maxValue, Apply apply) {
    OptionSpec s = valued(longName, shortName, Arity::Integer, group, valueName, help, std::move(apply));
    s.minValue = minValue;
    s.maxValue = maxValue;
    return s;
}

OptionSpec choice(const char* longName, const char* group, const char* valueName, const char* help,
                  std::vector<std::string> choices, Apply apply) {
    OptionSpec s = valued(longName, 0, Arity::Choice, group, valueName, help, std::move(apply));
    s.choices = std::move(choices);
    return s;
}

std::string display(const OptionSpec& spec) {
    return "--" + spec.longName;
}

Error usage(const std::string& message) {
    return Error{ErrorCode::UsageError, message};
}

constexpr const char* ACTIONS = "Actions";
constexpr const char* PROJECT = "Project selection";
constexpr const char* STORY = "Story fields";
constexpr const char* GENERAL = "General";

constexpr int64_t INT_LIMIT = std::numeric_limits<int>::max();

}

OptionParser::OptionParser() {
    table = {
        flag("help", 'h', GENERAL, "Print usage and exit",
             [](Options& o, const OptionValue&) { o.help = true; }),
        flag("man", 0, GENERAL, "Print the full manual and exit",
             [](Options& o, const OptionValue&) { o.manual = true; }),
        flag("verbose", 'v', GENERAL, "Log diagnostics to stderr",
             [](Options& o, const OptionValue&) { o.verbose = true; }),
        valued("config", 'c', Arity::String, GENERAL, "<file>", "Read this configuration file after the defaults",
               [](Options& o, const OptionValue& v) { o.config = v.text; }),
        integer("timeout", 0, GENERAL, "<seconds>", "Request timeout (default 30)", 1, INT_LIMIT,
                [](Options& o, const OptionValue& v) { o.timeout = static_cast<long>(v.integer); }),

        flag("list-projects", 'l', ACTIONS, "List the named projects from the configuration",
             [](Options& o, const OptionValue&) { o.listProjects = true; }),
        flag("show-project", 0, ACTIONS, "Show project details",
             [](Options& o, const OptionValue&) { o.showProject = true; }),
        flag("show-story", 's', ACTIONS, "Show the story given by --story-id",
             [](Options& o, const OptionValue&) { o.showStory = true; }),
        flag("all-stories", 'a', ACTIONS, "With --show-story, show every story in the project",
             [](Options& o, const OptionValue&) { o.allStories = true; }),
        flag("show-notes", 'n', ACTIONS, "Include notes when showing stories",
             [](Options& o, const OptionValue&) { o.showNotes = true; }),
        valued("search", 'f', Arity::String, ACTIONS, "<filter>", "Show stories matching a search filter",
               [](Options& o, const OptionValue& v) { o.search = v.text; }),
        flag("add-story", 0, ACTIONS, "Create a story titled by --story",
             [](Options& o, const OptionValue&) { o.addStory = true; }),
        flag("update-story", 0, ACTIONS, "Update the story given by --story-id",
             [](Options& o, const OptionValue&) { o.updateStory = true; }),
        flag("delete-story", 0, ACTIONS, "Delete the story given by --story-id",
             [](Options& o, const OptionValue&) { o.deleteStory = true; }),
        valued("add-note", 0, Arity::String, ACTIONS, "<text>", "Add a note to the story given by --story-id",
               [](Options& o, const OptionValue& v) { o.addNote = v.text; }),

        valued("project", 'p', Arity::String, PROJECT, "<name>", "Project name from the Projects table",
               [](Options& o, const OptionValue& v) { o.project = v.text; }),
        integer("project-id", 'P', PROJECT, "<id>", "Numeric project id", 1,
                std::numeric_limits<int64_t>::max(),
                [](Options& o, const OptionValue& v) { o.projectId = v.integer; }),

        integer("story-id", 'i', STORY, "<id>", "Story id", 1, std::numeric_limits<int64_t>::max(),
                [](Options& o, const OptionValue& v) { o.storyId = v.integer; }),
        valued("story", 't', Arity::String, STORY, "<title>", "Story title",
               [](Options& o, const OptionValue& v) { o.story = v.text; }),
        valued("description", 'd', Arity::String, STORY, "<text>", "Story description",
               [](Options& o, const OptionValue& v) { o.description = v.text; }),
        valued("requested-by", 'r', Arity::String, STORY, "<name>", "Requester (defaults to General.Me)",
               [](Options& o, const OptionValue& v) { o.requestedBy = v.text; }),
        valued("owned-by", 'o', Arity::String, STORY, "<name>", "Owner",
               [](Options& o, const OptionValue& v) { o.ownedBy = v.text; }),
        valued("label", 'L', Arity::Repeated, STORY, "<labels>", "Label; repeat or separate with commas",
               [](Options& o, const OptionValue& v) { o.labels.push_back(v.text); }),
        integer("estimate", 'e', STORY, "<points>", "Point estimate", 0, INT_LIMIT,
                [](Options& o, const OptionValue& v) { o.estimate = static_cast<int>(v.integer); }),
        valued("created-at", 0, Arity::String, STORY, "<date>", "Creation date",
               [](Options& o, const OptionValue& v) { o.createdAt = v.text; }),
        valued("deadline", 0, Arity::String, STORY, "<date>", "Deadline (release stories)",
               [](Options& o, const OptionValue& v) { o.deadline = v.text; }),
        choice("story-type", STORY, "<type>", "Story type", storyTypeNames(),
               [](Options& o, const OptionValue& v) { o.storyType = parseStoryType(v.text); }),
        choice("state", STORY, "<state>", "Story state", storyStateNames(),
               [](Options& o, const OptionValue& v) { o.state = parseStoryState(v.text); }),
        flag("feature", 0, STORY, "Same as --story-type feature",
             [](Options& o, const OptionValue&) { o.storyType = StoryType::Feature; }),
        flag("bug", 0, STORY, "Same as --story-type bug",
             [](Options& o, const OptionValue&) { o.storyType = StoryType::Bug; }),
        flag("chore", 0, STORY, "Same as --story-type chore",
             [](Options& o, const OptionValue&) { o.storyType = StoryType::Chore; }),
        flag("release", 0, STORY, "Same as --story-type release",
             [](Options& o, const OptionValue&) { o.storyType = StoryType::Release; }),
    };
}

const OptionSpec* OptionParser::findLong(const std::string& name) const {
    for (const auto& spec : table) {
        if (spec.longName == name) return &spec;
    }
    return nullptr;
}

const OptionSpec* OptionParser::findShort(char name) const {
    for (const auto& spec : table) {
        if (spec.shortName != 0 && spec.shortName == name) return &spec;
    }
    return nullptr;
}

Expected<void> OptionParser::applyValue(const OptionSpec& spec, const std::string& text, Options& options) const {
    OptionValue value;
    value.text = text;

    if (spec.arity == Arity::Integer) {
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value.integer);
        if (text.empty() || ec != std::errc() || ptr != end) {
            return usage("option '" + display(spec) + "' expects an integer, got '" + text + "'");
        }
        if (value.integer < spec.minValue || value.integer > spec.maxValue) {
            return usage("option '" + display(spec) + "' value " + text + " is out of range");
        }
    } else if (spec.arity == Arity::Choice) {
        bool known = false;
        for (const auto& c : spec.choices) {
            if (c == text) known = true;
        }
        if (!known) {
            return usage("option '" + display(spec) + "' must be one of: " + Strings::join(spec.choices, ", ") +
                         " (got '" + text + "')");
        }
    }

    spec.apply(options, value);
    return {};
}

Expected<Options> OptionParser::parse(const std::vector<std::string>& args) const {
    Options options;
    bool endOfOptions = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (endOfOptions || arg.size() < 2 || arg[0] != '-') {
            return usage("unexpected argument '" + arg + "'");
        }
        if (arg == "--") {
            endOfOptions = true;
            continue;
        }

        if (arg.rfind("--", 0) == 0) {
            // Long option: --name, --name=value, --name value
            std::string name = arg.substr(2);
            std::optional<std::string> inlineValue;
            size_t eq = name.find('=');
            if (eq != std::string::npos) {
                inlineValue = name.substr(eq + 1);
                name = name.substr(0, eq);
            }

            const OptionSpec* spec = findLong(name);
            if (!spec) {
                return usage("unrecognized option '--" + name + "'");
            }

            if (spec->arity == Arity::Flag) {
                if (inlineValue) {
                    return usage("option '--" + name + "' does not take a value");
                }
                spec->apply(options, OptionValue{});
                continue;
            }

            std::string value;
            if (inlineValue) {
                value = *inlineValue;
            } else if (i + 1 < args.size()) {
                value = args[++i];
            } else {
                return usage("option '--" + name + "' requires a value");
            }
            auto res = applyValue(*spec, value, options);
            if (!res) return res.error();
            continue;
        }

        // Short option group: -a, -an, -i7, -i 7
        for (size_t j = 1; j < arg.size(); ++j) {
            const OptionSpec* spec = findShort(arg[j]);
            if (!spec) {
                return usage(std::string("unrecognized option '-") + arg[j] + "'");
            }
            if (spec->arity == Arity::Flag) {
                spec->apply(options, OptionValue{});
                continue;
            }

            std::string value = arg.substr(j + 1);
            if (value.empty()) {
                if (i + 1 >= args.size()) {
                    return usage(std::string("option '-") + arg[j] + "' requires a value");
                }
                value = args[++i];
            }
            auto res = applyValue(*spec, value, options);
            if (!res) return res.error();
            break;
        }
    }

    return options;
}

std::string OptionParser::describeOptions() const {
    std::ostringstream out;
    std::vector<std::string> groups;
    for (const auto& spec : table) {
        bool seen = false;
        for (const auto& g : groups) {
            if (g == spec.group) seen = true;
        }
        if (!seen) groups.push_back(spec.group);
    }

    for (const auto& group : groups) {
        out << group << ":\n";
        for (const auto& spec : table) {
            if (spec.group != group) continue;
            std::string left = spec.shortName ? std::string("-") + spec.shortName + ", " : "    ";
            left += "--" + spec.longName;
            if (!spec.valueName.empty()) left += " " + spec.valueName;
            out << "  " << left;
            const size_t column = 30;
            if (left.size() < column) {
                out << std::string(column - left.size(), ' ');
            } else {
                out << "\n  " << std::string(column, ' ');
            }
            out << spec.help;
            if (spec.arity == Arity::Choice) {
                out << " (" << Strings::join(spec.choices, "|") << ")";
            }
            out << "\n";
        }
        out << "\n";
    }
    return out.str();
}

}
