#include <cmd/local/session.h>
#include <cmd/ui/color.h>
#include <stg/patch/parse.h>

#include <cxxopts.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Stg {
namespace {

struct Options {
    /// Branch to list patches of.
    std::optional<std::string> branch;
    /// Patch ranges to limit the output.
    std::vector<std::string> ranges;
    /// Groups of patches to list.
    bool applied = false;
    bool unapplied = false;
    bool hidden = false;
    /// Show the title of each patch.
    bool description = false;
    /// Coloring mode.
    std::optional<ColorMode> coloring;
};

RangeConstraint SelectConstraint(const Options& options) {
    const int selected = int(options.applied) + int(options.unapplied) + int(options.hidden);

    if (selected == 1) {
        if (options.applied) {
            return RangeConstraint::Applied;
        }
        if (options.unapplied) {
            return RangeConstraint::Unapplied;
        }
        return RangeConstraint::Hidden;
    }
    if (options.hidden) {
        return RangeConstraint::AllWithAppliedBoundary;
    }
    return RangeConstraint::VisibleWithAppliedBoundary;
}

bool IsSelected(const Options& options, const LocationGroup group) {
    if (!options.applied && !options.unapplied && !options.hidden) {
        return group != LocationGroup::Hidden;
    }
    switch (group) {
        case LocationGroup::Applied:
            return options.applied;
        case LocationGroup::Unapplied:
            return options.unapplied;
        case LocationGroup::Hidden:
            return options.hidden;
    }
    return false;
}

int Execute(const Options& options, const Session& session) {
    const auto& repo = session.GetRepository();
    const auto stack = repo.GetStack(options.branch);
    const bool colored = IsColored(options.coloring.value_or(session.GetColorMode()), stdout);

    std::vector<PatchName> patches;

    if (options.ranges.empty()) {
        for (size_t i = 0; i < stack.Size(); ++i) {
            if (IsSelected(options, stack.GroupAt(i))) {
                patches.push_back(stack.At(i));
            }
        }
    } else {
        std::vector<PatchRange> ranges;

        for (const auto& text : options.ranges) {
            ranges.push_back(ParseRange(text));
        }
        for (auto& name : ResolveRanges(ranges, stack, SelectConstraint(options))) {
            if (IsSelected(options, stack.GroupAt(*stack.IndexOf(name.Str())))) {
                patches.push_back(std::move(name));
            }
        }
    }

    size_t width = 0;
    for (const auto& name : patches) {
        width = std::max(width, name.Size());
    }

    const auto style = [&](const fmt::text_style& value) {
        return colored ? value : fmt::text_style();
    };

    for (const auto& name : patches) {
        const size_t index = *stack.IndexOf(name.Str());
        const auto group = stack.GroupAt(index);

        char marker = '+';
        fmt::text_style name_style;

        switch (group) {
            case LocationGroup::Applied:
                if (index + 1 == stack.Applied().size()) {
                    marker = '>';
                    name_style = style(fmt::emphasis::bold);
                } else {
                    name_style = style(fmt::fg(fmt::terminal_color::green));
                }
                break;
            case LocationGroup::Unapplied:
                marker = '-';
                break;
            case LocationGroup::Hidden:
                marker = '!';
                name_style = style(fmt::emphasis::faint);
                break;
        }

        if (options.description) {
            const auto commit = repo.LookupCommit(stack.PatchCommit(name));

            fmt::print(
                "{} {} # {}\n",
                marker,
                fmt::styled(fmt::format("{:<{}}", name.Str(), width), name_style),
                fmt::styled(MessageTitle(commit->Message()), style(fmt::fg(fmt::terminal_color::yellow)))
            );
        } else {
            fmt::print("{} {}\n", marker, fmt::styled(name.Str(), name_style));
        }
    }

    return 0;
}

} // namespace

int ExecuteSeries(int argc, char* argv[], const std::function<Session&()>& cb) {
    Options options;

    {
        bool all = false;

        cxxopts::Options spec(fmt::format("stg {}", argv[0]));
        spec.add_options(
            "",
            {
                {"h,help", "print help"},
                {"b,branch", "use the given branch instead of the current one", cxxopts::value<std::string>(), "<branch>"},
                {"a,all", "show all patches, including the hidden ones", cxxopts::value<bool>(all)},
                {"A,applied", "show the applied patches only", cxxopts::value<bool>(options.applied)},
                {"U,unapplied", "show the unapplied patches only", cxxopts::value<bool>(options.unapplied)},
                {"H,hidden", "show the hidden patches only", cxxopts::value<bool>(options.hidden)},
                {"d,description", "show a short description for each patch", cxxopts::value<bool>(options.description)},
                {"color", "coloring mode [always|auto|none]", cxxopts::value<std::string>(), "<mode>"},
                {"args", "free args", cxxopts::value<std::vector<std::string>>()},
            }
        );

        spec.parse_positional("args");
        spec.custom_help("[<options>]");
        spec.positional_help("[<patch-range>...]");

        const auto& opts = spec.parse(argc, argv);
        if (opts.count("help")) {
            fmt::print("{}\n", spec.help());
            return 0;
        }
        if (opts.count("branch")) {
            options.branch = opts["branch"].as<std::string>();
        }
        if (opts.count("args")) {
            options.ranges = opts["args"].as<std::vector<std::string>>();
        }
        if (opts.count("color")) {
            const auto arg = opts["color"].as<std::string>();

            if (auto coloring = ParseColorMode(arg)) {
                options.coloring = *coloring;
            } else {
                fmt::print(stderr, "error: unknown coloring mode '{}'\n", arg);
                return 1;
            }
        }
        if (all) {
            if (options.applied || options.unapplied || options.hidden) {
                fmt::print(stderr, "error: --all cannot be combined with --applied, --unapplied or --hidden\n");
                return 1;
            }
            options.applied = options.unapplied = options.hidden = true;
        }
    }

    return Execute(options, cb());
}

} // namespace Stg
