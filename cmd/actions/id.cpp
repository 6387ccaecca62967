#include <cmd/local/session.h>
#include <stg/patch/parse.h>

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace Stg {
namespace {

struct Options {
    /// Branch to resolve patches in.
    std::optional<std::string> branch;
    /// Revision specification.
    std::string revision = "@";
    /// Print abbreviated commit id.
    bool abbreviate = false;
};

int Execute(const Options& options, const Session& session) {
    const auto& repo = session.GetRepository();
    const auto spec = ParseSingleRevisionSpec(options.revision);

    std::shared_ptr<const Commit> commit;
    // Plain git revisions do not need a stack.
    if (const auto* git = std::get_if<SingleRevisionSpec::GitLike>(&spec.Get())) {
        commit = repo.LookupRevision(git->revision);
    } else {
        commit = ResolveRevision(spec, repo.GetStack(options.branch), repo, repo).commit;
    }

    if (options.abbreviate) {
        fmt::print("{}\n", commit->Id().ToShortHex(session.GetAbbrev()));
    } else {
        fmt::print("{}\n", commit->Id());
    }

    return 0;
}

} // namespace

int ExecuteId(int argc, char* argv[], const std::function<Session&()>& cb) {
    Options options;

    {
        cxxopts::Options spec(fmt::format("stg {}", argv[0]));
        spec.add_options(
            "",
            {
                {"h,help", "print help"},
                {"b,branch", "use the given branch instead of the current one", cxxopts::value<std::string>(), "<branch>"},
                {"short", "print abbreviated commit id", cxxopts::value<bool>(options.abbreviate)},
                {"args", "free args", cxxopts::value<std::vector<std::string>>()},
            }
        );

        spec.parse_positional("args");
        spec.custom_help("[<options>]");
        spec.positional_help("[<revision>]");

        const auto& opts = spec.parse(argc, argv);
        if (opts.count("help")) {
            fmt::print("{}\n", spec.help());
            return 0;
        }
        if (opts.count("branch")) {
            options.branch = opts["branch"].as<std::string>();
        }
        if (opts.count("args")) {
            const auto& args = opts["args"].as<std::vector<std::string>>();

            if (args.size() > 1) {
                fmt::print(stderr, "error: at most one revision should be provided\n");
                return 1;
            }
            options.revision = args[0];
        }
    }

    return Execute(options, cb());
}

} // namespace Stg
