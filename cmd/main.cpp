#include "actions.h"

#include <cmd/local/session.h>

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <string_view>

namespace Stg {

extern int ExecuteId(int argc, char* argv[], const std::function<Session&()>& cb);
extern int ExecuteSeries(int argc, char* argv[], const std::function<Session&()>& cb);

namespace {

class Instance {
public:
    Session& GetSession() {
        if (!session_) {
            session_ = std::make_unique<Session>(std::filesystem::current_path());
        }
        return *session_;
    }

private:
    std::unique_ptr<Session> session_;
};

void PrintHelp() {
    fmt::print("usage: stg [-C <path>] <command> [<options>]\n"
               "\n"
               "List of available commands:\n"
               "   id           Print git hash of a StGit revision\n"
               "   series       Print the patch series\n");
}

/// Position of the command name after the global options.
int FindCommand(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "-C") {
            ++i;
        } else if (!arg.starts_with('-')) {
            return i;
        }
    }
    return argc;
}

int Main(int argc, char* argv[]) {
    {
        const int command = FindCommand(argc, argv);

        cxxopts::Options spec("stg");
        spec.add_options(
            "",
            {
                {"h,help", "print help"},
                {"C", "run as if stg was started in <path>", cxxopts::value<std::string>(), "<path>"},
            }
        );

        spec.custom_help("[<options>]");
        spec.positional_help("<command> [<args>]");

        const auto& opts = spec.parse(command, argv);
        if (opts.count("help")) {
            fmt::print("{}\n", spec.help());
            return 0;
        }
        if (opts.count("C")) {
            std::filesystem::current_path(opts["C"].as<std::string>());
        }

        argc -= command;
        argv += command;
    }

    if (argc < 1) {
        PrintHelp();
        return 0;
    }

    Instance instance;
    const auto get_session = [&] -> Session& {
        return instance.GetSession();
    };

    switch (ParseAction(argv[0])) {
        case Action::Id:
            return ExecuteId(argc, argv, get_session);
        case Action::Series:
            return ExecuteSeries(argc, argv, get_session);
        case Action::Unknown:
            fmt::print(stderr, "error: unknown command '{}'\n", argv[0]);
            return 1;
    }

    return 0;
}

} // namespace
} // namespace Stg

int main(int argc, char* argv[]) {
    try {
        return Stg::Main(argc, argv);
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
    }
    return 1;
}
