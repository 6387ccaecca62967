#include "session.h"

#include <fmt/format.h>

#include <stdexcept>

namespace Stg {

Session::Session(const std::filesystem::path& path)
    : repository_(std::make_unique<Git::Repository>(path)) {
    config_.Reset(ConfigLocation::Repository, Config::MakeBackend(repository_->GitDir() / "stgit.json"));
    if (const auto user = UserConfigPath(); !user.empty()) {
        config_.Reset(ConfigLocation::User, Config::MakeBackend(user));
    }
    config_.Reset(ConfigLocation::Default, Config::MakeBackend(DefaultConfig()));
}

size_t Session::GetAbbrev() const {
    const auto value = config_.GetOr<int64_t>("core.abbrev", 7);

    if (value < 4 || value > 40) {
        throw std::runtime_error(fmt::format("core.abbrev should be in range [4, 40], got {}", value));
    }
    return size_t(value);
}

ColorMode Session::GetColorMode() const {
    const auto value = config_.GetOr<std::string>("color.ui", "auto");

    if (const auto mode = ParseColorMode(value)) {
        return *mode;
    }
    throw std::runtime_error(fmt::format("unknown coloring mode '{}' in color.ui", value));
}

} // namespace Stg
