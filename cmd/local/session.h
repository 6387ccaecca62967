#pragma once

#include "config.h"

#include <cmd/ui/color.h>
#include <stg/git/repository.h>

#include <filesystem>
#include <memory>

namespace Stg {

/**
 * Repository opened by a command together with its configuration.
 */
class Session {
public:
    /**
     * @param path path inside a repository.
     */
    explicit Session(const std::filesystem::path& path);

    Git::Repository& GetRepository() noexcept {
        return *repository_;
    }

    const Git::Repository& GetRepository() const noexcept {
        return *repository_;
    }

    const Config& GetConfig() const noexcept {
        return config_;
    }

    /** Number of hex digits in abbreviated commit ids. */
    size_t GetAbbrev() const;

    /** Coloring mode configured by `color.ui`. */
    ColorMode GetColorMode() const;

private:
    std::unique_ptr<Git::Repository> repository_;
    Config config_;
};

} // namespace Stg
