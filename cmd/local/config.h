#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace Stg {

enum class ConfigLocation {
    /// Repository specific configuration.
    Repository = 0,
    /// User specific configuration.
    User,
    /// Default configuration.
    Default,
};

/**
 * Layered configuration.
 *
 * Keys are dotted paths (e.g. `core.abbrev`). A value is taken from the first
 * location, in the order of ConfigLocation, which has it.
 */
class Config {
public:
    class Backend {
    public:
        virtual ~Backend() = default;

        virtual std::optional<nlohmann::json> Get(const std::string_view key) const = 0;
    };

    /** Makes a file backend. Missing file is treated as an empty configuration. */
    static std::unique_ptr<Backend> MakeBackend(const std::filesystem::path& path);

    /** Makes a json backend. */
    static std::unique_ptr<Backend> MakeBackend(nlohmann::json config);

    /** Makes an in-memory backend. */
    static std::unique_ptr<Backend> MakeBackend(std::map<std::string, nlohmann::json, std::less<>> config);

public:
    Config();

    Config(std::map<ConfigLocation, std::unique_ptr<Backend>> locations);

    /** Returns value by key. */
    std::optional<nlohmann::json> Get(const std::string_view key) const;

    /** Returns value by key from the specific location. */
    std::optional<nlohmann::json> Get(const std::string_view key, const ConfigLocation location) const;

    /** Returns typed value by key or the fallback value. Throws if the value has another type. */
    template <typename T>
    T GetOr(const std::string_view key, T fallback) const {
        if (auto value = Get(key)) {
            return value->get<T>();
        }
        return fallback;
    }

public:
    void Reset(const ConfigLocation location, std::unique_ptr<Backend> backend);

private:
    std::optional<nlohmann::json> GetImpl(
        const std::string_view key, const std::optional<ConfigLocation> location
    ) const;

private:
    std::vector<std::unique_ptr<Backend>> backends_;
};

/** Path to the user configuration file. */
std::filesystem::path UserConfigPath();

/** Built-in values of known keys. */
std::map<std::string, nlohmann::json, std::less<>> DefaultConfig();

} // namespace Stg
