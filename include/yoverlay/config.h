#pragma once

#include "result.hpp"
#include "focus-navigator.h"
#include "menu-controller.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace yoverlay {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Defaults < file < YOVERLAY_* environment < cmdOverrides.
    // An empty configPath means the XDG location, if that file exists.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    virtual ~Config() = default;

    // Get a value by dotted path (e.g. "menu.close-on-select").
    // Returns nullopt if the key doesn't exist or doesn't convert.
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    virtual bool has(const std::string& path) const = 0;

    // Menu settings assembled from menu.open, menu.close-on-select and menu.position
    virtual MenuConfig menuConfig() const = 0;

    // menu.options; every entry needs an id
    virtual Result<std::vector<Option>> menuOptions() const = 0;

    virtual Side tooltipSide() const = 0;
    virtual std::string logLevel() const = 0;

    static std::filesystem::path getXDGConfigPath();

    // "menu.close-on-select" -> "YOVERLAY_MENU_CLOSE_ON_SELECT"
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "YOVERLAY_";

    static constexpr const char* KEY_MENU_OPEN = "menu.open";
    static constexpr const char* KEY_MENU_CLOSE_ON_SELECT = "menu.close-on-select";
    static constexpr const char* KEY_MENU_POSITION = "menu.position";
    static constexpr const char* KEY_MENU_OPTIONS = "menu.options";
    static constexpr const char* KEY_TOOLTIP_POSITION = "tooltip.position";
    static constexpr const char* KEY_LOG_LEVEL = "log.level";

protected:
    Config() = default;

    // Node at a dotted path; an undefined node if missing
    virtual YAML::Node getNode(const std::string& path) const = 0;

private:
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace yoverlay
