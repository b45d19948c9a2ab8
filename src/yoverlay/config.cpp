#include "yoverlay/config.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace yoverlay {

namespace {

constexpr const char* DEFAULT_CONFIG = R"(
menu:
  open: false
  close-on-select: always
  position: bottom-end
tooltip:
  position: top
log:
  level: info
)";

// Keys that may be overridden from the environment
constexpr const char* ENV_KEYS[] = {
    Config::KEY_MENU_OPEN,
    Config::KEY_MENU_CLOSE_ON_SELECT,
    Config::KEY_MENU_POSITION,
    Config::KEY_TOOLTIP_POSITION,
    Config::KEY_LOG_LEVEL,
};

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// Source into target; maps merge recursively, anything else replaces
void mergeNodes(YAML::Node target, const YAML::Node& source) {
    if (!source.IsMap()) return;
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        YAML::Node existing = target[key];
        if (value.IsMap() && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

void setScalar(YAML::Node root, const std::vector<std::string>& parts, const std::string& value) {
    if (parts.empty()) return;
    YAML::Node current;
    current.reset(root);
    for (size_t i = 0; i + 1 < parts.size(); i++) {
        YAML::Node next = current[parts[i]];
        if (!next.IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
            next.reset(current[parts[i]]);
        }
        current.reset(next);
    }
    current[parts.back()] = value;
}

CloseOnSelect parseCloseOnSelect(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "always" || lower == "true") return CloseAlways{};
    if (lower == "never" || lower == "false") return CloseNever{};
    ywarn("Config: unknown {} value '{}', using 'always'", Config::KEY_MENU_CLOSE_ON_SELECT, value);
    return CloseAlways{};
}

} // namespace

// ─── ConfigImpl ──────────────────────────────────────────────────────────────

class ConfigImpl : public Config {
public:
    ConfigImpl(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
        : _configPath(configPath), _cmdOverrides(cmdOverrides) {}

    ~ConfigImpl() override = default;

    Result<void> init() noexcept {
        try {
            _config = YAML::Load(DEFAULT_CONFIG);
        } catch (const YAML::Exception& e) {
            return Err<void>("Config: invalid built-in defaults: " + std::string(e.what()));
        }

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                return Err<void>("Config: failed to load " + effectivePath, res);
            }
            yinfo("Loaded config from: {}", effectivePath);
        }

        applyEnvOverrides();

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
        return Ok();
    }

    bool has(const std::string& path) const override {
        return getNode(path).IsDefined();
    }

    MenuConfig menuConfig() const override {
        MenuConfig config;
        config.isOpen = Config::get<bool>(KEY_MENU_OPEN, false);
        config.closeOnSelect = parseCloseOnSelect(
            Config::get<std::string>(KEY_MENU_CLOSE_ON_SELECT, "always"));
        config.position = parsePlacement(Config::get<std::string>(KEY_MENU_POSITION, "bottom-end"));
        return config;
    }

    Result<std::vector<Option>> menuOptions() const override {
        YAML::Node node = getNode(KEY_MENU_OPTIONS);
        if (!node || node.IsNull()) return Ok(std::vector<Option>{});
        if (!node.IsSequence()) {
            return Err<std::vector<Option>>(std::string(KEY_MENU_OPTIONS) + " must be a sequence");
        }

        std::vector<Option> options;
        options.reserve(node.size());
        for (size_t i = 0; i < node.size(); i++) {
            const YAML::Node& entry = node[i];
            if (!entry.IsMap() || !entry["id"] || !entry["id"].IsScalar()) {
                return Err<std::vector<Option>>(
                    std::string(KEY_MENU_OPTIONS) + "[" + std::to_string(i) + "]: missing id");
            }
            Option option;
            option.id = entry["id"].as<std::string>();
            option.label = entry["label"] ? entry["label"].as<std::string>() : option.id;
            try {
                option.disabled = entry["disabled"] ? entry["disabled"].as<bool>() : false;
            } catch (const YAML::Exception& e) {
                return Err<std::vector<Option>>(
                    std::string(KEY_MENU_OPTIONS) + "[" + std::to_string(i) +
                    "]: disabled must be a bool: " + e.what());
            }
            options.push_back(std::move(option));
        }
        return Ok(std::move(options));
    }

    Side tooltipSide() const override {
        return parseSide(Config::get<std::string>(KEY_TOOLTIP_POSITION, "top"));
    }

    std::string logLevel() const override {
        return Config::get<std::string>(KEY_LOG_LEVEL, "info");
    }

protected:
    YAML::Node getNode(const std::string& path) const override {
        YAML::Node current;
        current.reset(_config);
        for (const auto& part : splitPath(path)) {
            if (!current.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
            const YAML::Node& constCurrent = current;
            YAML::Node child = constCurrent[part];
            if (!child) return YAML::Node(YAML::NodeType::Undefined);
            current.reset(child);
        }
        return current;
    }

private:
    Result<void> loadFile(const std::string& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Err<void>("file not found: " + path);
        }
        try {
            YAML::Node loaded = YAML::LoadFile(path);
            if (loaded && !loaded.IsNull() && !loaded.IsMap()) {
                return Err<void>("top level must be a map");
            }
            mergeNodes(_config, loaded);
        } catch (const YAML::Exception& e) {
            return Err<void>(std::string("yaml: ") + e.what());
        }
        return Ok();
    }

    void applyEnvOverrides() {
        for (const char* key : ENV_KEYS) {
            std::string envName = pathToEnvVar(key);
            if (const char* value = std::getenv(envName.c_str())) {
                ydebug("Config: {} overridden by {}", key, envName);
                setScalar(_config, splitPath(key), value);
            }
        }
    }

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

// ─── Config static API ───────────────────────────────────────────────────────

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = std::make_shared<ConfigImpl>(configPath, cmdOverrides);
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(Ptr(config));
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        return {};
    }
    return base / "yoverlay" / "config.yaml";
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string name = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') {
            name += '_';
        } else {
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return name;
}

} // namespace yoverlay
