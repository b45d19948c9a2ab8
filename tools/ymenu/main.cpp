// ymenu: drive a menu controller and the position resolver from the command line
//
//   ymenu [--config FILE] Home ArrowDown Enter ...
//   ymenu resolve --anchor 10,10,80,40 --overlay 200,100 --viewport 1280,800
//
// Menu mode prints one line per state notification and per callback.

#include <yoverlay/config.h>
#include <yoverlay/menu-controller.h>
#include <yoverlay/position-resolver.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <args.hxx>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace yoverlay;

namespace {

bool parseFloats(const std::string& text, size_t expected, std::vector<float>& out) {
    out.clear();
    std::istringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ',')) {
        try {
            out.push_back(std::stof(part));
        } catch (const std::exception&) {
            return false;
        }
    }
    return out.size() == expected;
}

// Level known before the config is read: --log-level, then YOVERLAY_LOG_LEVEL
std::string earlyLogLevel(const args::ValueFlag<std::string>& levelFlag) {
    if (levelFlag) return args::get(levelFlag);
    std::string envName = Config::pathToEnvVar(Config::KEY_LOG_LEVEL);
    if (const char* env = std::getenv(envName.c_str())) return env;
    return "info";
}

void setupLogging(const std::string& level, const std::string& logFile) {
    if (!logFile.empty()) {
        auto fileLogger = spdlog::basic_logger_mt("ymenu", logFile, true);
        spdlog::set_default_logger(fileLogger);
    }
    spdlog::set_level(spdlog::level::from_str(level));
}

// Loads the config with logging already in place, then applies its log level
Result<Config::Ptr> loadConfig(const args::ValueFlag<std::string>& configFlag,
                               const args::ValueFlag<std::string>& levelFlag,
                               const YAML::Node& overrides) {
    spdlog::set_level(spdlog::level::from_str(earlyLogLevel(levelFlag)));
    auto configResult = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (configResult) {
        spdlog::set_level(spdlog::level::from_str((*configResult)->logLevel()));
    }
    return configResult;
}

int runResolve(int argc, char** argv) {
    args::ArgumentParser parser("ymenu resolve - pick the side an overlay renders on");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> anchorFlag(parser, "L,T,W,H", "Anchor rectangle", {"anchor"});
    args::ValueFlag<std::string> overlayFlag(parser, "W,H", "Overlay size", {"overlay"});
    args::ValueFlag<std::string> viewportFlag(parser, "W,H", "Viewport size", {"viewport"});
    args::ValueFlag<std::string> positionFlag(parser, "POS",
        "Preferred position, e.g. top or bottom-end (default: menu.position)", {"position"});
    args::ValueFlag<std::string> configFlag(parser, "FILE", "YAML configuration file", {'c', "config"});
    args::ValueFlag<std::string> levelFlag(parser, "LEVEL", "Log level (trace, debug, info, warn, error)",
                                           {"log-level"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    YAML::Node overrides;
    if (levelFlag) overrides["log"]["level"] = args::get(levelFlag);
    auto configResult = loadConfig(configFlag, levelFlag, overrides);
    if (!configResult) {
        std::cerr << "Error: " << error_msg(configResult) << "\n";
        return 1;
    }
    auto config = *configResult;

    std::vector<float> a, o, v;
    if (!anchorFlag || !parseFloats(args::get(anchorFlag), 4, a)) {
        std::cerr << "Error: --anchor expects L,T,W,H\n";
        return 1;
    }
    if (!overlayFlag || !parseFloats(args::get(overlayFlag), 2, o)) {
        std::cerr << "Error: --overlay expects W,H\n";
        return 1;
    }
    if (!viewportFlag || !parseFloats(args::get(viewportFlag), 2, v)) {
        std::cerr << "Error: --viewport expects W,H\n";
        return 1;
    }

    Rect anchor = Rect::fromXYWH(a[0], a[1], a[2], a[3]);
    Rect overlay = Rect::fromSize(o[0], o[1]);
    Viewport viewport{v[0], v[1]};
    Placement preferred = positionFlag ? parsePlacement(args::get(positionFlag))
                                       : config->menuConfig().position;

    Placement resolved = resolvePlacement(overlay, anchor, viewport, preferred);
    std::cout << placementName(resolved) << std::endl;
    return 0;
}

int runMenu(int argc, char** argv) {
    args::ArgumentParser parser("ymenu - feed key presses to a menu controller");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "FILE", "YAML configuration file", {'c', "config"});
    args::ValueFlag<std::string> levelFlag(parser, "LEVEL", "Log level (trace, debug, info, warn, error)",
                                           {"log-level"});
    args::ValueFlag<std::string> logFileFlag(parser, "FILE", "Write logs to FILE", {"log-file"});
    args::ValueFlag<std::string> closeFlag(parser, "POLICY", "Close on select: always or never",
                                           {"close-on-select"});
    args::PositionalList<std::string> keys(parser, "keys",
        "Enter, Space, ArrowUp, ArrowDown, Escape, Tab, Home, End, click, dismiss, hover:<id>");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    YAML::Node overrides;
    if (closeFlag) overrides["menu"]["close-on-select"] = args::get(closeFlag);
    if (levelFlag) overrides["log"]["level"] = args::get(levelFlag);

    setupLogging(earlyLogLevel(levelFlag), logFileFlag ? args::get(logFileFlag) : "");
    auto configResult = loadConfig(configFlag, levelFlag, overrides);
    if (!configResult) {
        std::cerr << "Error: " << error_msg(configResult) << "\n";
        return 1;
    }
    auto config = *configResult;

    auto optionsResult = config->menuOptions();
    if (!optionsResult) {
        std::cerr << "Error: " << error_msg(optionsResult) << "\n";
        return 1;
    }
    yinfo("ymenu: {} options, position {}", optionsResult->size(),
          placementName(config->menuConfig().position));

    MenuCallbacks callbacks;
    callbacks.onOpen = [] { std::cout << "open\n"; };
    callbacks.onClose = [] { std::cout << "close\n"; };
    callbacks.onSelect = [](const Option& option) { std::cout << "select " << option.id << "\n"; };
    callbacks.onHover = [](const Option& option) { std::cout << "hover " << option.id << "\n"; };

    MenuController menu(std::move(*optionsResult), config->menuConfig(), std::move(callbacks));
    menu.subscribe([](const MenuState& state) {
        std::cout << "state open=" << (state.isOpen ? "true" : "false")
                  << " focus=" << state.focusedId.value_or("-") << "\n";
    });

    for (const auto& name : args::get(keys)) {
        if (name == "click") {
            menu.click();
        } else if (name == "dismiss") {
            menu.dismiss();
        } else if (name.rfind("hover:", 0) == 0) {
            std::string id = name.substr(std::strlen("hover:"));
            const Option* target = nullptr;
            for (const auto& option : menu.navigator().options()) {
                if (option.id == id) target = &option;
            }
            if (!target || target->disabled) {
                ywarn("ymenu: cannot hover '{}'", id);
                continue;
            }
            menu.hoverOption(*target);
        } else {
            Key key = parseKey(name == "Space" ? " " : name);
            if (key == Key::Unknown) {
                ywarn("ymenu: ignoring unknown key '{}'", name);
                continue;
            }
            bool consumed = menu.handleKey(key);
            ydebug("ymenu: '{}' consumed={}", keyName(key), consumed);
        }
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 1 && std::strcmp(argv[1], "resolve") == 0) {
        return runResolve(argc - 1, argv + 1);
    }
    return runMenu(argc, argv);
}
