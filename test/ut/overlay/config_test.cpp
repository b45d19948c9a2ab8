//=============================================================================
// Config Tests
//
// Layering of defaults, YAML file, YOVERLAY_* environment and command line
// overrides, and menu option parsing.
//=============================================================================

#include <boost/ut.hpp>
#include <yoverlay/config.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

using namespace boost::ut;
using namespace yoverlay;

namespace {

namespace fs = std::filesystem;

//-----------------------------------------------------------------------------
// TempDir — scratch directory, also used as XDG_CONFIG_HOME so a config in
// the user's home never leaks into the tests
//-----------------------------------------------------------------------------
class TempDir {
public:
    TempDir() {
        _path = fs::temp_directory_path() /
                ("yoverlay-config-test-" + std::to_string(_counter++) + "-" +
                 std::to_string(reinterpret_cast<uintptr_t>(this)));
        fs::create_directories(_path);
        if (const char* previous = std::getenv("XDG_CONFIG_HOME")) {
            _previousXdg = previous;
        }
        setenv("XDG_CONFIG_HOME", _path.c_str(), 1);
    }
    ~TempDir() {
        if (_previousXdg) {
            setenv("XDG_CONFIG_HOME", _previousXdg->c_str(), 1);
        } else {
            unsetenv("XDG_CONFIG_HOME");
        }
        std::error_code ec;
        fs::remove_all(_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string write(const std::string& name, const std::string& content) const {
        fs::path file = _path / name;
        fs::create_directories(file.parent_path());
        std::ofstream out(file);
        out << content;
        return file.string();
    }

    const fs::path& path() const { return _path; }

private:
    static inline int _counter = 0;
    fs::path _path;
    std::optional<std::string> _previousXdg;
};

// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : _name(name) {
        setenv(name, value, 1);
    }
    ~EnvGuard() { unsetenv(_name); }
    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    const char* _name;
};

constexpr const char* MENU_YAML = R"(
menu:
  open: true
  close-on-select: never
  position: top-start
  options:
    - id: cut
      label: Cut
    - id: copy
    - id: paste
      label: Paste
      disabled: true
tooltip:
  position: left
log:
  level: debug
)";

} // namespace

suite config_tests = [] {
    "defaults without a file"_test = [] {
        TempDir dir;
        auto res = Config::create();
        expect(res.has_value()) << error_msg(res);
        if (!res) return;
        auto config = *res;

        MenuConfig menu = config->menuConfig();
        expect(!menu.isOpen);
        expect(std::holds_alternative<CloseAlways>(menu.closeOnSelect));
        expect(menu.position == Placement{Side::Bottom, Align::End});
        expect(config->tooltipSide() == Side::Top);
        expect(config->logLevel() == "info");

        auto options = config->menuOptions();
        expect(options.has_value());
        expect(options->empty());
    };

    "values from a file"_test = [] {
        TempDir dir;
        auto path = dir.write("menu.yaml", MENU_YAML);
        auto res = Config::create(path);
        expect(res.has_value()) << error_msg(res);
        if (!res) return;
        auto config = *res;

        MenuConfig menu = config->menuConfig();
        expect(menu.isOpen);
        expect(std::holds_alternative<CloseNever>(menu.closeOnSelect));
        expect(menu.position == Placement{Side::Top, Align::Start});
        expect(config->tooltipSide() == Side::Left);
        expect(config->logLevel() == "debug");
        expect(config->has("menu.options"));
        expect(!config->has("menu.nothing"));
        expect(config->get<std::string>("menu.position").value_or("") == "top-start");
        expect(config->get<int>("menu.missing", 7) == 7);
    };

    "menu options from a file"_test = [] {
        TempDir dir;
        auto res = Config::create(dir.write("menu.yaml", MENU_YAML));
        expect(res.has_value());
        if (!res) return;

        auto options = (*res)->menuOptions();
        expect(options.has_value()) << error_msg(options);
        if (!options) return;
        expect(options->size() == 3u);
        expect((*options)[0].id == "cut" && (*options)[0].label == "Cut");
        expect((*options)[1].label == "copy") << "label defaults to the id";
        expect((*options)[2].disabled);
        expect(!(*options)[0].disabled);
    };

    "option without an id is an error"_test = [] {
        TempDir dir;
        auto path = dir.write("bad.yaml", "menu:\n  options:\n    - id: a\n    - label: nope\n");
        auto res = Config::create(path);
        expect(res.has_value());
        if (!res) return;

        auto options = (*res)->menuOptions();
        expect(!options.has_value());
        expect(error_msg(options).find("[1]") != std::string::npos) << error_msg(options);
    };

    "options must be a sequence"_test = [] {
        TempDir dir;
        auto res = Config::create(dir.write("bad.yaml", "menu:\n  options: 3\n"));
        expect(res.has_value());
        if (!res) return;
        expect(!(*res)->menuOptions().has_value());
    };

    "missing explicit file is an error"_test = [] {
        TempDir dir;
        auto res = Config::create((dir.path() / "nope.yaml").string());
        expect(!res.has_value());
        expect(error_msg(res).find("file not found") != std::string::npos) << error_msg(res);
    };

    "malformed yaml is an error"_test = [] {
        TempDir dir;
        auto res = Config::create(dir.write("broken.yaml", "menu: [unterminated\n"));
        expect(!res.has_value());
        expect(error_msg(res).find("yaml") != std::string::npos) << error_msg(res);
    };

    "xdg config is picked up when no path is given"_test = [] {
        TempDir dir;
        dir.write("yoverlay/config.yaml", "tooltip:\n  position: right\n");
        auto res = Config::create();
        expect(res.has_value()) << error_msg(res);
        if (!res) return;
        expect((*res)->tooltipSide() == Side::Right);
    };

    "environment overrides the file"_test = [] {
        TempDir dir;
        EnvGuard open("YOVERLAY_MENU_OPEN", "false");
        EnvGuard close("YOVERLAY_MENU_CLOSE_ON_SELECT", "always");
        auto res = Config::create(dir.write("menu.yaml", MENU_YAML));
        expect(res.has_value());
        if (!res) return;

        MenuConfig menu = (*res)->menuConfig();
        expect(!menu.isOpen);
        expect(std::holds_alternative<CloseAlways>(menu.closeOnSelect));
    };

    "command line overrides the environment"_test = [] {
        TempDir dir;
        EnvGuard level("YOVERLAY_LOG_LEVEL", "warn");
        YAML::Node overrides;
        overrides["log"]["level"] = "trace";
        overrides["menu"]["position"] = "left";
        auto res = Config::create(dir.write("menu.yaml", MENU_YAML), overrides);
        expect(res.has_value());
        if (!res) return;

        expect((*res)->logLevel() == "trace");
        expect((*res)->menuConfig().position == Placement{Side::Left, Align::Center});
        expect((*res)->menuConfig().isOpen) << "untouched keys keep the file value";
    };

    "unknown close-on-select falls back to always"_test = [] {
        TempDir dir;
        auto res = Config::create(dir.write("menu.yaml", "menu:\n  close-on-select: sometimes\n"));
        expect(res.has_value());
        if (!res) return;
        expect(std::holds_alternative<CloseAlways>((*res)->menuConfig().closeOnSelect));
    };

    "boolean close-on-select"_test = [] {
        TempDir dir;
        auto res = Config::create(dir.write("menu.yaml", "menu:\n  close-on-select: false\n"));
        expect(res.has_value());
        if (!res) return;
        expect(std::holds_alternative<CloseNever>((*res)->menuConfig().closeOnSelect));
    };

    "scratch directory restores XDG_CONFIG_HOME"_test = [] {
        EnvGuard outer("XDG_CONFIG_HOME", "/tmp/yoverlay-outer-xdg");
        {
            TempDir dir;
            expect(std::string(std::getenv("XDG_CONFIG_HOME")) == dir.path().string());
        }
        const char* restored = std::getenv("XDG_CONFIG_HOME");
        expect(restored != nullptr && std::string(restored) == "/tmp/yoverlay-outer-xdg");
    };

    "env var names"_test = [] {
        expect(Config::pathToEnvVar("menu.close-on-select") == "YOVERLAY_MENU_CLOSE_ON_SELECT");
        expect(Config::pathToEnvVar("log.level") == "YOVERLAY_LOG_LEVEL");
    };
};
