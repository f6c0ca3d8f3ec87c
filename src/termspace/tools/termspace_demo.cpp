#include <termspace/input/KeyMap.hpp>
#include <termspace/platform/HeadlessPlatform.hpp>
#include <termspace/platform/TerminalPlatform.hpp>
#include <termspace/runtime/Runtime.hpp>
#include <termspace/state/SnapshotJson.hpp>

#include "Cli.hpp"
#include "DemoWidgets.hpp"
#include "log/TaggedLogger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

using namespace TS;

namespace {

struct DemoOptions {
    std::optional<std::filesystem::path> keymapPath;
    std::optional<std::filesystem::path> stateOut;
    bool                                 headless = false;
    int                                  frames   = 60;
    std::string                          script   = "Ada\\tada@example.com\\t\\r";
    bool                                 showHelp = false;
};

// "\t", "\r", "\n" and "\e" escapes; everything else is copied as is.
auto unescape(std::string_view text) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\' || i + 1 == text.size()) {
            out.push_back(text[i]);
            continue;
        }
        switch (text[++i]) {
        case 't':
            out.push_back('\t');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'e':
            out.push_back('\x1b');
            break;
        default:
            out.push_back('\\');
            out.push_back(text[i]);
            break;
        }
    }
    return out;
}

auto parseArguments(int argc, char** argv) -> std::optional<DemoOptions> {
    DemoOptions options;
    Tools::Cli  cli("termspace-demo");

    cli.add_flag("--help", {.help = "Show this message", .on_set = [&] { options.showHelp = true; }});
    cli.add_alias("-h", "--help");
    cli.add_flag("--headless", {.help = "Run against an in-memory terminal with scripted input", .on_set = [&] { options.headless = true; }});
    cli.add_value("--keymap",
                  {.help        = "Key map JSON file",
                   .placeholder = "FILE",
                   .on_value    = [&](std::string_view value) -> Tools::Cli::ParseError {
                       options.keymapPath = std::filesystem::path(std::string(value));
                       return std::nullopt;
                   }});
    cli.add_value("--state-out",
                  {.help        = "Write the final UI state as JSON",
                   .placeholder = "FILE",
                   .on_value    = [&](std::string_view value) -> Tools::Cli::ParseError {
                       options.stateOut = std::filesystem::path(std::string(value));
                       return std::nullopt;
                   }});
    cli.add_value("--script",
                  {.help        = "Headless input bytes (\\t \\r \\n \\e escapes)",
                   .placeholder = "KEYS",
                   .on_value    = [&](std::string_view value) -> Tools::Cli::ParseError {
                       options.script = std::string(value);
                       return std::nullopt;
                   }});
    cli.add_int("--frames", {.help = "Frames to run in headless mode", .min_value = 1, .on_value = [&](int value) { options.frames = value; }});

    if (!cli.parse(argc, argv)) {
        std::cerr << cli.usage();
        return std::nullopt;
    }
    if (options.showHelp)
        std::cout << cli.usage();
    return options;
}

auto dumpState(Runtime& runtime, std::filesystem::path const& path) -> bool {
    if (auto saved = SnapshotJson::saveToFileAtomic(runtime.stateTracker().current(), path); !saved) {
        std::cerr << "termspace-demo: failed to write " << path << ": " << describeError(saved.error()) << "\n";
        return false;
    }
    return true;
}

auto runHeadless(DemoOptions const& options, KeyMap const& keys) -> int {
    HeadlessPlatform platform(Size{80, 24});
    Runtime          runtime(platform);
    runtime.keyMap() = keys;

    if (auto started = runtime.start(Demo::buildForm()); !started) {
        std::cerr << "termspace-demo: " << describeError(started.error()) << "\n";
        return EXIT_FAILURE;
    }
    platform.script(unescape(options.script));

    for (int frame = 0; frame < options.frames && !runtime.isCanceled(); ++frame) {
        if (auto updated = runtime.update(); !updated) {
            std::cerr << "termspace-demo: " << describeError(updated.error()) << "\n";
            return EXIT_FAILURE;
        }
        if (auto rendered = runtime.render(); !rendered) {
            std::cerr << "termspace-demo: " << describeError(rendered.error()) << "\n";
            return EXIT_FAILURE;
        }
        std::this_thread::sleep_for(runtime.options().frameInterval);
    }

    std::cout << runtime.screen().toString() << "\n";
    std::cout << "focused: " << runtime.focused().value_or("<none>") << ", history: " << runtime.stateTracker().historySize() << "\n";

    bool ok = !options.stateOut || dumpState(runtime, *options.stateOut);
    if (auto down = runtime.shutdown(std::chrono::milliseconds(1000)); !down) {
        std::cerr << "termspace-demo: " << describeError(down.error()) << "\n";
        ok = false;
    }
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

auto runTerminal(DemoOptions const& options, KeyMap const& keys) -> int {
    TerminalPlatform platform;
    Runtime          runtime(platform);
    runtime.keyMap() = keys;

    if (auto started = runtime.start(Demo::buildForm()); !started) {
        std::cerr << "termspace-demo: " << describeError(started.error()) << "\n";
        return EXIT_FAILURE;
    }
    auto finished = runtime.run();
    if (!finished) {
        std::cerr << "termspace-demo: " << describeError(finished.error()) << "\n";
        return EXIT_FAILURE;
    }
    if (options.stateOut && !dumpState(runtime, *options.stateOut))
        return EXIT_FAILURE;
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
#if defined(TS_LOG_DEBUG)
    if (char const* env = std::getenv("TERMSPACE_LOG"))
        set_logging_enabled(std::string_view(env) != "0");
    else
        set_logging_enabled(false);
    set_thread_name("Main");
#endif

    auto options = parseArguments(argc, argv);
    if (!options)
        return EXIT_FAILURE;
    if (options->showHelp)
        return EXIT_SUCCESS;

    KeyMap keys;
    if (options->keymapPath) {
        auto loaded = loadKeyMap(*options->keymapPath);
        if (!loaded) {
            std::cerr << "termspace-demo: " << describeError(loaded.error()) << "\n";
            return EXIT_FAILURE;
        }
        keys = *loaded;
    }

    return options->headless ? runHeadless(*options, keys) : runTerminal(*options, keys);
}
