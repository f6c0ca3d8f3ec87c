#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace TS::Tools {

// Minimal "--name value" / "--name=value" parser for the command line tools.
class Cli {
public:
    using ParseError = std::optional<std::string>;

    explicit Cli(std::string_view program_name);

    void set_error_logger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::string           help;
        std::function<void()> on_set;
    };

    struct ValueOption {
        std::string                                                 help;
        std::string                                                 placeholder = "VALUE";
        std::function<ParseError(std::string_view)> on_value;
    };

    struct IntOption {
        std::string              help;
        int                      min_value = 0;
        std::function<void(int)> on_value;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_int(std::string_view name, IntOption option);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char** argv);
    [[nodiscard]] bool had_errors() const;
    // Positional arguments in the order they appeared.
    [[nodiscard]] std::vector<std::string> const& positional() const;
    [[nodiscard]] std::string usage() const;

private:
    struct OptionEntry {
        std::string                                 name;
        std::string                                 help;
        std::string                                 placeholder;
        std::vector<std::string>                    aliases;
        bool                                        expects_value = false;
        std::function<void()>                       flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    OptionEntry* find_option(std::string_view name);
    void         register_option(OptionEntry entry);
    void         log_error(std::string_view message);

    std::vector<OptionEntry>                     options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::vector<std::string>                     positional_;
    std::string                                  program_name_;
    std::function<void(std::string const&)>      error_logger_;
    bool                                         had_error_ = false;
};

} // namespace TS::Tools
