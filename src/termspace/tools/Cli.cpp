#include "Cli.hpp"

#include <charconv>
#include <iostream>
#include <string>

namespace TS::Tools {

Cli::Cli(std::string_view program_name)
    : program_name_(program_name) {}

void Cli::set_error_logger(std::function<void(std::string const&)> logger) {
    error_logger_ = std::move(logger);
}

void Cli::add_flag(std::string_view name, FlagOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help         = std::move(option.help);
    entry.flag_handler = std::move(option.on_set);
    register_option(std::move(entry));
}

void Cli::add_value(std::string_view name, ValueOption option) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.help          = std::move(option.help);
    entry.placeholder   = std::move(option.placeholder);
    entry.expects_value = true;
    entry.value_handler = std::move(option.on_value);
    register_option(std::move(entry));
}

void Cli::add_int(std::string_view name, IntOption option) {
    ValueOption value_opt{};
    value_opt.help        = std::move(option.help);
    value_opt.placeholder = "N";
    value_opt.on_value    = [stored = std::string(name), min_value = option.min_value, handler = std::move(option.on_value)](
                                 std::string_view token) -> ParseError {
        int  value  = 0;
        auto begin  = token.data();
        auto end    = begin + token.size();
        auto result = std::from_chars(begin, end, value);
        if (token.empty() || result.ec != std::errc{} || result.ptr != end)
            return stored + " expects an integer value";
        if (value < min_value)
            return stored + " must be at least " + std::to_string(min_value);
        handler(value);
        return std::nullopt;
    };
    add_value(name, std::move(value_opt));
}

void Cli::add_alias(std::string_view alias, std::string_view target) {
    auto target_it = option_lookup_.find(std::string(target));
    if (target_it == option_lookup_.end()) {
        log_error("missing option for alias '" + std::string(target) + "'");
        had_error_ = true;
        return;
    }
    options_[target_it->second].aliases.emplace_back(alias);
    option_lookup_.emplace(std::string(alias), target_it->second);
}

bool Cli::parse(int argc, char** argv) {
    had_error_ = false;
    positional_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string_view                raw_token{argv[i]};
        std::optional<std::string_view> attached_value;
        std::string_view                name       = raw_token;
        auto                            equals_pos = raw_token.find('=');
        if (equals_pos != std::string_view::npos) {
            name           = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        if (name.empty() || name.front() != '-') {
            positional_.emplace_back(raw_token);
            continue;
        }

        OptionEntry* entry = find_option(name);
        if (entry == nullptr) {
            log_error("unknown argument '" + std::string(raw_token) + "'");
            had_error_ = true;
            continue;
        }

        if (!entry->expects_value) {
            if (attached_value) {
                log_error(entry->name + " does not accept a value");
                had_error_ = true;
                continue;
            }
            if (entry->flag_handler)
                entry->flag_handler();
            continue;
        }

        std::string_view value;
        if (attached_value) {
            value = *attached_value;
        } else {
            if ((i + 1) >= argc) {
                log_error(entry->name + " requires a value");
                had_error_ = true;
                continue;
            }
            value = std::string_view{argv[++i]};
        }

        if (entry->value_handler) {
            if (auto error = entry->value_handler(value)) {
                log_error(*error);
                had_error_ = true;
            }
        }
    }
    return !had_error_;
}

bool Cli::had_errors() const {
    return had_error_;
}

std::vector<std::string> const& Cli::positional() const {
    return positional_;
}

std::string Cli::usage() const {
    std::string text = "Usage: " + program_name_ + " [options]\n\nOptions:\n";
    for (auto const& option : options_) {
        std::string line = "  ";
        for (auto const& alias : option.aliases)
            line += alias + ", ";
        line += option.name;
        if (option.expects_value)
            line += " " + option.placeholder;
        if (line.size() < 28)
            line.resize(28, ' ');
        else
            line += "  ";
        text += line + option.help + "\n";
    }
    return text;
}

Cli::OptionEntry* Cli::find_option(std::string_view name) {
    auto it = option_lookup_.find(std::string(name));
    if (it == option_lookup_.end())
        return nullptr;
    return &options_[it->second];
}

void Cli::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    option_lookup_.emplace(options_.back().name, options_.size() - 1);
}

void Cli::log_error(std::string_view message) {
    std::string text = program_name_;
    text.append(": ");
    text.append(message.begin(), message.end());
    if (error_logger_)
        error_logger_(text);
    else
        std::cerr << text << '\n';
}

} // namespace TS::Tools
