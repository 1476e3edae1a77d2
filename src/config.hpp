#pragma once
#include "align/live_matcher.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace diktat {

struct AppConfig {
    std::optional<bool> preserve_case;           // --case
    std::optional<std::size_t> window;           // lookahead of the live matcher
    std::optional<double> acceptance_threshold;
    std::optional<double> correct_threshold;
    std::optional<double> position_penalty;      // case-insensitive mode
    std::optional<double> position_penalty_case; // case-sensitive mode
    std::optional<double> compound_score;

    std::optional<std::string> db_path;          // --db
    std::optional<bool> verbose;                 // --verbose
    std::optional<bool> json;                    // --json
};

// Returns $XDG_CONFIG_HOME/diktat/diktat.toml or ~/.config/diktat/diktat.toml
std::string default_config_path();

// Load config file if it exists. Simple TOML/INI-like: key = value
// Supports comments starting with '#' or ';'. Strings may be quoted.
// Missing file returns an empty AppConfig (all optionals disengaged).
AppConfig load_config_file(const std::string& path);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);

// Live matcher tuning with the configured overrides applied.
LiveMatchParams live_match_params(const AppConfig& cfg);

} // namespace diktat
