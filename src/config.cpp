#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace diktat {

using std::string;

static inline void trim_inplace(string& s) {
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

static inline bool is_quoted(const string& s) {
    return s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''));
}

static inline bool ieq(const string& a, const string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i=0;i<a.size();++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

// std::stoi/std::stod report bad input as std::logic_error subclasses.
static std::optional<std::size_t> as_count(const string& s) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size() || v < 1) return std::nullopt;
        return static_cast<std::size_t>(v);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

static std::optional<double> as_double(const string& s) {
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

static std::optional<bool> as_bool(const string& s) {
    if (ieq(s, "true") || ieq(s,"yes") || s=="1") return true;
    if (ieq(s, "false")|| ieq(s,"no")  || s=="0") return false;
    return std::nullopt;
}

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/diktat/diktat.toml";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/diktat/diktat.toml";
}

AppConfig load_config_file(const std::string& path) {
    AppConfig cfg;
    std::ifstream f(path);
    if (!f.good()) return cfg; // missing is fine

    string line;
    while (std::getline(f, line)) {
        // strip comments
        auto pos_hash = line.find('#');
        auto pos_sc   = line.find(';');
        auto pos_cmt  = std::min(pos_hash == string::npos ? line.size() : pos_hash,
                                  pos_sc   == string::npos ? line.size() : pos_sc);
        line = line.substr(0, pos_cmt);
        trim_inplace(line);
        if (line.empty()) continue;

        // allow 'key = value' or 'key: value'
        size_t sep = line.find('=');
        if (sep == string::npos) sep = line.find(':');
        if (sep == string::npos) continue;

        string key = line.substr(0, sep);
        string val = line.substr(sep+1);
        trim_inplace(key);
        trim_inplace(val);
        if (key.empty() || val.empty()) continue;

        if (is_quoted(val)) val = val.substr(1, val.size()-2);

        if (ieq(key, "preserve_case") || ieq(key, "case")) cfg.preserve_case = as_bool(val);
        else if (ieq(key, "window")) cfg.window = as_count(val);
        else if (ieq(key, "acceptance_threshold")) cfg.acceptance_threshold = as_double(val);
        else if (ieq(key, "correct_threshold")) cfg.correct_threshold = as_double(val);
        else if (ieq(key, "position_penalty")) cfg.position_penalty = as_double(val);
        else if (ieq(key, "position_penalty_case")) cfg.position_penalty_case = as_double(val);
        else if (ieq(key, "compound_score")) cfg.compound_score = as_double(val);
        else if (ieq(key, "db_path") || ieq(key, "db")) cfg.db_path = expand_path(val);
        else if (ieq(key, "verbose")) cfg.verbose = as_bool(val);
        else if (ieq(key, "json")) cfg.json = as_bool(val);
    }
    return cfg;
}

LiveMatchParams live_match_params(const AppConfig& cfg) {
    LiveMatchParams p;
    if (cfg.window) p.window = *cfg.window;
    if (cfg.acceptance_threshold) p.acceptanceThreshold = *cfg.acceptance_threshold;
    if (cfg.correct_threshold) p.correctThreshold = *cfg.correct_threshold;
    if (cfg.position_penalty) p.positionPenalty = *cfg.position_penalty;
    if (cfg.position_penalty_case) p.positionPenaltyCaseSensitive = *cfg.position_penalty_case;
    if (cfg.compound_score) p.compoundScore = *cfg.compound_score;
    return p;
}

} // namespace diktat
