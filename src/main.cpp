#include "config.hpp"
#include "sqlite_logger.hpp"
#include "exercise/exercise.hpp"
#include "report/report.hpp"
#include "report/terminal_renderer.hpp"
#include "text/normalizer.hpp"
#include "text/similarity.hpp"
#include <unistd.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct Args {
    std::string exercise_path;
    std::optional<std::string> answers_path;
    std::optional<std::string> config_path;
    std::optional<std::string> db_path;
    std::optional<std::size_t> live_sentence;   // 1-based
    bool preserve_case = false;
    bool json = false;
    bool verbose = false;
};

static void print_usage() {
    std::cout << "diktat - dictation feedback\n"
              << "Usage: diktat --exercise <file> --answers <file> [options]\n"
              << "       diktat --exercise <file> --live <n> [options]\n"
              << "      --exercise <file>      Exercise (.json, or one sentence per line)\n"
              << "      --answers <file>       Typed answers, one line per sentence ('-' = skipped)\n"
              << "      --live <n>             Read snapshots of sentence n from stdin\n"
              << "      --case                 Letter case is significant\n"
              << "      --json                 Print a JSON report\n"
              << "      --db <path>            Log the attempts to an SQLite DB\n"
              << "      --config <path>        Config file (default XDG)\n"
              << "  -v, --verbose              Debug output on stderr\n"
              << "  -h, --help                 Show this help\n";
}

static std::size_t parse_count(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int n = std::stoi(value, &used);
        if (used == value.size() && n > 0) return static_cast<std::size_t>(n);
    } catch (const std::logic_error&) {
        // reported below
    }
    throw std::runtime_error("Invalid value for " + flag + ": " + value);
}

static Args parse_args(int argc, char** argv) {
    Args a{};
    auto next = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw std::runtime_error("Missing value for " + flag);
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if      (s == "--exercise" || s == "-e") a.exercise_path = next(i, s);
        else if (s == "--answers"  || s == "-a") a.answers_path = next(i, s);
        else if (s == "--config") a.config_path = next(i, s);
        else if (s == "--db") a.db_path = next(i, s);
        else if (s == "--live") a.live_sentence = parse_count(s, next(i, s));
        else if (s == "--case") a.preserve_case = true;
        else if (s == "--json") a.json = true;
        else if (s == "--verbose" || s == "-v") a.verbose = true;
        else if (s == "--help" || s == "-h") {
            print_usage();
            std::exit(0);
        }
        else throw std::runtime_error("Unknown option: " + s);
    }

    if (a.exercise_path.empty()) throw std::runtime_error("--exercise is required");
    if (!a.answers_path && !a.live_sentence) throw std::runtime_error("--answers or --live is required");
    return a;
}

static int run_live(const diktat::Exercise& exercise, std::size_t sentence,
                    bool preserveCase, bool json, const diktat::LiveMatchParams& params) {
    const auto& sentences = exercise.getSentences();
    if (sentence > sentences.size()) {
        std::cerr << "Error: exercise has " << sentences.size() << " sentences\n";
        return 1;
    }
    const std::string& reference = sentences[sentence - 1].text;
    const auto referenceWords = diktat::splitWords(reference);

    diktat::TerminalRenderer renderer(std::cout, !json && isatty(STDOUT_FILENO));
    std::string line;
    while (std::getline(std::cin, line)) {
        const auto tokens = diktat::tokenize(line);
        std::vector<std::string> typed;
        for (const auto& t : tokens) typed.push_back(t.text);

        const auto judgments = diktat::matchLive(referenceWords, typed, preserveCase, params);
        if (json) {
            nlohmann::json j{
                {"words", judgments},
                {"errors", diktat::errorSpans(tokens, judgments)},
                {"solved", diktat::isSentenceCorrect(reference, line, preserveCase)}
            };
            std::cout << j.dump() << "\n" << std::flush;
        } else {
            renderer.renderLive(judgments);
        }
    }
    if (!json && isatty(STDOUT_FILENO)) std::cout << "\n";
    return 0;
}

static void log_attempts(const std::string& dbPath, const diktat::ExerciseReport& report, bool verbose) {
    diktat::AttemptLogger logger(diktat::expand_path(dbPath));
    const auto session_id = logger.startSession(report.exerciseId, report.preserveCase);
    for (const auto& s : report.sentences) {
        if (!s.answer) continue;
        const auto& counts = report.stats.sentences[s.index];
        logger.logAttempt(session_id, s.index, s.reference, *s.answer,
                          counts.correctWords, counts.referenceWords);
    }
    logger.endSession(session_id);
    if (verbose) {
        std::cerr << "Debug: Logged " << logger.attemptCount(session_id)
                  << " attempts to " << logger.path() << " (session " << session_id << ")\n";
    }
}

int main(int argc, char** argv) {
    try {
        Args args = parse_args(argc, argv);

        const std::string config_path = diktat::expand_path(args.config_path.value_or(diktat::default_config_path()));
        const diktat::AppConfig cfg = diktat::load_config_file(config_path);

        const bool verbose = args.verbose || cfg.verbose.value_or(false);
        const bool preserve_case = args.preserve_case || cfg.preserve_case.value_or(false);
        const bool json = args.json || cfg.json.value_or(false);
        const std::optional<std::string> db_path = args.db_path ? args.db_path : cfg.db_path;
        const diktat::LiveMatchParams params = diktat::live_match_params(cfg);

        if (verbose) {
            std::cerr << "Debug: Config: " << config_path << "\n"
                      << "Debug: Case sensitive: " << (preserve_case ? "yes" : "no") << "\n"
                      << "Debug: Window " << params.window
                      << ", acceptance " << params.acceptanceThreshold
                      << ", correct " << params.correctThreshold << "\n";
        }

        diktat::Exercise exercise(verbose);
        if (!exercise.loadFromFile(args.exercise_path)) {
            std::cerr << "Failed to load exercise\n";
            return 1;
        }

        if (args.live_sentence) {
            return run_live(exercise, *args.live_sentence, preserve_case, json, params);
        }

        const auto answers = diktat::loadAnswers(*args.answers_path);
        if (answers.size() > exercise.getSentences().size()) {
            std::cerr << "Warning: " << answers.size() - exercise.getSentences().size()
                      << " answer lines beyond the last sentence are ignored\n";
        }

        const auto report = diktat::buildReport(exercise, answers, preserve_case, params);

        if (db_path) log_attempts(*db_path, report, verbose);

        if (json) {
            nlohmann::json j = report;
            std::cout << j.dump(2) << "\n";
        } else {
            diktat::TerminalRenderer renderer(std::cout, isatty(STDOUT_FILENO));
            renderer.renderReport(report);
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
