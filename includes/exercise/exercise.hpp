#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace diktat {

using JsonValue = nlohmann::json;

struct Sentence {
    std::string text;
    JsonValue additional_data;   // unknown keys of a sentence object
};

class Exercise {
public:
    explicit Exercise(bool verbose = false) : verbose_(verbose) {}

    // JSON for *.json files, a plain sentence list otherwise.
    bool loadFromFile(const std::string& filepath);
    bool loadFromJson(const JsonValue& json);

    // One sentence per line; blank lines and '#' comments are skipped.
    bool loadFromText(const std::string& content);

    const std::string& getId() const { return id_; }
    const std::string& getTitle() const { return title_; }
    const std::optional<std::string>& getLevel() const { return level_; }
    const std::optional<std::string>& getLanguage() const { return language_; }
    const std::vector<Sentence>& getSentences() const { return sentences_; }

    std::vector<std::string> getSentenceTexts() const;
    std::size_t getTotalWords() const;

private:
    bool verbose_;
    std::string id_;
    std::string title_;
    std::optional<std::string> level_;
    std::optional<std::string> language_;
    std::vector<Sentence> sentences_;

    void parseFromJson(const JsonValue& json);
};

// Reads the typed answers of an exercise: one line per sentence, in order.
// A line holding only "-" marks the sentence as not attempted. Throws
// std::runtime_error when the file cannot be opened.
std::vector<std::optional<std::string>> loadAnswers(const std::string& path);

} // namespace diktat
