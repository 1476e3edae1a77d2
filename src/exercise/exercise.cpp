#include "exercise/exercise.hpp"
#include "text/normalizer.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace diktat {

namespace {

void trim(std::string& s) {
    auto notspace = [](unsigned char c){ return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notspace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notspace).base(), s.end());
}

} // namespace

bool Exercise::loadFromFile(const std::string& filepath) {
    try {
        if (verbose_) std::cerr << "Debug: Opening exercise: " << filepath << std::endl;
        std::ifstream file(filepath);
        if (!file.is_open()) {
            std::cerr << "Failed to open file: " << filepath << std::endl;
            return false;
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

        std::filesystem::path path(filepath);
        if (path.extension() == ".json") {
            JsonValue json = nlohmann::json::parse(content);
            return loadFromJson(json);
        }

        if (!loadFromText(content)) {
            return false;
        }
        id_ = path.stem().string();
        title_ = id_;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error loading exercise: " << e.what() << std::endl;
        return false;
    }
}

bool Exercise::loadFromJson(const JsonValue& json) {
    try {
        parseFromJson(json);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing exercise: " << e.what() << std::endl;
        return false;
    }

    if (sentences_.empty()) {
        std::cerr << "Exercise " << id_ << " has no sentences" << std::endl;
        return false;
    }
    if (verbose_) {
        std::cerr << "Debug: Loaded exercise " << id_ << " with "
                  << sentences_.size() << " sentences" << std::endl;
    }
    return true;
}

bool Exercise::loadFromText(const std::string& content) {
    sentences_.clear();

    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        sentences_.push_back(Sentence{line, JsonValue::object()});
    }

    if (sentences_.empty()) {
        std::cerr << "No sentences found in exercise text" << std::endl;
        return false;
    }
    if (verbose_) std::cerr << "Debug: Loaded " << sentences_.size() << " sentences" << std::endl;
    return true;
}

void Exercise::parseFromJson(const JsonValue& json) {
    // Parse into locals first so a failure leaves the exercise untouched.
    std::string id = json.at("id").get<std::string>();
    std::string title = json.at("title").get<std::string>();
    std::optional<std::string> level;
    std::optional<std::string> language;
    if (json.contains("level")) level = json["level"].get<std::string>();
    if (json.contains("language")) language = json["language"].get<std::string>();

    std::vector<Sentence> sentences;
    for (const auto& sentence_json : json.at("sentences")) {
        Sentence sentence;
        if (sentence_json.is_string()) {
            sentence.text = sentence_json.get<std::string>();
            sentence.additional_data = JsonValue::object();
        } else {
            sentence.text = sentence_json.at("text").get<std::string>();
            sentence.additional_data = JsonValue::object();
            for (const auto& [key, value] : sentence_json.items()) {
                if (key != "text") {
                    sentence.additional_data[key] = value;
                }
            }
        }

        // Answers are matched to sentences by position, so a hole would shift them.
        trim(sentence.text);
        if (sentence.text.empty()) {
            throw std::runtime_error("sentence " + std::to_string(sentences.size() + 1) + " is empty");
        }
        sentences.push_back(std::move(sentence));
    }

    id_ = std::move(id);
    title_ = std::move(title);
    level_ = std::move(level);
    language_ = std::move(language);
    sentences_ = std::move(sentences);
}

std::vector<std::string> Exercise::getSentenceTexts() const {
    std::vector<std::string> texts;
    texts.reserve(sentences_.size());
    for (const auto& s : sentences_) texts.push_back(s.text);
    return texts;
}

std::size_t Exercise::getTotalWords() const {
    std::size_t total = 0;
    for (const auto& s : sentences_) total += splitWords(s.text).size();
    return total;
}

std::vector<std::optional<std::string>> loadAnswers(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) {
        throw std::runtime_error("Cannot open answers file: " + path);
    }

    std::vector<std::optional<std::string>> out;
    std::string line;
    while (std::getline(f, line)) {
        trim(line);
        if (line == "-") {
            out.push_back(std::nullopt);
        } else {
            out.push_back(line);
        }
    }
    return out;
}

} // namespace diktat
