#include "exercise/exercise.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace diktat;

namespace {

class TempFile : public ::testing::Test {
protected:
    std::filesystem::path make(const std::string& suffix, const std::string& content) {
        auto p = std::filesystem::temp_directory_path() /
                 ("diktat_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + suffix);
        std::ofstream f(p);
        f << content;
        paths_.push_back(p);
        return p;
    }
    void TearDown() override {
        for (const auto& p : paths_) std::filesystem::remove(p);
    }

    std::vector<std::filesystem::path> paths_;
};

} // namespace

TEST(Exercise, LoadFromJson) {
    auto json = nlohmann::json::parse(R"({
        "id": "a1-wochentage",
        "title": "Die Woche",
        "level": "A1",
        "sentences": [
            "Am Montagmorgen fährt der Bus.",
            {"text": "  Es ist schön.  ", "start": 3.5, "end": 5.0}
        ]
    })");
    Exercise ex;
    ASSERT_TRUE(ex.loadFromJson(json));
    EXPECT_EQ(ex.getId(), "a1-wochentage");
    EXPECT_EQ(ex.getTitle(), "Die Woche");
    EXPECT_EQ(ex.getLevel(), "A1");
    EXPECT_FALSE(ex.getLanguage());
    ASSERT_EQ(ex.getSentences().size(), 2u);
    EXPECT_EQ(ex.getSentences()[1].text, "Es ist schön.");
    EXPECT_EQ(ex.getSentences()[1].additional_data.at("start"), 3.5);
    EXPECT_FALSE(ex.getSentences()[1].additional_data.contains("text"));
    EXPECT_EQ(ex.getTotalWords(), 8u);
}

TEST(Exercise, RejectsInvalidJson) {
    Exercise ex;
    EXPECT_FALSE(ex.loadFromJson(nlohmann::json::parse(R"({"title": "no id", "sentences": ["x"]})")));
    EXPECT_FALSE(ex.loadFromJson(nlohmann::json::parse(R"({"id": "x", "title": "t", "sentences": [42]})")));
    EXPECT_FALSE(ex.loadFromJson(nlohmann::json::parse(R"({"id": "x", "title": "t", "sentences": []})")));
}

TEST(Exercise, RejectsEmptySentenceAndKeepsPreviousContent) {
    Exercise ex;
    ASSERT_TRUE(ex.loadFromJson(nlohmann::json::parse(R"({"id": "a", "title": "t", "sentences": ["Eins.", "Zwei."]})")));
    EXPECT_FALSE(ex.loadFromJson(nlohmann::json::parse(
        R"({"id": "b", "title": "t", "sentences": ["Eins.", "   ", "Drei."]})")));
    EXPECT_EQ(ex.getId(), "a");
    EXPECT_EQ(ex.getSentences().size(), 2u);
}

TEST(Exercise, LoadFromText) {
    Exercise ex;
    ASSERT_TRUE(ex.loadFromText("# Lektion 1\n\nGuten Morgen.\n  Wie geht es dir?\n"));
    EXPECT_EQ(ex.getSentenceTexts(), (std::vector<std::string>{"Guten Morgen.", "Wie geht es dir?"}));
    EXPECT_FALSE(ex.loadFromText("# nothing\n\n"));
}

TEST_F(TempFile, LoadFromFilePicksFormatByExtension) {
    auto json = make(".json", R"({"id": "j", "title": "J", "sentences": ["Hallo Welt"]})");
    auto text = make(".txt", "Hallo Welt\nTschüss\n");

    Exercise fromJson;
    ASSERT_TRUE(fromJson.loadFromFile(json.string()));
    EXPECT_EQ(fromJson.getId(), "j");

    Exercise fromText;
    ASSERT_TRUE(fromText.loadFromFile(text.string()));
    EXPECT_EQ(fromText.getSentences().size(), 2u);
    EXPECT_EQ(fromText.getId(), text.stem().string());
}

TEST_F(TempFile, LoadFromFileFailures) {
    Exercise ex;
    EXPECT_FALSE(ex.loadFromFile("/nonexistent/diktat/exercise.json"));
    auto broken = make(".json", "{ not json");
    EXPECT_FALSE(ex.loadFromFile(broken.string()));
}

TEST_F(TempFile, LoadAnswers) {
    auto p = make(".txt", "Guten Morgen\n-\n  Wie geht es?  \n\n");
    auto answers = loadAnswers(p.string());
    ASSERT_EQ(answers.size(), 4u);
    EXPECT_EQ(answers[0], "Guten Morgen");
    EXPECT_FALSE(answers[1]);
    EXPECT_EQ(answers[2], "Wie geht es?");
    EXPECT_EQ(answers[3], "");
}

TEST(Answers, MissingFileThrows) {
    EXPECT_THROW(loadAnswers("/nonexistent/diktat/answers.txt"), std::runtime_error);
}
