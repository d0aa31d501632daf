/**
 * @file test_answer_assembler.cpp
 * @brief Unit tests for turning bubble readings into answers
 */

#include <gtest/gtest.h>
#include <omr/AnswerAssembler.hpp>

using namespace omr;

namespace {

constexpr double kDark = 30.0;
constexpr double kBlank = 240.0;
constexpr double kThreshold = 120.0;

BubbleSpec spec(const std::string& question, const std::string& sub, const std::string& choice) {
    BubbleSpec b;
    b.page = 2;
    b.question = question;
    b.subquestion = sub;
    b.choice = choice;
    b.key = parseBubbleKey(b.page, question, sub, choice);
    return b;
}

}

class AnswerAssemblerTest : public ::testing::Test {
protected:
    // Layout and one reading per bubble; everything blank until mark()ed.
    void build(std::vector<BubbleSpec> specs) {
        layout_ = BubbleLayout(std::move(specs));
        readings_.clear();
        for (const auto& b : layout_.bubbles()) {
            BubbleReading r;
            r.key = b.key;
            r.meanIntensity = b.key.isSeparator() ? config_.separatorIntensity : kBlank;
            readings_.push_back(r);
        }
    }

    void mark(const std::string& column) {
        for (auto& r : readings_) {
            if (r.key.columnName() == column) r.meanIntensity = kDark;
        }
    }

    StudentAnswers assemble() const {
        return assembler_.assemble(readings_, kThreshold, layout_);
    }

    OmrConfig config_;
    AnswerAssembler assembler_{config_};
    BubbleLayout layout_;
    std::vector<BubbleReading> readings_;
};

TEST_F(AnswerAssemblerTest, SingleChoice) {
    build({spec("1", "i", "a"), spec("1", "i", "b"), spec("1", "i", "c")});
    mark("1.i_b");

    StudentAnswers a = assemble();
    ASSERT_EQ(a.count("1.i"), 1u);
    EXPECT_EQ(joinAnswers(a.at("1.i")), "b");
}

TEST_F(AnswerAssemblerTest, MultipleMarksAreKeptSorted) {
    build({spec("1", "i", "c"), spec("1", "i", "b"), spec("1", "i", "a")});
    mark("1.i_c");
    mark("1.i_a");

    StudentAnswers a = assemble();
    EXPECT_EQ(joinAnswers(a.at("1.i")), "a,c");
}

TEST_F(AnswerAssemblerTest, UnansweredQuestionHasNoEntry) {
    build({spec("1", "i", "a"), spec("1", "ii", "a")});
    mark("1.i_a");

    StudentAnswers a = assemble();
    EXPECT_EQ(a.count("1.ii"), 0u);
}

TEST_F(AnswerAssemblerTest, DecimalNumber) {
    build({spec("4-0-1", "i", ""), spec("4-0-2", "i", ""),
           spec("4-1-D", "i", ""),
           spec("4-2-5", "i", ""), spec("4-2-6", "i", "")});
    mark("4.i_4-0-1");
    mark("4.i_4-2-5");

    EXPECT_EQ(joinAnswers(assemble().at("4.i")), "1.5");
}

TEST_F(AnswerAssemblerTest, FractionNumber) {
    build({spec("4-0-3", "i", ""), spec("4-1-S", "i", ""), spec("4-2-4", "i", "")});
    mark("4.i_4-0-3");
    mark("4.i_4-2-4");

    EXPECT_EQ(joinAnswers(assemble().at("4.i")), "3/4");
}

TEST_F(AnswerAssemblerTest, MultiDigitNumberInPositionOrder) {
    build({spec("4-3-5", "i", ""), spec("4-2-D", "i", ""), spec("4-1-2", "i", ""), spec("4-0-1", "i", "")});
    mark("4.i_4-0-1");
    mark("4.i_4-1-2");
    mark("4.i_4-3-5");

    EXPECT_EQ(joinAnswers(assemble().at("4.i")), "12.5");
}

TEST_F(AnswerAssemblerTest, SeparatorAloneGivesNoNumber) {
    build({spec("4-0-1", "i", ""), spec("4-1-D", "i", ""), spec("4-2-5", "i", "")});

    EXPECT_EQ(assemble().count("4.i"), 0u);
}

TEST_F(AnswerAssemblerTest, FirstMarkedDigitWinsAPosition) {
    build({spec("4-0-7", "i", ""), spec("4-0-1", "i", ""), spec("4-1-9", "i", "")});
    mark("4.i_4-0-7");
    mark("4.i_4-0-1");
    mark("4.i_4-1-9");

    EXPECT_EQ(joinAnswers(assemble().at("4.i")), "79");
}

TEST_F(AnswerAssemblerTest, OtherChoiceSuppressedWhenNumberWritten) {
    build({spec("4", "i", "a"), spec("4", "i", "e"),
           spec("4-0-1", "i", "e"), spec("4-1-2", "i", "e")});
    mark("4.i_e");
    mark("4.i_4-0-1");
    mark("4.i_4-1-2");

    EXPECT_EQ(joinAnswers(assemble().at("4.i")), "12");
}

TEST_F(AnswerAssemblerTest, OtherChoiceKeptWithoutNumber) {
    build({spec("4", "i", "a"), spec("4", "i", "e"),
           spec("4-0-1", "i", "e"), spec("4-1-2", "i", "e")});
    mark("4.i_e");

    EXPECT_EQ(joinAnswers(assemble().at("4.i")), "e");
}

TEST_F(AnswerAssemblerTest, UnlinkedChoiceKeptNextToNumber) {
    build({spec("4", "i", "a"), spec("4", "i", "e"), spec("4-0-1", "i", "e")});
    mark("4.i_a");
    mark("4.i_4-0-1");

    EXPECT_EQ(joinAnswers(assemble().at("4.i")), "1,a");
}

TEST_F(AnswerAssemblerTest, DarkBubbleAboveThresholdIsNotMarked) {
    build({spec("1", "i", "a"), spec("1", "i", "b")});
    readings_[0].meanIntensity = kThreshold + 1.0;

    EXPECT_EQ(assemble().count("1.i"), 0u);
}

TEST(StudentAnswerTableTest, MergesPagesPerStudent) {
    StudentAnswerTable t;
    t.merge("abc123", {{"1.i", {"a"}}});
    t.merge("abc123", {{"2.i", {"12.5"}}});
    t.merge("def456", {{"1.i", {"b", "c"}}});

    EXPECT_EQ(t.size(), 2u);
    EXPECT_EQ(t.cell("abc123", "1.i"), "a");
    EXPECT_EQ(t.cell("abc123", "2.i"), "12.5");
    EXPECT_EQ(t.cell("def456", "1.i"), "b,c");
    EXPECT_EQ(t.cell("def456", "2.i"), "");
    EXPECT_EQ(t.cell("nobody", "1.i"), "");
}

TEST(StudentAnswerTableTest, EmptyAnswersStillCreateARow) {
    StudentAnswerTable t;
    t.merge("abc123", {});
    EXPECT_EQ(t.size(), 1u);
}

TEST(StudentAnswerTableTest, QuestionsSortNumerically) {
    StudentAnswerTable t;
    t.merge("s", {{"10.i", {"a"}}, {"2.ii", {"a"}}, {"2.i", {"a"}}, {"x.a", {"a"}}, {"1.iii", {"b"}}});

    std::vector<std::string> expected = {"1.iii", "2.i", "2.ii", "10.i", "x.a"};
    EXPECT_EQ(t.sortedQuestions(), expected);
}

TEST(StudentAnswerTableTest, MergeKeepsChoicesFromOtherPages) {
    StudentAnswerTable t;
    t.merge("abc123", {{"4.i", {"12"}}});
    t.merge("abc123", {{"4.i", {"e"}}});

    EXPECT_EQ(t.cell("abc123", "4.i"), "12,e");
}

TEST_F(AnswerAssemblerTest, OtherLinkIsScopedToItsPage) {
    // Page 2 layout links 4.i to "e"; a page 3 reading of the same question does not.
    build({spec("4", "i", "e"), spec("4-0-1", "i", "e")});
    BubbleReading other;
    other.key = parseBubbleKey(3, "4", "i", "e");
    other.meanIntensity = kDark;
    BubbleReading digit;
    digit.key = parseBubbleKey(3, "4-0-1", "i", "e");
    digit.meanIntensity = kDark;

    StudentAnswers a = assembler_.assemble({digit, other}, kThreshold, layout_);
    EXPECT_EQ(joinAnswers(a.at("4.i")), "1,e");
}
