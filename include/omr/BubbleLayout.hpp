#ifndef OMR_BUBBLE_LAYOUT_HPP
#define OMR_BUBBLE_LAYOUT_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace omr {

// Plain multiple-choice bubble.
struct ChoiceMark {
    std::string choice;
};

// One cell of a numeric answer grid, authored as "<base>-<position>-<digit>".
struct DigitMark {
    std::string code;      // full question code, e.g. "4-2-D"
    int position = 0;
    char symbol = '0';     // '0'..'9', 'D' (decimal point) or 'S' (fraction slash)

    bool isSeparator() const { return symbol == 'D' || symbol == 'S'; }
};

struct BubbleKey {
    int page = 0;
    std::string problem;       // question number; the <base> part for digits
    std::string subquestion;
    std::variant<ChoiceMark, DigitMark> mark;

    bool isDigit() const { return std::holds_alternative<DigitMark>(mark); }
    bool isSeparator() const;

    // "problem.subquestion", the answer-table column.
    std::string question() const;
    // Per-page intensity column, e.g. "3.i_a" or "4.ii_4-0-7".
    std::string columnName() const;
};

struct BubbleSpec {
    int page = 0;
    std::string question;
    std::string subquestion;
    std::string choice;
    double x = 0.0;
    double y = 0.0;

    BubbleKey key;
};

// Throws LayoutError when `question` looks numeric but is malformed.
BubbleKey parseBubbleKey(int page, const std::string& question,
                         const std::string& subquestion, const std::string& choice);

class BubbleLayout {
public:
    BubbleLayout() = default;
    explicit BubbleLayout(std::vector<BubbleSpec> bubbles);

    // Reads columns page, question, subquestion, choice, Xpos, Ypos.
    static BubbleLayout fromCsv(const std::filesystem::path& path);

    const std::vector<BubbleSpec>& bubbles() const { return bubbles_; }
    std::vector<const BubbleSpec*> forPage(int page) const;
    bool hasPage(int page) const;

    // MC choice standing for "write the number below" on a numeric question.
    std::optional<std::string> linkedOtherChoice(int page, const std::string& question) const;

private:
    void index();

    std::vector<BubbleSpec> bubbles_;
    std::map<std::pair<int, std::string>, std::string> otherChoice_;
};

}

#endif
