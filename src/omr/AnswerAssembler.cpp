#include "omr/AnswerAssembler.hpp"

#include <algorithm>
#include <cctype>
#include <tuple>

namespace omr {

namespace {

// Numeric prefix of a problem label, or -1 if it is not a plain integer.
long problemNumber(const std::string& problem) {
    if (problem.empty() || problem.size() > 18) return -1;
    for (char ch : problem) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) return -1;
    }
    return std::stol(problem);
}

std::tuple<int, long, std::string, std::string> questionSortKey(const std::string& q) {
    size_t dot = q.find('.');
    std::string problem = dot == std::string::npos ? q : q.substr(0, dot);
    std::string sub = dot == std::string::npos ? std::string() : q.substr(dot + 1);
    long n = problemNumber(problem);
    if (n >= 0) return {0, n, std::string(), sub};
    return {1, 0, problem, sub};
}

}

bool questionLess(const std::string& a, const std::string& b) {
    return questionSortKey(a) < questionSortKey(b);
}

std::string joinAnswers(const AnswerSet& answers) {
    std::string out;
    for (const auto& a : answers) {
        if (!out.empty()) out.push_back(',');
        out += a;
    }
    return out;
}

void StudentAnswerTable::merge(const std::string& studentId, const StudentAnswers& answers) {
    StudentAnswers& row = rows_[studentId];
    for (const auto& [question, tokens] : answers) {
        row[question].insert(tokens.begin(), tokens.end());
    }
}

std::vector<std::string> StudentAnswerTable::sortedQuestions() const {
    std::set<std::string> all;
    for (const auto& row : rows_) {
        for (const auto& q : row.second) all.insert(q.first);
    }
    std::vector<std::string> out(all.begin(), all.end());
    std::stable_sort(out.begin(), out.end(), questionLess);
    return out;
}

std::string StudentAnswerTable::cell(const std::string& studentId, const std::string& question) const {
    auto row = rows_.find(studentId);
    if (row == rows_.end()) return "";
    auto it = row->second.find(question);
    if (it == row->second.end()) return "";
    return joinAnswers(it->second);
}

AnswerAssembler::AnswerAssembler(const OmrConfig& config)
    : threshold_(config) {}

StudentAnswers AnswerAssembler::assemble(const std::vector<BubbleReading>& readings,
                                         double threshold,
                                         const BubbleLayout& layout) const {
    // question -> position -> symbol, first marked row wins a position
    std::map<std::string, std::map<int, char>> digits;
    // question -> marked choices, insertion order kept for the Other filter
    std::map<std::string, std::vector<std::string>> choices;
    int page = readings.empty() ? 0 : readings.front().key.page;

    for (const auto& r : readings) {
        const bool marked = threshold_.isMarked(r.meanIntensity, threshold);
        const std::string question = r.key.question();

        if (const auto* d = std::get_if<DigitMark>(&r.key.mark)) {
            if (d->isSeparator() || marked) digits[question].emplace(d->position, d->symbol);
        } else if (marked) {
            choices[question].push_back(std::get<ChoiceMark>(r.key.mark).choice);
        }
    }

    StudentAnswers out;
    for (const auto& [question, positions] : digits) {
        bool hasDigit = std::any_of(positions.begin(), positions.end(),
                                    [](const auto& p) { return p.second != 'D' && p.second != 'S'; });
        if (!hasDigit) continue;

        std::string number;
        for (const auto& p : positions) {
            if (p.second == 'D') number.push_back('.');
            else if (p.second == 'S') number.push_back('/');
            else number.push_back(p.second);
        }
        out[question].insert(number);
    }

    for (const auto& [question, marked] : choices) {
        AnswerSet& slot = out[question];
        const bool hasNumber = !slot.empty();
        const auto other = layout.linkedOtherChoice(page, question);
        for (const auto& c : marked) {
            // The numeric grid already carries this response.
            if (hasNumber && other && *other == c) continue;
            slot.insert(c);
        }
    }
    return out;
}

}
