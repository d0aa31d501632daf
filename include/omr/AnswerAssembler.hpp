#ifndef OMR_ANSWER_ASSEMBLER_HPP
#define OMR_ANSWER_ASSEMBLER_HPP

#include <map>
#include <set>
#include <string>
#include <vector>

#include "omr/BubbleLayout.hpp"
#include "omr/BubbleSampler.hpp"
#include "omr/OmrConfig.hpp"
#include "omr/ThresholdEstimator.hpp"

namespace omr {

using AnswerSet = std::set<std::string>;
// "problem.subquestion" -> answer tokens (choice letters or numeric strings)
using StudentAnswers = std::map<std::string, AnswerSet>;

// All students of a run. Filled one page at a time through merge(), which is
// the only mutation, so pages can be read in any order.
class StudentAnswerTable {
public:
    void merge(const std::string& studentId, const StudentAnswers& answers);

    bool empty() const { return rows_.empty(); }
    size_t size() const { return rows_.size(); }
    const std::map<std::string, StudentAnswers>& rows() const { return rows_; }

    // Every question seen, ordered by numeric problem then subquestion.
    std::vector<std::string> sortedQuestions() const;

    // Comma-joined sorted tokens, empty when the student has none.
    std::string cell(const std::string& studentId, const std::string& question) const;

private:
    std::map<std::string, StudentAnswers> rows_;
};

// Orders "problem.subquestion" labels: numeric problems ascending, then
// non-numeric problems lexicographically; ties broken by subquestion.
bool questionLess(const std::string& a, const std::string& b);

std::string joinAnswers(const AnswerSet& answers);

class AnswerAssembler {
public:
    explicit AnswerAssembler(const OmrConfig& config);

    // Turns one page's readings into that student's answers for the page.
    StudentAnswers assemble(const std::vector<BubbleReading>& readings,
                            double threshold,
                            const BubbleLayout& layout) const;

private:
    ThresholdEstimator threshold_;
};

}

#endif
