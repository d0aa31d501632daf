#include "omr/BubbleLayout.hpp"
#include "omr/Csv.hpp"
#include "omr/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>
#include <tuple>

namespace omr {

namespace {

std::vector<std::string> splitOn(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string tok;
    while (std::getline(ss, tok, sep)) out.push_back(tok);
    if (!s.empty() && s.back() == sep) out.emplace_back();
    return out;
}

double parseNumber(const std::string& text, const std::string& column, size_t line) {
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if (used == text.size()) return v;
    } catch (const std::exception&) {
    }
    throw LayoutError("line " + std::to_string(line) + ": column '" + column +
                      "' is not a number: '" + text + "'");
}

int parsePage(const std::string& text, size_t line) {
    double v = parseNumber(text, "page", line);
    if (std::floor(v) != v) {
        throw LayoutError("line " + std::to_string(line) + ": page is not an integer: '" + text + "'");
    }
    return static_cast<int>(v);
}

}

bool BubbleKey::isSeparator() const {
    const auto* d = std::get_if<DigitMark>(&mark);
    return d && d->isSeparator();
}

std::string BubbleKey::question() const {
    return problem + "." + subquestion;
}

std::string BubbleKey::columnName() const {
    if (const auto* d = std::get_if<DigitMark>(&mark)) return question() + "_" + d->code;
    return question() + "_" + std::get<ChoiceMark>(mark).choice;
}

BubbleKey parseBubbleKey(int page, const std::string& question,
                         const std::string& subquestion, const std::string& choice) {
    BubbleKey key;
    key.page = page;
    key.subquestion = subquestion;

    std::vector<std::string> parts = splitOn(question, '-');
    if (parts.size() < 3) {
        key.problem = question;
        key.mark = ChoiceMark{choice};
        return key;
    }

    DigitMark d;
    d.code = question;
    try {
        size_t used = 0;
        d.position = std::stoi(parts[1], &used);
        if (used != parts[1].size()) throw std::invalid_argument(parts[1]);
    } catch (const std::exception&) {
        throw LayoutError("numeric bubble '" + question + "' has a non-integer position");
    }
    const std::string& sym = parts[2];
    if (sym.size() != 1 || !(std::isdigit(static_cast<unsigned char>(sym[0])) || sym == "D" || sym == "S")) {
        throw LayoutError("numeric bubble '" + question + "' has digit code '" + sym +
                          "', expected 0-9, D or S");
    }
    d.symbol = sym[0];

    key.problem = parts[0];
    key.mark = d;
    return key;
}

BubbleLayout::BubbleLayout(std::vector<BubbleSpec> bubbles)
    : bubbles_(std::move(bubbles)) {
    index();
}

BubbleLayout BubbleLayout::fromCsv(const std::filesystem::path& path) {
    std::vector<csv::Row> rows = csv::readFile(path);
    if (rows.empty()) throw LayoutError("bubble table is empty: " + path.string());

    const csv::Row& header = rows.front();
    auto column = [&](const std::string& name) {
        auto it = std::find(header.begin(), header.end(), name);
        if (it == header.end()) {
            throw LayoutError("bubble table " + path.string() + " has no '" + name + "' column");
        }
        return static_cast<size_t>(it - header.begin());
    };
    const size_t cPage = column("page");
    const size_t cQuestion = column("question");
    const size_t cSub = column("subquestion");
    const size_t cChoice = column("choice");
    const size_t cX = column("Xpos");
    const size_t cY = column("Ypos");
    const size_t width = std::max({cPage, cQuestion, cSub, cChoice, cX, cY}) + 1;

    std::vector<BubbleSpec> bubbles;
    bubbles.reserve(rows.size() - 1);
    for (size_t i = 1; i < rows.size(); ++i) {
        csv::Row r = rows[i];
        const size_t line = i + 1;
        if (r.size() < width) r.resize(width);

        BubbleSpec b;
        b.page = parsePage(r[cPage], line);
        b.question = r[cQuestion];
        b.subquestion = r[cSub];
        b.choice = r[cChoice];
        b.x = parseNumber(r[cX], "Xpos", line);
        b.y = parseNumber(r[cY], "Ypos", line);
        if (b.question.empty()) {
            throw LayoutError("line " + std::to_string(line) + ": empty question");
        }
        b.key = parseBubbleKey(b.page, b.question, b.subquestion, b.choice);
        bubbles.push_back(std::move(b));
    }
    return BubbleLayout(std::move(bubbles));
}

void BubbleLayout::index() {
    std::set<std::tuple<int, std::string, std::string, std::string>> seen;
    otherChoice_.clear();

    for (const auto& b : bubbles_) {
        if (!seen.emplace(b.page, b.question, b.subquestion, b.choice).second) {
            throw LayoutError("duplicate bubble on page " + std::to_string(b.page) + ": question '" +
                              b.question + "', subquestion '" + b.subquestion + "', choice '" +
                              b.choice + "'");
        }
        if (!b.key.isDigit() || b.choice.empty()) continue;

        auto slot = std::make_pair(b.page, b.key.question());
        auto it = otherChoice_.find(slot);
        if (it == otherChoice_.end()) {
            otherChoice_.emplace(slot, b.choice);
        } else if (it->second != b.choice) {
            throw LayoutError("numeric question " + slot.second + " on page " + std::to_string(b.page) +
                              " is linked to more than one choice ('" + it->second + "' and '" +
                              b.choice + "')");
        }
    }
}

std::vector<const BubbleSpec*> BubbleLayout::forPage(int page) const {
    std::vector<const BubbleSpec*> out;
    for (const auto& b : bubbles_) {
        if (b.page == page) out.push_back(&b);
    }
    return out;
}

bool BubbleLayout::hasPage(int page) const {
    return std::any_of(bubbles_.begin(), bubbles_.end(),
                       [page](const BubbleSpec& b) { return b.page == page; });
}

std::optional<std::string> BubbleLayout::linkedOtherChoice(int page, const std::string& question) const {
    auto it = otherChoice_.find(std::make_pair(page, question));
    if (it == otherChoice_.end()) return std::nullopt;
    return it->second;
}

}
