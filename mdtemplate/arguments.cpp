
#include "arguments.hpp"
#include "parseutils.hpp"

using ParseUtils::IsWhite;
using ParseUtils::TrimWhitespace;

namespace {
    static const char EQ('=');

    struct PairStart_ {
        size_t name_;
        size_t eq_;
    };

    bool WordStartsAt(const std::string& raw, size_t pos) {
        return !IsWhite(raw[pos]) && (pos == 0 || IsWhite(raw[pos - 1]));
    }

    // a pair starts with a nonempty name run (no '=', no whitespace) followed by '='
    bool PairAt(const std::string& raw, size_t pos, PairStart_* dst) {
        auto stop = pos;
        while (stop < raw.size() && raw[stop] != EQ && !IsWhite(raw[stop]))
            ++stop;
        if (stop == pos || stop == raw.size() || raw[stop] != EQ)
            return false;
        *dst = PairStart_{pos, stop};
        return true;
    }

    void Reject(std::vector<std::string>* rejects, const std::string& what) {
        if (rejects)
            rejects->push_back(what);
    }
} // namespace

Args::Map_ Args::ParseInline(const std::string& raw, std::vector<std::string>* rejects) {
    std::vector<PairStart_> starts;
    PairStart_ start;
    for (size_t pos = 0; pos < raw.size(); ++pos)
        if (WordStartsAt(raw, pos) && PairAt(raw, pos, &start))
            starts.push_back(start);

    // words after a pair belong to its value; only those ahead of the first pair are orphans
    const size_t firstPair = starts.empty() ? raw.size() : starts.front().name_;
    for (size_t pos = ParseUtils::SkipWhite(raw, 0); pos < firstPair; pos = ParseUtils::SkipWhite(raw, pos)) {
        const auto wordStart = pos;
        while (pos < raw.size() && !IsWhite(raw[pos]))
            ++pos;
        Reject(rejects, raw.substr(wordStart, pos - wordStart));
    }

    Map_ retval;
    for (auto ps = starts.begin(); ps != starts.end(); ++ps) {
        // the value stops short of the single whitespace character that introduces the next pair
        const auto valueEnd = Next(ps) == starts.end() ? raw.size() : Next(ps)->name_ - 1;
        retval[raw.substr(ps->name_, ps->eq_ - ps->name_)] = raw.substr(ps->eq_ + 1, valueEnd - ps->eq_ - 1);
    }
    return retval;
}

Args::Map_ Args::ParseLines(const std::string& raw, std::vector<std::string>* rejects) {
    Map_ retval;
    for (const auto& line : ParseUtils::SplitLines(raw)) {
        const std::string text = TrimWhitespace(line);
        if (text.empty())
            continue;
        const auto eq = text.find(EQ);
        const std::string name = eq == std::string::npos ? std::string() : TrimWhitespace(text.substr(0, eq));
        if (name.empty()) {
            Reject(rejects, text);
            continue;
        }
        retval[name] = text.substr(eq + 1);
    }
    return retval;
}
