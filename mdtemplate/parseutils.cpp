
#include "parseutils.hpp"
#include <algorithm>

bool ParseUtils::IsWhite(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }
bool ParseUtils::IsLineBreak(char c) { return c == '\n' || c == '\r'; }

bool ParseUtils::HasLineBreak(const std::string& src) {
    return std::find_if(src.begin(), src.end(), IsLineBreak) != src.end();
}

std::string ParseUtils::AfterInitialWhitespace(const std::string& line) {
    auto offset = SkipWhite(line, 0);
    return offset == line.size() ? std::string() : line.substr(offset);
}

std::string ParseUtils::TrimWhitespace(const std::string& src) {
    std::string retval = AfterInitialWhitespace(src);
    while (!retval.empty() && IsWhite(retval.back()))
        retval.pop_back();
    return retval;
}

bool ParseUtils::StartsAt(const std::string& src, size_t pos, const std::string& token) {
    return pos <= src.size() && src.compare(pos, token.size(), token) == 0;
}

size_t ParseUtils::SkipWhite(const std::string& src, size_t pos) {
    while (pos < src.size() && IsWhite(src[pos]))
        ++pos;
    return pos;
}

size_t ParseUtils::UntilWhiteOr(const std::string& src, size_t pos, const std::string& stop) {
    while (pos < src.size() && !IsWhite(src[pos]) && !StartsAt(src, pos, stop))
        ++pos;
    return pos;
}

size_t ParseUtils::EscapedMarkerEnd(
    const std::string& src, size_t pos, char escape, const std::string& opener, const std::string& close) {
    if (pos >= src.size() || src[pos] != escape || !StartsAt(src, pos + 1, opener))
        return std::string::npos;
    for (auto ket = pos + 1 + opener.size(); ket < src.size() && !IsLineBreak(src[ket]); ++ket)
        if (StartsAt(src, ket, close))
            return ket + close.size();
    return std::string::npos;
}

std::vector<std::string> ParseUtils::SplitLines(const std::string& src) {
    std::vector<std::string> retval(1);
    for (auto c : src) {
        if (IsLineBreak(c))
            retval.emplace_back();
        else
            retval.back().push_back(c);
    }
    return retval;
}
