
#ifndef MDTEMPLATE_PARSEUTILS__
#define MDTEMPLATE_PARSEUTILS__

#include "handle.hpp"

namespace ParseUtils {
    bool IsWhite(char c);
    bool IsLineBreak(char c);
    bool HasLineBreak(const std::string& src);
    std::string AfterInitialWhitespace(const std::string& line);
    std::string TrimWhitespace(const std::string& src);

    // position-based helpers for the marker scanners; none of them reads past src.size()
    bool StartsAt(const std::string& src, size_t pos, const std::string& token);
    size_t SkipWhite(const std::string& src, size_t pos);
    size_t UntilWhiteOr(const std::string& src, size_t pos, const std::string& stop); // first whitespace or 'stop'
    // end of "<escape><opener>...<close>" starting at pos, up to the first 'close' on the same line; npos if the line ends first
    size_t EscapedMarkerEnd(const std::string& src, size_t pos, char escape, const std::string& opener, const std::string& close);

    std::vector<std::string> SplitLines(const std::string& src); // splits at '\n' and '\r', keeps empty lines
} // namespace ParseUtils

#endif
