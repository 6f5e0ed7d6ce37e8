#pragma once

#include "handle.hpp"
#include <map>

// Arguments of one invocation, name -> value. A name given twice keeps its last value.

namespace Args {
    typedef std::map<std::string, std::string> Map_;

    // "name=value name2=value two" -- a new pair starts only where whitespace is followed by "name="
    Map_ ParseInline(const std::string& raw, std::vector<std::string>* rejects);
    // one "name=value" per line, split at the first '='
    Map_ ParseLines(const std::string& raw, std::vector<std::string>* rejects);

    // rejects receives the tokens or lines that are not pairs; they are skipped
    inline Map_ Parse(const std::string& raw, bool multi_line, std::vector<std::string>* rejects) {
        return multi_line ? ParseLines(raw, rejects) : ParseInline(raw, rejects);
    }
} // namespace Args
