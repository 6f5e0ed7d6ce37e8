#pragma once

#include "handle.hpp"
#include "diagnostic.hpp"

class Reader_;

/* Expansion of one document:
        each "{{#template <path> <args>}}" is replaced by the content of <path>, with its placeholders filled from
<args>, itself expanded in turn with <path>'s directory as the new base directory
        escaped markers lose their backslash and nothing else

  Problems never abort the document:
        an unreadable template leaves its marker in place
        nesting deeper than MAX_DEPTH drops the innermost invocation
        each is recorded in the log against source_id
*/

namespace Expand {
    constexpr int MAX_DEPTH = 10;

    std::string Run(const std::string& text,
                    const Reader_& reader,
                    const std::string& base_dir,
                    const std::string& source_id,
                    Log_* log, // may be null
                    int depth = 0);
} // namespace Expand
