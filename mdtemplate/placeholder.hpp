#ifndef MDTEMPLATE_PLACEHOLDER__
#define MDTEMPLATE_PLACEHOLDER__

#include "arguments.hpp"

namespace Placeholder {
    struct Syntax_ {
        std::string open_ = "[[";
        std::string close_ = "]]";
        char sigil_ = '#';
        char escape_ = '\\';
    };
    const Syntax_& DefaultSyntax();

    struct Placeholder_ {
        enum Kind_ { ESCAPED, PLAIN, WITH_DEFAULT };
        Kind_ kind_ = PLAIN;
        size_t start_ = 0; // [start_, end_) in the scanned text
        size_t end_ = 0;
        std::string text_;
        std::string name_;
        std::string default_; // WITH_DEFAULT only, verbatim

        std::string Resolve(const Args::Map_& args) const;
    };

    // walks the text left to right; the text must outlive the scan
    class Scan_ {
    public:
        explicit Scan_(const std::string& text, const Syntax_& syntax = DefaultSyntax());
        bool Next(Placeholder_* dst);
        void Restart() { pos_ = 0; }

    private:
        const std::string& text_;
        const Syntax_& syntax_;
        size_t pos_;
    };

    std::vector<Placeholder_> All(const std::string& text, const Syntax_& syntax = DefaultSyntax());

    // replaces every placeholder; all other text is copied unchanged
    std::string Substitute(const std::string& text, const Args::Map_& args, const Syntax_& syntax = DefaultSyntax());
} // namespace Placeholder

#endif

/* Placeholders, as written in an included file:

"[[#name]]" is replaced by the argument 'name', or by nothing if the invocation did not supply it
"[[#name default text]]" is replaced by the argument 'name', or else by "default text" (up to the first ']')
        whitespace is allowed after "[[" and before "]]"; the default keeps its trailing whitespace
"\[[#<anything>]]" is emitted without the backslash
*/
