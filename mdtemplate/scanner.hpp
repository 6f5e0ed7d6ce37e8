#ifndef MDTEMPLATE_SCANNER__
#define MDTEMPLATE_SCANNER__

#include "handle.hpp"

namespace Scanner {
    struct Syntax_ {
        std::string open_ = "{{";
        std::string close_ = "}}";
        std::string keyword_ = "template";
        char sigil_ = '#';
        char escape_ = '\\';
    };
    const Syntax_& DefaultSyntax();

    struct Invocation_ {
        enum Kind_ { ESCAPED, TEMPLATE };
        Kind_ kind_ = TEMPLATE;
        size_t start_ = 0; // [start_, end_) in the scanned text
        size_t end_ = 0;
        std::string text_; // exactly as matched
        std::string path_; // TEMPLATE only
        std::string args_; // raw argument text, TEMPLATE only
        bool multiLine_ = false;

        std::string Literal() const; // what an ESCAPED marker emits
    };

    // walks the text left to right; the text must outlive the scan
    class Scan_ {
    public:
        explicit Scan_(const std::string& text, const Syntax_& syntax = DefaultSyntax());
        bool Next(Invocation_* dst);
        void Restart() { pos_ = 0; }

    private:
        const std::string& text_;
        const Syntax_& syntax_;
        size_t pos_;
    };

    std::vector<Invocation_> All(const std::string& text, const Syntax_& syntax = DefaultSyntax());
} // namespace Scanner

#endif

/* Invocation markers, as written in a document:

"{{#template <path>}}" includes the file at <path>, relative to the directory of the including file
        whitespace is allowed after "{{" and before "}}"; at least one whitespace character follows "#template"
        <path> is any run of non-whitespace characters, ending before "}}"
"{{#template <path> <args>}}" also supplies arguments to the placeholders in that file
        <args> runs to the closing "}}" and cannot contain '}'
        if the marker is all on one line, <args> is "name=value name2=value2 ..." and values may contain spaces
        if the marker spans lines, <args> is one "name=value" per line
"\{{#<anything>}}" is not expanded; it is emitted without the backslash
        the marker ends at the first "}}"

Anything else, including a marker missing its path or its closing braces, is plain text.
*/
