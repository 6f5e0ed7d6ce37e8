#include "scanner.hpp"
#include "parseutils.hpp"

using ParseUtils::SkipWhite;
using ParseUtils::StartsAt;

namespace {
    bool MatchEscaped(const std::string& text, size_t at, const Scanner::Syntax_& syntax, Scanner::Invocation_* dst) {
        const auto end =
            ParseUtils::EscapedMarkerEnd(text, at, syntax.escape_, syntax.open_ + syntax.sigil_, syntax.close_);
        if (end == std::string::npos)
            return false;
        dst->kind_ = Scanner::Invocation_::ESCAPED;
        dst->path_.clear();
        dst->args_.clear();
        dst->start_ = at;
        dst->end_ = end;
        return true;
    }

    bool MatchTemplate(const std::string& text, size_t at, const Scanner::Syntax_& syntax, Scanner::Invocation_* dst) {
        if (!StartsAt(text, at, syntax.open_))
            return false;
        auto here = SkipWhite(text, at + syntax.open_.size());
        if (!StartsAt(text, here, syntax.sigil_ + syntax.keyword_))
            return false;
        here += 1 + syntax.keyword_.size();

        const auto pathStart = SkipWhite(text, here);
        if (pathStart == here) // "#templatefoo", or "#template" at end of text
            return false;
        const auto pathEnd = ParseUtils::UntilWhiteOr(text, pathStart, syntax.close_);
        if (pathEnd == pathStart)
            return false;

        here = SkipWhite(text, pathEnd);
        auto argsEnd = here;
        if (!StartsAt(text, here, syntax.close_)) {
            // arguments stop at the first character of the closing delimiter, which must then be complete
            argsEnd = text.find(syntax.close_[0], here);
            if (argsEnd == std::string::npos || !StartsAt(text, argsEnd, syntax.close_))
                return false;
        }

        dst->kind_ = Scanner::Invocation_::TEMPLATE;
        dst->path_ = text.substr(pathStart, pathEnd - pathStart);
        dst->args_ = text.substr(here, argsEnd - here);
        dst->start_ = at;
        dst->end_ = argsEnd + syntax.close_.size();
        return true;
    }
} // namespace

const Scanner::Syntax_& Scanner::DefaultSyntax() {
    static const Syntax_ RETVAL{};
    return RETVAL;
}

std::string Scanner::Invocation_::Literal() const { return kind_ == ESCAPED ? text_.substr(1) : text_; }

Scanner::Scan_::Scan_(const std::string& text, const Syntax_& syntax) : text_(text), syntax_(syntax), pos_(0) {
    REQUIRE(!syntax.open_.empty() && !syntax.close_.empty(), "Invocation delimiters can't be empty");
}

bool Scanner::Scan_::Next(Invocation_* dst) {
    const std::string candidates{syntax_.escape_, syntax_.open_[0]};
    for (;;) {
        pos_ = text_.find_first_of(candidates, pos_);
        if (pos_ == std::string::npos) {
            pos_ = text_.size();
            return false;
        }
        if (MatchEscaped(text_, pos_, syntax_, dst) || MatchTemplate(text_, pos_, syntax_, dst)) {
            dst->text_ = text_.substr(dst->start_, dst->end_ - dst->start_);
            dst->multiLine_ = ParseUtils::HasLineBreak(dst->text_);
            pos_ = dst->end_;
            return true;
        }
        ++pos_;
    }
}

std::vector<Scanner::Invocation_> Scanner::All(const std::string& text, const Syntax_& syntax) {
    std::vector<Invocation_> retval;
    Scan_ scan(text, syntax);
    for (Invocation_ inv; scan.Next(&inv);)
        retval.push_back(inv);
    return retval;
}
