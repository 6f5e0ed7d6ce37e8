#include "placeholder.hpp"
#include "parseutils.hpp"

using ParseUtils::SkipWhite;
using ParseUtils::StartsAt;

namespace {
    bool MatchEscaped(const std::string& text, size_t at, const Placeholder::Syntax_& syntax, Placeholder::Placeholder_* dst) {
        const auto end =
            ParseUtils::EscapedMarkerEnd(text, at, syntax.escape_, syntax.open_ + syntax.sigil_, syntax.close_);
        if (end == std::string::npos)
            return false;
        dst->kind_ = Placeholder::Placeholder_::ESCAPED;
        dst->name_.clear();
        dst->default_.clear();
        dst->start_ = at;
        dst->end_ = end;
        return true;
    }

    bool MatchNamed(const std::string& text, size_t at, const Placeholder::Syntax_& syntax, Placeholder::Placeholder_* dst) {
        if (!StartsAt(text, at, syntax.open_))
            return false;
        const auto sigil = SkipWhite(text, at + syntax.open_.size());
        if (sigil == text.size() || text[sigil] != syntax.sigil_)
            return false;
        const auto nameStart = Next(sigil);
        const auto nameEnd = ParseUtils::UntilWhiteOr(text, nameStart, syntax.close_);
        if (nameEnd == nameStart)
            return false;

        auto here = SkipWhite(text, nameEnd);
        if (StartsAt(text, here, syntax.close_)) {
            dst->kind_ = Placeholder::Placeholder_::PLAIN;
            dst->default_.clear();
        } else {
            const auto ket = text.find(syntax.close_[0], here);
            if (ket == std::string::npos || !StartsAt(text, ket, syntax.close_))
                return false;
            dst->kind_ = Placeholder::Placeholder_::WITH_DEFAULT;
            dst->default_ = text.substr(here, ket - here);
            here = ket;
        }
        dst->name_ = text.substr(nameStart, nameEnd - nameStart);
        dst->start_ = at;
        dst->end_ = here + syntax.close_.size();
        return true;
    }
} // namespace

const Placeholder::Syntax_& Placeholder::DefaultSyntax() {
    static const Syntax_ RETVAL{};
    return RETVAL;
}

std::string Placeholder::Placeholder_::Resolve(const Args::Map_& args) const {
    if (kind_ == ESCAPED)
        return text_.substr(1);
    auto pa = args.find(name_);
    if (pa != args.end())
        return pa->second;
    return kind_ == WITH_DEFAULT ? default_ : std::string();
}

Placeholder::Scan_::Scan_(const std::string& text, const Syntax_& syntax) : text_(text), syntax_(syntax), pos_(0) {
    REQUIRE(!syntax.open_.empty() && !syntax.close_.empty(), "Placeholder delimiters can't be empty");
}

bool Placeholder::Scan_::Next(Placeholder_* dst) {
    const std::string candidates{syntax_.escape_, syntax_.open_[0]};
    for (;;) {
        pos_ = text_.find_first_of(candidates, pos_);
        if (pos_ == std::string::npos) {
            pos_ = text_.size();
            return false;
        }
        if (MatchEscaped(text_, pos_, syntax_, dst) || MatchNamed(text_, pos_, syntax_, dst)) {
            dst->text_ = text_.substr(dst->start_, dst->end_ - dst->start_);
            pos_ = dst->end_;
            return true;
        }
        ++pos_;
    }
}

std::vector<Placeholder::Placeholder_> Placeholder::All(const std::string& text, const Syntax_& syntax) {
    std::vector<Placeholder_> retval;
    Scan_ scan(text, syntax);
    for (Placeholder_ ph; scan.Next(&ph);)
        retval.push_back(ph);
    return retval;
}

std::string Placeholder::Substitute(const std::string& text, const Args::Map_& args, const Syntax_& syntax) {
    // offsets refer to 'text', never to the growing result
    std::string retval;
    retval.reserve(text.size());
    size_t copied = 0;
    Scan_ scan(text, syntax);
    for (Placeholder_ ph; scan.Next(&ph);) {
        retval.append(text, copied, ph.start_ - copied);
        retval += ph.Resolve(args);
        copied = ph.end_;
    }
    retval.append(text, copied, std::string::npos);
    return retval;
}
