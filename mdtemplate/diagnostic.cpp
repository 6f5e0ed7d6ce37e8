
#include "diagnostic.hpp"
#include <algorithm>

std::string Diagnostic::KindName(Diagnostic_::Kind_ kind) {
    switch (kind) {
    case Diagnostic_::MALFORMED_ARGUMENT:
        return "malformed argument";
    case Diagnostic_::FILE_READ_FAILURE:
        return "file read failure";
    case Diagnostic_::DEPTH_EXCEEDED:
        return "depth exceeded";
    }
    THROW("Unknown diagnostic kind");
}

std::string Diagnostic::Format(const Diagnostic_& d) {
    return d.source_ + ": " + KindName(d.kind_) + ": " + d.message_;
}

void Log_::Add(Diagnostic_::Kind_ kind, const std::string& source, const std::string& message) {
    vals_.push_back(Diagnostic_{kind, source, message});
    if (echo_)
        *echo_ << Diagnostic::Format(vals_.back()) << "\n";
}

int Log_::Count(Diagnostic_::Kind_ kind) const {
    return static_cast<int>(
        std::count_if(vals_.begin(), vals_.end(), [&](const Diagnostic_& d) { return d.kind_ == kind; }));
}
