#pragma once

#include "handle.hpp"
#include <ostream>

// Diagnostic_ records one recoverable problem found while expanding a document.
// Expansion never stops on these; they are collected so the author can find the marker at fault.

struct Diagnostic_ {
    enum Kind_ { MALFORMED_ARGUMENT, FILE_READ_FAILURE, DEPTH_EXCEEDED };
    Kind_ kind_;
    std::string source_;  // identity of the top-level document
    std::string message_;
};

// Log_ is not synchronized; a host expanding documents in parallel gives each thread its own Log_.
class Log_ {
public:
    explicit Log_(std::ostream* echo = nullptr) : echo_(echo) {}
    void Add(Diagnostic_::Kind_ kind, const std::string& source, const std::string& message);

    const std::vector<Diagnostic_>& All() const { return vals_; }
    int Count(Diagnostic_::Kind_ kind) const;
    bool empty() const { return vals_.empty(); }

private:
    std::vector<Diagnostic_> vals_;
    std::ostream* echo_; // not owned
};

namespace Diagnostic {
    std::string KindName(Diagnostic_::Kind_ kind);
    std::string Format(const Diagnostic_& d); // one line, as echoed
} // namespace Diagnostic
