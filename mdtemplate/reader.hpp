#pragma once

#include "handle.hpp"
#include <map>

// Reader_ supplies the content of a template file named by an invocation.
// Failure is reported by throwing std::runtime_error; the message names the marker and the resolved path.
// Implementations must be safe for concurrent reads.

class Reader_ {
public:
    virtual ~Reader_() = default;
    virtual std::string operator()(const std::string& base_dir,
                                   const std::string& relative_path,
                                   const std::string& marker_text) const = 0;
};

namespace Reader {
    std::string FailureMessage(const std::string& marker_text, const std::string& resolved_path);

    // reads base_dir/relative_path from disk
    struct Disk_ : Reader_ {
        std::string operator()(const std::string& base_dir,
                               const std::string& relative_path,
                               const std::string& marker_text) const override;
    };

    // looks up base_dir/relative_path in a preloaded map; for tests
    struct Memory_ : Reader_ {
        std::map<std::string, std::string> files_; // resolved path -> content
        Memory_() = default;
        explicit Memory_(const std::map<std::string, std::string>& files) : files_(files) {}
        std::string operator()(const std::string& base_dir,
                               const std::string& relative_path,
                               const std::string& marker_text) const override;
    };
} // namespace Reader
