#pragma once

#include "handle.hpp"

namespace File {
    std::string Join(const std::string& dir, const std::string& path); // cd dir; cd path -- path may be absolute
    std::string Parent(const std::string& filename);                    // empty for a bare filename
    std::string Relative(const std::string& path, const std::string& base);
    bool IsInside(const std::string& path, const std::string& dir);

    bool Slurp(const std::string& filename, std::string* dst); // whole file, byte for byte; false if unreadable
    void Write(const std::string& filename, const std::string& content); // creates parent directories

    std::vector<std::string> List(const std::string& dir,
                                  const std::vector<std::string>& patterns,        // matched against file names
                                  const std::vector<std::string>& reject_patterns); // lets us exclude SUMMARY.md etc
} // namespace File
