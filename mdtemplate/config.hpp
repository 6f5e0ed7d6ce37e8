#pragma once

#include "handle.hpp"

/* The purpose of a config is to state:
        -- which documents to expand
        -- where top-level template paths are resolved
        -- where the expanded documents go

  The format is minimal; blank lines and lines starting with ` are ignored:
        "<-pattern;pattern!reject;reject" selects documents by file name (regular expressions); default .*\.md
        "@dir" sets the templates directory, relative to the config file
        "->dir" sets the output directory
  "$(NAME)" in a directory is replaced by the environment variable NAME.

  e.g.
<-.*\.md!SUMMARY\.md
@templates
->$(BUILD_DIR)/expanded

  Without a templates directory, each document's own directory is used.
*/

struct Config_ {
    struct Source_ {
        std::string filePattern_;
        std::vector<std::string> rejectPatterns_;
        Source_(const std::string& pattern) : filePattern_(pattern) {}
    };

    std::vector<Source_> sources_;
    std::string ownPath_;
    std::string templatePath_; // relative to config file, not to working directory!
    std::string outputPath_;   // relative to working directory

    std::string TemplateDir() const; // empty if not configured
};

namespace Config {
    extern const char* DEFAULT_FILE;
    extern const char* DEFAULT_PATTERN;

    Config_ Read(const std::string& filename); // missing file gives the defaults
    Config_ Parse(const std::vector<std::string>& lines, const std::string& own_path);
} // namespace Config
