#pragma once

#include "handle.hpp"

struct Config_;
class Log_;
class Reader_;

// A book is a directory tree of documents; each selected document is expanded into a mirror tree.

namespace Book {
    struct Stats_ {
        int nRead_ = 0;
        int nLines_ = 0;
        int nWritten_ = 0;
    };

    std::vector<std::string> Documents(const Config_& config, const std::string& dir, const std::string& out_dir);
    std::string BaseDir(const Config_& config, const std::string& document);

    // returns true if the file was (re)written
    bool WriteIfChanged(const std::string& dst_name, const std::string& output);

    // log may be null; a document that can't be read is logged and skipped
    Stats_ Process(const Config_& config, const std::string& dir, const std::string& out_dir, Log_* log);
    // reads documents and templates through reader
    Stats_ Process(
        const Config_& config, const std::string& dir, const std::string& out_dir, Log_* log, const Reader_& reader);
} // namespace Book
