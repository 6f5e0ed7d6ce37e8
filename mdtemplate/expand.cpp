
#include "expand.hpp"
#include "arguments.hpp"
#include "file.hpp"
#include "placeholder.hpp"
#include "reader.hpp"
#include "scanner.hpp"

namespace {
    Args::Map_ ArgumentsOf(const Scanner::Invocation_& inv, const std::string& source_id, Log_* log) {
        std::vector<std::string> rejects;
        auto retval = Args::Parse(inv.args_, inv.multiLine_, &rejects);
        for (const auto& r : rejects)
            log->Add(Diagnostic_::MALFORMED_ARGUMENT, source_id,
                     "Couldn't find a key/value pair in '" + r + "' while parsing " + inv.text_);
        return retval;
    }
} // namespace

std::string Expand::Run(const std::string& text,
                        const Reader_& reader,
                        const std::string& base_dir,
                        const std::string& source_id,
                        Log_* log,
                        int depth) {
    Log_ discarded;
    if (!log)
        log = &discarded;
    std::string retval;
    retval.reserve(text.size());
    size_t copied = 0; // text before this has been dealt with
    Scanner::Scan_ scan(text);
    for (Scanner::Invocation_ inv; scan.Next(&inv);) {
        retval.append(text, copied, inv.start_ - copied);
        if (inv.kind_ == Scanner::Invocation_::ESCAPED) {
            retval += inv.Literal();
            copied = inv.end_;
            continue;
        }

        const Args::Map_ args = ArgumentsOf(inv, source_id, log);
        std::string content;
        try {
            content = reader(base_dir, inv.path_, inv.text_);
        } catch (std::exception& e) {
            log->Add(Diagnostic_::FILE_READ_FAILURE, source_id, e.what());
            // the marker itself is copied with the next slice
            copied = inv.start_;
            continue;
        }
        content = Placeholder::Substitute(content, args);

        if (depth < MAX_DEPTH) {
            const std::string target = File::Join(base_dir, inv.path_);
            retval += Run(content, reader, File::Parent(target), source_id, log, depth + 1);
        } else {
            log->Add(Diagnostic_::DEPTH_EXCEEDED, source_id,
                     "Stopped expanding " + inv.text_ + " at nesting depth " + std::to_string(depth) +
                         "; is a template including itself?");
        }
        copied = inv.end_;
    }
    retval.append(text, copied, std::string::npos);
    return retval;
}
