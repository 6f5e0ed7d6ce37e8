
#include "book.hpp"
#include "config.hpp"
#include "diagnostic.hpp"
#include "expand.hpp"
#include "file.hpp"
#include "reader.hpp"
#include <algorithm>
#include <iostream>

using std::cout;

std::vector<std::string> Book::Documents(const Config_& config, const std::string& dir, const std::string& out_dir) {
    const std::string templates = config.TemplateDir();
    std::vector<std::string> retval;
    for (const auto& source : config.sources_) {
        for (auto& doc : File::List(dir, std::vector<std::string>(1, source.filePattern_), source.rejectPatterns_)) {
            if (File::IsInside(doc, templates) || File::IsInside(doc, out_dir))
                continue;
            if (std::find(retval.begin(), retval.end(), doc) == retval.end())
                retval.push_back(doc);
        }
    }
    return retval;
}

std::string Book::BaseDir(const Config_& config, const std::string& document) {
    const std::string templates = config.TemplateDir();
    return templates.empty() ? File::Parent(document) : templates;
}

bool Book::WriteIfChanged(const std::string& dst_name, const std::string& output) {
    // I guess we have to read it
    std::string prior;
    if (File::Slurp(dst_name, &prior) && prior == output)
        return false;
    cout << "\tWriting " << dst_name << "\n";
    File::Write(dst_name, output);
    return true;
}

Book::Stats_ Book::Process(const Config_& config, const std::string& dir, const std::string& out_dir, Log_* log) {
    const Reader::Disk_ reader{};
    return Process(config, dir, out_dir, log, reader);
}

Book::Stats_ Book::Process(
    const Config_& config, const std::string& dir, const std::string& out_dir, Log_* log, const Reader_& reader) {
    REQUIRE(!out_dir.empty(), "No output directory; supply one with -o or '->' in the config");
    REQUIRE(!File::IsInside(dir, out_dir),
            "Output directory '" + out_dir + "' can't contain the document directory '" + dir + "'");
    Log_ discard;
    if (!log)
        log = &discard;
    Stats_ retval;
    for (const auto& doc : Documents(config, dir, out_dir)) {
        const std::string source = File::Relative(doc, dir);
        cout << "Reading " << source << "\n";
        std::string text;
        try {
            text = reader(dir, source, source);
        } catch (std::exception& e) {
            log->Add(Diagnostic_::FILE_READ_FAILURE, source, std::string("Skipped document: ") + e.what());
            continue;
        }
        ++retval.nRead_;
        retval.nLines_ += static_cast<int>(std::count(text.begin(), text.end(), '\n'));

        const std::string expanded = Expand::Run(text, reader, BaseDir(config, doc), source, log);
        if (WriteIfChanged(File::Join(out_dir, source), expanded))
            ++retval.nWritten_;
    }
    return retval;
}
