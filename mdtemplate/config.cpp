
#include "config.hpp"
#include "file.hpp"
#include "parseutils.hpp"
#include <iostream>

const char* Config::DEFAULT_FILE = "mdtemplate.cfg";
const char* Config::DEFAULT_PATTERN = ".*\\.md";

namespace {
    bool NamesOutput(const std::string& line) { return line.size() > 2 && line[0] == '-' && line[1] == '>'; }

    bool NamesSources(const std::string& line) { return line.size() > 2 && line[0] == '<' && line[1] == '-'; }

    std::vector<std::string> SourcePatterns(const std::string& line, std::vector<std::string>* reject) {
        std::string rest = line.substr(2);
        std::vector<std::string> ret_val;
        bool rejecting = false;
        while (!rest.empty()) {
            auto stop = rest.find_first_of(";!");
            const std::string pattern = rest.substr(0, stop);
            if (!pattern.empty())
                (rejecting ? reject : &ret_val)->push_back(pattern);
            if (stop == std::string::npos)
                rest.clear();
            else {
                if (rest[stop] == '!')
                    rejecting = true;
                rest = rest.substr(stop + 1);
            }
        }
        return ret_val;
    }

    bool StartsWithBackQuote(const std::string& line) {
        auto non_blank = line.find_first_not_of(" \t");
        return non_blank == std::string::npos // all blank
               || line[non_blank] == '`';
    }

    std::vector<std::string> ReadLines(const std::string& filename) {
        std::string all;
        if (!File::Slurp(filename, &all))
            return std::vector<std::string>();
        return ParseUtils::SplitLines(all);
    }
} // namespace

Config_ Config::Parse(const std::vector<std::string>& src, const std::string& own_path) {
    Config_ ret_val;
    ret_val.ownPath_ = own_path;
    for (auto& line : src) {
        if (line.empty() || StartsWithBackQuote(line))
            continue;
        else if (line[0] == '@') {
            REQUIRE(ret_val.templatePath_.empty(), "Can't supply multiple template directories");
            ret_val.templatePath_ = WithEnvironment(ParseUtils::TrimWhitespace(line.substr(1)));
            REQUIRE(!ret_val.templatePath_.empty(), "Template directory after '@' can't be empty");
        } else if (NamesOutput(line)) {
            REQUIRE(ret_val.outputPath_.empty(), "Can't supply multiple output directories");
            ret_val.outputPath_ = WithEnvironment(ParseUtils::TrimWhitespace(line.substr(2)));
        } else if (NamesSources(line)) {
            std::vector<std::string> reject;
            auto patterns = SourcePatterns(ParseUtils::TrimWhitespace(line), &reject);
            REQUIRE(!patterns.empty(), "Source line '" + line + "' names no file pattern");
            for (auto& pattern : patterns) {
                ret_val.sources_.emplace_back(pattern);
                ret_val.sources_.back().rejectPatterns_ = reject;
            }
        } else {
            THROW("Unrecognized configuration line '" + line + "'");
        }
    }
    if (ret_val.sources_.empty())
        ret_val.sources_.emplace_back(DEFAULT_PATTERN);
    return ret_val;
}

Config_ Config::Read(const std::string& filename) {
    std::cout << "Reading configuration from " << filename << "\n";
    return Parse(ReadLines(filename), File::Parent(filename));
}

std::string Config_::TemplateDir() const {
    return templatePath_.empty() ? std::string() : File::Join(ownPath_, templatePath_);
}
