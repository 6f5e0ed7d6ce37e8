// mdtemplate.cpp : Defines the entry point for the console application.
//
#include "../mdtemplate/handle.hpp"

#include <filesystem>
#include <iostream>
#include "../mdtemplate/book.hpp"
#include "../mdtemplate/config.hpp"
#include "../mdtemplate/diagnostic.hpp"

using std::cout;
using std::endl;

namespace {
    void ReadCommandLine
            (int argc,
             char *argv[],
             std::string *config,
             std::string *out_dir,
             std::vector<std::string> *dirs) {
        for (int ii = 1; ii < argc; ++ii) {
            std::string arg(argv[ii]);
            REQUIRE(!arg.empty(), "Empty command line argument");
            if (arg[0] == '-') {
                // command-line switch
                REQUIRE(arg.size() == 2, "Unrecognized command line switch '" + arg + "'");
                switch (arg[1]) {
                    case 'c':
                        REQUIRE(ii + 1 < argc, "-c switch must be followed by a config filename");
                        REQUIRE(config->empty(), "Can't supply multiple configs");
                        *config = argv[++ii];    // jump forward to this input
                        break;

                    case 'd':
                        REQUIRE(ii + 1 < argc, "-d switch must be followed by a document directory");
                        dirs->push_back(std::string(argv[++ii]));    // jump forward to this input
                        break;

                    case 'o':
                        REQUIRE(ii + 1 < argc, "-o must be followed by an output directory");
                        REQUIRE(out_dir->empty(), "Can't supply multiple output directories");
                        *out_dir = argv[++ii];
                        break;

                    default:
                        THROW("Unrecognized command line switch '" + arg + "'");
                }
            } else {
                // can't understand this
                THROW("Unexpected command line input '" + arg + "'");
            }
        }

        if (config->empty())
            *config = Config::DEFAULT_FILE;    // the default
        if (dirs->empty())
            dirs->push_back(".");    // the default
    }
}    // leave local

void XMain(int argc, char *argv[]) {
    cout << "In directory " << std::filesystem::current_path().string() << endl;

    std::string configFile, outDir;
    std::vector<std::string> dirs;
    ReadCommandLine(argc, argv, &configFile, &outDir, &dirs);
    const Config_ config = Config::Read(configFile);
    if (outDir.empty())
        outDir = config.outputPath_;
    if (!config.templatePath_.empty())
        cout << "Reading templates from " << config.TemplateDir() << endl;

    Log_ log(&std::cerr);
    // loop over directories
    for (auto &dir : dirs) {
        cout << "Scanning " << dir << "\n";
        const Book::Stats_ stats = Book::Process(config, dir, outDir, &log);
        cout << "Scanned " << stats.nRead_ << " files (" << stats.nLines_ << " lines), wrote " << stats.nWritten_
             << " files" << endl;
        cout << "mdtemplate finished directory " << dir << endl;
    }
    if (!log.empty())
        cout << log.All().size() << " problems (" << log.Count(Diagnostic_::FILE_READ_FAILURE) << " unreadable, "
             << log.Count(Diagnostic_::DEPTH_EXCEEDED) << " too deep, " << log.Count(Diagnostic_::MALFORMED_ARGUMENT)
             << " malformed arguments)" << endl;
}

int main(int argc, char *argv[]) {
    try {
        XMain(argc, argv);
        return 0;
    }
    catch (std::exception &e) {
        std::cerr << "Error:  " << e.what() << endl;
        return -1;
    }
}
