#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include "../mdtemplate/config.hpp"
#include "../mdtemplate/file.hpp"

TEST(test_config, full) {
    const std::vector<std::string> lines = {
        "` documents to expand",
        "",
        "<-.*\\.md;.*\\.markdown!SUMMARY\\.md",
        "   ` indented comment",
        "@templates",
        "->out",
    };
    const Config_ config = Config::Parse(lines, "proj");
    ASSERT_EQ(config.sources_.size(), 2u);
    EXPECT_EQ(config.sources_[0].filePattern_, ".*\\.md");
    EXPECT_EQ(config.sources_[1].filePattern_, ".*\\.markdown");
    for (const auto& s : config.sources_)
        EXPECT_EQ(s.rejectPatterns_, std::vector<std::string>{"SUMMARY\\.md"});
    EXPECT_EQ(config.templatePath_, "templates");
    EXPECT_EQ(config.TemplateDir(), "proj/templates");
    EXPECT_EQ(config.outputPath_, "out");
}

TEST(test_config, defaults) {
    const Config_ config = Config::Parse(std::vector<std::string>(), "");
    ASSERT_EQ(config.sources_.size(), 1u);
    EXPECT_EQ(config.sources_[0].filePattern_, Config::DEFAULT_PATTERN);
    EXPECT_TRUE(config.sources_[0].rejectPatterns_.empty());
    EXPECT_EQ(config.TemplateDir(), "");
    EXPECT_EQ(config.outputPath_, "");
}

TEST(test_config, environment) {
    setenv("MDTEMPLATE_TEST_OUT", "/tmp/mdt", 1);
    const Config_ config = Config::Parse({"->$(MDTEMPLATE_TEST_OUT)/book", "@$(MDTEMPLATE_TEST_OUT)/parts"}, "");
    EXPECT_EQ(config.outputPath_, "/tmp/mdt/book");
    // an absolute template directory ignores the config location
    EXPECT_EQ(config.TemplateDir(), "/tmp/mdt/parts");

    unsetenv("MDTEMPLATE_TEST_UNDEFINED");
    EXPECT_THROW(Config::Parse({"->$(MDTEMPLATE_TEST_UNDEFINED)"}, ""), std::runtime_error);
    EXPECT_THROW(Config::Parse({"->$(MDTEMPLATE_TEST_OUT"}, ""), std::runtime_error);
}

TEST(test_config, errors) {
    EXPECT_THROW(Config::Parse({"what is this"}, ""), std::runtime_error);
    EXPECT_THROW(Config::Parse({"@a", "@b"}, ""), std::runtime_error);
    EXPECT_THROW(Config::Parse({"->a", "->b"}, ""), std::runtime_error);
    EXPECT_THROW(Config::Parse({"@   "}, ""), std::runtime_error);
    EXPECT_THROW(Config::Parse({"<-!README\\.md"}, ""), std::runtime_error);
}

TEST(test_config, read_file) {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "mdtemplate_test_config";
    fs::remove_all(dir);
    const std::string name = (dir / "book.cfg").generic_string();
    File::Write(name, "` test config\n@parts\r\n->expanded\n");

    const Config_ config = Config::Read(name);
    EXPECT_EQ(config.TemplateDir(), (dir / "parts").generic_string());
    EXPECT_EQ(config.outputPath_, "expanded");

    const Config_ missing = Config::Read((dir / "absent.cfg").generic_string());
    ASSERT_EQ(missing.sources_.size(), 1u);
    EXPECT_EQ(missing.outputPath_, "");
    fs::remove_all(dir);
}
