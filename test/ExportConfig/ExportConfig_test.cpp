/*!
 * \file ExportConfig_test.cpp
 *
 * \brief Tests loading export options from YAML and the command
 * line, and the rejection of unknown keys and bad values
 */

#include "MigrationTester.hpp"
#include "common/QueryHelpers.hpp"

#include "mdb2sqlite/app/ExportConfig.hpp"
#include "mdb2sqlite/app/CommandLine.hpp"
#include "mdb2sqlite/Errors.hpp"

#include <sstream>

TEST_INIT;

using namespace mdb2sqlite::test;

void testDefaults()
{
    PRINT_ENTER_TEST

    mdb2sqlite::ExportConfig config;
    EXPECT_FALSE(config.source.include_system_tables);
    EXPECT_EQUAL(config.source.date_format, "%Y-%m-%d %H:%M:%S");
    EXPECT_EQUAL(config.progress_interval, mdb2sqlite::DEFAULT_PROGRESS_INTERVAL);
    EXPECT_TRUE(config.taps.empty());

    //An empty document changes nothing
    EXPECT_NOTHROW(config.loadString(""));
    EXPECT_EQUAL(config.progress_interval, 10000);
}

void testLoadString()
{
    PRINT_ENTER_TEST

    const std::string yaml =
        "source:\n"
        "  include_system_tables: true\n"
        "  date_format: \"%d/%m/%Y\"\n"
        "export:\n"
        "  progress_interval: 500\n"
        "logging:\n"
        "  - { pattern: \"\", category: \"warning\", destination: \"2\" }\n"
        "  - { pattern: \"export\", category: \"info\", destination: \"export.log.basic\" }\n"
        "  - { destination: \"everything.log\" }\n";

    mdb2sqlite::ExportConfig config;
    config.loadString(yaml);

    EXPECT_TRUE(config.source.include_system_tables);
    EXPECT_EQUAL(config.source.date_format, "%d/%m/%Y");
    EXPECT_EQUAL(config.progress_interval, 500);

    EXPECT_EQUAL(config.taps.size(), 3);
    EXPECT_EQUAL(config.taps[0].getLocation(), "");
    EXPECT_EQUAL(config.taps[0].getCategoryName(), "warning");
    EXPECT_EQUAL(config.taps[0].getDestination(), "2");
    EXPECT_EQUAL(config.taps[1].getLocation(), "export");
    EXPECT_EQUAL(config.taps[1].getCategoryName(), "info");
    EXPECT_EQUAL(config.taps[1].getDestination(), "export.log.basic");
    EXPECT_EQUAL(config.taps[2].getLocation(), "");
    EXPECT_EQUAL(config.taps[2].getCategoryName(), "");

    std::ostringstream oss;
    config.dump(oss);
    EXPECT_TRUE(oss.str().find("export.progress_interval: 500") != std::string::npos);
    EXPECT_TRUE(oss.str().find("source.include_system_tables: true") != std::string::npos);
}

void testPartialDocument()
{
    PRINT_ENTER_TEST

    mdb2sqlite::ExportConfig config;
    config.loadString("export:\n  progress_interval: 0\n");
    EXPECT_EQUAL(config.progress_interval, 0);
    EXPECT_FALSE(config.source.include_system_tables);
    EXPECT_EQUAL(config.source.date_format, "%Y-%m-%d %H:%M:%S");
}

void testBadDocuments()
{
    PRINT_ENTER_TEST

    mdb2sqlite::ExportConfig config;

    //Unknown keys at every level
    EXPECT_THROW_TYPE(config.loadString("sources:\n  include_system_tables: true\n"),
                      mdb2sqlite::ConfigError);
    EXPECT_THROW_MSG_CONTAINS(config.loadString("source:\n  include_sys_tables: true\n"),
                              "source.include_sys_tables");
    EXPECT_THROW_TYPE(config.loadString("export:\n  batch_size: 10\n"),
                      mdb2sqlite::ConfigError);
    EXPECT_THROW_TYPE(config.loadString("logging:\n  - { destination: \"1\", level: \"x\" }\n"),
                      mdb2sqlite::ConfigError);

    //Wrongly typed values
    EXPECT_THROW_TYPE(config.loadString("export:\n  progress_interval: lots\n"),
                      mdb2sqlite::ConfigError);
    EXPECT_THROW_TYPE(config.loadString("export:\n  progress_interval: -5\n"),
                      mdb2sqlite::ConfigError);
    EXPECT_THROW_TYPE(config.loadString("source:\n  include_system_tables: maybe\n"),
                      mdb2sqlite::ConfigError);
    EXPECT_THROW_TYPE(config.loadString("source: [1, 2]\n"),
                      mdb2sqlite::ConfigError);
    EXPECT_THROW_TYPE(config.loadString("logging:\n  pattern: export\n"),
                      mdb2sqlite::ConfigError);

    //A tap needs somewhere to write
    EXPECT_THROW_TYPE(config.loadString("logging:\n  - { pattern: export }\n"),
                      mdb2sqlite::ConfigError);

    //Not YAML
    EXPECT_THROW_TYPE(config.loadString("source: {include_system_tables: true\n"),
                      mdb2sqlite::ConfigError);

    //The location of the bad node is reported
    EXPECT_THROW_MSG_CONTAINS(config.loadString("export:\n  progress_interval: lots\n", "cfg.yaml"),
                              "cfg.yaml:2");
}

void testLoadFile()
{
    PRINT_ENTER_TEST

    writeFile("export_config.yaml", "export:\n  progress_interval: 42\n");

    mdb2sqlite::ExportConfig config;
    EXPECT_NOTHROW(config.loadFile("export_config.yaml"));
    EXPECT_EQUAL(config.progress_interval, 42);

    EXPECT_THROW_TYPE(config.loadFile("no_such_config.yaml"), mdb2sqlite::ConfigError);
}

bool parseArgs(mdb2sqlite::app::CommandLine & cmdline, const std::vector<std::string> & args)
{
    std::vector<const char*> argv;
    argv.push_back("mdb2sqlite");
    for (const auto & arg : args) {
        argv.push_back(arg.c_str());
    }
    return cmdline.parse((int)argv.size(), argv.data());
}

void testCommandLine()
{
    PRINT_ENTER_TEST

    {
        mdb2sqlite::app::CommandLine cmdline;
        EXPECT_TRUE(parseArgs(cmdline, {"in.mdb", "out.sqlite"}));
        EXPECT_EQUAL(cmdline.getSourcePath(), "in.mdb");
        EXPECT_EQUAL(cmdline.getDestinationPath(), "out.sqlite");
        EXPECT_FALSE(cmdline.isQuiet());
        EXPECT_EQUAL(cmdline.getConfig().progress_interval, 10000);
    }

    {
        mdb2sqlite::app::CommandLine cmdline;
        EXPECT_TRUE(parseArgs(cmdline, {"--quiet", "--include-system-tables",
                                        "--progress-interval", "7",
                                        "--log", "export", "info", "1",
                                        "--log", "export.populate", "warning", "warn.log",
                                        "in.mdb", "out.sqlite"}));
        EXPECT_TRUE(cmdline.isQuiet());
        EXPECT_TRUE(cmdline.getConfig().source.include_system_tables);
        EXPECT_EQUAL(cmdline.getConfig().progress_interval, 7);
        EXPECT_EQUAL(cmdline.getConfig().taps.size(), 2);
        EXPECT_EQUAL(cmdline.getConfig().taps[0].getLocation(), "export");
        EXPECT_EQUAL(cmdline.getConfig().taps[1].getDestination(), "warn.log");
        EXPECT_EQUAL(cmdline.getSourcePath(), "in.mdb");
    }

    //Command line options override the file
    writeFile("export_override.yaml",
              "export:\n  progress_interval: 100\n"
              "logging:\n  - { destination: \"file_tap.log\" }\n");
    {
        mdb2sqlite::app::CommandLine cmdline;
        EXPECT_TRUE(parseArgs(cmdline, {"--config", "export_override.yaml",
                                        "--progress-interval", "3",
                                        "--log", "export", "debug", "2",
                                        "in.mdb", "out.sqlite"}));
        EXPECT_EQUAL(cmdline.getConfig().progress_interval, 3);
        EXPECT_EQUAL(cmdline.getConfig().taps.size(), 2);
        EXPECT_EQUAL(cmdline.getConfig().taps[0].getDestination(), "file_tap.log");
        EXPECT_EQUAL(cmdline.getConfig().taps[1].getCategoryName(), "debug");
    }

    //Bad usage
    {
        mdb2sqlite::app::CommandLine cmdline;
        EXPECT_FALSE(parseArgs(cmdline, {"in.mdb"}));
        EXPECT_EQUAL(cmdline.getErrorCode(), 1);
    }
    {
        mdb2sqlite::app::CommandLine cmdline;
        EXPECT_FALSE(parseArgs(cmdline, {"--progress-interval", "-1", "in.mdb", "out.sqlite"}));
        EXPECT_EQUAL(cmdline.getErrorCode(), 1);
    }
    {
        mdb2sqlite::app::CommandLine cmdline;
        EXPECT_FALSE(parseArgs(cmdline, {"--no-such-option", "in.mdb", "out.sqlite"}));
        EXPECT_EQUAL(cmdline.getErrorCode(), 1);
    }
    {
        mdb2sqlite::app::CommandLine cmdline;
        EXPECT_FALSE(parseArgs(cmdline, {"--config", "no_such_config.yaml", "in.mdb", "out.sqlite"}));
        EXPECT_EQUAL(cmdline.getErrorCode(), 1);
    }
    {
        mdb2sqlite::app::CommandLine cmdline;
        EXPECT_FALSE(parseArgs(cmdline, {"--help"}));
        EXPECT_EQUAL(cmdline.getErrorCode(), 0);
    }
}

int main()
{
    testDefaults();
    testLoadString();
    testPartialDocument();
    testBadDocuments();
    testLoadFile();
    testCommandLine();

    REPORT_ERROR;
    return ERROR_CODE;
}
