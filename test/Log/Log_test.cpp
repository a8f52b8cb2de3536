/*!
 * \file Log_test.cpp
 *
 * \brief Tests message sources, taps and destinations: origin
 * pattern matching, category filtering, duplicate suppression
 * and the file formats chosen by extension
 */

#include "MigrationTester.hpp"
#include "common/QueryHelpers.hpp"

#include "mdb2sqlite/log/MessageSource.hpp"
#include "mdb2sqlite/log/Tap.hpp"
#include "mdb2sqlite/log/Destination.hpp"
#include "mdb2sqlite/utils/StringUtils.hpp"

#include <sstream>

TEST_INIT;

using namespace mdb2sqlite::test;

//Destinations live until exit, so the streams must too
std::ostringstream export_stream;
std::ostringstream info_stream;
std::ostringstream shared_stream;

size_t countOccurrences(const std::string & text, const std::string & needle)
{
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

void testLocationMatching()
{
    PRINT_ENTER_TEST

    EXPECT_TRUE(mdb2sqlite::utils::locationMatches("", "export.populate"));
    EXPECT_TRUE(mdb2sqlite::utils::locationMatches("export", "export"));
    EXPECT_TRUE(mdb2sqlite::utils::locationMatches("export", "export.populate"));
    EXPECT_TRUE(mdb2sqlite::utils::locationMatches("export.populate", "export.populate"));
    EXPECT_FALSE(mdb2sqlite::utils::locationMatches("export.populate", "export"));
    EXPECT_FALSE(mdb2sqlite::utils::locationMatches("export", "exporter"));
    EXPECT_FALSE(mdb2sqlite::utils::locationMatches("export", "global"));
}

void testTapsFilterMessages()
{
    PRINT_ENTER_TEST

    mdb2sqlite::log::MessageSource top_info("export", mdb2sqlite::log::categories::INFO_STR);
    mdb2sqlite::log::MessageSource populate_info("export.populate", mdb2sqlite::log::categories::INFO_STR);
    mdb2sqlite::log::MessageSource populate_debug("export.populate", mdb2sqlite::log::categories::DEBUG_STR);
    mdb2sqlite::log::MessageSource other_warn("global", mdb2sqlite::log::categories::WARN_STR);

    EXPECT_FALSE(top_info.observed());

    mdb2sqlite::log::Tap export_tap("export", mdb2sqlite::log::categories::NONE_STR, export_stream);
    mdb2sqlite::log::Tap info_tap("", mdb2sqlite::log::categories::INFO_STR, info_stream);

    EXPECT_TRUE(top_info);
    EXPECT_TRUE(populate_debug);
    EXPECT_FALSE(other_warn);

    top_info << "schema created";
    populate_info << "copied " << 10 << " rows";
    populate_debug << "committed";
    other_warn << "unrelated";

    EXPECT_EQUAL(top_info.getNumEmitted(), 1);
    EXPECT_EQUAL(export_tap.getNumMessages(), 3);
    EXPECT_EQUAL(info_tap.getNumMessages(), 2);

    const std::string exported = export_stream.str();
    EXPECT_TRUE(exported.find("schema created") != std::string::npos);
    EXPECT_TRUE(exported.find("copied 10 rows") != std::string::npos);
    EXPECT_TRUE(exported.find("committed") != std::string::npos);
    EXPECT_TRUE(exported.find("unrelated") == std::string::npos);

    const std::string info = info_stream.str();
    EXPECT_TRUE(info.find("committed") == std::string::npos);
    EXPECT_TRUE(info.find("copied 10 rows") != std::string::npos);

    //Detached taps see nothing more
    export_tap.detach();
    info_tap.detach();
    EXPECT_FALSE(top_info);
    top_info << "after detach";
    EXPECT_TRUE(export_stream.str().find("after detach") == std::string::npos);
}

void testSharedDestinationWritesOnce()
{
    PRINT_ENTER_TEST

    mdb2sqlite::log::MessageSource source("export.schema", mdb2sqlite::log::categories::WARN_STR);

    //Both taps observe the message and share one destination
    mdb2sqlite::log::Tap tap_a("export", "", shared_stream);
    mdb2sqlite::log::Tap tap_b("", mdb2sqlite::log::categories::WARN_STR, shared_stream);
    EXPECT_EQUAL(tap_a.getDestination(), tap_b.getDestination());

    source << "only once";

    EXPECT_EQUAL(tap_a.getNumMessages(), 1);
    EXPECT_EQUAL(tap_b.getNumMessages(), 1);
    EXPECT_EQUAL(countOccurrences(shared_stream.str(), "only once"), 1);
    EXPECT_EQUAL(tap_a.getDestination()->getNumMessagesReceived(), 2);
    EXPECT_EQUAL(tap_a.getDestination()->getNumMessagesWritten(), 1);
    EXPECT_EQUAL(tap_a.getDestination()->getNumMessageDuplicates(), 1);

    std::ostringstream dests;
    mdb2sqlite::log::DestinationManager::dumpDestinations(dests);
    EXPECT_TRUE(dests.str().find("wrote=1 dups=1") != std::string::npos);
}

void testFileFormats()
{
    PRINT_ENTER_TEST

    mdb2sqlite::log::MessageSource source("export.populate", mdb2sqlite::log::categories::INFO_STR);

    {
        mdb2sqlite::log::TapDescriptor basic("export", "info", "log_test.log.basic");
        mdb2sqlite::log::TapDescriptor raw("export", "info", "log_test.log.raw");
        mdb2sqlite::log::TapDescriptor verbose("export", "info", "log_test.log.verbose");
        mdb2sqlite::log::TapDescriptor plain("export", "info", "log_test.log");

        EXPECT_TRUE(basic.stringize().find("log_test.log.basic") != std::string::npos);

        std::unique_ptr<mdb2sqlite::log::Tap> basic_tap = basic.createTap();
        std::unique_ptr<mdb2sqlite::log::Tap> raw_tap = raw.createTap();
        std::unique_ptr<mdb2sqlite::log::Tap> verbose_tap = verbose.createTap();
        std::unique_ptr<mdb2sqlite::log::Tap> plain_tap = plain.createTap();

        source << "Table 'T': 10 rows copied";
    }

    const std::string basic_text = readFile("log_test.log.basic");
    EXPECT_TRUE(basic_text.find("# mdb2sqlite log: log_test.log.basic") == 0);
    EXPECT_TRUE(basic_text.find("export.populate: info: Table 'T': 10 rows copied\n") != std::string::npos);

    const std::string raw_text = readFile("log_test.log.raw");
    EXPECT_TRUE(raw_text.find("\nTable 'T': 10 rows copied\n") != std::string::npos);
    EXPECT_TRUE(raw_text.find("export.populate") == std::string::npos);

    const std::string verbose_text = readFile("log_test.log.verbose");
    EXPECT_TRUE(verbose_text.find("export.populate") != std::string::npos);
    EXPECT_TRUE(verbose_text.find("0x") != std::string::npos);

    const std::string plain_text = readFile("log_test.log");
    EXPECT_TRUE(plain_text.find("export.populate") != std::string::npos);
    EXPECT_TRUE(plain_text.find("Table 'T': 10 rows copied") != std::string::npos);

    std::ostringstream extensions;
    mdb2sqlite::log::DestinationManager::dumpFileExtensions(extensions);
    EXPECT_TRUE(extensions.str().find(".log.basic") != std::string::npos);
    EXPECT_TRUE(extensions.str().find(".log.raw") != std::string::npos);

    //A file that cannot be opened is a configuration error
    mdb2sqlite::log::TapDescriptor bad("", "", "no/such/directory/out.log");
    EXPECT_THROW_TYPE(bad.createTap(), mdb2sqlite::ConfigError);
}

int main()
{
    testLocationMatching();
    testTapsFilterMessages();
    testSharedDestinationWritesOnce();
    testFileFormats();

    REPORT_ERROR;
    return ERROR_CODE;
}
