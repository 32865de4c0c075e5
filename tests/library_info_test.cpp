/******************************************************************************\
 * library_info_test.cpp - Unit tests for the library metadata queries
 ******************************************************************************/

#include <string>
#include <vector>

#include "library.hpp"
#include "ilibrary_errors.hpp"

#include "mock_command_channel.hpp"
#include "test_config.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

namespace {

ResultSet libraryRow()
{
    ResultSet result;
    result.columns = {"OBJECT_COUNT", "LIBRARY_SIZE", "LIBRARY_SIZE_COMPLETE", "LIBRARY_TYPE",
                      "TEXT_DESCRIPTION"};
    result.rows.push_back({std::string("42"), std::string("1048576"), std::string("YES"),
                           std::string("PROD"), std::nullopt});
    return result;
}

ResultSet objectRows()
{
    ResultSet result;
    result.columns = {"OBJNAME", "OBJTYPE", "OBJOWNER"};
    result.rows.push_back({std::string("CUSTOMERS"), std::string("*FILE"), std::string("QPGMR")});
    result.rows.push_back({std::string("ORDERS"), std::string("*FILE"), std::nullopt});
    return result;
}

Json::Value parse(const std::string& text)
{
    Json::Value value;
    Json::Reader reader;
    EXPECT_TRUE(reader.parse(text, value)) << text;
    return value;
}

} // namespace

class LibraryInfoTest : public ::testing::Test
{
protected:
    MockCommandChannel::Nice channel;
    HostConfig config = testConfig();
    Library library{channel, config};
};

TEST(RecordMappingTest, RowsMapByPosition)
{
    ResultSet::Row row = {std::string("7"), std::string("2048"), std::nullopt, std::string("TEST")};
    LibraryInfo info = recordFromRow<LibraryInfo>(row);

    EXPECT_EQ(info.objectCount, "7");
    EXPECT_EQ(info.librarySize, "2048");
    EXPECT_FALSE(info.librarySizeComplete.has_value());
    EXPECT_EQ(info.libraryType, "TEST");
    EXPECT_FALSE(info.textDescription.has_value());
}

TEST(RecordMappingTest, ColumnLayouts)
{
    EXPECT_EQ(LibraryInfo::columns().size(), 18u);
    EXPECT_EQ(ObjectStatistics::columns().size(), 70u);
    EXPECT_STREQ(ObjectStatistics::columns().front().name, "OBJNAME");
    EXPECT_STREQ(LibraryInfo::columns().back().name, "APPLY_STARTING_RECEIVER_ASP");
}

TEST(RecordMappingTest, JsonUsesColumnNamesAndNull)
{
    ResultSet::Row row = {std::string("CUSTOMERS"), std::string("*FILE")};
    Json::Value json = recordToJson(recordFromRow<ObjectStatistics>(row));

    EXPECT_EQ(json["OBJNAME"].asString(), "CUSTOMERS");
    EXPECT_EQ(json["OBJTYPE"].asString(), "*FILE");
    EXPECT_TRUE(json["OBJOWNER"].isNull());
    EXPECT_EQ(json.size(), ObjectStatistics::columns().size());
}

TEST_F(LibraryInfoTest, SummaryOfAnExistingLibrary)
{
    EXPECT_CALL(channel, query("SELECT * FROM TABLE(QSYS2.LIBRARY_INFO(upper('AKANSHA231')))"))
        .WillOnce(Return(QueryResult(libraryRow())));

    auto summary = library.queryLibrarySummary("akansha231");
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->objectCount, "42");
    EXPECT_EQ(summary->libraryType, "PROD");

    EXPECT_CALL(channel, query(_)).WillOnce(Return(QueryResult(libraryRow())));
    Json::Value json = parse(library.getInfoForLibrary("AKANSHA231"));
    EXPECT_EQ(json["OBJECT_COUNT"].asString(), "42");
    EXPECT_EQ(json["LIBRARY_SIZE"].asString(), "1048576");
    EXPECT_TRUE(json["TEXT_DESCRIPTION"].isNull());
}

TEST_F(LibraryInfoTest, SummaryOfAnUnknownLibrary)
{
    EXPECT_CALL(channel, query(_)).WillRepeatedly(Return(QueryResult(ResultSet{})));

    EXPECT_FALSE(library.queryLibrarySummary("NOSUCHLIB").has_value());

    Json::Value json = parse(library.getInfoForLibrary("NOSUCHLIB"));
    EXPECT_EQ(json["error"].asString(), "No data found for library for Library: NOSUCHLIB");
}

TEST_F(LibraryInfoTest, ObjectListing)
{
    EXPECT_CALL(channel, query("SELECT * FROM TABLE (QSYS2.OBJECT_STATISTICS('AKANSHA231','*ALL') ) AS X"))
        .WillRepeatedly(Return(QueryResult(objectRows())));

    auto objects = library.queryObjects("AKANSHA231");
    ASSERT_EQ(objects.size(), 2u);
    EXPECT_EQ(objects[0].objName, "CUSTOMERS");
    EXPECT_FALSE(objects[1].objOwner.has_value());

    EXPECT_CALL(channel, commit()).Times(1);
    Json::Value json = parse(library.getFileInfo("AKANSHA231"));
    ASSERT_TRUE(json.isArray());
    ASSERT_EQ(json.size(), 2u);
    EXPECT_EQ(json[1]["OBJNAME"].asString(), "ORDERS");
    EXPECT_TRUE(json[1]["OBJOWNER"].isNull());
}

TEST_F(LibraryInfoTest, MemberListingUsesSysMemberStat)
{
    ResultSet members;
    members.rows.push_back({std::string("AKANSHA231"), std::string("QRPGLESRC")});
    EXPECT_CALL(channel, query(HasSubstr("QSYS2.SYSMEMBERSTAT"))).WillOnce(Return(QueryResult(members)));

    Json::Value json = parse(library.getFileInfo("AKANSHA231", true));
    ASSERT_EQ(json.size(), 1u);
    EXPECT_EQ(json[0].size(), MemberStatistics::columns().size());
}

TEST_F(LibraryInfoTest, EmptyLibrary)
{
    EXPECT_CALL(channel, query(_)).WillOnce(Return(QueryResult(ResultSet{})));

    EXPECT_EQ(library.getFileInfo("EMPTYLIB"), "No Files Found in Library: EMPTYLIB");
}

TEST_F(LibraryInfoTest, QueryFailureRollsBackAndThrows)
{
    EXPECT_CALL(channel, query(_))
        .WillOnce(Return(QueryResult(std::unexpected(CommandError{"SQL0204 not found", "42704", -204}))));
    EXPECT_CALL(channel, rollback()).Times(1);

    try {
        library.queryObjects("AKANSHA231");
        FAIL() << "expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_EQ(e.cause().sqlState, "42704");
        EXPECT_EQ(e.cause().nativeCode, -204);
    }
}

TEST_F(LibraryInfoTest, InvalidLibraryNameIsNeverQueried)
{
    EXPECT_CALL(channel, query(_)).Times(0);

    EXPECT_THROW(library.queryLibrarySummary("ABCDEFGHIJK"), ValidationError);
    EXPECT_THROW(library.getFileInfo("X')--"), ValidationError);
}
