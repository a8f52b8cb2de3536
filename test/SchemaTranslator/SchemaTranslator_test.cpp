/*!
 * \file SchemaTranslator_test.cpp
 *
 * \brief Tests identifier escaping and CREATE TABLE / CREATE INDEX
 * generation from source table definitions
 */

#include "MigrationTester.hpp"

#include "mdb2sqlite/schema/SchemaTranslator.hpp"
#include "mdb2sqlite/Errors.hpp"

TEST_INIT;

using mdb2sqlite::SourceType;

mdb2sqlite::Table makeCustomers()
{
    mdb2sqlite::Table table;
    table.name = "Customers";
    table.columns = {
        {"ID", SourceType::LONG},
        {"First", SourceType::TEXT},
        {"Last", SourceType::TEXT},
        {"Balance", SourceType::MONEY},
        {"Photo", SourceType::OLE},
        {"Rating", SourceType::DOUBLE}
    };
    return table;
}

void testEscapeIdentifier()
{
    PRINT_ENTER_TEST

    EXPECT_EQUAL(mdb2sqlite::escapeIdentifier("plain"), "'plain'");
    EXPECT_EQUAL(mdb2sqlite::escapeIdentifier("a'b"), "'a''b'");
    EXPECT_EQUAL(mdb2sqlite::escapeIdentifier("''"), "''''''");
    EXPECT_EQUAL(mdb2sqlite::escapeIdentifier(""), "''");
    EXPECT_EQUAL(mdb2sqlite::escapeIdentifier("Order Details"), "'Order Details'");
}

void testCreateTable()
{
    PRINT_ENTER_TEST

    mdb2sqlite::Table table;
    table.name = "T";
    table.columns = {{"c1", SourceType::LONG}, {"c2", SourceType::TEXT}};

    const mdb2sqlite::TableDDL ddl = mdb2sqlite::translateTable(table);
    EXPECT_EQUAL(ddl.table_name, "T");
    EXPECT_EQUAL(ddl.create_table, "CREATE TABLE 'T' ('c1' INTEGER, 'c2' TEXT)");
    EXPECT_TRUE(ddl.create_indexes.empty());

    const mdb2sqlite::TableDDL customers = mdb2sqlite::translateTable(makeCustomers());
    EXPECT_EQUAL(customers.create_table,
                 "CREATE TABLE 'Customers' ('ID' INTEGER, 'First' TEXT, 'Last' TEXT, "
                 "'Balance' TEXT, 'Photo' BLOB, 'Rating' REAL)");
}

void testQuotedNames()
{
    PRINT_ENTER_TEST

    mdb2sqlite::Table table;
    table.name = "Bob's Table";
    table.columns = {{"it's", SourceType::INT}};
    table.indexes = {{"o'k", {"it's"}, false}};

    const mdb2sqlite::TableDDL ddl = mdb2sqlite::translateTable(table);
    EXPECT_EQUAL(ddl.create_table, "CREATE TABLE 'Bob''s Table' ('it''s' INTEGER)");
    EXPECT_EQUAL(ddl.create_indexes.size(), 1);
    EXPECT_EQUAL(ddl.create_indexes[0],
                 "CREATE INDEX 'Bob''s Table_o''k' ON 'Bob''s Table'('it''s')");
}

void testCreateIndexes()
{
    PRINT_ENTER_TEST

    mdb2sqlite::Table table = makeCustomers();
    table.indexes = {
        {"PrimaryKey", {"ID"}, true},
        {"ByName", {"Last", "First"}, false}
    };

    EXPECT_EQUAL(mdb2sqlite::getDerivedIndexName(table, table.indexes[0]), "Customers_PrimaryKey");

    const mdb2sqlite::TableDDL ddl = mdb2sqlite::translateTable(table);
    EXPECT_EQUAL(ddl.create_indexes.size(), 2);
    EXPECT_EQUAL(ddl.create_indexes[0],
                 "CREATE UNIQUE INDEX 'Customers_PrimaryKey' ON 'Customers'('ID')");
    EXPECT_EQUAL(ddl.create_indexes[1],
                 "CREATE INDEX 'Customers_ByName' ON 'Customers'('Last', 'First')");
}

void testIndexOnUnknownColumn()
{
    PRINT_ENTER_TEST

    mdb2sqlite::Table table = makeCustomers();
    table.indexes = {{"ByCity", {"City"}, false}};

    EXPECT_THROW_TYPE(mdb2sqlite::translateTable(table), mdb2sqlite::SchemaError);
    EXPECT_THROW_MSG_CONTAINS(mdb2sqlite::translateTable(table), "City");
    EXPECT_THROW_MSG_CONTAINS(mdb2sqlite::translateTable(table), "ByCity");
}

void testUnsupportedColumnType()
{
    PRINT_ENTER_TEST

    mdb2sqlite::Table table;
    table.name = "Attachments";
    table.columns = {{"ID", SourceType::LONG}, {"Files", SourceType::COMPLEX_TYPE}};

    EXPECT_THROW_TYPE(mdb2sqlite::translateTable(table), mdb2sqlite::UnsupportedTypeError);
    EXPECT_THROW_MSG_CONTAINS(mdb2sqlite::translateTable(table), "Files");
}

void testTranslateSchema()
{
    PRINT_ENTER_TEST

    mdb2sqlite::Table good;
    good.name = "Good";
    good.columns = {{"ID", SourceType::LONG}};

    mdb2sqlite::Table bad;
    bad.name = "Bad";
    bad.columns = {{"When", SourceType::EXT_DATE_TIME}};

    const auto schema_ddl = mdb2sqlite::translateSchema({good, makeCustomers()});
    EXPECT_EQUAL(schema_ddl.size(), 2);
    EXPECT_EQUAL(schema_ddl[0].table_name, "Good");
    EXPECT_EQUAL(schema_ddl[1].table_name, "Customers");

    //A single bad table fails the whole schema, even when it is last
    const std::vector<mdb2sqlite::Table> tables = {good, makeCustomers(), bad};
    EXPECT_THROW_TYPE(mdb2sqlite::translateSchema(tables), mdb2sqlite::UnsupportedTypeError);

    EXPECT_TRUE(mdb2sqlite::translateSchema({}).empty());
}

int main()
{
    testEscapeIdentifier();
    testCreateTable();
    testQuotedNames();
    testCreateIndexes();
    testIndexOnUnknownColumn();
    testUnsupportedColumnType();
    testTranslateSchema();

    REPORT_ERROR;
    return ERROR_CODE;
}
