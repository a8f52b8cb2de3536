/*!
 * \file MdbSourceReader_test.cpp
 *
 * \brief Tests how the Access reader turns what libmdb reports
 * (catalog, index definitions, bound field text and null mask)
 * into tables, indexes and typed row values
 */

#include "MigrationTester.hpp"
#include "common/QueryHelpers.hpp"

#include "mdb2sqlite/source/MdbSourceReader.hpp"
#include "mdb2sqlite/source/MdbTranslation.hpp"
#include "mdb2sqlite/Errors.hpp"

TEST_INIT;

using mdb2sqlite::SourceType;
using mdb2sqlite::FieldKind;
using mdb2sqlite::FieldValue;
using mdb2sqlite::OptionalValue;
using namespace mdb2sqlite::test;

mdb2sqlite::Table makeCustomers()
{
    mdb2sqlite::Table table;
    table.name = "Customers";
    table.columns = {{"ID", SourceType::LONG},
                     {"First", SourceType::TEXT},
                     {"Last", SourceType::TEXT},
                     {"Active", SourceType::BOOLEAN}};
    return table;
}

mdb2sqlite::mdb::IndexDef makeIndexDef(const std::string & name,
                                       const mdb2sqlite::mdb::IndexType type,
                                       const bool unique_flag,
                                       const std::vector<int> & key_col_nums)
{
    mdb2sqlite::mdb::IndexDef def;
    def.name = name;
    def.index_type = static_cast<unsigned char>(type);
    def.unique_flag = unique_flag;
    def.key_col_nums = key_col_nums;
    return def;
}

OptionalValue parse(const SourceType type, const bool is_null, const std::string & text)
{
    return mdb2sqlite::mdb::parseFieldText("T", {"C", type}, is_null, text, 1);
}

void testCatalogFiltering()
{
    PRINT_ENTER_TEST

    const std::vector<mdb2sqlite::mdb::CatalogEntry> catalog = {
        {"MSysObjects", true, true},
        {"Customers", true, false},
        {"CustomerForm", false, false},
        {"MSysACEs", true, true},
        {"Orders", true, false}
    };

    mdb2sqlite::SourceOptions options;
    const std::vector<std::string> user_tables =
        mdb2sqlite::mdb::selectTableNames(catalog, options);
    EXPECT_EQUAL(user_tables.size(), 2);
    EXPECT_EQUAL(user_tables[0], "Customers");
    EXPECT_EQUAL(user_tables[1], "Orders");

    //System tables come back in catalog order, forms never do
    options.include_system_tables = true;
    const std::vector<std::string> all_tables =
        mdb2sqlite::mdb::selectTableNames(catalog, options);
    EXPECT_EQUAL(all_tables.size(), 4);
    EXPECT_EQUAL(all_tables[0], "MSysObjects");
    EXPECT_EQUAL(all_tables[1], "Customers");
    EXPECT_EQUAL(all_tables[2], "MSysACEs");
    EXPECT_EQUAL(all_tables[3], "Orders");
}

void testIndexTranslation()
{
    PRINT_ENTER_TEST

    using mdb2sqlite::mdb::IndexType;
    const mdb2sqlite::Table customers = makeCustomers();

    //Key column numbers are 1-based and keep the declared order
    auto by_name = mdb2sqlite::mdb::translateIndex(customers,
        makeIndexDef("ByName", IndexType::NORMAL, false, {3, 2}));
    EXPECT_TRUE(by_name.isValid());
    EXPECT_EQUAL(by_name.getValue().name, "ByName");
    EXPECT_FALSE(by_name.getValue().unique);
    EXPECT_EQUAL(by_name.getValue().column_names.size(), 2);
    EXPECT_EQUAL(by_name.getValue().column_names[0], "Last");
    EXPECT_EQUAL(by_name.getValue().column_names[1], "First");

    auto unique_flag = mdb2sqlite::mdb::translateIndex(customers,
        makeIndexDef("ByFirst", IndexType::NORMAL, true, {2}));
    EXPECT_TRUE(unique_flag.getValue().unique);

    //Primary keys are unique even without the flag
    auto primary = mdb2sqlite::mdb::translateIndex(customers,
        makeIndexDef("PrimaryKey", IndexType::PRIMARY_KEY, false, {1}));
    EXPECT_TRUE(primary.isValid());
    EXPECT_TRUE(primary.getValue().unique);
    EXPECT_EQUAL(primary.getValue().column_names[0], "ID");

    //The reference side of a relationship is skipped
    auto reference = mdb2sqlite::mdb::translateIndex(customers,
        makeIndexDef("OrdersCustomers", IndexType::FOREIGN_KEY, false, {1}));
    EXPECT_FALSE(reference.isValid());

    EXPECT_THROW_TYPE(mdb2sqlite::mdb::translateIndex(customers,
        makeIndexDef("Broken", IndexType::NORMAL, false, {0})), mdb2sqlite::SchemaError);
    EXPECT_THROW_MSG_CONTAINS(mdb2sqlite::mdb::translateIndex(customers,
        makeIndexDef("Broken", IndexType::NORMAL, false, {5})), "column number 5");
}

void testNullComesFromTheMask()
{
    PRINT_ENTER_TEST

    //Zero-length text that is not NULL stays an empty string
    OptionalValue empty = parse(SourceType::TEXT, false, "");
    EXPECT_TRUE(empty.isValid());
    EXPECT_EQUAL(empty.getValue(), FieldValue::fromText(""));

    OptionalValue empty_memo = parse(SourceType::MEMO, false, "");
    EXPECT_TRUE(empty_memo.isValid());
    EXPECT_EQUAL(empty_memo.getValue().getText(), "");

    EXPECT_FALSE(parse(SourceType::TEXT, true, "").isValid());
    EXPECT_FALSE(parse(SourceType::MEMO, true, "").isValid());
    EXPECT_FALSE(parse(SourceType::LONG, true, "").isValid());
    EXPECT_FALSE(parse(SourceType::DOUBLE, true, "").isValid());
    EXPECT_FALSE(parse(SourceType::MONEY, true, "").isValid());
    EXPECT_FALSE(parse(SourceType::SHORT_DATE_TIME, true, "").isValid());

    //Booleans are stored in the mask itself, so they are never NULL
    EXPECT_EQUAL(parse(SourceType::BOOLEAN, true, "0").getValue(), FieldValue::fromBoolean(false));
    EXPECT_EQUAL(parse(SourceType::BOOLEAN, false, "1").getValue(), FieldValue::fromBoolean(true));
}

void testTypedValues()
{
    PRINT_ENTER_TEST

    EXPECT_EQUAL(parse(SourceType::BOOLEAN, false, "0").getValue(), FieldValue::fromBoolean(false));
    EXPECT_THROW_TYPE(parse(SourceType::BOOLEAN, false, "yes"), mdb2sqlite::ConversionError);

    EXPECT_EQUAL(parse(SourceType::BYTE, false, "255").getValue(), FieldValue::fromInteger(255));
    EXPECT_EQUAL(parse(SourceType::INT, false, "-32768").getValue(), FieldValue::fromInteger(-32768));
    EXPECT_EQUAL(parse(SourceType::LONG, false, "2147483647").getValue(),
                 FieldValue::fromInteger(2147483647));

    OptionalValue real = parse(SourceType::DOUBLE, false, "2.5");
    EXPECT_EQUAL(real.getValue().getKind(), FieldKind::REAL);
    EXPECT_EQUAL(real.getValue().getReal(), 2.5);
    EXPECT_EQUAL(parse(SourceType::FLOAT, false, "-0.125").getValue(), FieldValue::fromReal(-0.125));

    //Currency and fixed-point digits are kept exactly
    OptionalValue money = parse(SourceType::MONEY, false, "1234.5600");
    EXPECT_EQUAL(money.getValue().getKind(), FieldKind::DECIMAL);
    EXPECT_EQUAL(money.getValue().getDecimal(), "1234.5600");
    EXPECT_EQUAL(parse(SourceType::NUMERIC, false, "0.000001").getValue(),
                 FieldValue::fromDecimal("0.000001"));

    EXPECT_EQUAL(parse(SourceType::TEXT, false, "O'Brien").getValue(), FieldValue::fromText("O'Brien"));
    EXPECT_EQUAL(parse(SourceType::GUID, false, "{6B29FC40-CA47-1067-B31D-00DD010662DA}").getValue(),
                 FieldValue::fromText("{6B29FC40-CA47-1067-B31D-00DD010662DA}"));
    EXPECT_EQUAL(parse(SourceType::SHORT_DATE_TIME, false, "2001-02-03 04:05:06").getValue(),
                 FieldValue::fromText("2001-02-03 04:05:06"));
}

void testUnparsableValues()
{
    PRINT_ENTER_TEST

    EXPECT_THROW_TYPE(parse(SourceType::LONG, false, "12abc"), mdb2sqlite::ConversionError);
    EXPECT_THROW_TYPE(parse(SourceType::DOUBLE, false, "not a number"), mdb2sqlite::ConversionError);
    EXPECT_THROW_TYPE(parse(SourceType::INT, false, ""), mdb2sqlite::ConversionError);

    //The message says where the value came from
    const mdb2sqlite::Column qty{"Qty", SourceType::LONG};
    EXPECT_THROW_MSG_CONTAINS(
        mdb2sqlite::mdb::parseFieldText("Orders", qty, false, "x", 42),
        "table 'Orders', column 'Qty', row 42");

    //Binary columns are read from the row, never from text
    EXPECT_THROW_TYPE(parse(SourceType::OLE, false, "abc"), mdb2sqlite::ConversionError);
    EXPECT_THROW_TYPE(parse(SourceType::BINARY, false, "abc"), mdb2sqlite::ConversionError);
}

void testOpenFailures()
{
    PRINT_ENTER_TEST

    removeFile("reader_missing.mdb");
    EXPECT_THROW_MSG_CONTAINS(mdb2sqlite::MdbSourceReader("reader_missing.mdb"),
                              "Unable to read source database file");

    writeFile("reader_not_access.mdb", std::string(4096, 'x'));
    EXPECT_THROW_MSG_CONTAINS(mdb2sqlite::MdbSourceReader("reader_not_access.mdb"),
                              "Not an Access database file");
}

int main()
{
    testCatalogFiltering();
    testIndexTranslation();
    testNullComesFromTheMask();
    testTypedValues();
    testUnparsableValues();
    testOpenFailures();

    REPORT_ERROR;
    return ERROR_CODE;
}
