// ═══════════════════════════════════════════════════════════════════
//  test_result.cpp — Tests for ResultTable, Row views and coercion
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <cypherpp/result.h>

#include <limits>

using namespace cypherpp;
using json = nlohmann::json;

namespace {

struct Language {
    std::string name;
    bool safe = false;
    CYPHER_SERIALIZE(Language, name, safe)
};

} // namespace

class ResultTableTest : public ::testing::Test {
protected:
    ResultTable table{
        {"name", "safe", "year", "score", "tags", "node", "missing"},
        {
            {"Rust", true, 2015, 0.5, json{"fast", "safe"}, json{{"name", "Rust"}, {"safe", true}}, nullptr},
            {"C", false, 1972, 3.0, json::array(), json{{"name", "C"}, {"safe", false}}, nullptr},
            {"Python", "true", 1991.5, 1, json{"slow"}, json{{"name", 3}}, nullptr},
        }};
};

TEST_F(ResultTableTest, Shape) {
    EXPECT_EQ(table.size(), 3u);
    EXPECT_FALSE(table.empty());
    EXPECT_EQ(table.columns().size(), 7u);
    EXPECT_EQ(table.columnIndex("year"), 2u);
    EXPECT_FALSE(table.columnIndex("nope").has_value());
}

TEST_F(ResultTableTest, GetByNameAndIndex) {
    auto row = table.first();
    EXPECT_EQ(row.get<std::string>("name"), "Rust");
    EXPECT_EQ(row.get<std::string>(0), "Rust");
    EXPECT_TRUE(row.get<bool>("safe"));
    EXPECT_EQ(row.get<int>("year"), 2015);
    EXPECT_DOUBLE_EQ(row.get<double>("score"), 0.5);
}

TEST_F(ResultTableTest, BooleanNeedsBooleanCell) {
    EXPECT_THROW(table.row(2).get<bool>("safe"), TypeCoercionError);
    EXPECT_THROW(table.row(0).get<bool>("year"), TypeCoercionError);
}

TEST_F(ResultTableTest, StringNeedsStringCell) {
    EXPECT_THROW(table.row(0).get<std::string>("year"), TypeCoercionError);
    EXPECT_THROW(table.row(0).get<std::string>("safe"), TypeCoercionError);
}

TEST_F(ResultTableTest, IntegerFromIntegralFloat) {
    EXPECT_EQ(table.row(1).get<int>("score"), 3);
    EXPECT_THROW(table.row(2).get<int>("year"), TypeCoercionError);
}

TEST_F(ResultTableTest, FloatFromInteger) {
    EXPECT_DOUBLE_EQ(table.row(2).get<double>("score"), 1.0);
}

TEST_F(ResultTableTest, IntegerRangeIsChecked) {
    ResultTable big({"n"}, {{json(std::numeric_limits<std::int64_t>::max())}, {json(-1)}});
    EXPECT_EQ(big.row(0).get<std::int64_t>("n"), std::numeric_limits<std::int64_t>::max());
    EXPECT_THROW(big.row(0).get<int>("n"), TypeCoercionError);
    EXPECT_THROW(big.row(1).get<unsigned>("n"), TypeCoercionError);
    EXPECT_EQ(big.row(1).get<short>("n"), -1);
}

TEST_F(ResultTableTest, OptionalFromNull) {
    auto row = table.first();
    EXPECT_FALSE(row.get<std::optional<std::string>>("missing").has_value());
    EXPECT_EQ(row.get<std::optional<std::string>>("name"), "Rust");
    EXPECT_THROW(row.get<std::string>("missing"), TypeCoercionError);
}

TEST_F(ResultTableTest, Collections) {
    auto tags = table.first().get<std::vector<std::string>>("tags");
    EXPECT_EQ(tags, (std::vector<std::string>{"fast", "safe"}));
    EXPECT_TRUE(table.row(1).get<std::vector<std::string>>("tags").empty());

    auto node = table.first().get<std::map<std::string, json>>("node");
    EXPECT_EQ(node.at("name"), "Rust");

    EXPECT_THROW(table.first().get<std::vector<int>>("tags"), TypeCoercionError);
    using IntMap = std::map<std::string, int>;
    EXPECT_THROW(table.first().get<IntMap>("name"), TypeCoercionError);
}

TEST_F(ResultTableTest, StructCells) {
    auto lang = table.first().get<Language>("node");
    EXPECT_EQ(lang.name, "Rust");
    EXPECT_TRUE(lang.safe);

    EXPECT_THROW(table.row(2).get<Language>("node"), TypeCoercionError);
}

TEST_F(ResultTableTest, RawAndParamValueCells) {
    EXPECT_EQ(table.first().get<json>("tags"), json({"fast", "safe"}));
    auto value = table.first().get<ParamValue>("node");
    EXPECT_EQ(value.kind(), ParamValue::Kind::Object);
}

TEST_F(ResultTableTest, UnknownColumnThrows) {
    auto row = table.first();
    EXPECT_FALSE(row.has("nope"));
    EXPECT_THROW(row.get<int>("nope"), TypeCoercionError);
    EXPECT_THROW(row.get<int>(99), TypeCoercionError);
}

TEST_F(ResultTableTest, ErrorNamesColumn) {
    try {
        table.first().get<int>("name");
        FAIL() << "expected TypeCoercionError";
    } catch (const TypeCoercionError& e) {
        EXPECT_NE(std::string(e.what()).find("'name'"), std::string::npos);
    }
}

TEST_F(ResultTableTest, RowOutOfRange) {
    EXPECT_THROW(table.row(3), std::out_of_range);
    ResultTable empty;
    EXPECT_THROW(empty.first(), std::out_of_range);
}

TEST_F(ResultTableTest, RowsAreRestartable) {
    std::vector<std::string> first, second;
    auto rows = table.rows();
    for (auto row : rows) first.push_back(row.get<std::string>("name"));
    for (auto row : rows) second.push_back(row.get<std::string>("name"));

    EXPECT_EQ(first, (std::vector<std::string>{"Rust", "C", "Python"}));
    EXPECT_EQ(first, second);
    EXPECT_EQ(rows.size(), 3u);
}

TEST_F(ResultTableTest, RowIndices) {
    std::size_t expected = 0;
    for (auto row : table.rows()) {
        EXPECT_EQ(row.index(), expected++);
        EXPECT_EQ(row.size(), 7u);
    }
}

TEST_F(ResultTableTest, ToJson) {
    auto j = table.toJson();
    ASSERT_EQ(j.size(), 3u);
    EXPECT_EQ(j[1]["name"], "C");
    EXPECT_EQ(j[1]["year"], 1972);
}

TEST_F(ResultTableTest, FloatRangeIsChecked) {
    ResultTable wide({"x", "y"}, {{1e300, 0.25}});
    EXPECT_THROW(wide.first().get<float>("x"), TypeCoercionError);
    EXPECT_FLOAT_EQ(wide.first().get<float>("y"), 0.25f);
    EXPECT_DOUBLE_EQ(wide.first().get<double>("x"), 1e300);
}

namespace {

template <typename T>
concept HasRows = requires(T&& t) { std::forward<T>(t).rows(); };

template <typename T>
concept HasFirst = requires(T&& t) { std::forward<T>(t).first(); };

} // namespace

TEST(ResultTableLifetimeTest, ViewsRequireLiveTable) {
    static_assert(HasRows<const ResultTable&>);
    static_assert(!HasRows<ResultTable>);
    static_assert(HasFirst<ResultTable&>);
    static_assert(!HasFirst<ResultTable>);

    ResultTable table({"n"}, {{1}, {2}});
    int sum = 0;
    for (auto row : table.rows()) sum += row.get<int>("n");
    EXPECT_EQ(sum, 3);
}

TEST(ResultTableDuplicateTest, FirstColumnWins) {
    ResultTable table({"x", "x"}, {{1, 2}});
    EXPECT_EQ(table.first().get<int>("x"), 1);
    EXPECT_EQ(table.first().get<int>(1), 2);
}

TEST(QueryResponseTest, ThrowIfErrors) {
    QueryResponse ok;
    EXPECT_NO_THROW(ok.throwIfErrors());

    QueryResponse failed;
    failed.errors.push_back({"Neo.ClientError.Statement.SyntaxError", "Invalid input"});
    try {
        failed.throwIfErrors();
        FAIL() << "expected EndpointError";
    } catch (const EndpointError& e) {
        ASSERT_EQ(e.errors().size(), 1u);
        EXPECT_EQ(e.errors()[0].code, "Neo.ClientError.Statement.SyntaxError");
    }
}
