#include <gtest/gtest.h>

#include <stdexcept>

#include "JsonPath.hpp"
#include "Result.hpp"

using namespace courier;
using infra::parsers::IsEmpty;
using infra::parsers::Search;

namespace {

const json::value& Document() {
    static const json::value doc = json::parse(R"({
        "Table": {"TableName": "things", "TableStatus": "ACTIVE"},
        "Tables": [
            {"Name": "a", "Indexes": [{"Status": "ACTIVE"}, {"Status": "CREATING"}]},
            {"Name": "b", "Indexes": [{"Status": "ACTIVE"}]},
            {"Name": "c"}
        ],
        "Nested": [[1, 2], [3]],
        "Empty": []
    })");
    return doc;
}

}  // namespace

TEST(JsonPathTest, DottedFields) {
    EXPECT_EQ(Search(Document(), "Table.TableStatus"), json::value("ACTIVE"));
    EXPECT_TRUE(Search(Document(), "Table.Missing").is_null());
    EXPECT_TRUE(Search(Document(), "Table.TableName.Deeper").is_null());
    EXPECT_EQ(Search(Document(), ""), Document());
}

TEST(JsonPathTest, Indexes) {
    EXPECT_EQ(Search(Document(), "Tables[0].Name"), json::value("a"));
    EXPECT_EQ(Search(Document(), "Tables[-1].Name"), json::value("c"));
    EXPECT_TRUE(Search(Document(), "Tables[3]").is_null());
    EXPECT_TRUE(Search(Document(), "Table[0]").is_null());
}

TEST(JsonPathTest, ProjectionsSkipMissingValues) {
    EXPECT_EQ(Search(Document(), "Tables[].Name"), json::parse(R"(["a","b","c"])"));
    EXPECT_EQ(Search(Document(), "Tables[].Indexes[].Status"),
              json::parse(R"(["ACTIVE","CREATING","ACTIVE"])"));
    EXPECT_EQ(Search(Document(), "Nested[]"), json::parse("[1,2,3]"));
    EXPECT_EQ(Search(Document(), "Empty[].Name"), json::parse("[]"));
    EXPECT_TRUE(Search(Document(), "Table[].Name").is_null());
}

TEST(JsonPathTest, MalformedExpressionsThrow) {
    EXPECT_THROW(Search(Document(), "Tables[x]"), std::invalid_argument);
    EXPECT_THROW(Search(Document(), "Tables[0"), std::invalid_argument);
    EXPECT_THROW(Search(Document(), "Table..Name"), std::invalid_argument);
    EXPECT_THROW(Search(Document(), "Table."), std::invalid_argument);
    EXPECT_THROW(Search(Document(), ".Table"), std::invalid_argument);
}

TEST(JsonPathTest, Emptiness) {
    EXPECT_TRUE(IsEmpty(json::value()));
    EXPECT_TRUE(IsEmpty(json::value("")));
    EXPECT_TRUE(IsEmpty(json::array()));
    EXPECT_TRUE(IsEmpty(json::object()));
    EXPECT_FALSE(IsEmpty(json::value(0)));
    EXPECT_FALSE(IsEmpty(json::value(false)));
    EXPECT_FALSE(IsEmpty(json::value("x")));
}

TEST(ResultTest, SearchesItsData) {
    models::Result result(Document().as_object());
    EXPECT_TRUE(result.Has("Tables"));
    EXPECT_EQ(result.Get("Nope"), nullptr);
    EXPECT_EQ(result.Search("Tables[1].Name"), json::value("b"));
    EXPECT_EQ(json::parse(result.ToString()), Document());
}
