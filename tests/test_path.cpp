/**
 * @file test_path.cpp
 * @brief Unit tests for path utilities (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jtransform/Path.hpp"
#include "jtransform/Errors.hpp"

using namespace jtransform;

// ============================================================================
// split_path / join_path
// ============================================================================

TEST(SplitPath, DotSeparated) {
    EXPECT_EQ(split_path("database.host"), (Path{"database", "host"}));
}

TEST(SplitPath, BracketIndices) {
    EXPECT_EQ(split_path("items[2].name"), (Path{"items", "2", "name"}));
    EXPECT_EQ(split_path("matrix[0][1]"), (Path{"matrix", "0", "1"}));
}

TEST(SplitPath, EmptyPath) {
    EXPECT_TRUE(split_path("").empty());
}

TEST(JoinPath, Segments) {
    EXPECT_EQ(join_path({"a", "b", "0"}), "a.b.0");
    EXPECT_EQ(join_path({}), "");
}

TEST(ArrayIndex, Canonical) {
    EXPECT_TRUE(is_array_index("0"));
    EXPECT_TRUE(is_array_index("42"));
    EXPECT_FALSE(is_array_index("007"));
    EXPECT_FALSE(is_array_index("-1"));
    EXPECT_FALSE(is_array_index("x"));
    EXPECT_FALSE(is_array_index(""));
}

// ============================================================================
// Lookup
// ============================================================================

class PathLookupTest : public ::testing::Test {
protected:
    Value data = Value::parse(R"({
        "simple": "value",
        "nested": {"key": 42, "deep": {"path": true}},
        "array": [1, 2, {"x": "y"}]
    })");
};

TEST_F(PathLookupTest, FindNested) {
    const Value* v = find_by_path(data, {"nested", "deep", "path"});
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(*v, true);
}

TEST_F(PathLookupTest, FindThroughArray) {
    const Value* v = find_by_path(data, split_path("array[2].x"));
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(*v, "y");
}

TEST_F(PathLookupTest, FindMissingReturnsNull) {
    EXPECT_EQ(find_by_path(data, {"nested", "nope"}), nullptr);
    EXPECT_EQ(find_by_path(data, {"array", "9"}), nullptr);
    EXPECT_EQ(find_by_path(data, {"simple", "x"}), nullptr);
}

TEST_F(PathLookupTest, EmptyPathIsRoot) {
    EXPECT_EQ(find_by_path(data, {}), &data);
}

TEST_F(PathLookupTest, GetMissingThrowsPathResolutionError) {
    EXPECT_THROW(get_by_path(data, {"nested", "nope"}), PathResolutionError);
    EXPECT_THROW(get_by_path(data, {"array", "3"}), PathResolutionError);
    EXPECT_THROW(get_by_path(data, {"array", "first"}), PathResolutionError);
}

TEST_F(PathLookupTest, GetThroughScalarThrowsShapeMismatch) {
    EXPECT_THROW(get_by_path(data, {"simple", "x"}), ShapeMismatchError);
}

TEST_F(PathLookupTest, ErrorCarriesPathAndSegment) {
    try {
        get_by_path(data, {"nested", "nope"});
        FAIL() << "Expected PathResolutionError";
    } catch (const PathResolutionError& e) {
        EXPECT_EQ(e.path(), "nested.nope");
        EXPECT_EQ(e.segment(), "nope");
    }
}

TEST_F(PathLookupTest, Contains) {
    EXPECT_TRUE(contains_path(data, {"array", "0"}));
    EXPECT_FALSE(contains_path(data, {"array", "5"}));
}

// ============================================================================
// set_by_path
// ============================================================================

TEST(SetByPath, CreatesIntermediates) {
    Value doc = Value::object();
    set_by_path(doc, {"db", "host"}, "localhost");
    EXPECT_EQ(doc, Value::parse(R"({"db": {"host": "localhost"}})"));
}

TEST(SetByPath, ReplacesArrayElementAndAppends) {
    Value doc = Value::parse(R"({"a": [1, 2]})");
    set_by_path(doc, {"a", "0"}, 10);
    set_by_path(doc, {"a", "2"}, 30);
    EXPECT_EQ(doc["a"], Value::parse("[10, 2, 30]"));
}

TEST(SetByPath, ArrayIndexPastEndThrows) {
    Value doc = Value::parse(R"({"a": [1]})");
    EXPECT_THROW(set_by_path(doc, {"a", "5"}, 0), PathResolutionError);
}

TEST(SetByPath, IntermediateIndexPastEndKeepsArray) {
    Value doc = Value::parse(R"({"a": [{"k": 1}]})");
    EXPECT_THROW(set_by_path(doc, {"a", "3", "x"}, 0), PathResolutionError);
    EXPECT_THROW(set_by_path(doc, {"a", "name", "x"}, 0), PathResolutionError);
    EXPECT_EQ(doc, Value::parse(R"({"a": [{"k": 1}]})"));
}

TEST(SetByPath, NoCreateMissingThrows) {
    Value doc = Value::object();
    EXPECT_THROW(set_by_path(doc, {"new", "key"}, 1, false), PathResolutionError);
}

// ============================================================================
// remove_by_path
// ============================================================================

TEST(RemoveByPath, ObjectKey) {
    Value doc = Value::parse(R"({"a": 1, "b": 2})");
    remove_by_path(doc, {"a"});
    EXPECT_EQ(doc, Value::parse(R"({"b": 2})"));
}

TEST(RemoveByPath, ArrayElementShifts) {
    Value doc = Value::parse(R"({"a": [1, 2, 3]})");
    remove_by_path(doc, {"a", "0"});
    EXPECT_EQ(doc["a"], Value::parse("[2, 3]"));
}

TEST(RemoveByPath, MissingThrows) {
    Value doc = Value::parse(R"({"a": [1]})");
    EXPECT_THROW(remove_by_path(doc, {"b"}), PathResolutionError);
    EXPECT_THROW(remove_by_path(doc, {"a", "1"}), PathResolutionError);
    EXPECT_THROW(remove_by_path(doc, {}), PathResolutionError);
}
