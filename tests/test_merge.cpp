/**
 * @file test_merge.cpp
 * @brief Tests for structural merge using Google Test
 */

#include <gtest/gtest.h>
#include "jtransform/Merge.hpp"

using namespace jtransform;

// ============================================================================
// Objects
// ============================================================================

TEST(MergeInto, OverrideAddsAndReplaces) {
    Value base = {{"a", 1}, {"b", 2}};
    merge_into(base, {{"b", 3}, {"c", 4}});
    EXPECT_EQ(base["a"], 1);
    EXPECT_EQ(base["b"], 3);
    EXPECT_EQ(base["c"], 4);
}

TEST(MergeInto, NestedObjectsMerged) {
    Value base = {{"db", {{"host", "a"}, {"port", 1}}}};
    merge_into(base, {{"db", {{"port", 2}}}});
    EXPECT_EQ(base["db"]["host"], "a");
    EXPECT_EQ(base["db"]["port"], 2);
}

TEST(MergeInto, ScalarReplacesObject) {
    Value base = {{"db", {{"host", "a"}}}};
    merge_into(base, {{"db", "string"}});
    EXPECT_EQ(base["db"], "string");
}

TEST(MergeInto, KeepsDocumentOrder) {
    Value base = Value::parse(R"({"z": 1, "a": 2})");
    merge_into(base, Value::parse(R"({"m": 3})"));
    EXPECT_EQ(base.dump(), R"({"z":1,"a":2,"m":3})");
}

// ============================================================================
// Nulls
// ============================================================================

TEST(MergeNulls, IgnoredOverExistingValue) {
    Value base = {{"a", 1}};
    merge_into(base, Value::parse(R"({"a": null})"));
    EXPECT_EQ(base["a"], 1);
}

TEST(MergeNulls, AddedWhenKeyAbsent) {
    Value base = {{"a", 1}};
    merge_into(base, Value::parse(R"({"b": null})"));
    ASSERT_TRUE(base.contains("b"));
    EXPECT_TRUE(base["b"].is_null());
}

TEST(MergeNulls, MergeModeOverwrites) {
    Value base = {{"a", 1}};
    merge_into(base, Value::parse(R"({"a": null})"),
               MergeOptions{ArrayMergeHandling::Merge, NullValueHandling::Merge});
    EXPECT_TRUE(base["a"].is_null());
}

// ============================================================================
// Arrays
// ============================================================================

TEST(MergeArrays, ElementWiseByIndex) {
    Value base = Value::parse("[1, {\"x\": 1}, 3]");
    merge_into(base, Value::parse("[9, {\"y\": 2}]"));
    EXPECT_EQ(base, Value::parse("[9, {\"x\": 1, \"y\": 2}, 3]"));
}

TEST(MergeArrays, LongerPatchAppends) {
    Value base = Value::parse("[1]");
    merge_into(base, Value::parse("[null, 2, 3]"));
    EXPECT_EQ(base, Value::parse("[1, 2, 3]"));
}

TEST(MergeArrays, Concat) {
    Value base = Value::parse("[1, 2]");
    merge_into(base, Value::parse("[2, 3]"), MergeOptions{ArrayMergeHandling::Concat});
    EXPECT_EQ(base, Value::parse("[1, 2, 2, 3]"));
}

TEST(MergeArrays, UnionSkipsStructuralDuplicates) {
    Value base = Value::parse(R"([1, {"a": 1}])");
    merge_into(base, Value::parse(R"([{"a": 1}, 2, 1])"), MergeOptions{ArrayMergeHandling::Union});
    EXPECT_EQ(base, Value::parse(R"([1, {"a": 1}, 2])"));
}

TEST(MergeArrays, Replace) {
    Value base = Value::parse("[1, 2, 3]");
    merge_into(base, Value::parse("[4]"), MergeOptions{ArrayMergeHandling::Replace});
    EXPECT_EQ(base, Value::parse("[4]"));
}

TEST(MergeArrays, IndexAddressedObjectPatch) {
    Value base = Value::parse(R"({"b": [{"x": 1}, {"x": 2}]})");
    merge_into(base, Value::parse(R"({"b": {"1": {"y": 3}, "7": {"y": 4}}})"));
    EXPECT_EQ(base, Value::parse(R"({"b": [{"x": 1}, {"x": 2, "y": 3}]})"));
}

TEST(MergeArrays, NonIndexObjectReplacesArray) {
    Value base = Value::parse(R"({"b": [1, 2]})");
    merge_into(base, Value::parse(R"({"b": {"k": 1}})"));
    EXPECT_EQ(base["b"], Value::parse(R"({"k": 1})"));
}

// ============================================================================
// deep_merge
// ============================================================================

TEST(DeepMerge, LeavesBaseUntouched) {
    const Value base = {{"a", {{"b", 1}}}};
    auto result = deep_merge(base, {{"a", {{"c", 2}}}});
    EXPECT_EQ(base, Value::parse(R"({"a": {"b": 1}})"));
    EXPECT_EQ(result, Value::parse(R"({"a": {"b": 1, "c": 2}})"));
}
