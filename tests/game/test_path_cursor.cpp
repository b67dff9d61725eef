/**
 * @file test_path_cursor.cpp
 * @brief Unit tests for the path cursor
 */

#include <gtest/gtest.h>

#include "navigation/PathCursor.hpp"

#include "utils/TestHelpers.hpp"

#include <vector>

using namespace Wayfarer;
using namespace Wayfarer::Bot;
using namespace Wayfarer::Test;

namespace {

FlatPath FivePoints() {
    return {{0, 0}, {1, 0}, {2, 0}, {3, 0}, {4, 0}};
}

} // namespace

TEST(PathCursorTest, StartsBeforeFirstWaypoint) {
    PathCursor cursor(FivePoints());

    EXPECT_FALSE(cursor.CurrentIndex().has_value());
    EXPECT_FALSE(cursor.CurrentPoint().has_value());
    EXPECT_FALSE(cursor.IsAtEnd());
    EXPECT_EQ(5u, cursor.Size());
}

TEST(PathCursorTest, AdvanceVisitsEveryIndexOnce) {
    PathCursor cursor(FivePoints());

    std::vector<size_t> visited;
    while (auto point = cursor.Advance()) {
        ASSERT_TRUE(cursor.CurrentIndex().has_value());
        visited.push_back(*cursor.CurrentIndex());
        EXPECT_POINT_EQ(cursor.GetWaypoints()[visited.back()], *point);
    }

    EXPECT_EQ((std::vector<size_t>{0, 1, 2, 3, 4}), visited);
    EXPECT_TRUE(cursor.IsAtEnd());
}

TEST(PathCursorTest, ExhaustedAdvanceKeepsIndex) {
    PathCursor cursor(FivePoints());
    while (cursor.Advance()) {
    }

    EXPECT_FALSE(cursor.Advance().has_value());
    EXPECT_EQ(4u, cursor.CurrentIndex().value_or(0));
}

TEST(PathCursorTest, ResetRewinds) {
    PathCursor cursor(FivePoints());
    cursor.Advance();
    cursor.Advance();

    cursor.Reset();

    EXPECT_FALSE(cursor.CurrentIndex().has_value());
    auto first = cursor.Advance();
    ASSERT_TRUE(first.has_value());
    EXPECT_POINT_EQ(Point(0, 0), *first);
}

TEST(PathCursorTest, SetIndexRepositions) {
    PathCursor cursor(FivePoints());

    ASSERT_TRUE(cursor.SetIndex(3).has_value());
    EXPECT_EQ(3u, *cursor.CurrentIndex());

    auto next = cursor.Advance();
    ASSERT_TRUE(next.has_value());
    EXPECT_POINT_EQ(Point(4, 0), *next);
}

TEST(PathCursorTest, SetIndexErrors) {
    PathCursor cursor(FivePoints());
    auto outOfRange = cursor.SetIndex(5);
    ASSERT_FALSE(outOfRange.has_value());
    EXPECT_EQ(CursorError::OutOfRange, outOfRange.error());

    PathCursor empty;
    auto emptyResult = empty.SetIndex(0);
    ASSERT_FALSE(emptyResult.has_value());
    EXPECT_EQ(CursorError::Empty, emptyResult.error());
    EXPECT_FALSE(empty.Advance().has_value());
}

TEST(PathCursorTest, ResettableFlag) {
    EXPECT_TRUE(PathCursor(FivePoints()).SupportsReset());
    EXPECT_FALSE(PathCursor(FivePoints(), false).SupportsReset());
}

TEST(CursorErrorTest, ToString) {
    EXPECT_STREQ("path is empty", CursorErrorToString(CursorError::Empty));
    EXPECT_STREQ("index out of range", CursorErrorToString(CursorError::OutOfRange));
}
