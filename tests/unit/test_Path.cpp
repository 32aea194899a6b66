#include <gtest/gtest.h>
#include "fs/model/Path.hpp"

using namespace folio::fs::model;

class PathTest : public ::testing::Test {
protected:
    Path books{"/Books/Fiction/Alice"};
};

TEST_F(PathTest, SplitsOnSlashes) {
    EXPECT_EQ(books.segments, (std::vector<std::string>{"Books", "Fiction", "Alice"}));
    EXPECT_EQ(books.name(), "Alice");
    EXPECT_TRUE(books.hasParent());
}

TEST_F(PathTest, IgnoresRedundantSeparatorsAndDots) {
    EXPECT_EQ(Path("Books//Fiction/./Alice/"), books);
    EXPECT_EQ(Path("///"), Path());
    EXPECT_EQ(Path("."), Path());
}

TEST_F(PathTest, RootPath) {
    const Path root("");
    EXPECT_TRUE(root.isRoot());
    EXPECT_TRUE(Path("/").isRoot());
    EXPECT_EQ(root.name(), "");
    EXPECT_FALSE(root.hasParent());
    EXPECT_TRUE(root.parent().isRoot());
    EXPECT_EQ(root.string(), "/");
}

TEST_F(PathTest, ParentDropsFinalSegment) {
    EXPECT_EQ(books.parent(), Path("/Books/Fiction"));
    EXPECT_EQ(books.parent().parent(), Path("Books"));
    EXPECT_FALSE(Path("Books").hasParent());
}

TEST_F(PathTest, StringIsAbsolute) {
    EXPECT_EQ(books.string(), "/Books/Fiction/Alice");
    EXPECT_EQ(Path("Trash/Old").string(), "/Trash/Old");
}

TEST_F(PathTest, ReservedSegments) {
    EXPECT_TRUE(Path("Trash").isTrash());
    EXPECT_TRUE(Path("/Trash/").isTrash());
    EXPECT_FALSE(Path("/Trash/Old").isTrash());
    EXPECT_FALSE(Path("trash").isTrash());

    EXPECT_TRUE(Path("/Favorites").isPinned());
    EXPECT_FALSE(Path("/Books/Favorites").isPinned());
}
