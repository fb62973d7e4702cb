#include "SysfsFixture.hpp"

namespace sp::test {
class UtilTest : public SysfsFixture {};

TEST_F(UtilTest, ReadTrimsWhitespace) {
  write("node", "  42 \t");
  EXPECT_EQ(Util::read_line(root / "node"), "42");
  EXPECT_EQ(Util::read<int>(root / "node"), 42);
}

TEST_F(UtilTest, ReadMissingOrEmptyIsNullopt) {
  EXPECT_FALSE(Util::read_line(root / "missing"));
  write("empty", "   ");
  EXPECT_FALSE(Util::read_line(root / "empty"));
  EXPECT_FALSE(Util::read<int>(root / "empty"));
}

TEST_F(UtilTest, ReadUnparseableIsNullopt) {
  write("node", "abc");
  EXPECT_FALSE(Util::read<int>(root / "node"));
  write("node", "12abc");
  EXPECT_FALSE(Util::read<int>(root / "node"));
}

TEST_F(UtilTest, ParseAcceptsSign) {
  EXPECT_EQ(Util::parse<int>("+25"), 25);
  EXPECT_EQ(Util::parse<int>("-3"), -3);
  EXPECT_EQ(Util::parse<string>("F2B"), "F2B");
  EXPECT_FALSE(Util::parse<int>(""));
}

TEST_F(UtilTest, GlobTakesFirstSortedMatch) {
  write("hwmon/hwmon3/temp1_input", "30000");
  write("hwmon/hwmon1/temp1_input", "25000");

  const auto p = Util::resolve(root / "hwmon/hwmon*/temp1_input");
  ASSERT_TRUE(p);
  EXPECT_EQ(p->string(), (root / "hwmon/hwmon1/temp1_input").string());
  EXPECT_EQ(Util::read<int>(root / "hwmon/hwmon*/temp1_input"), 25000);
}

TEST_F(UtilTest, GlobWithoutMatchIsNullopt) {
  EXPECT_FALSE(Util::resolve(root / "hwmon*/temp1_input"));
  EXPECT_FALSE(Util::read_line(root / "hwmon*/temp1_input"));
}

TEST_F(UtilTest, WriteRefusesMissingFile) {
  EXPECT_FALSE(Util::write(root / "missing", 50));
  EXPECT_FALSE(exists(root / "missing"));
}

TEST_F(UtilTest, WriteCreatesWhenAsked) {
  EXPECT_TRUE(Util::write(root / "marker", 50, true));
  EXPECT_EQ(contents("marker"), "50");

  write("node", "10");
  EXPECT_TRUE(Util::write(root / "node", 70));
  EXPECT_EQ(Util::read<int>(root / "node"), 70);
}

TEST_F(UtilTest, ReadUnreadableNodeIsNullopt) {
  // Opens, but every read fails, the retry included
  create_directories(root / "node");
  EXPECT_FALSE(Util::read_line(root / "node"));
  EXPECT_FALSE(Util::read<int>(root / "node"));
}

TEST_F(UtilTest, WriteFailsWhenFlushFails) {
  const path full = "/dev/full";
  if (!exists(full))
    GTEST_SKIP() << full << " not available";

  EXPECT_FALSE(Util::write(full, 50));
  EXPECT_FALSE(Util::write(full, string("F2B"), true));
}

TEST_F(UtilTest, DeepEqual) {
  sp_pb::Platform a, b;
  a.set_name("x");
  b.set_name("x");
  EXPECT_TRUE(Util::deep_equal(a, b));
  b.set_fan_trays(1);
  EXPECT_FALSE(Util::deep_equal(a, b));
}
} // namespace sp::test
