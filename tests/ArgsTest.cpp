#include <gtest/gtest.h>

#include "Args.hpp"

namespace sp::test {
TEST(ArgsTest, FindByKey) {
  Args args;
  const auto a = args.find("--set-speed");
  ASSERT_TRUE(a);
  EXPECT_EQ(a->get().key, "set-speed");
  EXPECT_TRUE(a->get().needs_value);

  ASSERT_TRUE(args.find("--service"));
  EXPECT_FALSE(args.find("--unknown"));
}

TEST(ArgsTest, FindByShortKey) {
  Args args;
  const auto a = args.find("-t");
  ASSERT_TRUE(a);
  EXPECT_EQ(&a->get(), &args.thermals);
  EXPECT_EQ(&args.find("-p")->get(), &args.platform);
  EXPECT_EQ(&args.find("-r")->get(), &args.reload);
  EXPECT_EQ(args.short_to_key().at("r"), "reload");
}

TEST(ArgsTest, ValuesAreNotArgs) {
  Args args;
  EXPECT_FALSE(args.find("FAN-1F=50"));
  EXPECT_FALSE(args.find("status"));
  EXPECT_FALSE(args.find("-"));
  EXPECT_FALSE(args.find(""));
}

TEST(ArgsTest, Defaults) {
  Args args;
  EXPECT_FALSE(args.config);
  EXPECT_EQ(args.config.value, DEFAULT_CONF_PATH);
  EXPECT_FALSE(args.platform);
  EXPECT_EQ(args.platform.value, DEFAULT_PLATFORM);
  EXPECT_EQ(args.short_to_key().at("u"), "fan-util");
}

TEST(ArgsTest, SplitAssignment) {
  const auto a = split_assignment("Temp sensor 1 = 80.5");
  ASSERT_TRUE(a);
  EXPECT_EQ(a->first, "Temp sensor 1");
  EXPECT_EQ(a->second, "80.5");

  const auto b = split_assignment("PSU-1 FAN-1=40");
  ASSERT_TRUE(b);
  EXPECT_EQ(b->first, "PSU-1 FAN-1");
  EXPECT_EQ(b->second, "40");
}

TEST(ArgsTest, SplitAssignmentInvalid) {
  EXPECT_FALSE(split_assignment("FAN-1F"));
  EXPECT_FALSE(split_assignment("=50"));
  EXPECT_FALSE(split_assignment("FAN-1F="));
}
} // namespace sp::test
