#include "SysfsFixture.hpp"
#include "ThresholdStore.hpp"

namespace sp::test {
class ThresholdStoreTest : public SysfsFixture {};

TEST_F(ThresholdStoreTest, MissingFileHasNoOverrides) {
  ThresholdStore store(root / "thresholds.pb.txt");
  EXPECT_FALSE(store.get_high("Temp sensor 1"));
  EXPECT_FALSE(store.get_high_critical("Temp sensor 1"));
}

TEST_F(ThresholdStoreTest, SetPersistsPerField) {
  ThresholdStore store(root / "thresholds.pb.txt");
  ASSERT_TRUE(store.set_high("Temp sensor 1", 80));
  EXPECT_EQ(store.get_high("Temp sensor 1"), 80);
  EXPECT_FALSE(store.get_high_critical("Temp sensor 1"));

  ASSERT_TRUE(store.set_high_critical("Temp sensor 1", 85));
  EXPECT_EQ(store.get_high("Temp sensor 1"), 80);
  EXPECT_EQ(store.get_high_critical("Temp sensor 1"), 85);
  EXPECT_FALSE(store.get_high("Temp sensor 2"));
}

TEST_F(ThresholdStoreTest, ReadsOverridesWrittenByOthers) {
  ThresholdStore store(root / "thresholds.pb.txt");
  EXPECT_FALSE(store.get_high("CPU Core 0 Temp"));

  write("thresholds.pb.txt",
        R"(device { key: "CPU Core 0 Temp" value { high: 75.5 } })");
  EXPECT_EQ(store.get_high("CPU Core 0 Temp"), 75.5);
}

TEST_F(ThresholdStoreTest, UnparseableFileIsIgnored) {
  write("thresholds.pb.txt", "not { a valid");
  ThresholdStore store(root / "thresholds.pb.txt");
  EXPECT_FALSE(store.get_high("Temp sensor 1"));

  // A write replaces the unparseable content
  ASSERT_TRUE(store.set_high("Temp sensor 1", 70));
  EXPECT_EQ(store.get_high("Temp sensor 1"), 70);
}
} // namespace sp::test
