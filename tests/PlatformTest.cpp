#include "Platform.hpp"
#include "SysfsFixture.hpp"

namespace sp::test {
class PlatformTest : public SysfsFixture {};

TEST_F(PlatformTest, BuiltinNames) {
  const auto names = Platform::builtin_names();
  EXPECT_NE(std::find(names.begin(), names.end(), "as7926-40xfb"),
            names.end());
  EXPECT_NE(std::find(names.begin(), names.end(), "as9736-64d"), names.end());
  EXPECT_FALSE(Platform::builtin("unknown"));
}

TEST_F(PlatformTest, As7926Thermals) {
  const auto p = Platform::builtin("as7926-40xfb");
  ASSERT_TRUE(p);
  Platform platform(*p, false);
  EXPECT_EQ(platform.thermals.size(), 21);
  EXPECT_TRUE(platform.fans.empty());
  EXPECT_FALSE(platform.fan_util);

  const Thermal *t = platform.find_thermal("Temp sensor 2");
  ASSERT_NE(t, nullptr);
  EXPECT_EQ(t->get_position_in_parent(), 2);
  EXPECT_EQ(t->get_input_path().string(),
            "/sys/devices/platform/as7926_40xfb_thermal/temp2_input");

  const Thermal *cpu = platform.find_thermal("CPU Core 7 Temp");
  ASSERT_NE(cpu, nullptr);
  EXPECT_EQ(cpu->kind(), sp_pb::CPU);
  EXPECT_EQ(cpu->get_position_in_parent(), 19);
  EXPECT_TRUE(cpu->get_presence());

  const Thermal *psu = platform.find_thermal("PSU-2 temp sensor 1");
  ASSERT_NE(psu, nullptr);
  EXPECT_EQ(psu->get_input_path().string(),
            "/sys/devices/platform/as7926_40xfb_psu/psu2_temp1_input");
}

TEST_F(PlatformTest, As9736Fans) {
  const auto p = Platform::builtin("as9736-64d");
  ASSERT_TRUE(p);
  Platform platform(*p, false);
  EXPECT_TRUE(platform.thermals.empty());
  ASSERT_EQ(platform.fans.size(), 10);
  ASSERT_TRUE(platform.fan_util);
  EXPECT_EQ(platform.fan_util->get_num_fans(), 4);

  EXPECT_EQ(platform.fans.front()->get_name(), "FAN-1F");
  EXPECT_EQ(platform.fans.at(7)->get_name(), "FAN-4R");
  EXPECT_EQ(platform.fans.at(8)->get_name(), "PSU-1 FAN-1");
  EXPECT_EQ(platform.fans.back()->get_name(), "PSU-2 FAN-1");
  EXPECT_TRUE(platform.fans.back()->is_psu_fan);
  EXPECT_NE(platform.find_fan("FAN-3R"), nullptr);
  EXPECT_EQ(platform.find_fan("FAN-5F"), nullptr);

  const auto targets = target_speed_map(*p);
  EXPECT_EQ(targets.size(), 21);
  EXPECT_EQ(targets.at(100), 13600);
  EXPECT_EQ(targets.at(50), 6800);
}

TEST_F(PlatformTest, FromDescription) {
  write("thermal/temp1_input", "30000");
  write("thermal/temp3_input", "51000");
  write("psu/psu1_present", "1");
  write("psu/psu1_temp1_input", "40000");

  Platform platform(thermal_platform(), false);
  ASSERT_EQ(platform.thermals.size(), 5);

  EXPECT_DOUBLE_EQ(platform.find_thermal("Temp sensor 1")->get_temperature(),
                   30);
  EXPECT_FALSE(platform.find_thermal("Temp sensor 2")->get_presence());
  EXPECT_DOUBLE_EQ(
      platform.find_thermal("CPU Package Temp")->get_temperature(), 51);
  EXPECT_TRUE(platform.find_thermal("PSU-1 temp sensor 1")->get_status());
  EXPECT_FALSE(platform.find_thermal("PSU-2 temp sensor 1")->get_status());
}

TEST_F(PlatformTest, SharedThresholdStore) {
  Platform platform(thermal_platform(), false);
  Thermal *t = platform.find_thermal("Temp sensor 1");
  ASSERT_NE(t, nullptr);
  ASSERT_TRUE(t->set_high_threshold(60));

  // Another instance sees the override immediately
  Platform other(thermal_platform(), false);
  EXPECT_DOUBLE_EQ(other.find_thermal("Temp sensor 1")->get_high_threshold(),
                   60);
  EXPECT_TRUE(exists(root / "device_threshold.pb.txt"));
}

TEST_F(PlatformTest, DuplicateThermalSkipped) {
  auto p = thermal_platform();
  *p.add_thermal() = p.thermal(0);
  Platform platform(p, false);
  EXPECT_EQ(platform.thermals.size(), 5);
}

TEST_F(PlatformTest, ReadTextFormat) {
  string text;
  ASSERT_TRUE(
      google::protobuf::TextFormat::PrintToString(fan_platform(), &text));
  write("swplat.conf", text);

  const auto p = Platform::read(root / "swplat.conf");
  ASSERT_TRUE(p);
  EXPECT_TRUE(Util::deep_equal(*p, fan_platform()));

  Platform platform(*p, false);
  EXPECT_EQ(platform.fans.size(), 5);
  ASSERT_TRUE(platform.fan_util);

  sp_pb::Platform exported;
  platform.to(exported);
  EXPECT_TRUE(Util::deep_equal(exported, *p));
}

TEST_F(PlatformTest, ReadInvalidFile) {
  write("swplat.conf", "fan_trays: \"four\"");
  EXPECT_FALSE(Platform::read(root / "swplat.conf"));
  EXPECT_FALSE(Platform::read(root / "missing.conf"));
}

TEST_F(PlatformTest, LoadPrefersConfigFile) {
  string text;
  ASSERT_TRUE(
      google::protobuf::TextFormat::PrintToString(thermal_platform(), &text));
  write("swplat.conf", text);

  const auto p = Platform::load(root / "swplat.conf", "as9736-64d");
  ASSERT_TRUE(p);
  EXPECT_EQ(p->name(), "test-thermals");
}

TEST_F(PlatformTest, LoadFallsBackToBuiltin) {
  const auto p = Platform::load(root / "missing.conf", "as7926-40xfb");
  ASSERT_TRUE(p);
  EXPECT_EQ(p->name(), "as7926-40xfb");

  EXPECT_TRUE(Platform::load(path(), "as9736-64d"));
  EXPECT_FALSE(Platform::load(path(), "as0000"));
}
} // namespace sp::test
