#include <cmath>

#include "SysfsFixture.hpp"
#include "thermal/Thermal.hpp"

namespace sp::test {
class ThermalTest : public SysfsFixture {
protected:
  sp_pb::ThermalSpec spec(const string &name, sp_pb::ThermalKind kind,
                          uint sensor, optional<double> high = 84,
                          optional<double> crit = 87) const {
    sp_pb::ThermalSpec t;
    t.set_name(name);
    t.set_kind(kind);
    t.set_sensor(sensor);
    if (high)
      t.set_high_threshold(*high);
    if (crit)
      t.set_high_critical_threshold(*crit);
    return t;
  }

  shared_ptr<ThresholdStore> store() const {
    return make_shared<ThresholdStore>(root / "thresholds.pb.txt");
  }
};

TEST_F(ThermalTest, TemperatureIsMillidegrees) {
  write("thermal/temp1_input", "45500");
  Thermal t(spec("Temp sensor 1", sp_pb::BOARD, 1), root / "thermal");
  EXPECT_DOUBLE_EQ(t.get_temperature(), 45.5);
  EXPECT_TRUE(t.get_presence());
  EXPECT_TRUE(t.get_status());
  EXPECT_EQ(t.get_position_in_parent(), 1);
  EXPECT_FALSE(t.is_replaceable());
}

TEST_F(ThermalTest, UnreadableSensorReadsZero) {
  Thermal t(spec("Temp sensor 2", sp_pb::BOARD, 2), root / "thermal");
  EXPECT_DOUBLE_EQ(t.get_temperature(), 0);
  EXPECT_FALSE(t.get_presence());
  EXPECT_FALSE(t.get_status());
  EXPECT_FALSE(t.get_minimum_recorded());
}

TEST_F(ThermalTest, ZeroReadingIsPresentButFaulty) {
  write("thermal/temp1_input", "0");
  Thermal t(spec("Temp sensor 1", sp_pb::BOARD, 1), root / "thermal");
  EXPECT_TRUE(t.get_presence());
  EXPECT_FALSE(t.get_status());
}

TEST_F(ThermalTest, CpuIsAlwaysPresent) {
  Thermal t(spec("CPU Core 0 Temp", sp_pb::CPU, 12, 82, 104),
            root / "thermal");
  EXPECT_TRUE(t.get_presence());
  EXPECT_FALSE(t.get_status());
  EXPECT_EQ(t.get_input_path().string(),
            (root / "thermal/temp12_input").string());
}

TEST_F(ThermalTest, PsuPresenceAndStatus) {
  auto s = spec("PSU-2 temp sensor 1", sp_pb::PSU, 1, 62, 67);
  s.set_psu_index(1);
  Thermal t(s, root / "psu");
  EXPECT_EQ(t.get_input_path().string(),
            (root / "psu/psu2_temp1_input").string());
  EXPECT_FALSE(t.get_presence());
  EXPECT_FALSE(t.get_status());

  write("psu/psu2_present", "1");
  write("psu/psu2_temp1_input", "31000");
  EXPECT_TRUE(t.get_presence());
  EXPECT_TRUE(t.get_status());
  EXPECT_DOUBLE_EQ(t.get_temperature(), 31);

  write("psu/psu2_present", "0");
  EXPECT_FALSE(t.get_presence());
}

TEST_F(ThermalTest, ExplicitInputNode) {
  auto s = spec("Temp sensor 1", sp_pb::BOARD, 1);
  s.set_input("hwmon*/temp1_input");
  write("thermal/hwmon4/temp1_input", "27000");
  Thermal t(s, root / "thermal");
  EXPECT_DOUBLE_EQ(t.get_temperature(), 27);
}

TEST_F(ThermalTest, RecordsMinimumAndMaximum) {
  Thermal t(spec("Temp sensor 1", sp_pb::BOARD, 1), root / "thermal");
  for (const char *v : {"40000", "55000", "35000", "50000"}) {
    write("thermal/temp1_input", v);
    t.get_temperature();
  }

  EXPECT_EQ(t.get_minimum_recorded(), 35);
  EXPECT_EQ(t.get_maximum_recorded(), 55);
}

TEST_F(ThermalTest, ThresholdDefaults) {
  Thermal t(spec("Temp sensor 1", sp_pb::BOARD, 1), root / "thermal",
            store());
  EXPECT_DOUBLE_EQ(t.get_high_threshold(), 84);
  EXPECT_DOUBLE_EQ(t.get_high_critical_threshold(), 87);
}

TEST_F(ThermalTest, ThresholdOverrideWins) {
  auto s = store();
  Thermal t(spec("Temp sensor 1", sp_pb::BOARD, 1), root / "thermal", s);
  ASSERT_TRUE(s->set_high("Temp sensor 1", 70));
  EXPECT_DOUBLE_EQ(t.get_high_threshold(), 70);
  EXPECT_DOUBLE_EQ(t.get_high_critical_threshold(), 87);
}

TEST_F(ThermalTest, MissingThresholdNotImplemented) {
  Thermal t(spec("Temp sensor 1", sp_pb::BOARD, 1, nullopt, nullopt),
            root / "thermal", store());
  EXPECT_THROW(t.get_high_threshold(), NotImplementedError);
  EXPECT_THROW(t.get_high_critical_threshold(), NotImplementedError);
  EXPECT_THROW(t.get_low_threshold(), NotImplementedError);
  EXPECT_THROW(t.get_low_critical_threshold(), NotImplementedError);
  EXPECT_FALSE(t.set_low_threshold(10));
  EXPECT_FALSE(t.set_low_critical_threshold(5));
}

TEST_F(ThermalTest, SetThreshold) {
  Thermal t(spec("Temp sensor 1", sp_pb::BOARD, 1), root / "thermal",
            store());
  EXPECT_TRUE(t.set_high_threshold(80));
  EXPECT_DOUBLE_EQ(t.get_high_threshold(), 80);
  EXPECT_TRUE(t.set_high_critical_threshold(87));
  EXPECT_DOUBLE_EQ(t.get_high_critical_threshold(), 87);
}

TEST_F(ThermalTest, SetThresholdRejected) {
  Thermal t(spec("Temp sensor 1", sp_pb::BOARD, 1), root / "thermal",
            store());
  EXPECT_FALSE(t.set_high_threshold(90));
  EXPECT_FALSE(t.set_high_threshold(std::nan("")));
  EXPECT_FALSE(t.set_high_critical_threshold(INFINITY));
  EXPECT_DOUBLE_EQ(t.get_high_threshold(), 84);

  Thermal no_store(spec("Temp sensor 2", sp_pb::BOARD, 2), root / "thermal");
  EXPECT_FALSE(no_store.set_high_threshold(60));
}

TEST_F(ThermalTest, ValidThresholdIgnoresStore) {
  Thermal t(spec("Temp sensor 2", sp_pb::BOARD, 2), root / "thermal");
  EXPECT_TRUE(t.valid_high_threshold(60));
  EXPECT_TRUE(t.valid_high_threshold(84));
  EXPECT_FALSE(t.valid_high_threshold(84.5));
  EXPECT_FALSE(t.valid_high_threshold(std::nan("")));
  EXPECT_TRUE(t.valid_high_critical_threshold(87));
  EXPECT_FALSE(t.valid_high_critical_threshold(INFINITY));

  // Valid, but there is nowhere to save it
  EXPECT_FALSE(t.set_high_threshold(60));

  Thermal no_default(spec("Temp sensor 3", sp_pb::BOARD, 3, nullopt),
                     root / "thermal");
  EXPECT_TRUE(no_default.valid_high_threshold(150));
}

TEST_F(ThermalTest, Status) {
  write("thermal/temp1_input", "42000");
  Thermal t(spec("Temp sensor 1", sp_pb::BOARD, 1), root / "thermal",
            store());

  sp_pb::ThermalStatus s;
  t.to(s);
  EXPECT_EQ(s.name(), "Temp sensor 1");
  EXPECT_TRUE(s.presence());
  EXPECT_DOUBLE_EQ(s.temperature(), 42);
  EXPECT_DOUBLE_EQ(s.high_threshold(), 84);
  EXPECT_DOUBLE_EQ(s.high_critical_threshold(), 87);
  EXPECT_DOUBLE_EQ(s.maximum_recorded(), 42);
}
} // namespace sp::test
