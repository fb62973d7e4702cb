#include "Thermal.hpp"

#include <cmath>

sp::Thermal::Thermal(sp_pb::ThermalSpec spec_, const path &sysfs_dir,
                     shared_ptr<ThresholdStore> store_)
    : spec(move(spec_)), store(move(store_)) {
  if (spec.sensor() == 0)
    spec.set_sensor(1);

  input_path = input_path_of(spec, sysfs_dir);
  if (spec.kind() == sp_pb::PSU)
    present_path =
        sysfs_dir / ("psu" + to_string(spec.psu_index() + 1) + "_present");
}

string sp::Thermal::get_name() const { return spec.name(); }

bool sp::Thermal::get_presence() const {
  switch (spec.kind()) {
  case sp_pb::CPU:
    // No presence node, the CPU is soldered to the board
    return true;
  case sp_pb::PSU:
    return Util::read<int>(present_path).value_or(0) == 1;
  default:
    return Util::read_line(input_path).has_value();
  }
}

bool sp::Thermal::get_status() const {
  if (spec.kind() == sp_pb::PSU)
    return get_presence();

  return Util::read<long>(input_path).value_or(0) != 0;
}

int sp::Thermal::get_position_in_parent() const {
  return static_cast<int>(spec.sensor());
}

bool sp::Thermal::is_replaceable() const { return false; }

Temp sp::Thermal::get_high_threshold() const {
  if (store) {
    if (const auto t = store->get_high(get_name()); t)
      return *t;
  }

  if (spec.has_high_threshold())
    return spec.high_threshold();

  throw NotImplementedError(get_name() + ": high threshold not available");
}

Temp sp::Thermal::get_high_critical_threshold() const {
  if (store) {
    if (const auto t = store->get_high_critical(get_name()); t)
      return *t;
  }

  if (spec.has_high_critical_threshold())
    return spec.high_critical_threshold();

  throw NotImplementedError(get_name() +
                            ": high critical threshold not available");
}

bool sp::Thermal::valid_high_threshold(Temp temp) const {
  const auto def = spec.has_high_threshold()
                       ? optional(spec.high_threshold())
                       : nullopt;
  return valid_threshold(temp, def, "high threshold");
}

bool sp::Thermal::valid_high_critical_threshold(Temp temp) const {
  const auto def = spec.has_high_critical_threshold()
                       ? optional(spec.high_critical_threshold())
                       : nullopt;
  return valid_threshold(temp, def, "high critical threshold");
}

bool sp::Thermal::set_high_threshold(Temp temp) {
  if (!valid_high_threshold(temp) || !has_store())
    return false;

  return store->set_high(get_name(), temp);
}

bool sp::Thermal::set_high_critical_threshold(Temp temp) {
  if (!valid_high_critical_threshold(temp) || !has_store())
    return false;

  return store->set_high_critical(get_name(), temp);
}

ThermalKind sp::Thermal::kind() const { return spec.kind(); }

void sp::Thermal::to(sp_pb::ThermalStatus &s) {
  s.set_name(get_name());
  s.set_presence(get_presence());
  s.set_status(get_status());
  s.set_temperature(get_temperature());
  s.set_position(get_position_in_parent());
  s.set_replaceable(is_replaceable());

  try {
    s.set_high_threshold(get_high_threshold());
  } catch (const NotImplementedError &e) {
    LOG(llvl::trace) << e.what();
  }
  try {
    s.set_high_critical_threshold(get_high_critical_threshold());
  } catch (const NotImplementedError &e) {
    LOG(llvl::trace) << e.what();
  }

  if (const auto m = get_minimum_recorded(); m)
    s.set_minimum_recorded(*m);
  if (const auto m = get_maximum_recorded(); m)
    s.set_maximum_recorded(*m);
}

optional<Temp> sp::Thermal::read() const {
  const auto temp = Util::read<long>(input_path);
  return (temp) ? optional(static_cast<Temp>(*temp) / SYSFS_TEMP_DIVISOR)
                : nullopt;
}

bool sp::Thermal::valid_threshold(Temp temp, optional<Temp> default_temp,
                                  const char *field) const {
  if (!std::isfinite(temp)) {
    LOG(llvl::error) << *this << ": invalid " << field << " " << temp;
    return false;
  }

  // Overrides may only tighten the default
  if (default_temp && temp > *default_temp) {
    LOG(llvl::warning) << *this << ": " << field << " " << temp
                       << " exceeds the default " << *default_temp;
    return false;
  }

  return true;
}

bool sp::Thermal::has_store() const {
  if (!store)
    LOG(llvl::error) << *this << ": no threshold store configured";

  return static_cast<bool>(store);
}

path sp::Thermal::input_path_of(const sp_pb::ThermalSpec &spec,
                                const path &dir) {
  if (!spec.input().empty())
    return dir / spec.input();

  const string temp = "temp" + to_string(spec.sensor()) + "_input";
  if (spec.kind() == sp_pb::PSU)
    return dir / ("psu" + to_string(spec.psu_index() + 1) + "_" + temp);

  return dir / temp;
}
