#include "Platform.hpp"

sp::Platform::Platform(const sp_pb::Platform &p, bool host) { from(p, host); }

sp::Thermal *sp::Platform::find_thermal(const string &name) const {
  const auto it =
      std::find_if(thermals.begin(), thermals.end(),
                   [&name](const auto &t) { return t->get_name() == name; });
  return (it != thermals.end()) ? it->get() : nullptr;
}

sp::Fan *sp::Platform::find_fan(const string &name) const {
  const auto it =
      std::find_if(fans.begin(), fans.end(),
                   [&name](const auto &f) { return f->get_name() == name; });
  return (it != fans.end()) ? it->get() : nullptr;
}

void sp::Platform::to(sp_pb::Platform &p) const { p.CopyFrom(spec); }

optional<sp_pb::Platform> sp::Platform::read(const path &config_path) {
  if (!exists(config_path))
    return nullopt;

  std::ifstream ifs(config_path);
  std::stringstream ss;
  ss << ifs.rdbuf();
  if (!ifs) {
    LOG(llvl::error) << "Failed to read platform config: " << config_path;
    return nullopt;
  }

  sp_pb::Platform p;
  if (!google::protobuf::TextFormat::ParseFromString(ss.str(), &p)) {
    LOG(llvl::error) << "Failed to parse platform config: " << config_path;
    return nullopt;
  }

  return p;
}

optional<sp_pb::Platform> sp::Platform::load(const path &config_path,
                                             const string &name) {
  if (!config_path.empty() && exists(config_path)) {
    LOG(llvl::debug) << "Loading platform from " << config_path;
    return read(config_path);
  }

  auto p = builtin(name);
  if (!p) {
    std::stringstream known;
    for (const auto &n : builtin_names())
      known << ' ' << n;
    LOG(llvl::error) << "Unknown platform '" << name
                     << "', known platforms:" << known.str();
  }
  return p;
}

void sp::Platform::from(const sp_pb::Platform &p, bool host) {
  spec = p;
  thresholds = make_shared<ThresholdStore>(
      p.threshold_path().empty() ? DEFAULT_THRESHOLD_PATH : p.threshold_path());

  // Board & CPU sensors are numbered by table order, PSU sensors per PSU
  uint board_sensor = 0;
  for (const auto &ts : p.thermal()) {
    sp_pb::ThermalSpec t(ts);
    const bool is_psu = t.kind() == sp_pb::PSU;
    if (!is_psu)
      ++board_sensor;
    if (t.sensor() == 0)
      t.set_sensor((is_psu) ? 1 : board_sensor);

    const path dir = (is_psu) ? p.psu_thermal_path() : p.thermal_path();
    auto thermal = make_unique<Thermal>(move(t), dir, thresholds);
    if (find_thermal(thermal->get_name())) {
      LOG(llvl::warning) << *thermal << ": skipping duplicate thermal";
      continue;
    }
    thermals.emplace_back(move(thermal));
  }

  const uint rotors =
      (p.fan_trays() > 0) ? p.fan_name_size() / p.fan_trays() : 0;
  for (uint tray = 0; tray < p.fan_trays(); ++tray) {
    for (uint rotor = 0; rotor < std::max(rotors, 1U); ++rotor)
      fans.emplace_back(make_unique<Fan>(p, tray, rotor, false, 0, host));
  }

  for (uint psu = 0; psu < static_cast<uint>(p.psu_size()); ++psu) {
    for (uint f = 0; f < p.psu_fans(); ++f)
      fans.emplace_back(make_unique<Fan>(p, 0, f, true, psu, host));
  }

  if (p.fan_util_fans() > 0)
    fan_util = make_unique<FanUtil>(p, host);

  LOG(llvl::debug) << p.name() << ": " << thermals.size() << " thermals, "
                   << fans.size() << " fans";
}
