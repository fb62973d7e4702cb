#include "ThresholdStore.hpp"

sp::ThresholdStore::ThresholdStore(path store_path_)
    : file_path(move(store_path_)) {}

optional<double> sp::ThresholdStore::get_high(const string &name) const {
  const auto t = find(name);
  return (t && t->has_high()) ? optional(t->high()) : nullopt;
}

optional<double>
sp::ThresholdStore::get_high_critical(const string &name) const {
  const auto t = find(name);
  return (t && t->has_high_critical()) ? optional(t->high_critical())
                                       : nullopt;
}

bool sp::ThresholdStore::set_high(const string &name, double value) {
  return update(name, [value](sp_pb::Threshold &t) { t.set_high(value); });
}

bool sp::ThresholdStore::set_high_critical(const string &name, double value) {
  return update(name,
                [value](sp_pb::Threshold &t) { t.set_high_critical(value); });
}

optional<sp_pb::Thresholds> sp::ThresholdStore::load() const {
  if (!exists(file_path))
    return nullopt;

  std::ifstream ifs(file_path);
  std::stringstream ss;
  ss << ifs.rdbuf();
  if (!ifs) {
    LOG(llvl::debug) << "Failed to read thresholds: " << file_path;
    return nullopt;
  }

  sp_pb::Thresholds t;
  if (!google::protobuf::TextFormat::ParseFromString(ss.str(), &t)) {
    LOG(llvl::warning) << "Ignoring unparseable thresholds: " << file_path;
    return nullopt;
  }

  return t;
}

optional<sp_pb::Threshold>
sp::ThresholdStore::find(const string &name) const {
  const std::lock_guard<std::mutex> lock(file_mutex);
  const auto t = load();
  if (!t)
    return nullopt;

  const auto it = t->device().find(name);
  if (it == t->device().end())
    return nullopt;

  return it->second;
}

bool sp::ThresholdStore::update(const string &name,
                                const function<void(sp_pb::Threshold &)> &f) {
  const std::lock_guard<std::mutex> lock(file_mutex);
  sp_pb::Thresholds t = load().value_or(sp_pb::Thresholds());
  f((*t.mutable_device())[name]);

  string out_s;
  google::protobuf::TextFormat::Printer printer;
  if (!printer.PrintToString(t, &out_s)) {
    LOG(llvl::error) << "Failed to serialize thresholds";
    return false;
  }

  if (!Util::write(file_path, out_s, true))
    return false;

  LOG(llvl::debug) << name << ": threshold override saved to " << file_path;
  return true;
}
