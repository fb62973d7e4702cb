#ifndef SWPLAT_PLATFORM_HPP
#define SWPLAT_PLATFORM_HPP

#include <google/protobuf/text_format.h>

#include "ThresholdStore.hpp"
#include "fan/Fan.hpp"
#include "fan/FanUtil.hpp"
#include "proto/PlatformSpec.pb.h"
#include "thermal/Thermal.hpp"
#include "util/Util.hpp"

namespace sp {
inline const char *DEFAULT_PLATFORM = "as9736-64d";

class Platform {
public:
  explicit Platform(const sp_pb::Platform &p, bool host = Util::is_host());

  vector<unique_ptr<Thermal>> thermals;
  vector<unique_ptr<Fan>> fans;
  unique_ptr<FanUtil> fan_util;
  shared_ptr<ThresholdStore> thresholds;

  const string &name() const { return spec.name(); }
  Thermal *find_thermal(const string &name) const;
  Fan *find_fan(const string &name) const;
  void to(sp_pb::Platform &p) const;

  static optional<sp_pb::Platform> builtin(const string &name);
  static vector<string> builtin_names();
  static optional<sp_pb::Platform> read(const path &config_path);
  static optional<sp_pb::Platform> load(const path &config_path,
                                        const string &name);

private:
  sp_pb::Platform spec;

  void from(const sp_pb::Platform &p, bool host);
};
} // namespace sp

#endif // SWPLAT_PLATFORM_HPP
