#ifndef SWPLAT_THRESHOLDSTORE_HPP
#define SWPLAT_THRESHOLDSTORE_HPP

#include <google/protobuf/text_format.h>
#include <mutex>

#include "proto/PlatformSpec.pb.h"
#include "util/Util.hpp"

namespace sp {
inline const char *DEFAULT_THRESHOLD_PATH = "/tmp/device_threshold.pb.txt";

/// \brief
/// Threshold overrides, keyed by device name. The file is re-read on every
/// lookup so that overrides set by another process apply immediately.
class ThresholdStore {
public:
  explicit ThresholdStore(path store_path_ = DEFAULT_THRESHOLD_PATH);

  optional<double> get_high(const string &name) const;
  optional<double> get_high_critical(const string &name) const;
  bool set_high(const string &name, double value);
  bool set_high_critical(const string &name, double value);

  const path &store_path() const { return file_path; }

private:
  path file_path;
  mutable std::mutex file_mutex;

  optional<sp_pb::Thresholds> load() const;
  optional<sp_pb::Threshold> find(const string &name) const;
  bool update(const string &name,
              const function<void(sp_pb::Threshold &)> &f);
};
} // namespace sp

#endif // SWPLAT_THRESHOLDSTORE_HPP
