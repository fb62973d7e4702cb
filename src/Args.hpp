#ifndef SWPLAT_ARGS_HPP
#define SWPLAT_ARGS_HPP

#ifndef SWPLAT_SYSCONFDIR
#define SWPLAT_SYSCONFDIR "/etc"
#endif // SWPLAT_SYSCONFDIR

#include "Platform.hpp"
#include "util/Util.hpp"

namespace sp {
static const char *DEFAULT_CONF_PATH(SWPLAT_SYSCONFDIR "/swplat.conf");

class Arg {
public:
  Arg(string name, string short_name = "", bool potential_value = false,
      bool needs_value = false, string value = "", bool triggered = false);

  string key, short_key, value;
  bool triggered, potential_value, needs_value;

  bool has_value() const;
  operator bool() const;
};

class Args {
public:
  Arg help = {"help", "h"}, status = {"status", "s"},
      thermals = {"thermals", "t"}, fans = {"fans", "f"},
      fan_util = {"fan-util", "u"},
      set_speed = {"set-speed", "", true, true},
      duty = {"duty", "", true, true},
      threshold = {"threshold", "", true, true}, critical = {"critical"},
      config = {"config", "c", true, true, DEFAULT_CONF_PATH},
      platform = {"platform", "p", true, true, DEFAULT_PLATFORM},
      service = {"service"}, daemon = {"daemon", "d"},
      reload = {"reload", "r"}, stop_service = {"stop-service"},
      verbose = {"verbose", "v"},
      trace = {"trace", "a"};

  map<string, Arg &> from_key = {{help.key, help},
                                 {status.key, status},
                                 {thermals.key, thermals},
                                 {fans.key, fans},
                                 {fan_util.key, fan_util},
                                 {set_speed.key, set_speed},
                                 {duty.key, duty},
                                 {threshold.key, threshold},
                                 {critical.key, critical},
                                 {config.key, config},
                                 {platform.key, platform},
                                 {service.key, service},
                                 {daemon.key, daemon},
                                 {reload.key, reload},
                                 {stop_service.key, stop_service},
                                 {verbose.key, verbose},
                                 {trace.key, trace}};

  map<string, string> short_to_key() const;
  optional<std::reference_wrapper<Arg>> find(string_view arg);
};

/// \brief
/// Splits "<name>=<value>", the name may contain spaces
optional<pair<string, string>> split_assignment(const string &s);
} // namespace sp

#endif // SWPLAT_ARGS_HPP
