#ifndef SWPLAT_CLIENT_HPP
#define SWPLAT_CLIENT_HPP

#include <grpcpp/grpcpp.h>
#include <iomanip>

#include "Args.hpp"
#include "proto/PlatformSpec.grpc.pb.h"
#include "proto/PlatformSpec.pb.h"
#include "util/Util.hpp"

using grpc::ClientContext;
using grpc::Status;
using grpc::StatusCode;
using sp::Args;
using std::setw;

namespace sp {
class Client {
public:
  Client();

  void run(Args &args);

  void stop_service();
  void reload();
  optional<sp_pb::ThermalStatusList> get_thermals();
  optional<sp_pb::FanStatusList> get_fans();

  void status();
  void thermals();
  void fans();
  void fan_util();
  void set_speed(const string &assignment);
  void set_duty_cycle(const string &percent);
  void set_threshold(const string &assignment, bool critical);

  static void print_help(const string &conf);
  static bool service_running();

  explicit operator bool() const;

private:
  unique_ptr<sp_pb::PService::Stub> client;
  shared_ptr<grpc::Channel> channel;
  sp_pb::Empty empty;

  bool connected(long timeout_ms) const;
  static bool check(const grpc::Status &status);
  static void log_service_unavailable();
  static void print(const sp_pb::ThermalStatusList &l);
  static void print(const sp_pb::FanStatusList &l);
  static string threshold_text(bool has, double value);
};
} // namespace sp

#endif // SWPLAT_CLIENT_HPP
