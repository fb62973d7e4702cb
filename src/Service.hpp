#ifndef SWPLAT_SERVICE_HPP
#define SWPLAT_SERVICE_HPP

#include <boost/thread.hpp>
#include <grpcpp/grpcpp.h>
#include <grpcpp/server.h>
#include <grpcpp/support/status.h>
#include <shared_mutex>
#include <sys/stat.h>

#include "Platform.hpp"
#include "proto/PlatformSpec.grpc.pb.h"
#include "proto/PlatformSpec.pb.h"

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using grpc::StatusCode;
using sp::Util::SERVICE_ADDR;
using sp_pb::Empty;
using std::shared_lock;
using std::shared_mutex;
using std::unique_lock;

namespace sp {
class Service : public sp_pb::PService::Service {
public:
  Service(path config_path_, string platform_name_, bool daemon = false);
  ~Service() override;

  void run();
  void shutdown();
  bool reload();

  Status StopService(ServerContext *context, const Empty *e,
                     Empty *resp) override;
  Status Reload(ServerContext *context, const Empty *e, Empty *resp) override;
  Status GetPlatform(ServerContext *context, const Empty *e,
                     sp_pb::Platform *resp) override;
  Status GetThermals(ServerContext *context, const Empty *e,
                     sp_pb::ThermalStatusList *resp) override;
  Status GetFans(ServerContext *context, const Empty *e,
                 sp_pb::FanStatusList *resp) override;
  Status GetFanStatus(ServerContext *context, const sp_pb::DeviceName *n,
                      sp_pb::FanStatus *resp) override;
  Status SetFanSpeed(ServerContext *context, const sp_pb::SpeedRequest *req,
                     Empty *resp) override;
  Status SetThreshold(ServerContext *context,
                      const sp_pb::ThresholdRequest *req,
                      Empty *resp) override;
  Status GetFanUtil(ServerContext *context, const Empty *e,
                    sp_pb::FanUtilStatus *resp) override;
  Status SetDutyCycle(ServerContext *context, const sp_pb::DutyCycle *req,
                      Empty *resp) override;

private:
  const path config_path;
  const string platform_name;
  unique_ptr<Platform> platform;
  mutable shared_mutex platform_mutex;
  unique_ptr<Server> server;
  optional<boost::thread> watcher;
  optional<fs::file_time_type> config_write_time;
  const boost::chrono::milliseconds watch_interval{2000};

  boost::thread spawn_watcher();
  bool config_file_modified();
  static void daemonize();
};
} // namespace sp

#endif // SWPLAT_SERVICE_HPP
