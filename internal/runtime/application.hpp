#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/factory.hpp"

namespace roadcast::runtime {

/*
  Application

  The engine plus the gRPC adapters that expose it. The engine outlives
  the services registered on the server, which only hold shared handles.
*/
struct Application {
  factory::Engine                               engine;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

Application BuildApplication(const roadcast::runtime::config::RuntimeConfig& config, factory::Providers providers);

} // namespace roadcast::runtime
