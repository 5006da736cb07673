#include "application.hpp"

#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/route_server.hpp"
#include "internal/grpc/weather_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/route_service.hpp"
#include "internal/service/weather_service.hpp"

namespace roadcast::runtime {

Application BuildApplication(const roadcast::runtime::config::RuntimeConfig& config, factory::Providers providers) {
  Application app;
  app.engine = factory::BuildEngine(factory::BuildRepository(config), roadcast::config::FromConfig(config), std::move(providers));

  const auto ctx = app.engine.Context();
  app.grpc_services.push_back(std::make_unique<grpc::RouteServer>(std::make_shared<service::RouteService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::WeatherServer>(std::make_shared<service::WeatherService>(ctx)));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(std::make_shared<service::AdminService>(ctx)));
  return app;
}

} // namespace roadcast::runtime
