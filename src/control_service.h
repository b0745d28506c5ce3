// Repository: Aqueduct
// Component: TransportControl gRPC Service Implementation
// Purpose: Implements the TransportControl service for inspecting and administering a sender.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_CONTROL_SERVICE_H_
#define AQUEDUCT_CONTROL_SERVICE_H_

#include <memory>

#include <grpcpp/grpcpp.h>

#include "aqueduct/control.grpc.pb.h"
#include "aqueduct/discovery/IDiscovery.h"
#include "aqueduct/sender/Sender.h"
#include "aqueduct/telemetry/MetricsExporter.h"

namespace aqueduct {
namespace control {

// TransportControlImpl implements the gRPC service defined in control.proto.
// The sender and discovery are borrowed; both must outlive the service.
class TransportControlImpl final : public TransportControl::Service {
 public:
  TransportControlImpl(sender::Sender* sender,
                       discovery::IDiscovery* discovery,
                       std::shared_ptr<telemetry::MetricsExporter> metrics_exporter);
  ~TransportControlImpl() override;

  // Disable copy and move
  TransportControlImpl(const TransportControlImpl&) = delete;
  TransportControlImpl& operator=(const TransportControlImpl&) = delete;

  // RPC implementations
  grpc::Status GetVersion(grpc::ServerContext* context,
                          const ApiVersionRequest* request,
                          ApiVersion* response) override;

  grpc::Status GetSenderStatus(grpc::ServerContext* context,
                               const SenderStatusRequest* request,
                               SenderStatus* response) override;

  grpc::Status CloseConnection(grpc::ServerContext* context,
                               const CloseConnectionRequest* request,
                               CloseConnectionResponse* response) override;

  grpc::Status ListSources(grpc::ServerContext* context,
                           const ListSourcesRequest* request,
                           ListSourcesResponse* response) override;

 private:
  // Pushes the sender's current counters to the exporter.
  void UpdateSenderMetrics();

  sender::Sender* sender_;
  discovery::IDiscovery* discovery_;
  std::shared_ptr<telemetry::MetricsExporter> metrics_exporter_;
};

}  // namespace control
}  // namespace aqueduct

#endif  // AQUEDUCT_CONTROL_SERVICE_H_
