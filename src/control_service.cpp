// Repository: Aqueduct
// Component: TransportControl gRPC Service Implementation
// Purpose: Implements the TransportControl service for inspecting and administering a sender.
// Copyright (c) 2025 RetroVue

#include "control_service.h"

#include <iostream>
#include <string>
#include <utility>

namespace aqueduct
{
  namespace control
  {

    namespace
    {
      constexpr char kApiVersion[] = "1.0.0";

      void FillConnection(const sender::ConnectionInfo &info, ConnectionStatus *status)
      {
        status->set_id(info.id);
        status->set_peer(info.peer);
        status->set_packets_sent(info.packets_sent);
        status->set_bytes_sent(info.bytes_sent);
        status->set_queued_packets(info.queued_packets);
        status->set_queued_bytes(info.queued_bytes);
        status->set_high_water_bytes(info.high_water_bytes);
        status->set_packets_dropped(info.packets_dropped);
      }
    } // namespace

    TransportControlImpl::TransportControlImpl(
        sender::Sender *sender,
        discovery::IDiscovery *discovery,
        std::shared_ptr<telemetry::MetricsExporter> metrics_exporter)
        : sender_(sender),
          discovery_(discovery),
          metrics_exporter_(std::move(metrics_exporter))
    {
      std::cout << "[TransportControlImpl] Service initialized (API version: " << kApiVersion
                << ", sender: " << (sender_ ? sender_->config().name : std::string("none"))
                << ")" << std::endl;
    }

    TransportControlImpl::~TransportControlImpl()
    {
      std::cout << "[TransportControlImpl] Service shutting down" << std::endl;
    }

    grpc::Status TransportControlImpl::GetVersion(grpc::ServerContext *context,
                                                  const ApiVersionRequest *request,
                                                  ApiVersion *response)
    {
      std::cout << "[GetVersion] Request received" << std::endl;

      response->set_version(kApiVersion);

      std::cout << "[GetVersion] Returning version: " << kApiVersion << std::endl;
      return grpc::Status::OK;
    }

    grpc::Status TransportControlImpl::GetSenderStatus(grpc::ServerContext *context,
                                                       const SenderStatusRequest *request,
                                                       SenderStatus *response)
    {
      if (!sender_)
      {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "No sender attached");
      }

      const sender::SenderStats stats = sender_->GetStats();
      response->set_name(sender_->config().name);
      response->set_port(sender_->GetPort());
      response->set_running(sender_->IsRunning());
      response->set_codec(sender_->codec_name());
      response->set_frames_submitted(stats.frames_submitted);
      response->set_frames_sent(stats.frames_sent);
      response->set_frames_rejected(stats.frames_rejected);
      response->set_codec_errors(stats.codec_errors);
      response->set_bytes_sent(stats.bytes_sent);
      response->set_packets_dropped(stats.packets_dropped);
      response->set_connections_accepted(stats.connections_accepted);
      response->set_connections_refused(stats.connections_refused);

      for (const auto &info : sender_->ListConnections())
      {
        if (info.open)
        {
          FillConnection(info, response->add_connections());
        }
      }

      UpdateSenderMetrics();
      return grpc::Status::OK;
    }

    grpc::Status TransportControlImpl::CloseConnection(grpc::ServerContext *context,
                                                       const CloseConnectionRequest *request,
                                                       CloseConnectionResponse *response)
    {
      const uint64_t connection_id = request->connection_id();
      std::cout << "[CloseConnection] Request received: connection_id=" << connection_id
                << std::endl;

      if (!sender_)
      {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "No sender attached");
      }

      if (!sender_->CloseConnection(connection_id))
      {
        response->set_success(false);
        response->set_message("Connection not found");
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "No connection with id " + std::to_string(connection_id));
      }

      response->set_success(true);
      response->set_message("Connection closed");
      UpdateSenderMetrics();

      std::cout << "[CloseConnection] Connection " << connection_id << " closed" << std::endl;
      return grpc::Status::OK;
    }

    grpc::Status TransportControlImpl::ListSources(grpc::ServerContext *context,
                                                   const ListSourcesRequest *request,
                                                   ListSourcesResponse *response)
    {
      if (!discovery_)
      {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "Discovery disabled");
      }

      for (const auto &record : discovery_->Browse())
      {
        SourceRecord *source = response->add_sources();
        source->set_name(record.name);
        source->set_host(record.host);
        source->set_port(record.port);
        source->set_last_seen_utc_us(record.last_seen_utc_us);
      }

      std::cout << "[ListSources] Returning " << response->sources_size() << " source(s)"
                << std::endl;
      return grpc::Status::OK;
    }

    void TransportControlImpl::UpdateSenderMetrics()
    {
      if (!metrics_exporter_ || !sender_)
      {
        return;
      }
      metrics_exporter_->SubmitSenderMetrics(sender_->config().name,
                                             telemetry::MakeSenderMetrics(*sender_));
    }

  } // namespace control
} // namespace aqueduct
