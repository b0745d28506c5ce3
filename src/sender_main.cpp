// Repository: Aqueduct
// Component: Sender Executable
// Purpose: Publishes a synthetic test stream; aqueduct_senderd also serves TransportControl.
// Copyright (c) 2025 RetroVue

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/capture/SyntheticSource.h"
#include "aqueduct/codec/CodecFactory.h"
#include "aqueduct/discovery/UdpBroadcastDiscovery.h"
#include "aqueduct/sender/Sender.h"
#include "aqueduct/telemetry/MetricsExporter.h"
#include "aqueduct/timing/MasterClock.h"

#ifdef AQUEDUCT_CONTROL_PLANE
#include <grpcpp/grpcpp.h>

#include "control_service.h"
#endif

namespace
{
  constexpr int kMetricsIntervalMs = 1000;

  std::atomic<bool> g_shutdown{false};

  void HandleSignal(int)
  {
    g_shutdown.store(true);
  }

  struct ParsedArgs
  {
    std::string name = "aqueduct";
    std::string bind_host = "0.0.0.0";
    int port = 6400;
    std::string codec = "passthrough";
    std::string policy = "block";
    int width = 640;
    int height = 360;
    double fps = 30.0;
    bool audio = true;
    uint64_t frames = 0;
    int duration_seconds = 0;
    bool advertise = true;
    int discovery_port = 6399;
    int metrics_port = 9308;
    int control_port = 50061;
  };

  ParsedArgs ParseArgs(int argc, char **argv)
  {
    ParsedArgs args;
    for (int i = 1; i < argc; ++i)
    {
      const std::string_view arg(argv[i]);
      if (arg == "--name" && i + 1 < argc)
      {
        args.name = argv[++i];
      }
      else if (arg == "--bind" && i + 1 < argc)
      {
        args.bind_host = argv[++i];
      }
      else if (arg == "--port" && i + 1 < argc)
      {
        args.port = std::stoi(argv[++i]);
      }
      else if (arg == "--codec" && i + 1 < argc)
      {
        args.codec = argv[++i];
      }
      else if (arg == "--policy" && i + 1 < argc)
      {
        args.policy = argv[++i];
      }
      else if (arg == "--width" && i + 1 < argc)
      {
        args.width = std::stoi(argv[++i]);
      }
      else if (arg == "--height" && i + 1 < argc)
      {
        args.height = std::stoi(argv[++i]);
      }
      else if (arg == "--fps" && i + 1 < argc)
      {
        args.fps = std::stod(argv[++i]);
      }
      else if (arg == "--no-audio")
      {
        args.audio = false;
      }
      else if (arg == "--frames" && i + 1 < argc)
      {
        args.frames = std::stoull(argv[++i]);
      }
      else if (arg == "--duration-seconds" && i + 1 < argc)
      {
        args.duration_seconds = std::stoi(argv[++i]);
      }
      else if (arg == "--no-advertise")
      {
        args.advertise = false;
      }
      else if (arg == "--discovery-port" && i + 1 < argc)
      {
        args.discovery_port = std::stoi(argv[++i]);
      }
      else if (arg == "--metrics-port" && i + 1 < argc)
      {
        args.metrics_port = std::stoi(argv[++i]);
      }
      else if (arg == "--control-port" && i + 1 < argc)
      {
        args.control_port = std::stoi(argv[++i]);
      }
      else
      {
        std::cerr << "[aqueduct_sender] Ignoring unknown argument: " << arg << std::endl;
      }
    }
    return args;
  }

  bool ParsePolicy(const std::string &value, aqueduct::buffer::OverloadPolicy *policy)
  {
    if (value == "block")
    {
      *policy = aqueduct::buffer::OverloadPolicy::kBlock;
      return true;
    }
    if (value == "drop-oldest")
    {
      *policy = aqueduct::buffer::OverloadPolicy::kDropOldest;
      return true;
    }
    return false;
  }

} // namespace

int main(int argc, char **argv)
{
  using namespace aqueduct;
  const ParsedArgs args = ParseArgs(argc, argv);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  if (args.port < 0 || args.port > 65535 || args.width <= 0 || args.height <= 0 ||
      args.fps <= 0.0)
  {
    std::cerr << "[aqueduct_sender] Invalid port, geometry or frame rate" << std::endl;
    return EXIT_FAILURE;
  }

  codec::CodecKind codec_kind;
  if (!codec::ParseCodecKind(args.codec, &codec_kind))
  {
    std::cerr << "[aqueduct_sender] Unknown codec: " << args.codec << std::endl;
    return EXIT_FAILURE;
  }
  auto codec = codec::MakeCodec(codec_kind);
  if (!codec)
  {
    std::cerr << "[aqueduct_sender] Codec unavailable in this build: " << args.codec
              << std::endl;
    return EXIT_FAILURE;
  }

  sender::SenderConfig sender_config;
  sender_config.name = args.name;
  sender_config.bind_host = args.bind_host;
  sender_config.port = static_cast<uint16_t>(args.port);
  sender_config.advertise = args.advertise;
  if (!ParsePolicy(args.policy, &sender_config.overload_policy))
  {
    std::cerr << "[aqueduct_sender] Unknown policy: " << args.policy
              << " (expected block or drop-oldest)" << std::endl;
    return EXIT_FAILURE;
  }

  auto clock = timing::MakeSystemMasterClock();

  auto pool = buffer::BufferPool::Create(buffer::BufferPoolConfig());
  if (!pool)
  {
    return EXIT_FAILURE;
  }

  discovery::DiscoveryConfig discovery_config;
  discovery_config.discovery_port = static_cast<uint16_t>(args.discovery_port);
  discovery::UdpBroadcastDiscovery discovery(discovery_config, clock);

  auto metrics = std::make_shared<telemetry::MetricsExporter>(args.metrics_port,
                                                              args.metrics_port > 0);
  if (!metrics->Start(args.metrics_port > 0))
  {
    std::cerr << "[aqueduct_sender] WARNING: Metrics exporter failed to start" << std::endl;
  }

  sender::Sender sender(sender_config, pool, std::move(codec), clock, &discovery);
  if (!sender.Start())
  {
    metrics->Stop();
    return EXIT_FAILURE;
  }

#ifdef AQUEDUCT_CONTROL_PLANE
  control::TransportControlImpl service(&sender, &discovery, metrics);

  const std::string control_address = "0.0.0.0:" + std::to_string(args.control_port);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(control_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server)
  {
    std::cerr << "[aqueduct_senderd] Failed to start control server on " << control_address
              << std::endl;
    sender.Stop();
    metrics->Stop();
    return EXIT_FAILURE;
  }
  std::cout << "[aqueduct_senderd] TransportControl listening on " << control_address
            << std::endl;
#endif

  capture::SyntheticSourceConfig source_config;
  source_config.label = args.name;
  source_config.width = static_cast<uint32_t>(args.width);
  source_config.height = static_cast<uint32_t>(args.height);
  source_config.target_fps = args.fps;
  source_config.audio_enabled = args.audio;
  source_config.samples_per_frame =
      static_cast<uint32_t>(source_config.sample_rate / args.fps);
  source_config.max_frames = args.frames;

  if (!sender.AttachSource(
          std::make_unique<capture::SyntheticSource>(source_config, pool, clock)))
  {
    sender.Stop();
    metrics->Stop();
    return EXIT_FAILURE;
  }

  std::cout << "[aqueduct_sender] Publishing '" << args.name << "' on port "
            << sender.GetPort() << " (" << args.width << "x" << args.height << " @ "
            << args.fps << " fps, codec " << sender.codec_name() << ")" << std::endl;

  const auto start_time = std::chrono::steady_clock::now();
  while (!g_shutdown.load())
  {
    if (sender.WaitForSources(kMetricsIntervalMs))
    {
      std::cout << "[aqueduct_sender] Source exhausted" << std::endl;
      break;
    }

    metrics->SubmitSenderMetrics(args.name, telemetry::MakeSenderMetrics(sender));
    metrics->SubmitPoolStats("sender", pool->GetStats());

    if (args.duration_seconds > 0 &&
        std::chrono::steady_clock::now() - start_time >=
            std::chrono::seconds(args.duration_seconds))
    {
      break;
    }
  }

#ifdef AQUEDUCT_CONTROL_PLANE
  server->Shutdown();
#endif

  sender.Stop();
  discovery.Stop();
  metrics->Stop();

  const sender::SenderStats stats = sender.GetStats();
  std::cout << "[aqueduct_sender] Done: frames_sent=" << stats.frames_sent
            << " bytes_sent=" << stats.bytes_sent
            << " connections=" << stats.connections_accepted << std::endl;
  return EXIT_SUCCESS;
}
