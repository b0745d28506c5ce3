// Repository: Aqueduct
// Component: Receiver Executable
// Purpose: Connects to a sender (discovered or direct) and prints or previews its stream.
// Copyright (c) 2025 RetroVue

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/buffer/FrameRingBuffer.h"
#include "aqueduct/codec/CodecFactory.h"
#include "aqueduct/discovery/UdpBroadcastDiscovery.h"
#include "aqueduct/receiver/Receiver.h"
#include "aqueduct/renderer/FrameRenderer.h"
#include "aqueduct/telemetry/MetricsExporter.h"
#include "aqueduct/timing/MasterClock.h"

namespace
{
  constexpr size_t kPreviewBufferFrames = 8;
  constexpr uint64_t kSummaryInterval = 100;
  constexpr int kPollIntervalMs = 250;

  std::atomic<bool> g_shutdown{false};

  void HandleSignal(int)
  {
    g_shutdown.store(true);
  }

  struct ParsedArgs
  {
    std::string host;
    int port = 6400;
    std::string source_name;
    int discover_seconds = 5;
    int discovery_port = 6399;
    std::string codec = "ffv1";
    bool preview = false;
    bool verbose = false;
    int max_skew_ms = 0;
    int metrics_port = 0;
  };

  ParsedArgs ParseArgs(int argc, char **argv)
  {
    ParsedArgs args;
    for (int i = 1; i < argc; ++i)
    {
      const std::string_view arg(argv[i]);
      if (arg == "--host" && i + 1 < argc)
      {
        args.host = argv[++i];
      }
      else if (arg == "--port" && i + 1 < argc)
      {
        args.port = std::stoi(argv[++i]);
      }
      else if (arg == "--source" && i + 1 < argc)
      {
        args.source_name = argv[++i];
      }
      else if (arg == "--discover-seconds" && i + 1 < argc)
      {
        args.discover_seconds = std::stoi(argv[++i]);
      }
      else if (arg == "--discovery-port" && i + 1 < argc)
      {
        args.discovery_port = std::stoi(argv[++i]);
      }
      else if (arg == "--codec" && i + 1 < argc)
      {
        args.codec = argv[++i];
      }
      else if (arg == "--preview")
      {
        args.preview = true;
      }
      else if (arg == "--verbose")
      {
        args.verbose = true;
      }
      else if (arg == "--max-skew-ms" && i + 1 < argc)
      {
        args.max_skew_ms = std::stoi(argv[++i]);
      }
      else if (arg == "--metrics-port" && i + 1 < argc)
      {
        args.metrics_port = std::stoi(argv[++i]);
      }
      else
      {
        std::cerr << "[aqueduct_receiver] Ignoring unknown argument: " << arg << std::endl;
      }
    }
    return args;
  }

  // Browses until a sender (named `name`, or any when empty) shows up.
  std::optional<aqueduct::discovery::SenderRecord> FindSender(
      aqueduct::discovery::IDiscovery &discovery, const std::string &name, int timeout_seconds)
  {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    while (!g_shutdown.load() && std::chrono::steady_clock::now() < deadline)
    {
      for (const auto &record : discovery.Browse())
      {
        if (name.empty() || record.name == name)
        {
          return record;
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
    }
    return std::nullopt;
  }

} // namespace

int main(int argc, char **argv)
{
  using namespace aqueduct;
  const ParsedArgs args = ParseArgs(argc, argv);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  codec::CodecKind codec_kind;
  if (!codec::ParseCodecKind(args.codec, &codec_kind))
  {
    std::cerr << "[aqueduct_receiver] Unknown codec: " << args.codec << std::endl;
    return EXIT_FAILURE;
  }

  auto clock = timing::MakeSystemMasterClock();
  auto pool = buffer::BufferPool::Create(buffer::BufferPoolConfig());
  if (!pool)
  {
    return EXIT_FAILURE;
  }

  discovery::SenderRecord target;
  if (!args.host.empty())
  {
    if (args.port <= 0 || args.port > 65535)
    {
      std::cerr << "[aqueduct_receiver] Invalid port: " << args.port << std::endl;
      return EXIT_FAILURE;
    }
    target.name = args.host;
    target.host = args.host;
    target.port = static_cast<uint16_t>(args.port);
  }
  else
  {
    discovery::DiscoveryConfig discovery_config;
    discovery_config.discovery_port = static_cast<uint16_t>(args.discovery_port);
    discovery::UdpBroadcastDiscovery discovery(discovery_config, clock);

    std::cout << "[aqueduct_receiver] Browsing for "
              << (args.source_name.empty() ? std::string("any sender")
                                           : "'" + args.source_name + "'")
              << "..." << std::endl;
    auto found = FindSender(discovery, args.source_name, args.discover_seconds);
    discovery.Stop();
    if (!found)
    {
      std::cerr << "[aqueduct_receiver] No sender found" << std::endl;
      return EXIT_FAILURE;
    }
    target = *found;
  }

  // Preview hand-off: the read thread produces, the renderer consumes.
  buffer::FrameRingBuffer preview_buffer(kPreviewBufferFrames);
  std::unique_ptr<renderer::FrameRenderer> renderer;
  if (args.preview)
  {
    renderer::RenderConfig render_config;
    render_config.mode = renderer::RenderMode::PREVIEW;
    render_config.window_title = "Aqueduct - " + target.name;
    renderer = renderer::FrameRenderer::Create(render_config, preview_buffer, clock);
    if (!renderer->Start())
    {
      std::cerr << "[aqueduct_receiver] WARNING: Preview unavailable, continuing without it"
                << std::endl;
      renderer.reset();
    }
  }

  std::atomic<uint64_t> packet_count{0};
  std::atomic<uint64_t> preview_overflow{0};

  receiver::ReceiverCallbacks callbacks;
  callbacks.on_packet = [&](const wire::Packet &packet, sync::SyncVerdict verdict)
  {
    const uint64_t count = packet_count.fetch_add(1) + 1;
    if (args.verbose)
    {
      std::cout << "[aqueduct_receiver] " << wire::PacketTypeToString(packet.header.type)
                << " ts=" << packet.header.timestamp_us
                << " len=" << packet.header.length
                << " flags=0x" << std::hex << packet.header.flags << std::dec
                << " sync=" << sync::SyncVerdictToString(verdict) << std::endl;
    }
    else if (count % kSummaryInterval == 0)
    {
      std::cout << "[aqueduct_receiver] " << count << " packets received" << std::endl;
    }
  };
  callbacks.on_frame = [&](media::MediaFrame &&frame)
  {
    if (!renderer || frame.type != wire::PacketType::kVideo)
    {
      return;
    }
    if (!preview_buffer.Push(std::move(frame)))
    {
      preview_overflow.fetch_add(1);
    }
  };
  callbacks.on_clock_anomaly = [](wire::PacketType type, uint64_t timestamp_us,
                                  sync::SyncVerdict verdict)
  {
    std::cerr << "[aqueduct_receiver] Clock anomaly on " << wire::PacketTypeToString(type)
              << " at " << timestamp_us << "us: " << sync::SyncVerdictToString(verdict)
              << std::endl;
  };
  callbacks.on_closed = [](ErrorKind reason)
  {
    std::cout << "[aqueduct_receiver] Connection closed: " << ErrorKindToString(reason)
              << std::endl;
  };

  receiver::ReceiverConfig receiver_config;
  receiver_config.max_skew_us = static_cast<uint64_t>(args.max_skew_ms) * 1'000;
  receiver::Receiver receiver(receiver_config, pool, codec::MakeCodec(codec_kind),
                              std::move(callbacks));

  std::shared_ptr<telemetry::MetricsExporter> metrics;
  if (args.metrics_port > 0)
  {
    metrics = std::make_shared<telemetry::MetricsExporter>(args.metrics_port);
    if (!metrics->Start())
    {
      std::cerr << "[aqueduct_receiver] WARNING: Metrics exporter failed to start"
                << std::endl;
      metrics.reset();
    }
  }

  if (!receiver.Connect(target))
  {
    if (renderer)
    {
      renderer->Stop();
    }
    if (metrics)
    {
      metrics->Stop();
    }
    return EXIT_FAILURE;
  }

  std::cout << "[aqueduct_receiver] Receiving from '" << target.name << "' at "
            << target.host << ":" << target.port << std::endl;

  while (!g_shutdown.load())
  {
    if (receiver.WaitForClose(kPollIntervalMs))
    {
      break;
    }
    if (metrics)
    {
      metrics->SubmitReceiverMetrics(receiver_config.name,
                                     telemetry::MakeReceiverMetrics(receiver.GetStats()));
      metrics->SubmitPoolStats("receiver", pool->GetStats());
    }
  }

  receiver.Close();
  if (renderer)
  {
    renderer->Stop();
  }
  if (metrics)
  {
    metrics->Stop();
  }

  const receiver::ReceiverStats stats = receiver.GetStats();
  std::cout << "[aqueduct_receiver] Done: packets=" << stats.packets_received
            << " bytes=" << stats.bytes_received
            << " frames=" << stats.frames_delivered
            << " codec_errors=" << stats.codec_errors
            << " clock_anomalies=" << stats.clock_anomalies
            << " preview_overflow=" << preview_overflow.load()
            << " reason=" << ErrorKindToString(stats.close_reason) << std::endl;

  const bool clean = stats.close_reason == ErrorKind::kNone ||
                     stats.close_reason == ErrorKind::kConnectionClosed;
  return clean ? EXIT_SUCCESS : EXIT_FAILURE;
}
