// Repository: Aqueduct
// Component: Metrics Exporter
// Purpose: Collects sender, receiver and pool snapshots and exposes them at /metrics.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_TELEMETRY_METRICS_EXPORTER_H_
#define AQUEDUCT_TELEMETRY_METRICS_EXPORTER_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "aqueduct/buffer/BufferPool.h"
#include "aqueduct/receiver/Receiver.h"
#include "aqueduct/sender/Sender.h"

namespace aqueduct::telemetry {

class MetricsHTTPServer;

// EndpointState is the lifecycle state of a sender or receiver.
enum class EndpointState {
  STOPPED = 0,
  LISTENING = 1,   // Sender up, no receivers
  STREAMING = 2,   // Sender with receivers, or receiver connected
  ERROR_STATE = 3, // Receiver closed by an error
};

const char* EndpointStateToString(EndpointState state);

struct SenderMetrics {
  EndpointState state = EndpointState::STOPPED;
  uint64_t active_connections = 0;
  uint64_t frames_sent = 0;
  uint64_t frames_rejected = 0;
  uint64_t codec_errors = 0;
  uint64_t bytes_sent = 0;
  uint64_t packets_dropped = 0;
  uint64_t queue_high_water_bytes = 0;  // Largest across open connections
};

struct ReceiverMetrics {
  EndpointState state = EndpointState::STOPPED;
  uint64_t packets_received = 0;
  uint64_t bytes_received = 0;
  uint64_t frames_delivered = 0;
  uint64_t codec_errors = 0;
  uint64_t clock_anomalies = 0;
};

// Snapshot builders for the transport's own stats types.
SenderMetrics MakeSenderMetrics(const sender::Sender& sender);
ReceiverMetrics MakeReceiverMetrics(const receiver::ReceiverStats& stats);

// MetricsExporter serves Prometheus metrics at an HTTP endpoint.
//
// Submissions never block the caller: while running they are queued to a
// worker thread, and a full queue drops the update and counts an overflow.
// Before Start() they are applied synchronously.
//
// Metrics Exported:
// - aqueduct_sender_state{sender="N",state="S"} - gauge
// - aqueduct_sender_connections{sender="N"} - gauge
// - aqueduct_sender_frames_sent_total{sender="N"} - counter
// - aqueduct_sender_codec_errors_total{sender="N"} - counter
// - aqueduct_receiver_packets_total{receiver="N"} - counter
// - aqueduct_receiver_clock_anomalies_total{receiver="N"} - counter
// - aqueduct_buffer_pool_outstanding_bytes{pool="N"} - gauge
// (and the related counters listed in GenerateMetricsText()).
class MetricsExporter {
 public:
  struct Snapshot {
    std::map<std::string, SenderMetrics> senders;
    std::map<std::string, ReceiverMetrics> receivers;
    std::map<std::string, buffer::BufferPoolStats> pools;
    uint64_t queue_overflow_total = 0;
  };

  explicit MetricsExporter(int port = 9308, bool enable_http = true);
  ~MetricsExporter();

  MetricsExporter(const MetricsExporter&) = delete;
  MetricsExporter& operator=(const MetricsExporter&) = delete;

  bool Start(bool start_http_server = true);
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Port the HTTP server is bound to (0 if disabled).
  int GetPort() const;

  bool SubmitSenderMetrics(const std::string& name, const SenderMetrics& metrics);
  bool SubmitReceiverMetrics(const std::string& name, const ReceiverMetrics& metrics);
  bool SubmitPoolStats(const std::string& name, const buffer::BufferPoolStats& stats);

  // Removes a sender or receiver (and its series) by name.
  void SubmitRemoval(const std::string& name);

  // Generates Prometheus-format metrics text.
  std::string GenerateMetricsText() const;

  // Test helpers.
  Snapshot SnapshotForTest() const;
  bool WaitUntilDrainedForTest(std::chrono::milliseconds timeout);

  uint64_t queue_overflow_total() const {
    return queue_overflow_total_.load(std::memory_order_acquire);
  }

 private:
  struct Event {
    enum class Type {
      kUpdateSender,
      kUpdateReceiver,
      kUpdatePool,
      kRemove,
    };

    Type type = Type::kRemove;
    std::string name;
    SenderMetrics sender;
    ReceiverMetrics receiver;
    buffer::BufferPoolStats pool;
  };

  // Bounded multi-producer queue drained by the worker thread.
  class EventQueue {
   public:
    explicit EventQueue(size_t capacity);

    bool Push(Event event);
    bool Pop(Event& event);
    bool Empty() const;

   private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<Event> events_;
  };

  bool Enqueue(Event event);
  void WorkerLoop();
  void ApplyEvent(const Event& event);

  int port_;
  const bool enable_http_;
  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;

  std::unique_ptr<MetricsHTTPServer> http_server_;

  std::atomic<uint64_t> queue_overflow_total_;
  EventQueue event_queue_;
  std::atomic<uint64_t> submitted_events_;
  std::atomic<uint64_t> processed_events_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::thread worker_thread_;

  mutable std::mutex metrics_mutex_;
  std::map<std::string, SenderMetrics> senders_;
  std::map<std::string, ReceiverMetrics> receivers_;
  std::map<std::string, buffer::BufferPoolStats> pools_;
};

}  // namespace aqueduct::telemetry

#endif  // AQUEDUCT_TELEMETRY_METRICS_EXPORTER_H_
