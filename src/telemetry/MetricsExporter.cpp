// Repository: Aqueduct
// Component: Metrics Exporter
// Purpose: Collects sender, receiver and pool snapshots and exposes them at /metrics.
// Copyright (c) 2025 RetroVue

#include "aqueduct/telemetry/MetricsExporter.h"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

#include "aqueduct/telemetry/MetricsHTTPServer.h"

namespace aqueduct::telemetry {

namespace {
constexpr size_t kEventQueueCapacity = 1024;
}  // namespace

const char* EndpointStateToString(EndpointState state) {
  switch (state) {
    case EndpointState::STOPPED:
      return "stopped";
    case EndpointState::LISTENING:
      return "listening";
    case EndpointState::STREAMING:
      return "streaming";
    case EndpointState::ERROR_STATE:
      return "error";
    default:
      return "unknown";
  }
}

SenderMetrics MakeSenderMetrics(const sender::Sender& sender) {
  const sender::SenderStats stats = sender.GetStats();
  SenderMetrics metrics;
  if (!sender.IsRunning()) {
    metrics.state = EndpointState::STOPPED;
  } else if (stats.active_connections > 0) {
    metrics.state = EndpointState::STREAMING;
  } else {
    metrics.state = EndpointState::LISTENING;
  }
  metrics.active_connections = stats.active_connections;
  metrics.frames_sent = stats.frames_sent;
  metrics.frames_rejected = stats.frames_rejected;
  metrics.codec_errors = stats.codec_errors;
  metrics.bytes_sent = stats.bytes_sent;
  metrics.packets_dropped = stats.packets_dropped;
  for (const auto& info : sender.ListConnections()) {
    metrics.queue_high_water_bytes =
        std::max<uint64_t>(metrics.queue_high_water_bytes, info.high_water_bytes);
  }
  return metrics;
}

ReceiverMetrics MakeReceiverMetrics(const receiver::ReceiverStats& stats) {
  ReceiverMetrics metrics;
  if (stats.connected) {
    metrics.state = EndpointState::STREAMING;
  } else if (stats.close_reason != ErrorKind::kNone) {
    metrics.state = EndpointState::ERROR_STATE;
  } else {
    metrics.state = EndpointState::STOPPED;
  }
  metrics.packets_received = stats.packets_received;
  metrics.bytes_received = stats.bytes_received;
  metrics.frames_delivered = stats.frames_delivered;
  metrics.codec_errors = stats.codec_errors;
  metrics.clock_anomalies = stats.clock_anomalies;
  return metrics;
}

// ============================================================================
// EventQueue
// ============================================================================

MetricsExporter::EventQueue::EventQueue(size_t capacity) : capacity_(capacity) {}

bool MetricsExporter::EventQueue::Push(Event event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (events_.size() >= capacity_) {
    return false;
  }
  events_.push_back(std::move(event));
  return true;
}

bool MetricsExporter::EventQueue::Pop(Event& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (events_.empty()) {
    return false;
  }
  event = std::move(events_.front());
  events_.pop_front();
  return true;
}

bool MetricsExporter::EventQueue::Empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.empty();
}

// ============================================================================
// MetricsExporter
// ============================================================================

MetricsExporter::MetricsExporter(int port, bool enable_http)
    : port_(port),
      enable_http_(enable_http),
      running_(false),
      stop_requested_(false),
      http_server_(enable_http ? std::make_unique<MetricsHTTPServer>(port) : nullptr),
      queue_overflow_total_(0),
      event_queue_(kEventQueueCapacity),
      submitted_events_(0),
      processed_events_(0) {
  if (http_server_) {
    http_server_->SetMetricsCallback([this]() { return this->GenerateMetricsText(); });
  }
}

MetricsExporter::~MetricsExporter() {
  Stop();
}

bool MetricsExporter::Start(bool start_http_server) {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return false;
  }

  stop_requested_.store(false, std::memory_order_release);

  if (enable_http_ && start_http_server && http_server_) {
    if (!http_server_->Start()) {
      std::cerr << "[MetricsExporter] Failed to start HTTP server" << std::endl;
      running_.store(false, std::memory_order_release);
      return false;
    }
    port_ = http_server_->GetPort();
    std::cout << "[MetricsExporter] Metrics at http://localhost:" << port_ << "/metrics"
              << std::endl;
  }

  worker_thread_ = std::thread(&MetricsExporter::WorkerLoop, this);
  return true;
}

void MetricsExporter::Stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return;
  }

  stop_requested_.store(true, std::memory_order_release);
  queue_cv_.notify_all();

  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }

  if (enable_http_ && http_server_) {
    http_server_->Stop();
  }
}

int MetricsExporter::GetPort() const {
  return http_server_ ? http_server_->GetPort() : 0;
}

bool MetricsExporter::Enqueue(Event event) {
  if (!running_.load(std::memory_order_acquire)) {
    ApplyEvent(event);
    return true;
  }

  const std::string name = event.name;
  if (!event_queue_.Push(std::move(event))) {
    queue_overflow_total_.fetch_add(1, std::memory_order_acq_rel);
    std::cerr << "[MetricsExporter] Queue overflow while enqueuing update for '" << name
              << "'" << std::endl;
    return false;
  }

  submitted_events_.fetch_add(1, std::memory_order_acq_rel);
  queue_cv_.notify_one();
  return true;
}

bool MetricsExporter::SubmitSenderMetrics(const std::string& name,
                                          const SenderMetrics& metrics) {
  Event event;
  event.type = Event::Type::kUpdateSender;
  event.name = name;
  event.sender = metrics;
  return Enqueue(std::move(event));
}

bool MetricsExporter::SubmitReceiverMetrics(const std::string& name,
                                            const ReceiverMetrics& metrics) {
  Event event;
  event.type = Event::Type::kUpdateReceiver;
  event.name = name;
  event.receiver = metrics;
  return Enqueue(std::move(event));
}

bool MetricsExporter::SubmitPoolStats(const std::string& name,
                                      const buffer::BufferPoolStats& stats) {
  Event event;
  event.type = Event::Type::kUpdatePool;
  event.name = name;
  event.pool = stats;
  return Enqueue(std::move(event));
}

void MetricsExporter::SubmitRemoval(const std::string& name) {
  Event event;
  event.type = Event::Type::kRemove;
  event.name = name;
  Enqueue(std::move(event));
}

MetricsExporter::Snapshot MetricsExporter::SnapshotForTest() const {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  Snapshot snapshot;
  snapshot.senders = senders_;
  snapshot.receivers = receivers_;
  snapshot.pools = pools_;
  snapshot.queue_overflow_total = queue_overflow_total_.load(std::memory_order_acquire);
  return snapshot;
}

bool MetricsExporter::WaitUntilDrainedForTest(std::chrono::milliseconds timeout) {
  if (!running_.load(std::memory_order_acquire)) {
    return true;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (processed_events_.load(std::memory_order_acquire) >=
            submitted_events_.load(std::memory_order_acquire) &&
        event_queue_.Empty()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return false;
}

void MetricsExporter::WorkerLoop() {
  while (!stop_requested_.load(std::memory_order_acquire) || !event_queue_.Empty()) {
    Event event;
    if (event_queue_.Pop(event)) {
      ApplyEvent(event);
      processed_events_.fetch_add(1, std::memory_order_acq_rel);
      continue;
    }

    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, std::chrono::milliseconds(50));
  }
}

void MetricsExporter::ApplyEvent(const Event& event) {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  switch (event.type) {
    case Event::Type::kUpdateSender:
      senders_[event.name] = event.sender;
      break;
    case Event::Type::kUpdateReceiver:
      receivers_[event.name] = event.receiver;
      break;
    case Event::Type::kUpdatePool:
      pools_[event.name] = event.pool;
      break;
    case Event::Type::kRemove:
      senders_.erase(event.name);
      receivers_.erase(event.name);
      pools_.erase(event.name);
      std::cout << "[MetricsExporter] '" << event.name << "' removed from metrics" << std::endl;
      break;
  }
}

std::string MetricsExporter::GenerateMetricsText() const {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  std::ostringstream oss;

  oss << "# HELP aqueduct_metrics_overflow_total Number of dropped metric events due to queue overflow\n";
  oss << "# TYPE aqueduct_metrics_overflow_total counter\n";
  oss << "aqueduct_metrics_overflow_total " << queue_overflow_total_.load(std::memory_order_acquire)
      << "\n\n";

  oss << "# HELP aqueduct_sender_state Current state of the sender\n";
  oss << "# TYPE aqueduct_sender_state gauge\n";
  for (const auto& [name, m] : senders_) {
    oss << "aqueduct_sender_state{sender=\"" << name << "\",state=\""
        << EndpointStateToString(m.state) << "\"} " << static_cast<int>(m.state) << "\n";
  }

  oss << "\n# HELP aqueduct_sender_connections Open receiver connections\n";
  oss << "# TYPE aqueduct_sender_connections gauge\n";
  for (const auto& [name, m] : senders_) {
    oss << "aqueduct_sender_connections{sender=\"" << name << "\"} " << m.active_connections
        << "\n";
  }

  oss << "\n# HELP aqueduct_sender_frames_sent_total Frames framed and fanned out\n";
  oss << "# TYPE aqueduct_sender_frames_sent_total counter\n";
  for (const auto& [name, m] : senders_) {
    oss << "aqueduct_sender_frames_sent_total{sender=\"" << name << "\"} " << m.frames_sent
        << "\n";
  }

  oss << "\n# HELP aqueduct_sender_frames_rejected_total Frames rejected as invalid\n";
  oss << "# TYPE aqueduct_sender_frames_rejected_total counter\n";
  for (const auto& [name, m] : senders_) {
    oss << "aqueduct_sender_frames_rejected_total{sender=\"" << name << "\"} "
        << m.frames_rejected << "\n";
  }

  oss << "\n# HELP aqueduct_sender_codec_errors_total Frames dropped by the codec\n";
  oss << "# TYPE aqueduct_sender_codec_errors_total counter\n";
  for (const auto& [name, m] : senders_) {
    oss << "aqueduct_sender_codec_errors_total{sender=\"" << name << "\"} " << m.codec_errors
        << "\n";
  }

  oss << "\n# HELP aqueduct_sender_bytes_sent_total Bytes written to receivers\n";
  oss << "# TYPE aqueduct_sender_bytes_sent_total counter\n";
  for (const auto& [name, m] : senders_) {
    oss << "aqueduct_sender_bytes_sent_total{sender=\"" << name << "\"} " << m.bytes_sent
        << "\n";
  }

  oss << "\n# HELP aqueduct_sender_packets_dropped_total Packets evicted by the overload policy\n";
  oss << "# TYPE aqueduct_sender_packets_dropped_total counter\n";
  for (const auto& [name, m] : senders_) {
    oss << "aqueduct_sender_packets_dropped_total{sender=\"" << name << "\"} "
        << m.packets_dropped << "\n";
  }

  oss << "\n# HELP aqueduct_sender_queue_high_water_bytes Largest per-connection queue size\n";
  oss << "# TYPE aqueduct_sender_queue_high_water_bytes gauge\n";
  for (const auto& [name, m] : senders_) {
    oss << "aqueduct_sender_queue_high_water_bytes{sender=\"" << name << "\"} "
        << m.queue_high_water_bytes << "\n";
  }

  oss << "\n# HELP aqueduct_receiver_state Current state of the receiver\n";
  oss << "# TYPE aqueduct_receiver_state gauge\n";
  for (const auto& [name, m] : receivers_) {
    oss << "aqueduct_receiver_state{receiver=\"" << name << "\",state=\""
        << EndpointStateToString(m.state) << "\"} " << static_cast<int>(m.state) << "\n";
  }

  oss << "\n# HELP aqueduct_receiver_packets_total Packets reassembled\n";
  oss << "# TYPE aqueduct_receiver_packets_total counter\n";
  for (const auto& [name, m] : receivers_) {
    oss << "aqueduct_receiver_packets_total{receiver=\"" << name << "\"} "
        << m.packets_received << "\n";
  }

  oss << "\n# HELP aqueduct_receiver_bytes_total Bytes read from the sender\n";
  oss << "# TYPE aqueduct_receiver_bytes_total counter\n";
  for (const auto& [name, m] : receivers_) {
    oss << "aqueduct_receiver_bytes_total{receiver=\"" << name << "\"} " << m.bytes_received
        << "\n";
  }

  oss << "\n# HELP aqueduct_receiver_frames_delivered_total Decoded frames delivered\n";
  oss << "# TYPE aqueduct_receiver_frames_delivered_total counter\n";
  for (const auto& [name, m] : receivers_) {
    oss << "aqueduct_receiver_frames_delivered_total{receiver=\"" << name << "\"} "
        << m.frames_delivered << "\n";
  }

  oss << "\n# HELP aqueduct_receiver_codec_errors_total Frames dropped as undecodable\n";
  oss << "# TYPE aqueduct_receiver_codec_errors_total counter\n";
  for (const auto& [name, m] : receivers_) {
    oss << "aqueduct_receiver_codec_errors_total{receiver=\"" << name << "\"} "
        << m.codec_errors << "\n";
  }

  oss << "\n# HELP aqueduct_receiver_clock_anomalies_total Out-of-order or skewed timestamps\n";
  oss << "# TYPE aqueduct_receiver_clock_anomalies_total counter\n";
  for (const auto& [name, m] : receivers_) {
    oss << "aqueduct_receiver_clock_anomalies_total{receiver=\"" << name << "\"} "
        << m.clock_anomalies << "\n";
  }

  oss << "\n# HELP aqueduct_buffer_pool_outstanding_bytes Bytes checked out of the pool\n";
  oss << "# TYPE aqueduct_buffer_pool_outstanding_bytes gauge\n";
  for (const auto& [name, s] : pools_) {
    oss << "aqueduct_buffer_pool_outstanding_bytes{pool=\"" << name << "\"} "
        << s.outstanding_bytes << "\n";
  }

  oss << "\n# HELP aqueduct_buffer_pool_idle_bytes Bytes retained for reuse\n";
  oss << "# TYPE aqueduct_buffer_pool_idle_bytes gauge\n";
  for (const auto& [name, s] : pools_) {
    oss << "aqueduct_buffer_pool_idle_bytes{pool=\"" << name << "\"} " << s.idle_bytes << "\n";
  }

  oss << "\n# HELP aqueduct_buffer_pool_allocations_total Blocks allocated\n";
  oss << "# TYPE aqueduct_buffer_pool_allocations_total counter\n";
  for (const auto& [name, s] : pools_) {
    oss << "aqueduct_buffer_pool_allocations_total{pool=\"" << name << "\"} " << s.allocations
        << "\n";
  }

  oss << "\n# HELP aqueduct_buffer_pool_reuses_total Idle blocks handed out again\n";
  oss << "# TYPE aqueduct_buffer_pool_reuses_total counter\n";
  for (const auto& [name, s] : pools_) {
    oss << "aqueduct_buffer_pool_reuses_total{pool=\"" << name << "\"} " << s.reuses << "\n";
  }

  return oss.str();
}

}  // namespace aqueduct::telemetry
