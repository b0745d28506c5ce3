// Repository: Aqueduct
// Component: Metrics HTTP Server
// Purpose: Minimal HTTP server for the Prometheus metrics endpoint.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_TELEMETRY_METRICS_HTTP_SERVER_H_
#define AQUEDUCT_TELEMETRY_METRICS_HTTP_SERVER_H_

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace aqueduct::telemetry {

// MetricsCallback is called to generate metrics text for each request.
using MetricsCallback = std::function<std::string()>;

// MetricsHTTPServer serves Prometheus metrics over HTTP.
//
// Routes:
// - GET /metrics: 200, text exposition format from the callback
// - GET /: 200, short info page
// - anything else: 404
//
// Thread Model:
// - Start() binds and listens on the caller's thread, so bind errors are
//   reported synchronously and port 0 resolves before Start() returns.
// - One server thread accepts (non-blocking, polled) and answers requests
//   one at a time. The callback runs on that thread.
class MetricsHTTPServer {
 public:
  // Port 0 binds an ephemeral port; see GetPort().
  explicit MetricsHTTPServer(int port = 9308);

  ~MetricsHTTPServer();

  MetricsHTTPServer(const MetricsHTTPServer&) = delete;
  MetricsHTTPServer& operator=(const MetricsHTTPServer&) = delete;

  // Must be called before Start().
  void SetMetricsCallback(MetricsCallback callback);

  bool Start();
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Bound port once started, otherwise the configured one.
  int GetPort() const { return port_; }

 private:
  void ServerLoop();
  void HandleConnection(int client_socket);
  std::string ParseRequest(const std::string& request);
  std::string GenerateResponse(const std::string& path);

  int port_;
  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;

  std::unique_ptr<std::thread> server_thread_;
  MetricsCallback metrics_callback_;

  int server_socket_;
};

}  // namespace aqueduct::telemetry

#endif  // AQUEDUCT_TELEMETRY_METRICS_HTTP_SERVER_H_
