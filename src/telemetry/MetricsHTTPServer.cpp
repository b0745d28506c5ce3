// Repository: Aqueduct
// Component: Metrics HTTP Server
// Purpose: Minimal HTTP server for the Prometheus metrics endpoint.
// Copyright (c) 2025 RetroVue

#include "aqueduct/telemetry/MetricsHTTPServer.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <sstream>
#include <utility>

#define INVALID_SOCKET -1
#define SOCKET_ERROR -1
#define CLOSE_SOCKET close

namespace aqueduct::telemetry {

namespace {
constexpr int kAcceptPollMs = 100;
constexpr int kRequestTimeoutSec = 5;
}  // namespace

MetricsHTTPServer::MetricsHTTPServer(int port)
    : port_(port),
      running_(false),
      stop_requested_(false),
      server_socket_(INVALID_SOCKET) {}

MetricsHTTPServer::~MetricsHTTPServer() {
  Stop();
}

void MetricsHTTPServer::SetMetricsCallback(MetricsCallback callback) {
  metrics_callback_ = std::move(callback);
}

bool MetricsHTTPServer::Start() {
  if (running_.load(std::memory_order_acquire)) {
    std::cerr << "[MetricsHTTPServer] Already running" << std::endl;
    return false;
  }

  if (!metrics_callback_) {
    std::cerr << "[MetricsHTTPServer] Metrics callback not set" << std::endl;
    return false;
  }

  server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_socket_ == INVALID_SOCKET) {
    std::cerr << "[MetricsHTTPServer] Failed to create socket" << std::endl;
    return false;
  }

  int opt = 1;
  setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = INADDR_ANY;
  addr.sin_port = htons(static_cast<uint16_t>(port_));

  if (bind(server_socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == SOCKET_ERROR) {
    std::cerr << "[MetricsHTTPServer] Failed to bind socket to port " << port_ << ": "
              << std::strerror(errno) << std::endl;
    CLOSE_SOCKET(server_socket_);
    server_socket_ = INVALID_SOCKET;
    return false;
  }

  if (listen(server_socket_, 5) == SOCKET_ERROR) {
    std::cerr << "[MetricsHTTPServer] Failed to listen" << std::endl;
    CLOSE_SOCKET(server_socket_);
    server_socket_ = INVALID_SOCKET;
    return false;
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (getsockname(server_socket_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    port_ = ntohs(bound.sin_port);
  }

  // Non-blocking accept so the loop can notice Stop().
  int flags = fcntl(server_socket_, F_GETFL, 0);
  fcntl(server_socket_, F_SETFL, flags | O_NONBLOCK);

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  server_thread_ = std::make_unique<std::thread>(&MetricsHTTPServer::ServerLoop, this);

  std::cout << "[MetricsHTTPServer] Started on port " << port_ << std::endl;
  return true;
}

void MetricsHTTPServer::Stop() {
  if (!running_.load(std::memory_order_acquire) && !server_thread_) {
    return;
  }

  std::cout << "[MetricsHTTPServer] Stopping..." << std::endl;
  stop_requested_.store(true, std::memory_order_release);

  if (server_thread_ && server_thread_->joinable()) {
    server_thread_->join();
  }
  server_thread_.reset();

  if (server_socket_ != INVALID_SOCKET) {
    CLOSE_SOCKET(server_socket_);
    server_socket_ = INVALID_SOCKET;
  }

  running_.store(false, std::memory_order_release);
  std::cout << "[MetricsHTTPServer] Stopped" << std::endl;
}

void MetricsHTTPServer::ServerLoop() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);

    const int client_socket =
        accept(server_socket_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);

    if (client_socket == INVALID_SOCKET) {
      if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) {
        std::this_thread::sleep_for(std::chrono::milliseconds(kAcceptPollMs));
        continue;
      }
      std::cerr << "[MetricsHTTPServer] accept failed: " << std::strerror(errno) << std::endl;
      break;
    }

    // The listening socket is non-blocking; requests are read blocking.
    const int client_flags = fcntl(client_socket, F_GETFL, 0);
    fcntl(client_socket, F_SETFL, client_flags & ~O_NONBLOCK);

    HandleConnection(client_socket);
    CLOSE_SOCKET(client_socket);
  }
}

void MetricsHTTPServer::HandleConnection(int client_socket) {
  char buffer[4096] = {0};

  timeval timeout;
  timeout.tv_sec = kRequestTimeoutSec;
  timeout.tv_usec = 0;
  setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

  const ssize_t bytes_read = recv(client_socket, buffer, sizeof(buffer) - 1, 0);
  if (bytes_read <= 0) {
    return;
  }

  buffer[bytes_read] = '\0';
  const std::string path = ParseRequest(std::string(buffer));
  const std::string response = GenerateResponse(path);

  size_t offset = 0;
  while (offset < response.size()) {
    const ssize_t sent =
        send(client_socket, response.data() + offset, response.size() - offset, MSG_NOSIGNAL);
    if (sent <= 0) {
      break;
    }
    offset += static_cast<size_t>(sent);
  }
}

std::string MetricsHTTPServer::ParseRequest(const std::string& request) {
  // First line: GET /path HTTP/1.1
  const size_t space1 = request.find(' ');
  if (space1 == std::string::npos) {
    return "/";
  }
  const size_t space2 = request.find(' ', space1 + 1);
  if (space2 == std::string::npos) {
    return "/";
  }
  return request.substr(space1 + 1, space2 - space1 - 1);
}

std::string MetricsHTTPServer::GenerateResponse(const std::string& path) {
  std::ostringstream response;
  std::string body;

  if (path == "/metrics") {
    body = metrics_callback_();
    response << "HTTP/1.1 200 OK\r\n";
    response << "Content-Type: text/plain; version=0.0.4; charset=utf-8\r\n";
  } else if (path == "/") {
    body = "Aqueduct - Metrics Server\nMetrics available at: /metrics\n";
    response << "HTTP/1.1 200 OK\r\n";
    response << "Content-Type: text/plain\r\n";
  } else {
    body = "404 Not Found\n";
    response << "HTTP/1.1 404 Not Found\r\n";
    response << "Content-Type: text/plain\r\n";
  }

  response << "Content-Length: " << body.length() << "\r\n";
  response << "Connection: close\r\n";
  response << "\r\n";
  response << body;
  return response.str();
}

}  // namespace aqueduct::telemetry
