// Repository: Aqueduct
// Component: UDP Broadcast Discovery
// Purpose: LAN sender discovery via periodic UDP announcement datagrams.
// Copyright (c) 2025 RetroVue

#include "aqueduct/discovery/UdpBroadcastDiscovery.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>

namespace aqueduct::discovery {

namespace {

constexpr int kInvalidSocket = -1;
constexpr int kPollSliceMs = 100;

std::string RecordKey(const SenderRecord& record) {
  return record.name + "@" + record.host + ":" + std::to_string(record.port);
}

void CopyName(char* dst, const std::string& src) {
  std::memset(dst, 0, kDiscoveryNameBytes);
  std::strncpy(dst, src.c_str(), kDiscoveryNameBytes - 1);
}

std::string ReadName(const char* src) {
  size_t len = 0;
  while (len < kDiscoveryNameBytes && src[len] != '\0') {
    ++len;
  }
  return std::string(src, len);
}

}  // namespace

UdpBroadcastDiscovery::UdpBroadcastDiscovery(const DiscoveryConfig& config,
                                             std::shared_ptr<timing::MasterClock> clock)
    : config_(config),
      clock_(clock ? std::move(clock) : timing::MakeSystemMasterClock()),
      stop_requested_(false),
      advertising_(false),
      browsing_(false),
      announce_socket_(kInvalidSocket),
      listen_socket_(kInvalidSocket) {}

UdpBroadcastDiscovery::~UdpBroadcastDiscovery() {
  Stop();
}

AnnouncementPacket UdpBroadcastDiscovery::EncodeAnnouncement(const std::string& name,
                                                             uint16_t port,
                                                             const std::string& hostname) {
  AnnouncementPacket packet;
  std::memset(&packet, 0, sizeof(packet));
  packet.magic = htonl(kDiscoveryMagic);
  packet.version = htonl(kDiscoveryVersion);
  packet.service_port = htonl(port);
  CopyName(packet.service_name, name);
  CopyName(packet.advertised_hostname, hostname);
  return packet;
}

bool UdpBroadcastDiscovery::DecodeAnnouncement(const void* data, size_t size,
                                               const std::string& source_host,
                                               SenderRecord* record) {
  if (data == nullptr || size != sizeof(AnnouncementPacket)) {
    return false;
  }
  AnnouncementPacket packet;
  std::memcpy(&packet, data, sizeof(packet));
  if (ntohl(packet.magic) != kDiscoveryMagic || ntohl(packet.version) != kDiscoveryVersion) {
    return false;
  }
  const uint32_t port = ntohl(packet.service_port);
  if (port == 0 || port > 65535) {
    return false;
  }
  const std::string name = ReadName(packet.service_name);
  if (name.empty()) {
    return false;
  }
  const std::string hostname = ReadName(packet.advertised_hostname);

  record->name = name;
  record->host = hostname.empty() ? source_host : hostname;
  record->port = static_cast<uint16_t>(port);
  return true;
}

bool UdpBroadcastDiscovery::Advertise(const std::string& name, uint16_t port) {
  if (advertising_.load(std::memory_order_acquire)) {
    std::cerr << "[Discovery] Already advertising" << std::endl;
    return false;
  }
  if (name.empty() || port == 0) {
    std::cerr << "[Discovery] Invalid advertisement: name='" << name << "' port=" << port
              << std::endl;
    return false;
  }

  announce_socket_ = socket(AF_INET, SOCK_DGRAM, 0);
  if (announce_socket_ < 0) {
    std::cerr << "[Discovery] Failed to create socket" << std::endl;
    announce_socket_ = kInvalidSocket;
    return false;
  }

  int broadcast = 1;
  if (setsockopt(announce_socket_, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
    std::cerr << "[Discovery] Failed to enable broadcast" << std::endl;
    close(announce_socket_);
    announce_socket_ = kInvalidSocket;
    return false;
  }

  stop_requested_.store(false, std::memory_order_release);
  advertising_.store(true, std::memory_order_release);
  announce_thread_ = std::make_unique<std::thread>(
      &UdpBroadcastDiscovery::AnnounceLoop, this,
      EncodeAnnouncement(name, port, config_.advertised_hostname));

  std::cout << "[Discovery] Advertising '" << name << "' (TCP " << port << " -> UDP "
            << config_.discovery_port << ")" << std::endl;
  return true;
}

void UdpBroadcastDiscovery::AnnounceLoop(AnnouncementPacket packet) {
  sockaddr_in broadcast_addr{};
  broadcast_addr.sin_family = AF_INET;
  broadcast_addr.sin_port = htons(config_.discovery_port);
  broadcast_addr.sin_addr.s_addr = htonl(INADDR_BROADCAST);

  sockaddr_in loopback_addr{};
  loopback_addr.sin_family = AF_INET;
  loopback_addr.sin_port = htons(config_.discovery_port);
  loopback_addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  bool warned = false;
  while (!stop_requested_.load(std::memory_order_acquire)) {
    const ssize_t sent = sendto(announce_socket_, &packet, sizeof(packet), 0,
                                reinterpret_cast<sockaddr*>(&broadcast_addr),
                                sizeof(broadcast_addr));
    if (sent < 0 && !warned) {
      std::cerr << "[Discovery] Broadcast announce failed: " << std::strerror(errno)
                << std::endl;
      warned = true;
    }
    if (config_.announce_loopback) {
      sendto(announce_socket_, &packet, sizeof(packet), 0,
             reinterpret_cast<sockaddr*>(&loopback_addr), sizeof(loopback_addr));
    }

    for (int waited = 0; waited < config_.announce_interval_ms &&
                         !stop_requested_.load(std::memory_order_acquire);
         waited += kPollSliceMs) {
      std::this_thread::sleep_for(std::chrono::milliseconds(kPollSliceMs));
    }
  }
}

bool UdpBroadcastDiscovery::StartBrowsing() {
  if (browsing_.load(std::memory_order_acquire)) {
    return true;
  }

  listen_socket_ = socket(AF_INET, SOCK_DGRAM, 0);
  if (listen_socket_ < 0) {
    std::cerr << "[Discovery] Failed to create listen socket" << std::endl;
    listen_socket_ = kInvalidSocket;
    return false;
  }

  int opt = 1;
  setsockopt(listen_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#ifdef SO_REUSEPORT
  setsockopt(listen_socket_, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt));
#endif

  // Receive timeout so the loop can notice Stop().
  timeval timeout;
  timeout.tv_sec = 0;
  timeout.tv_usec = kPollSliceMs * 1000;
  setsockopt(listen_socket_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(config_.discovery_port);
  if (bind(listen_socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::cerr << "[Discovery] Failed to bind UDP port " << config_.discovery_port << ": "
              << std::strerror(errno) << std::endl;
    close(listen_socket_);
    listen_socket_ = kInvalidSocket;
    return false;
  }

  stop_requested_.store(false, std::memory_order_release);
  browsing_.store(true, std::memory_order_release);
  listen_thread_ = std::make_unique<std::thread>(&UdpBroadcastDiscovery::ListenLoop, this);
  std::cout << "[Discovery] Browsing on UDP " << config_.discovery_port << std::endl;
  return true;
}

void UdpBroadcastDiscovery::ListenLoop() {
  AnnouncementPacket packet;
  while (!stop_requested_.load(std::memory_order_acquire)) {
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t received = recvfrom(listen_socket_, &packet, sizeof(packet), 0,
                                      reinterpret_cast<sockaddr*>(&from), &from_len);
    if (received < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        continue;
      }
      std::cerr << "[Discovery] recvfrom failed: " << std::strerror(errno) << std::endl;
      break;
    }

    char host[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &from.sin_addr, host, sizeof(host));

    SenderRecord record;
    if (DecodeAnnouncement(&packet, static_cast<size_t>(received), host, &record)) {
      RecordAnnouncement(record);
    }
  }
}

void UdpBroadcastDiscovery::RecordAnnouncement(const SenderRecord& record) {
  SenderRecord stamped = record;
  stamped.last_seen_utc_us = clock_->now_utc_us();

  std::lock_guard<std::mutex> lock(records_mutex_);
  const std::string key = RecordKey(stamped);
  if (records_.find(key) == records_.end()) {
    std::cout << "[Discovery] Found sender '" << stamped.name << "' at " << stamped.host << ":"
              << stamped.port << std::endl;
  }
  records_[key] = stamped;
}

std::vector<SenderRecord> UdpBroadcastDiscovery::Browse() {
  if (!browsing_.load(std::memory_order_acquire)) {
    StartBrowsing();
  }

  const int64_t now = clock_->now_utc_us();
  const int64_t ttl_us = static_cast<int64_t>(config_.record_ttl_ms) * 1000;

  std::vector<SenderRecord> result;
  std::lock_guard<std::mutex> lock(records_mutex_);
  for (auto it = records_.begin(); it != records_.end();) {
    if (now - it->second.last_seen_utc_us > ttl_us) {
      std::cout << "[Discovery] Sender '" << it->second.name << "' expired" << std::endl;
      it = records_.erase(it);
      continue;
    }
    result.push_back(it->second);
    ++it;
  }
  return result;
}

void UdpBroadcastDiscovery::Stop() {
  if (!advertising_.load(std::memory_order_acquire) &&
      !browsing_.load(std::memory_order_acquire)) {
    return;
  }

  stop_requested_.store(true, std::memory_order_release);

  if (announce_thread_ && announce_thread_->joinable()) {
    announce_thread_->join();
  }
  announce_thread_.reset();
  if (listen_thread_ && listen_thread_->joinable()) {
    listen_thread_->join();
  }
  listen_thread_.reset();

  if (announce_socket_ != kInvalidSocket) {
    close(announce_socket_);
    announce_socket_ = kInvalidSocket;
  }
  if (listen_socket_ != kInvalidSocket) {
    close(listen_socket_);
    listen_socket_ = kInvalidSocket;
  }

  advertising_.store(false, std::memory_order_release);
  browsing_.store(false, std::memory_order_release);
  std::cout << "[Discovery] Stopped" << std::endl;
}

}  // namespace aqueduct::discovery
