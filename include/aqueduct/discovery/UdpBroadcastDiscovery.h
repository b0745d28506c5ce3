// Repository: Aqueduct
// Component: UDP Broadcast Discovery
// Purpose: LAN sender discovery via periodic UDP announcement datagrams.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_DISCOVERY_UDP_BROADCAST_DISCOVERY_H_
#define AQUEDUCT_DISCOVERY_UDP_BROADCAST_DISCOVERY_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "aqueduct/discovery/IDiscovery.h"
#include "aqueduct/timing/MasterClock.h"

namespace aqueduct::discovery {

constexpr uint32_t kDiscoveryMagic = 0x41514443;  // "AQDC"
constexpr uint32_t kDiscoveryVersion = 1;
constexpr size_t kDiscoveryNameBytes = 64;

#pragma pack(push, 1)
// Announcement datagram. Integer fields are big-endian.
struct AnnouncementPacket {
  uint32_t magic;
  uint32_t version;
  uint32_t service_port;
  char service_name[kDiscoveryNameBytes];
  // Empty means "use the datagram's source address".
  char advertised_hostname[kDiscoveryNameBytes];
};
#pragma pack(pop)

struct DiscoveryConfig {
  uint16_t discovery_port = 6399;
  int announce_interval_ms = 1000;
  // Records not refreshed within this window are dropped from Browse().
  int record_ttl_ms = 5000;
  // Also announce to 127.0.0.1 so same-host receivers see us when
  // broadcast is filtered.
  bool announce_loopback = true;
  std::string advertised_hostname;
};

// UdpBroadcastDiscovery announces a sender to 255.255.255.255 (and
// loopback) on the discovery port and collects announcements from others.
//
// Thread Model:
// - Advertise() starts an announce thread.
// - StartBrowsing() (or the first Browse()) starts a listener thread.
// - Stop() ends both and closes their sockets.
class UdpBroadcastDiscovery : public IDiscovery {
 public:
  explicit UdpBroadcastDiscovery(const DiscoveryConfig& config = DiscoveryConfig(),
                                 std::shared_ptr<timing::MasterClock> clock = nullptr);
  ~UdpBroadcastDiscovery() override;

  UdpBroadcastDiscovery(const UdpBroadcastDiscovery&) = delete;
  UdpBroadcastDiscovery& operator=(const UdpBroadcastDiscovery&) = delete;

  bool Advertise(const std::string& name, uint16_t port) override;
  std::vector<SenderRecord> Browse() override;
  void Stop() override;

  // Binds the discovery port and starts collecting announcements.
  bool StartBrowsing();

  // Datagram codec, exposed for tests.
  static AnnouncementPacket EncodeAnnouncement(const std::string& name, uint16_t port,
                                               const std::string& hostname);
  // Returns false if the datagram is not a valid announcement.
  static bool DecodeAnnouncement(const void* data, size_t size,
                                 const std::string& source_host, SenderRecord* record);

 private:
  void AnnounceLoop(AnnouncementPacket packet);
  void ListenLoop();
  void RecordAnnouncement(const SenderRecord& record);

  const DiscoveryConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;

  std::atomic<bool> stop_requested_;
  std::atomic<bool> advertising_;
  std::atomic<bool> browsing_;

  int announce_socket_;
  int listen_socket_;
  std::unique_ptr<std::thread> announce_thread_;
  std::unique_ptr<std::thread> listen_thread_;

  mutable std::mutex records_mutex_;
  // Keyed by "name@host:port".
  std::map<std::string, SenderRecord> records_;
};

}  // namespace aqueduct::discovery

#endif  // AQUEDUCT_DISCOVERY_UDP_BROADCAST_DISCOVERY_H_
