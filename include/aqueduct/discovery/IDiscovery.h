// Repository: Aqueduct
// Component: Discovery Interface
// Purpose: Capability that advertises senders and yields sender records.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_DISCOVERY_I_DISCOVERY_H_
#define AQUEDUCT_DISCOVERY_I_DISCOVERY_H_

#include <cstdint>
#include <string>
#include <vector>

namespace aqueduct::discovery {

// SenderRecord is what a receiver needs to open a connection.
struct SenderRecord {
  std::string name;
  std::string host;
  uint16_t port = 0;
  int64_t last_seen_utc_us = 0;
};

// IDiscovery advertises a local sender and browses for remote ones.
// The transport core only calls these three operations; the discovery
// protocol itself belongs to the implementation.
class IDiscovery {
 public:
  virtual ~IDiscovery() = default;

  // Registers a local sender under `name`, reachable on TCP `port`.
  virtual bool Advertise(const std::string& name, uint16_t port) = 0;

  // Returns the senders currently known (stale records excluded).
  virtual std::vector<SenderRecord> Browse() = 0;

  // Withdraws advertisements and stops background work.
  virtual void Stop() = 0;
};

}  // namespace aqueduct::discovery

#endif  // AQUEDUCT_DISCOVERY_I_DISCOVERY_H_
