// Repository: Aqueduct
// Component: Static Discovery
// Purpose: In-process sender registry for direct host:port use and tests.
// Copyright (c) 2025 RetroVue

#include "aqueduct/discovery/StaticDiscovery.h"

#include <algorithm>
#include <iostream>
#include <utility>

namespace aqueduct::discovery {

StaticDiscovery::StaticDiscovery(std::shared_ptr<Registry> registry,
                                 std::shared_ptr<timing::MasterClock> clock)
    : registry_(registry ? std::move(registry) : std::make_shared<Registry>()),
      clock_(clock ? std::move(clock) : timing::MakeSystemMasterClock()) {}

StaticDiscovery::~StaticDiscovery() {
  Stop();
}

bool StaticDiscovery::Advertise(const std::string& name, uint16_t port) {
  if (name.empty() || port == 0) {
    std::cerr << "[StaticDiscovery] Refusing to advertise '" << name << "' on port " << port
              << std::endl;
    return false;
  }
  SenderRecord record;
  record.name = name;
  record.host = "127.0.0.1";
  record.port = port;
  AddRecord(record);
  advertised_.emplace_back(name, port);
  std::cout << "[StaticDiscovery] Advertised " << name << " on port " << port << std::endl;
  return true;
}

void StaticDiscovery::AddRecord(const SenderRecord& record) {
  SenderRecord stamped = record;
  stamped.last_seen_utc_us = clock_->now_utc_us();

  std::lock_guard<std::mutex> lock(registry_->mutex);
  auto& records = registry_->records;
  auto it = std::find_if(records.begin(), records.end(), [&](const SenderRecord& r) {
    return r.name == stamped.name && r.host == stamped.host && r.port == stamped.port;
  });
  if (it != records.end()) {
    *it = stamped;
  } else {
    records.push_back(stamped);
  }
}

std::vector<SenderRecord> StaticDiscovery::Browse() {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  return registry_->records;
}

void StaticDiscovery::Stop() {
  if (advertised_.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(registry_->mutex);
  auto& records = registry_->records;
  for (const auto& ad : advertised_) {
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&](const SenderRecord& r) {
                                   return r.name == ad.first && r.port == ad.second &&
                                          r.host == "127.0.0.1";
                                 }),
                  records.end());
  }
  advertised_.clear();
}

}  // namespace aqueduct::discovery
