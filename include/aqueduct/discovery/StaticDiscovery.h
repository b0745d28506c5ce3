// Repository: Aqueduct
// Component: Static Discovery
// Purpose: In-process sender registry for direct host:port use and tests.
// Copyright (c) 2025 RetroVue

#ifndef AQUEDUCT_DISCOVERY_STATIC_DISCOVERY_H_
#define AQUEDUCT_DISCOVERY_STATIC_DISCOVERY_H_

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "aqueduct/discovery/IDiscovery.h"
#include "aqueduct/timing/MasterClock.h"

namespace aqueduct::discovery {

// StaticDiscovery keeps records in memory. Instances created from the same
// Registry see each other's advertisements, which lets a sender and a
// receiver in one process find each other without the network.
class StaticDiscovery : public IDiscovery {
 public:
  struct Registry {
    std::mutex mutex;
    std::vector<SenderRecord> records;
  };

  explicit StaticDiscovery(std::shared_ptr<Registry> registry = std::make_shared<Registry>(),
                           std::shared_ptr<timing::MasterClock> clock = nullptr);
  ~StaticDiscovery() override;

  // Advertised records use host 127.0.0.1.
  bool Advertise(const std::string& name, uint16_t port) override;
  std::vector<SenderRecord> Browse() override;
  void Stop() override;

  // Adds a record for a sender reached by explicit address.
  void AddRecord(const SenderRecord& record);

  const std::shared_ptr<Registry>& registry() const { return registry_; }

 private:
  std::shared_ptr<Registry> registry_;
  std::shared_ptr<timing::MasterClock> clock_;
  std::vector<std::pair<std::string, uint16_t>> advertised_;
};

}  // namespace aqueduct::discovery

#endif  // AQUEDUCT_DISCOVERY_STATIC_DISCOVERY_H_
