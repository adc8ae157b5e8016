#include "internal/ports/port_allocator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using sandbox::db::model::PortType;
using sandbox::ports::PortAllocator;
using sandbox::ports::PortAllocatorOptions;
using sandbox::ports::PortRange;

// Ports in `busy` report as bound by some other process.
struct FakePortProbe {
  std::shared_ptr<std::set<uint32_t>> busy = std::make_shared<std::set<uint32_t>>();

  sandbox::ports::PortProbe Fn() const {
    auto ports = busy;
    return [ports](uint32_t port) { return ports->count(port) == 0; };
  }
};

struct Fixture {
  std::shared_ptr<sandbox::db::memory::MemoryRepository> repository = std::make_shared<sandbox::db::memory::MemoryRepository>();
  FakePortProbe                                           probe;
  std::unique_ptr<PortAllocator>                          allocator;

  explicit Fixture(PortAllocatorOptions options = {}) {
    allocator = std::make_unique<PortAllocator>(repository, options, probe.Fn());
  }
};

void TestStableHashMatchesJavaStringHash() {
  assert(PortAllocator::StableHash("") == 0);
  assert(PortAllocator::StableHash("a") == 97);
  assert(PortAllocator::StableHash("proj1") == 106940532);
  // Wraps into negative values.
  assert(PortAllocator::StableHash("proj1:h1") == -1000285809);

  const PortRange base{3000, 3999};
  assert(PortAllocator::MapIntoRange(PortAllocator::StableHash("proj1"), base) == 3532);
  assert(PortAllocator::MapIntoRange(PortAllocator::StableHash("game-72"), base) == 3042);
  assert(PortAllocator::MapIntoRange(-1000285809, PortRange{5000, 5999}) == 5809);
}

void TestBasePortIsDeterministicAndIdempotent() {
  Fixture f;
  const auto port = f.allocator->AllocateProjectBasePort("game-72");
  assert(port == 3042);
  assert(f.allocator->AllocateProjectBasePort("game-72") == 3042);

  const auto ports = f.allocator->PortsForProject("game-72");
  assert(ports.size() == 1);
  assert(ports[0].type == PortType::kBase);

  // A fresh allocator over the same table sees the same assignment.
  PortAllocator restarted(f.repository, PortAllocatorOptions{}, f.probe.Fn());
  assert(restarted.AllocateProjectBasePort("game-72") == 3042);
}

void TestBasePortProbesForwardPastCollisions() {
  Fixture f;
  // Registered to someone else.
  assert(f.allocator->RegisterPort(3042, PortType::kBase, "other"));
  // Bound by an unrelated process.
  f.probe.busy->insert(3043);

  assert(f.allocator->AllocateProjectBasePort("game-72") == 3044);
}

void TestBasePortWrapsAroundTheRange() {
  PortAllocatorOptions options;
  options.base = PortRange{4000, 4009};
  Fixture f(options);

  const auto preferred = PortAllocator::MapIntoRange(PortAllocator::StableHash("proj1"), options.base);
  assert(preferred == 4002);
  for (uint32_t port = preferred; port <= options.base.max; ++port) {
    f.probe.busy->insert(port);
  }

  assert(f.allocator->AllocateProjectBasePort("proj1") == 4000);
}

void TestExhaustedRangeThrows() {
  PortAllocatorOptions options;
  options.base = PortRange{4000, 4001};
  Fixture f(options);
  f.probe.busy->insert(4000);
  f.probe.busy->insert(4001);

  bool threw = false;
  try {
    f.allocator->AllocateProjectBasePort("proj1");
  } catch (const sandbox::util::ResourceExhausted&) {
    threw = true;
  }
  assert(threw);
}

void TestRegisterPortOwnership() {
  Fixture f;
  assert(f.allocator->RegisterPort(5100, PortType::kVersion, "proj1", "h1"));
  // Same owner again is a no-op.
  assert(f.allocator->RegisterPort(5100, PortType::kVersion, "proj1", "h1"));
  // Anyone else collides.
  assert(!f.allocator->RegisterPort(5100, PortType::kVersion, "proj2", "h9"));

  f.allocator->UnregisterPort(5100);
  assert(f.allocator->RegisterPort(5100, PortType::kVersion, "proj2", "h9"));
}

void TestVersionPortDerivation() {
  Fixture f;
  assert(f.allocator->DeriveVersionPort("proj1", "h1") == 5809);
  assert(f.allocator->DeriveVersionPort("proj1", "h1") == f.allocator->DeriveVersionPort("proj1", "h1"));
}

void TestProjectPortsAreDistinctAndRecorded() {
  Fixture f;
  const auto ports = f.allocator->AllocateProjectPorts("proj1");
  assert(ports.dev_port != 0);
  assert(ports.runtime_port != 0);
  assert(ports.dev_port != ports.runtime_port);

  const auto recorded = f.allocator->PortsForProject("proj1");
  assert(recorded.size() == 2);
  for (const auto& record : recorded) {
    assert(record.type == PortType::kDev);
  }
}

} // namespace

int main() {
  TestStableHashMatchesJavaStringHash();
  TestBasePortIsDeterministicAndIdempotent();
  TestBasePortProbesForwardPastCollisions();
  TestBasePortWrapsAroundTheRange();
  TestExhaustedRangeThrows();
  TestRegisterPortOwnership();
  TestVersionPortDerivation();
  TestProjectPortsAreDistinctAndRecorded();

  std::cout << "sandbox_unit_port_allocator: pass\n";
  return 0;
}
