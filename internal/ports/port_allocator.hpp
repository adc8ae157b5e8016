#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace sandbox::runtime::config {
class RuntimeConfig;
}

namespace sandbox::ports {

struct PortRange {
  uint32_t min = 0;
  uint32_t max = 0;

  uint32_t Size() const {
    return max >= min ? max - min + 1 : 0;
  }
  bool Contains(uint32_t port) const {
    return port >= min && port <= max;
  }
};

struct PortAllocatorOptions {
  PortRange   base{3000, 3999};
  PortRange   version{5000, 5999};
  std::string bind_host = "127.0.0.1";

  static PortAllocatorOptions FromConfig(const sandbox::runtime::config::RuntimeConfig& config);
};

struct ProjectPorts {
  uint32_t dev_port     = 0;
  uint32_t runtime_port = 0;
};

// True when the port can be bound right now.
using PortProbe = std::function<bool(uint32_t port)>;

/*
  PortAllocator

  Two sources of ports:
    - OS ephemeral ports (bind to :0) for preview containers
    - deterministic ports in fixed ranges for production, derived from a
      32-bit string hash of the project (and release) identity

  Every handed-out port is recorded in the ports table, so collisions
  survive restarts. A base port is probed forward through its range,
  wrapping once, until a port is found that is neither registered nor
  bound.
*/
class PortAllocator {
 public:
  PortAllocator(std::shared_ptr<db::Repository> repository, PortAllocatorOptions options, PortProbe probe = {},
                util::NowFn now = util::Now);

  // OS-assigned free port; the socket is closed before returning.
  uint32_t AllocatePort();

  bool IsPortAvailable(uint32_t port);

  // Idempotent per project. ResourceExhausted when the range is full.
  uint32_t AllocateProjectBasePort(const std::string& project_id);

  uint32_t DeriveVersionPort(const std::string& project_id, const std::string& hash) const;

  /*
    Records a port. Re-registering with the same owner is a no-op;
    returns false when the port belongs to someone else.
  */
  bool RegisterPort(uint32_t port, db::model::PortType type, const std::string& project_id = {}, const std::string& hash = {});

  void UnregisterPort(uint32_t port);

  std::vector<db::model::PortRecord> PortsForProject(const std::string& project_id);

  // Two distinct OS ports for a project's preview and runtime, recorded as dev.
  ProjectPorts AllocateProjectPorts(const std::string& project_id);

  // h = 31*h + c over the bytes, wrapping at 32 bits.
  static int32_t StableHash(std::string_view value);

  static uint32_t MapIntoRange(int32_t hash, const PortRange& range);

  const PortAllocatorOptions& Options() const {
    return options_;
  }

 private:
  bool BindProbe(uint32_t port) const;

  std::shared_ptr<db::Repository> repository_;
  PortAllocatorOptions            options_;
  PortProbe                       probe_;
  util::NowFn                     now_;
};

} // namespace sandbox::ports
