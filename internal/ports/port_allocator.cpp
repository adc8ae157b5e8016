#include "port_allocator.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "config/config.pb.h"
#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sandbox::ports {

using db::model::PortRecord;
using db::model::PortType;
using observability::IntField;
using observability::StringField;

namespace {

class Socket {
 public:
  Socket() : fd_(::socket(AF_INET, SOCK_STREAM, 0)) {
  }
  ~Socket() {
    if (fd_ >= 0) ::close(fd_);
  }
  Socket(const Socket&)            = delete;
  Socket& operator=(const Socket&) = delete;

  int Fd() const {
    return fd_;
  }

 private:
  int fd_;
};

sockaddr_in MakeAddress(const std::string& host, uint32_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(static_cast<uint16_t>(port));
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    throw util::InvalidArgument("invalid bind host: " + host);
  }
  return addr;
}

PortRange RangeOrDefault(const sandbox::runtime::config::PortRange& configured, PortRange fallback) {
  if (configured.min() == 0 || configured.max() < configured.min()) return fallback;
  return PortRange{configured.min(), configured.max()};
}

} // namespace

PortAllocatorOptions PortAllocatorOptions::FromConfig(const sandbox::runtime::config::RuntimeConfig& config) {
  PortAllocatorOptions options;
  options.base    = RangeOrDefault(config.ports().base(), options.base);
  options.version = RangeOrDefault(config.ports().version(), options.version);
  if (!config.ports().bind_host().empty()) options.bind_host = config.ports().bind_host();
  return options;
}

PortAllocator::PortAllocator(std::shared_ptr<db::Repository> repository, PortAllocatorOptions options, PortProbe probe, util::NowFn now)
    : repository_(std::move(repository)), options_(std::move(options)), probe_(std::move(probe)), now_(std::move(now)) {
  if (!probe_) {
    probe_ = [this](uint32_t port) { return BindProbe(port); };
  }
}

int32_t PortAllocator::StableHash(std::string_view value) {
  uint32_t h = 0;
  for (unsigned char c : value) {
    h = h * 31u + c;
  }
  return static_cast<int32_t>(h);
}

uint32_t PortAllocator::MapIntoRange(int32_t hash, const PortRange& range) {
  const int64_t magnitude = std::llabs(static_cast<int64_t>(hash));
  return range.min + static_cast<uint32_t>(magnitude % range.Size());
}

bool PortAllocator::BindProbe(uint32_t port) const {
  Socket sock;
  if (sock.Fd() < 0) return false;

  auto addr = MakeAddress(options_.bind_host, port);
  return ::bind(sock.Fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
}

bool PortAllocator::IsPortAvailable(uint32_t port) {
  return probe_(port);
}

uint32_t PortAllocator::AllocatePort() {
  Socket sock;
  if (sock.Fd() < 0) {
    throw util::ResourceExhausted(std::string("socket: ") + std::strerror(errno));
  }

  auto addr = MakeAddress(options_.bind_host, 0);
  if (::bind(sock.Fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw util::ResourceExhausted(std::string("bind: ") + std::strerror(errno));
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(sock.Fd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    throw util::ResourceExhausted(std::string("getsockname: ") + std::strerror(errno));
  }

  const uint32_t port = ntohs(addr.sin_port);
  SANDBOX_LOG_DEBUG("port allocated", {IntField("port", port)});
  return port;
}

uint32_t PortAllocator::AllocateProjectBasePort(const std::string& project_id) {
  const auto& range     = options_.base;
  const auto  preferred = MapIntoRange(StableHash(project_id), range);

  auto tx = repository_->Begin();

  for (const auto& existing : repository_->ListPortsForProject(*tx, project_id)) {
    if (existing.type == PortType::kBase) {
      tx->Commit();
      return existing.port;
    }
  }

  for (uint32_t i = 0; i < range.Size(); ++i) {
    const uint32_t port = range.min + (preferred - range.min + i) % range.Size();
    if (repository_->GetPort(*tx, port)) continue;
    if (!probe_(port)) continue;

    PortRecord record;
    record.port          = port;
    record.type          = PortType::kBase;
    record.project_id    = project_id;
    record.created_at_ms = util::NowMillis(now_);
    record.updated_at_ms = record.created_at_ms;
    db::ThrowIfDbError(repository_->InsertPort(*tx, record), "register base port");
    tx->Commit();

    if (port != preferred) {
      SANDBOX_LOG_WARN("preferred base port unavailable", {StringField("project_id", project_id), IntField("preferred", preferred),
                                                           IntField("port", port)});
    }
    SANDBOX_LOG_INFO("base port allocated", {StringField("project_id", project_id), IntField("port", port)});
    return port;
  }

  throw util::ResourceExhausted("no available base ports in range " + std::to_string(range.min) + "-" + std::to_string(range.max));
}

uint32_t PortAllocator::DeriveVersionPort(const std::string& project_id, const std::string& hash) const {
  return MapIntoRange(StableHash(project_id + ":" + hash), options_.version);
}

bool PortAllocator::RegisterPort(uint32_t port, PortType type, const std::string& project_id, const std::string& hash) {
  auto tx = repository_->Begin();

  if (auto existing = repository_->GetPort(*tx, port)) {
    tx->Commit();
    const bool same_owner = existing->type == type && existing->project_id == project_id && existing->hash == hash;
    if (!same_owner) {
      SANDBOX_LOG_WARN("port already registered", {IntField("port", port), StringField("owner", existing->project_id),
                                                   StringField("requested_by", project_id)});
    }
    return same_owner;
  }

  PortRecord record;
  record.port          = port;
  record.type          = type;
  record.project_id    = project_id;
  record.hash          = hash;
  record.created_at_ms = util::NowMillis(now_);
  record.updated_at_ms = record.created_at_ms;
  db::ThrowIfDbError(repository_->InsertPort(*tx, record), "register port");
  tx->Commit();

  SANDBOX_LOG_DEBUG("port registered", {IntField("port", port), StringField("type", db::model::ToString(type)),
                                        StringField("project_id", project_id)});
  return true;
}

void PortAllocator::UnregisterPort(uint32_t port) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeletePort(*tx, port), "unregister port");
  tx->Commit();
  SANDBOX_LOG_DEBUG("port unregistered", {IntField("port", port)});
}

std::vector<PortRecord> PortAllocator::PortsForProject(const std::string& project_id) {
  auto tx    = repository_->Begin();
  auto ports = repository_->ListPortsForProject(*tx, project_id);
  tx->Commit();
  return ports;
}

ProjectPorts PortAllocator::AllocateProjectPorts(const std::string& project_id) {
  constexpr int kMaxTries = 16;

  ProjectPorts ports;
  for (int attempt = 0; attempt < kMaxTries && ports.runtime_port == 0; ++attempt) {
    const auto candidate = AllocatePort();
    if (!RegisterPort(candidate, PortType::kDev, project_id)) continue;
    if (ports.dev_port == 0) {
      ports.dev_port = candidate;
    } else if (candidate != ports.dev_port) {
      ports.runtime_port = candidate;
    }
  }

  if (ports.runtime_port == 0) {
    if (ports.dev_port != 0) UnregisterPort(ports.dev_port);
    throw util::ResourceExhausted("could not allocate project ports for " + project_id);
  }

  SANDBOX_LOG_INFO("project ports allocated", {StringField("project_id", project_id), IntField("dev_port", ports.dev_port),
                                               IntField("runtime_port", ports.runtime_port)});
  return ports;
}

} // namespace sandbox::ports
