#include "handler_registry.hpp"

#include "internal/util/errors.hpp"

namespace sandbox::queue {

void HandlerRegistry::Register(const std::string& type, JobHandler handler) {
  if (!handler) {
    throw util::InvalidArgument("empty handler for job type " + type);
  }

  std::lock_guard lock(mutex_);
  if (!handlers_.emplace(type, std::move(handler)).second) {
    throw util::AlreadyExists("handler already registered for job type " + type);
  }
}

JobHandler HandlerRegistry::Find(const std::string& type) const {
  std::lock_guard lock(mutex_);
  auto            it = handlers_.find(type);
  return it == handlers_.end() ? JobHandler{} : it->second;
}

std::vector<std::string> HandlerRegistry::Types() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> out;
  out.reserve(handlers_.size());
  for (const auto& [type, _] : handlers_) {
    out.push_back(type);
  }
  return out;
}

} // namespace sandbox::queue
