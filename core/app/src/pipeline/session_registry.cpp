#include "riskgate/pipeline/session_registry.hpp"

#include <algorithm>
#include <iostream>

namespace riskgate {

SessionRegistry::SessionRegistry(const domain::CapitalConfig& capital,
                                 const ITimeProvider& clock,
                                 SessionInitializer initializer,
                                 std::size_t fill_id_window)
    : capital_(capital),
      clock_(clock),
      initializer_(std::move(initializer)),
      fill_id_window_(fill_id_window) {}

std::shared_ptr<SessionContext> SessionRegistry::getOrCreate(
    const std::string& session_id) {
  std::promise<std::shared_ptr<SessionContext>> opened;
  std::shared_future<std::shared_ptr<SessionContext>> in_flight;
  {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
      return it->second;
    }
    auto opening = opening_.find(session_id);
    if (opening != opening_.end()) {
      in_flight = opening->second;
    } else {
      opening_.emplace(session_id, opened.get_future().share());
    }
  }
  if (in_flight.valid()) {
    // Another caller is recovering this session; rethrows its failure.
    return in_flight.get();
  }

  auto ctx = std::make_shared<SessionContext>(
      session_id, capital_.initial_capital,
      std::max(capital_.initial_capital, capital_.peak_equity), clock_,
      fill_id_window_);
  try {
    if (initializer_) {
      initializer_(*ctx);
    }
  } catch (...) {
    {
      std::lock_guard lock(mutex_);
      opening_.erase(session_id);
    }
    opened.set_exception(std::current_exception());
    throw;
  }

  std::size_t open = 0;
  {
    std::lock_guard lock(mutex_);
    sessions_.emplace(session_id, ctx);
    opening_.erase(session_id);
    open = sessions_.size();
  }
  opened.set_value(ctx);
  std::cout << "[SessionRegistry] opened session '" << session_id << "' ("
            << open << " open)" << std::endl;
  return ctx;
}

std::shared_ptr<SessionContext> SessionRegistry::find(
    const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto it = sessions_.find(session_id);
  return it != sessions_.end() ? it->second : nullptr;
}

std::vector<std::string> SessionRegistry::sessionIds() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(sessions_.size());
  for (const auto& entry : sessions_) {
    ids.push_back(entry.first);
  }
  return ids;
}

std::vector<std::shared_ptr<SessionContext>> SessionRegistry::all() const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<SessionContext>> out;
  out.reserve(sessions_.size());
  for (const auto& entry : sessions_) {
    out.push_back(entry.second);
  }
  return out;
}

bool SessionRegistry::close(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  if (sessions_.erase(session_id) == 0) {
    return false;
  }
  std::cout << "[SessionRegistry] closed session '" << session_id << "'"
            << std::endl;
  return true;
}

std::size_t SessionRegistry::size() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

}  // namespace riskgate
