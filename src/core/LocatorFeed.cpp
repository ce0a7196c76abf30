/* @file LocatorFeed.cpp
 * @brief snapshot swap + id-set diff
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <string>
#include <unordered_set>

// PetCtl headers
#include "core/LocatorFeed.hpp"
#include "core/Logger.hpp"

using namespace petctl::core;

LocatorFeed::LocatorFeed(std::shared_ptr<Logger> log) : log_(std::move(log)) {}

LocatorFeed::SubscriptionId LocatorFeed::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto id = nextId_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void LocatorFeed::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mtx_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [id](const auto& l) { return l.first == id; }),
                   listeners_.end());
}

bool LocatorFeed::ingest(NpcList npcs, std::optional<Location> ping) {
  npcs = dedupe(std::move(npcs));

  LocatorNpcListChangeEvent event;
  std::vector<Listener> targets;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    const bool changed = !sameMembers(npcs_, npcs);
    npcs_ = std::move(npcs);
    ping_ = ping;
    if (!changed)
      return false;

    event.npcs = npcs_;
    targets.reserve(listeners_.size());
    for (const auto& [id, listener] : listeners_)
      targets.push_back(listener);
  }

  if (log_)
    log_->log(LogEvent::make(LogLevel::Info, "LocatorFeed",
                             "locator list changed, " + std::to_string(event.npcs.size()) +
                                 " npcs"));
  for (const auto& listener : targets)
    listener(event);
  return true;
}

NpcList LocatorFeed::npcs() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return npcs_;
}

std::optional<Location> LocatorFeed::ping() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return ping_;
}

NpcList LocatorFeed::dedupe(NpcList npcs) {
  std::unordered_set<int> seen;
  NpcList out;
  out.reserve(npcs.size());
  for (auto& npc : npcs) {
    if (seen.insert(npc.id).second)
      out.push_back(std::move(npc));
  }
  return out;
}

// both lists are already deduped, so equal size + containment == equal sets
bool LocatorFeed::sameMembers(const NpcList& a, const NpcList& b) {
  if (a.size() != b.size())
    return false;
  std::unordered_set<int> ids;
  for (const auto& npc : a)
    ids.insert(npc.id);
  return std::all_of(b.begin(), b.end(), [&](const NpcInfo& npc) { return ids.count(npc.id) > 0; });
}
