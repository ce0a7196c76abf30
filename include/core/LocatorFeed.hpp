#pragma once
/** @file  LocatorFeed.hpp
 *  @brief Latest pet-locator snapshot with membership-change notification.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

// PetCtl headers
#include "core/PetTypes.hpp"

namespace petctl {
  namespace core {

    class Logger;

    /**
 * @class LocatorFeed
 * @brief Replaced wholesale by the host on each ingestion tick.
 *
 *  * Emits LocatorNpcListChangeEvent only when the set of NPC ids changes;
 *    hp/shield churn on the same NPCs is absorbed silently.
 *  * Listeners run on the ingesting thread, outside the internal lock.
 */
    class LocatorFeed {
    public:
      using Listener = std::function<void(const LocatorNpcListChangeEvent&)>;
      using SubscriptionId = std::size_t;

      explicit LocatorFeed(std::shared_ptr<Logger> log = nullptr);

      SubscriptionId subscribe(Listener listener);
      void unsubscribe(SubscriptionId id);

      /**
       * Replace the snapshot. Duplicate ids in \p npcs keep the first entry.
       * @returns true if membership changed and listeners were notified.
       */
      bool ingest(NpcList npcs, std::optional<Location> ping);

      /// Locator unavailable: empty set, no ping.
      bool clear() { return ingest({}, std::nullopt); }

      /// Copy of the current set; empty when nothing was ingested.
      NpcList npcs() const;

      std::optional<Location> ping() const;

    private:
      static NpcList dedupe(NpcList npcs);
      static bool sameMembers(const NpcList& a, const NpcList& b);

      std::shared_ptr<Logger> log_;

      mutable std::mutex mtx_;
      NpcList npcs_;
      std::optional<Location> ping_;
      std::vector<std::pair<SubscriptionId, Listener>> listeners_;
      SubscriptionId nextId_{ 1 };
    };

  } // namespace core
} // namespace petctl
