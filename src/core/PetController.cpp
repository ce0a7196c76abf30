#include "core/PetController.hpp"
#include "core/Logger.hpp"

using namespace petctl::core;

PetController::PetController(const GameState& game, const Clock& clock, const PetConfig& cfg,
                             std::shared_ptr<ErrorMonitor> errMonitor,
                             std::shared_ptr<Logger> log)
    : game_(game), catalog_(cfg.gears), arbiter_(log),
      gears_(game, clock, cfg.gearGracePeriod, std::move(errMonitor), log), cooldowns_(game),
      locator_(log) {}

std::optional<PetGear> PetController::getGear() const {
  auto current = game_.currentGear();
  if (!current)
    return std::nullopt;
  return catalog_.resolve(*current);
}
