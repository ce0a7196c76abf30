// PetCtl-Prod headers
#include "core/ItemNotEquippedError.hpp"
#include "core/ModuleFactory.hpp"
#include "core/PetController.hpp"
#include "core/PetSession.hpp"
#include "core/SystemCoordinator.hpp"
#include "core/UserSettings.hpp"
#include "modules/BehaviorModule.hpp"

// PetCtl-Fake headers
#include "FakeClock.hpp"
#include "FakeGameState.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>

namespace petctl::test {

  using namespace std::chrono_literals;
  using core::ModuleFactory;
  using core::PetController;
  using core::PetDirective;
  using core::SystemCoordinator;

  /// Module whose tick body is supplied by the test.
  class ScriptedModule : public modules::BehaviorModule {
  public:
    ScriptedModule(std::string name, std::function<void(PetController&)> body)
        : name_(std::move(name)), body_(std::move(body)) {}

    std::string name() const override { return name_; }
    void onTick(PetController& pet) override { body_(pet); }

  private:
    std::string name_;
    std::function<void(PetController&)> body_;
  };

  class CoordinatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      cfg.petEnabled = true;
      cfg.defaultGear = 1;
      cfg.gearGracePeriod = 5000ms;
      game.equipped = { 1, 2, 4 };

      settings = std::make_unique<core::UserSettings>(cfg);
      pet = std::make_unique<PetController>(game, clock, cfg,
                                            std::make_shared<core::ErrorMonitor>());

      registerScript("farmer", [](PetController& p) {
        p.setEnabled(true);
        p.setGear(2);
      });
      registerScript("escort", [](PetController& p) { p.setEnabled(false); });
      registerScript("lazy", [](PetController&) {});
      registerScript("broken", [](PetController& p) {
        p.setEnabled(true);
        p.setGear(99);
      });

      coordinator = std::make_unique<SystemCoordinator>(*pet, *settings, factory);
    }

    void registerScript(const std::string& name, std::function<void(PetController&)> body) {
      factory.registerModule(name, [name, body] {
        return std::make_unique<ScriptedModule>(name, body);
      });
    }

    core::PetConfig cfg;
    FakeGameState game;
    FakeClock clock;
    ModuleFactory factory;
    std::unique_ptr<core::UserSettings> settings;
    std::unique_ptr<PetController> pet;
    std::unique_ptr<SystemCoordinator> coordinator;
  };

  TEST_F(CoordinatorTest, IdleUntilStarted) {
    coordinator->setModule("farmer");
    auto d = coordinator->tick();
    EXPECT_FALSE(d.deploy);
    EXPECT_FALSE(pet->isEnabled()); // module not run while stopped
    EXPECT_EQ(coordinator->state(), SystemCoordinator::State::IDLE);
  }

  TEST_F(CoordinatorTest, DeploysWhenModuleAndUserAgree) {
    coordinator->setModule("farmer");
    coordinator->start();
    auto d = coordinator->tick();
    EXPECT_EQ(d, (PetDirective{ true, 2, false }));
    EXPECT_EQ(coordinator->state(), SystemCoordinator::State::OPERATING);
  }

  TEST_F(CoordinatorTest, UserSwitchGatesDeployment) {
    settings->setPetEnabled(false);
    coordinator->setModule("farmer");
    coordinator->start();
    auto d = coordinator->tick();
    EXPECT_TRUE(pet->isEnabled());
    EXPECT_FALSE(d.deploy);
    EXPECT_EQ(coordinator->state(), SystemCoordinator::State::DISABLED);
  }

  TEST_F(CoordinatorTest, LazyModuleInheritsPreviousFlag) {
    coordinator->start();
    coordinator->setModule("farmer");
    coordinator->tick();
    coordinator->setModule("lazy");
    auto d = coordinator->tick();
    EXPECT_TRUE(d.deploy);

    coordinator->setModule("escort");
    coordinator->tick();
    coordinator->setModule("lazy");
    EXPECT_FALSE(coordinator->tick().deploy);
  }

  TEST_F(CoordinatorTest, GearLeaseDecaysAfterModuleSwap) {
    coordinator->start();
    coordinator->setModule("farmer");
    EXPECT_EQ(coordinator->tick().gear, 2);

    coordinator->setModule("lazy");
    clock.advance(4000ms);
    EXPECT_EQ(coordinator->tick().gear, 2);
    clock.advance(1500ms);
    EXPECT_EQ(coordinator->tick().gear, 1); // user default
  }

  TEST_F(CoordinatorTest, NoOverrideNoDefaultLeavesGearAlone) {
    settings->setDefaultGear(std::nullopt);
    coordinator->start();
    coordinator->setModule("lazy");
    EXPECT_FALSE(coordinator->tick().gear);
  }

  TEST_F(CoordinatorTest, RejectedGearDoesNotStopTheLoop) {
    coordinator->start();
    coordinator->setModule("farmer");
    coordinator->tick();

    coordinator->setModule("broken");
    PetDirective d;
    EXPECT_NO_THROW(d = coordinator->tick());
    EXPECT_TRUE(d.deploy);
    EXPECT_EQ(d.gear, 2); // farmer's lease is untouched
  }

  TEST_F(CoordinatorTest, RepairRequestedOnlyWhenDeployed) {
    game.repaired = false;
    coordinator->start();
    coordinator->setModule("farmer");
    EXPECT_TRUE(coordinator->tick().repair);

    coordinator->setModule("escort");
    EXPECT_FALSE(coordinator->tick().repair);

    coordinator->stop();
    EXPECT_FALSE(coordinator->tick().repair);
    EXPECT_EQ(coordinator->state(), SystemCoordinator::State::IDLE);
  }

  TEST_F(CoordinatorTest, UnknownModuleKeepsCurrent) {
    coordinator->setModule("farmer");
    EXPECT_THROW(coordinator->setModule("nope"), std::out_of_range);
    EXPECT_EQ(coordinator->activeModule(), "farmer");

    coordinator->clearModule();
    EXPECT_EQ(coordinator->activeModule(), "");
  }

  TEST(ModuleFactory, RegisterAndCreate) {
    ModuleFactory factory;
    auto maker = [] {
      return std::make_unique<ScriptedModule>("x", [](PetController&) {});
    };
    EXPECT_TRUE(factory.registerModule("x", maker));
    EXPECT_FALSE(factory.registerModule("x", maker));
    EXPECT_TRUE(factory.contains("x"));
    EXPECT_EQ(factory.names(), (std::vector<std::string>{ "x" }));
    EXPECT_EQ(factory.create("x")->name(), "x");
    EXPECT_THROW(factory.create("y"), std::out_of_range);
    EXPECT_THROW(factory.registerModule("z", nullptr), std::invalid_argument);
  }

  TEST(PetSession, RunLogCapturesEscalatedFailures) {
    FakeGameState game;
    game.equipped = { 1 };
    FakeClock clock;

    core::PetConfig cfg;
    cfg.petEnabled = true;
    cfg.logPath = ::testing::TempDir() + "petctl_session.csv";

    {
      core::PetSession session(game, clock, cfg);
      session.modules().registerModule("broken", [] {
        return std::make_unique<ScriptedModule>("broken", [](PetController& p) {
          p.setEnabled(true);
          p.setGear(7);
        });
      });
      session.coordinator().setModule("broken");
      session.begin();
      for (int i = 0; i < 3; ++i)
        session.coordinator().tick();
      EXPECT_EQ(session.errors().uniqueFailures(), 1u);
      session.end();
    }

    std::ifstream in(cfg.logPath);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(text.find("ERROR,ErrorMonitor"), std::string::npos);
    EXPECT_NE(text.find("gear 7 is not equipped"), std::string::npos);
    EXPECT_NE(text.find("IDLE -> OPERATING"), std::string::npos);
    std::remove(cfg.logPath.c_str());
  }

} // namespace petctl::test
