#include <catch2/catch_all.hpp>
#include <drawer/ui/gesture_coordinator.hpp>
#include <drawer/core/error_utils.hpp>

using namespace drawer;
using namespace drawer::ui;
using anim::Phase;

static constexpr float FrameTime = 1.0f / 60.0f;

struct CoordinatorFixture {
  anim::ManualFrameScheduler scheduler;
  anim::ProgressController controller{scheduler};
  DrawerGestureCoordinator coordinator{controller};

  CoordinatorFixture() { coordinator.setLayout(400.0f, 60.0f); }

  void start(float x) { coordinator.handle(input::DragStartEvent{.position = float2(x, 200.0f)}); }
  void update(float x, float delta) {
    coordinator.handle(input::DragUpdateEvent{.position = float2(x, 200.0f), .primaryDelta = delta});
  }
  void end(float velocityX) { coordinator.handle(input::DragEndEvent{.velocity = float2(velocityX, 0.0f)}); }

  void openFully() {
    controller.open();
    scheduler.runUntilIdle(FrameTime);
  }
};

TEST_CASE_METHOD(CoordinatorFixture, "Drag arming") {
  CHECK(coordinator.getMaxSlide() == 340.0f);

  SECTION("Opening drag near the left edge") {
    start(10.0f);
    REQUIRE(coordinator.getSession());
    CHECK(coordinator.getSession()->draggable);
    CHECK(coordinator.getSession()->startPositionX == 10.0f);
  }

  SECTION("Opening drag too far from the edge") {
    start(100.0f);
    CHECK_FALSE(coordinator.getSession()->draggable);
    update(140.0f, 40.0f);
    CHECK(controller.value() == 0.0f);
  }

  SECTION("Closing drag away from the open edge") {
    openFully();
    start(10.0f);
    CHECK_FALSE(coordinator.getSession()->draggable);
    update(-24.0f, -34.0f);
    CHECK(controller.value() == 1.0f);
  }

  SECTION("Closing drag near the open edge") {
    openFully();
    start(330.0f);
    CHECK(coordinator.getSession()->draggable);
    update(296.0f, -34.0f);
    CHECK(controller.value() == Catch::Approx(0.9f));
  }

  SECTION("Nothing arms while animating") {
    controller.open();
    scheduler.tick(FrameTime);
    start(10.0f);
    CHECK_FALSE(coordinator.getSession()->draggable);
  }
}

TEST_CASE_METHOD(CoordinatorFixture, "Dragging moves the progress") {
  start(10.0f);
  update(44.0f, 34.0f);
  CHECK(controller.value() == Catch::Approx(0.1f));
  CHECK(controller.phase() == Phase::AnimatingForward);

  SECTION("Slow release past half way opens") {
    update(180.0f, 136.0f);
    CHECK(controller.value() == Catch::Approx(0.5f));
    end(0.0f);
    CHECK_FALSE(coordinator.getSession());
    CHECK(controller.phase() == Phase::AnimatingForward);
    scheduler.runUntilIdle(FrameTime);
    CHECK(controller.isCompleted());
  }

  SECTION("Slow release before half way closes") {
    update(146.0f, 102.0f);
    CHECK(controller.value() == Catch::Approx(0.4f));
    end(100.0f);
    CHECK(controller.phase() == Phase::AnimatingReverse);
    scheduler.runUntilIdle(FrameTime);
    CHECK(controller.isDismissed());
  }

  SECTION("Fast release to the left closes from past half way") {
    update(214.0f, 170.0f);
    CHECK(controller.value() == Catch::Approx(0.6f));
    end(-400.0f);
    CHECK(controller.phase() == Phase::AnimatingReverse);
    scheduler.runUntilIdle(FrameTime);
    CHECK(controller.isDismissed());
  }

  SECTION("Fast release to the right opens from before half way") {
    update(112.0f, 68.0f);
    CHECK(controller.value() == Catch::Approx(0.3f));
    end(400.0f);
    CHECK(controller.phase() == Phase::AnimatingForward);
    scheduler.runUntilIdle(FrameTime);
    CHECK(controller.isCompleted());
  }

  SECTION("Dragging back to the start") {
    update(10.0f, -34.0f);
    CHECK(controller.isDismissed());
    end(-1000.0f);
    CHECK_FALSE(scheduler.hasCallbacks());
    CHECK(controller.isDismissed());
  }

  SECTION("Dragging past the end clamps") {
    update(800.0f, 800.0f);
    CHECK(controller.value() == 1.0f);
    CHECK(controller.isCompleted());
    end(0.0f);
    CHECK_FALSE(scheduler.hasCallbacks());
  }
}

TEST_CASE_METHOD(CoordinatorFixture, "Fling velocity threshold") {
  start(10.0f);

  SECTION("Exactly the threshold flings") {
    update(214.0f, 204.0f);
    CHECK(controller.value() == Catch::Approx(0.6f));
    end(-365.0f);
    CHECK(controller.phase() == Phase::AnimatingReverse);
    scheduler.runUntilIdle(FrameTime);
    CHECK(controller.isDismissed());
  }

  SECTION("Just below the threshold snaps") {
    update(214.0f, 204.0f);
    end(-364.9f);
    CHECK(controller.phase() == Phase::AnimatingForward);
    scheduler.runUntilIdle(FrameTime);
    CHECK(controller.isCompleted());
  }

  SECTION("Same boundary to the right") {
    update(112.0f, 102.0f);
    CHECK(controller.value() == Catch::Approx(0.3f));
    SECTION("At the threshold") {
      end(365.0f);
      CHECK(controller.phase() == Phase::AnimatingForward);
    }
    SECTION("Below the threshold") {
      end(364.9f);
      CHECK(controller.phase() == Phase::AnimatingReverse);
    }
  }
}

TEST_CASE_METHOD(CoordinatorFixture, "Reset drops the drag session") {
  start(10.0f);
  REQUIRE(coordinator.getSession());
  coordinator.reset();
  CHECK_FALSE(coordinator.getSession());

  update(110.0f, 100.0f);
  end(1000.0f);
  CHECK(controller.value() == 0.0f);
  CHECK_FALSE(scheduler.hasCallbacks());
}

TEST_CASE_METHOD(CoordinatorFixture, "Drag end when already settled") {
  start(10.0f);
  end(0.0f);
  CHECK_FALSE(coordinator.getSession());
  CHECK_FALSE(scheduler.hasCallbacks());
  CHECK(controller.isDismissed());
}

TEST_CASE_METHOD(CoordinatorFixture, "Unarmed drag end still settles") {
  controller.addProgress(0.7f);
  start(10.0f);
  CHECK_FALSE(coordinator.getSession()->draggable);
  end(0.0f);
  scheduler.runUntilIdle(FrameTime);
  CHECK(controller.isCompleted());
}

TEST_CASE_METHOD(CoordinatorFixture, "Drag events without a start") {
  update(50.0f, 40.0f);
  CHECK(controller.value() == 0.0f);

  controller.addProgress(0.3f);
  end(1000.0f);
  CHECK_FALSE(scheduler.hasCallbacks());
  CHECK(controller.value() == Catch::Approx(0.3f));
}

TEST_CASE_METHOD(CoordinatorFixture, "No room to slide") {
  coordinator.setLayout(50.0f, 60.0f);
  start(10.0f);
  update(30.0f, 20.0f);
  CHECK(controller.value() == 0.0f);
}

TEST_CASE_METHOD(CoordinatorFixture, "Gesture thresholds are configurable") {
  coordinator.setConfig(GestureConfig{.minDragStartEdge = 200.0f, .minFlingVelocity = 1000.0f});
  start(150.0f);
  CHECK(coordinator.getSession()->draggable);
  update(320.0f, 170.0f);
  CHECK(controller.value() == Catch::Approx(0.5f));
  end(-400.0f);
  // Too slow to fling with the raised threshold, snaps open instead
  CHECK(controller.phase() == Phase::AnimatingForward);

  CHECK_THROWS_AS(coordinator.setConfig(GestureConfig{.minFlingVelocity = 0.0f}), ConfigurationError);
  CHECK_THROWS_AS(coordinator.setConfig(GestureConfig{.minDragStartEdge = -1.0f}), ConfigurationError);
}
