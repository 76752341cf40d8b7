#include <catch2/catch_all.hpp>
#include <drawer/ui/slide_drawer.hpp>
#include <drawer/core/error_utils.hpp>

using namespace drawer;
using namespace drawer::ui;
using anim::Phase;
using namespace std::chrono_literals;

static constexpr float FrameTime = 1.0f / 60.0f;

struct DrawerFixture {
  anim::ManualFrameScheduler scheduler;
  SlideDrawer drawer{scheduler};

  DrawerFixture() { drawer.setViewSize(float2(400.0f, 800.0f)); }

  void settle() { scheduler.runUntilIdle(FrameTime); }
};

TEST_CASE_METHOD(DrawerFixture, "Drawer open and close") {
  CHECK(drawer.phase() == Phase::Dismissed);
  CHECK(drawer.getCoordinator().getMaxSlide() == 340.0f);

  drawer.open();
  CHECK(drawer.phase() == Phase::AnimatingForward);
  settle();
  CHECK(drawer.phase() == Phase::Completed);
  CHECK(drawer.value() == 1.0f);

  DrawerRenderState state = drawer.getRenderState();
  CHECK(state.value == 1.0f);
  CHECK(state.phase == Phase::Completed);
  CHECK(state.transform.translationX == Catch::Approx(340.0f));
  CHECK(state.transform.scale == Catch::Approx(0.75f));
  CHECK(state.transform.roundCorners);
  CHECK(state.transform.blockContentPointer);
  CHECK(state.panel.paddingRight == 60.0f);

  drawer.toggle();
  CHECK(drawer.phase() == Phase::AnimatingReverse);
  settle();
  CHECK(drawer.phase() == Phase::Dismissed);
  CHECK_FALSE(drawer.getRenderState().transform.roundCorners);
}

TEST_CASE_METHOD(DrawerFixture, "Back navigation") {
  SECTION("Closed drawer lets the navigation through") {
    CHECK_FALSE(drawer.handleBack());
    CHECK(drawer.phase() == Phase::Dismissed);
  }

  SECTION("Open drawer consumes it and closes") {
    drawer.open();
    settle();
    CHECK(drawer.handleBack());
    CHECK(drawer.phase() == Phase::AnimatingReverse);
    settle();
    CHECK(drawer.phase() == Phase::Dismissed);
  }

  SECTION("Animating drawer lets the navigation through") {
    drawer.open();
    scheduler.tick(FrameTime);
    CHECK_FALSE(drawer.handleBack());
    CHECK(drawer.phase() == Phase::AnimatingForward);
  }
}

TEST_CASE_METHOD(DrawerFixture, "Tapping the content") {
  CHECK_FALSE(drawer.tapContent());

  drawer.open();
  scheduler.tick(FrameTime);
  CHECK_FALSE(drawer.tapContent());
  CHECK(drawer.phase() == Phase::AnimatingForward);

  settle();
  CHECK(drawer.tapContent());
  settle();
  CHECK(drawer.phase() == Phase::Dismissed);
}

TEST_CASE_METHOD(DrawerFixture, "Dragging the drawer open") {
  drawer.handle(input::DragStartEvent{.position = float2(20.0f, 400.0f)});
  drawer.handle(input::DragUpdateEvent{.position = float2(210.0f, 400.0f), .primaryDelta = 190.0f});
  CHECK(drawer.value() == Catch::Approx(190.0f / 340.0f));
  CHECK(drawer.getRenderState().transform.translationX == Catch::Approx(190.0f));

  drawer.handle(input::DragEndEvent{.velocity = float2(0.0f, 0.0f)});
  settle();
  CHECK(drawer.phase() == Phase::Completed);
}

TEST_CASE_METHOD(DrawerFixture, "Pointer input") {
  auto press = [&](float x, double time) {
    drawer.handle(input::PointerEvent{
        input::PointerButtonEvent{.pos = float2(x, 400.0f), .index = 0, .pressed = true, .time = time}});
  };
  auto moveTo = [&](float x, float dx, double time) {
    drawer.handle(
        input::PointerEvent{input::PointerMoveEvent{.pos = float2(x, 400.0f), .delta = float2(dx, 0.0f), .time = time}});
  };
  auto release = [&](float x, double time) {
    drawer.handle(input::PointerEvent{
        input::PointerButtonEvent{.pos = float2(x, 400.0f), .index = 0, .pressed = false, .time = time}});
  };

  SECTION("Slow drag past half way opens") {
    press(10.0f, 0.0);
    moveTo(40.0f, 30.0f, 0.1);
    CHECK(drawer.value() == Catch::Approx(30.0f / 340.0f));
    moveTo(190.0f, 150.0f, 0.2);
    CHECK(drawer.value() == Catch::Approx(180.0f / 340.0f));
    // Held still before releasing
    release(190.0f, 0.5);
    CHECK(drawer.phase() == Phase::AnimatingForward);
    settle();
    CHECK(drawer.phase() == Phase::Completed);
  }

  SECTION("Drag starting away from the edge does nothing") {
    press(200.0f, 0.0);
    moveTo(260.0f, 60.0f, 0.05);
    CHECK(drawer.value() == 0.0f);
    release(260.0f, 0.1);
    CHECK_FALSE(scheduler.hasCallbacks());
  }

  SECTION("Quick flick opens") {
    press(10.0f, 0.0);
    for (int i = 1; i <= 5; i++)
      moveTo(10.0f + i * 12.0f, 12.0f, i * 0.01);
    CHECK(drawer.value() < 0.5f);
    release(70.0f, 0.05);
    CHECK(drawer.phase() == Phase::AnimatingForward);
    settle();
    CHECK(drawer.phase() == Phase::Completed);
  }
}

TEST_CASE_METHOD(DrawerFixture, "Reconfigure") {
  drawer.open();
  for (int i = 0; i < 5; i++)
    scheduler.tick(FrameTime);
  CHECK(drawer.value() > 0.0f);

  drawer.reconfigure(DrawerConfig{
      .animation = anim::ProgressConfig{.forwardDuration = 100ms},
      .offsetFromRight = 100.0f,
      .isRotate = false,
  });
  CHECK(drawer.value() == 0.0f);
  CHECK(drawer.phase() == Phase::Dismissed);
  CHECK_FALSE(scheduler.hasCallbacks());
  CHECK(drawer.getCoordinator().getMaxSlide() == 300.0f);

  drawer.open();
  size_t numFrames = scheduler.runUntilIdle(FrameTime);
  CHECK(numFrames <= 7);
  DrawerRenderState state = drawer.getRenderState();
  CHECK(state.transform.translationX == Catch::Approx(300.0f));
  CHECK(state.transform.rotationY == 0.0f);

  SECTION("Invalid configuration keeps the current one") {
    CHECK_THROWS_AS(drawer.reconfigure(DrawerConfig{.offsetFromRight = -5.0f}), ConfigurationError);
    CHECK(drawer.getConfig().offsetFromRight == 100.0f);
    CHECK(drawer.phase() == Phase::Completed);
  }
}

TEST_CASE_METHOD(DrawerFixture, "Reconfigure cancels a drag in progress") {
  drawer.handle(input::DragStartEvent{.position = float2(20.0f, 400.0f)});
  REQUIRE(drawer.getCoordinator().getSession());

  drawer.reconfigure(DrawerConfig{.offsetFromRight = 100.0f});
  CHECK_FALSE(drawer.getCoordinator().getSession());

  drawer.handle(input::DragUpdateEvent{.position = float2(170.0f, 400.0f), .primaryDelta = 150.0f});
  CHECK(drawer.value() == 0.0f);
  drawer.handle(input::DragEndEvent{.velocity = float2(1000.0f, 0.0f)});
  CHECK(drawer.phase() == Phase::Dismissed);
  CHECK_FALSE(scheduler.hasCallbacks());
}

TEST_CASE_METHOD(DrawerFixture, "Slots and theme") {
  CHECK(drawer.getRenderState().panel.source == PanelContentSource::Empty);

  drawer.setSlots(DrawerSlots{.items = {MenuItem{.title = "Home"}}});
  drawer.setTheme(Theme{.primaryColor = Color{1.0f, 0.0f, 0.0f, 1.0f}, .primaryBrightness = Brightness::Light});

  DrawerRenderState state = drawer.getRenderState();
  CHECK(state.panel.source == PanelContentSource::GeneratedFromItems);
  CHECK(state.panel.items.size() == 1);
  CHECK(state.panel.brightness == Brightness::Light);
  REQUIRE(std::holds_alternative<Color>(state.panel.background));
  CHECK(std::get<Color>(state.panel.background) == Color{1.0f, 0.0f, 0.0f, 1.0f});
}

TEST_CASE("Drawer without a view size ignores drags") {
  anim::ManualFrameScheduler scheduler;
  SlideDrawer drawer(scheduler);
  drawer.handle(input::DragStartEvent{.position = float2(10.0f, 0.0f)});
  drawer.handle(input::DragUpdateEvent{.position = float2(50.0f, 0.0f), .primaryDelta = 40.0f});
  CHECK(drawer.value() == 0.0f);
}

TEST_CASE("Drawer rejects invalid configuration") {
  anim::ManualFrameScheduler scheduler;
  CHECK_THROWS_AS(SlideDrawer(scheduler, DrawerConfig{.offsetFromRight = -1.0f}), ConfigurationError);
}

TEST_CASE_METHOD(DrawerFixture, "Render state outlives replaced slots") {
  int numTaps{};
  drawer.setSlots(DrawerSlots{.items = {MenuItem{.title = "Home", .onTap = [&]() { ++numTaps; }}}});
  DrawerRenderState state = drawer.getRenderState();

  drawer.setSlots(DrawerSlots{});
  CHECK(drawer.getRenderState().panel.source == PanelContentSource::Empty);

  REQUIRE(state.panel.items.size() == 1);
  CHECK(state.panel.items[0].title == "Home");
  REQUIRE(state.panel.items[0].onTap);
  state.panel.items[0].onTap();
  CHECK(numTaps == 1);
}
