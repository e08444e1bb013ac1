#include <gtest/gtest.h>
#include <viewmodels/window_view_model.hpp>
#include <interfaces/i_window_host.hpp>

using namespace kiosk;

TEST(WindowViewModelTest, FromOptions) {
    LaunchOptions options;
    options.zoom = 2.0f;
    options.fullscreen = true;
    options.show_menu = true;

    const auto vm = WindowViewModel::from_options(options);
    EXPECT_FLOAT_EQ(vm.zoom, 2.0f);
    EXPECT_TRUE(vm.fullscreen);
    EXPECT_TRUE(vm.show_menu);
    EXPECT_FALSE(vm.developer);
    EXPECT_FALSE(vm.dev_tools_open);
}

TEST(WindowViewModelTest, ZoomStepsAndReset) {
    WindowViewModel vm;
    vm.zoom_in();
    EXPECT_FLOAT_EQ(vm.zoom, 1.2f);
    vm.zoom_out();
    EXPECT_FLOAT_EQ(vm.zoom, 1.0f);
    vm.zoom_out();
    EXPECT_LT(vm.zoom, 1.0f);
    vm.reset_zoom();
    EXPECT_FLOAT_EQ(vm.zoom, 1.0f);
}

TEST(WindowViewModelTest, ZoomStaysInRange) {
    WindowViewModel vm;
    for (int i = 0; i < 50; ++i) vm.zoom_in();
    EXPECT_FLOAT_EQ(vm.zoom, kMaxZoom);
    for (int i = 0; i < 50; ++i) vm.zoom_out();
    EXPECT_FLOAT_EQ(vm.zoom, kMinZoom);
}

TEST(WindowViewModelTest, DevToolsOnlyInDeveloperMode) {
    WindowViewModel vm;
    vm.toggle_dev_tools();
    EXPECT_FALSE(vm.dev_tools_open);

    vm.developer = true;
    vm.toggle_dev_tools();
    EXPECT_TRUE(vm.dev_tools_open);
    vm.toggle_dev_tools();
    EXPECT_FALSE(vm.dev_tools_open);
}

TEST(WindowViewModelTest, ToggleFullscreen) {
    WindowViewModel vm;
    vm.toggle_fullscreen();
    EXPECT_TRUE(vm.fullscreen);
    vm.toggle_fullscreen();
    EXPECT_FALSE(vm.fullscreen);
}

TEST(WindowConfigTest, FromOptions) {
    LaunchOptions options;
    options.width = 640;
    options.height = 480;
    options.always_on_top = true;
    options.maximize = true;
    options.icon = "/tmp/icon.png";

    const auto config = WindowConfig::from_options(options, "https://example.com");
    EXPECT_EQ(config.url, "https://example.com");
    EXPECT_EQ(config.width, 640);
    EXPECT_EQ(config.height, 480);
    EXPECT_TRUE(config.always_on_top);
    EXPECT_TRUE(config.maximize);
    EXPECT_FALSE(config.minimize);
    EXPECT_EQ(config.icon, std::filesystem::path("/tmp/icon.png"));
}
