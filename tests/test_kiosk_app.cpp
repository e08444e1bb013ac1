#include <gtest/gtest.h>
#include <comm_channel.hpp>
#include <instance_id.hpp>
#include <kiosk_app.hpp>
#include <lock_store.hpp>
#include <platform_factory.hpp>
#include "wait_until.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace kiosk;

namespace {

// What the test can observe of the window the app created
struct HostRecord {
    int created = 0;
    WindowConfig config;
    std::atomic<int> focus_requests{0};
    std::atomic<bool> close_requested{false};
    std::atomic<bool> torn_down{false};
    std::atomic<int> focus_after_teardown{0};
    std::function<void(HostRecord&)> on_run;
    // Runs once the window is gone, while the app still owns the singleton
    std::function<void(HostRecord&)> after_teardown;
};

class FakeWindowHost : public IWindowHost {
public:
    explicit FakeWindowHost(HostRecord* record) : record_(record) {}

    void create_window(const WindowConfig& config) override {
        ++record_->created;
        record_->config = config;
    }

    void run() override {
        if (record_->on_run) record_->on_run(*record_);
        if (on_closed_) on_closed_();
        record_->torn_down = true;
        if (record_->after_teardown) record_->after_teardown(*record_);
    }

    void request_focus() override {
        ++record_->focus_requests;
        if (record_->torn_down) ++record_->focus_after_teardown;
    }
    void request_close() override { record_->close_requested = true; }
    void set_on_closed(std::function<void()> callback) override { on_closed_ = std::move(callback); }

private:
    HostRecord* record_;
    std::function<void()> on_closed_;
};

} // namespace

class KioskAppTest : public ::testing::Test {
protected:
    fs::path test_dir;
    HostRecord host;
    const std::string key = "kiosk-app-test";

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("kiosk_app_test_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    LaunchOptions singleton_options() const {
        LaunchOptions options;
        options.path = "https://example.com";
        options.singleton = key;
        options.work_dir = test_dir / "work";
        return options;
    }

    KioskApp make_app(const LaunchOptions& options) {
        return KioskApp(options, "kiosk_tests", [this]() {
            return std::make_unique<FakeWindowHost>(&host);
        });
    }

    std::string instance_id() const { return compute_instance_id(key, current_user_name()); }
};

TEST_F(KioskAppTest, InvalidUrlExitsWithoutWindow) {
    LaunchOptions options;
    options.path = (test_dir / "missing.html").string();

    auto app = make_app(options);
    EXPECT_EQ(app.run(), 1);
    EXPECT_EQ(host.created, 0);
}

TEST_F(KioskAppTest, PlainLaunchShowsWindow) {
    LaunchOptions options;
    options.path = "https://example.com";
    options.width = 300;
    options.fullscreen = true;

    auto app = make_app(options);
    EXPECT_EQ(app.run(), 0);
    EXPECT_EQ(host.created, 1);
    EXPECT_EQ(host.config.url, "https://example.com");
    EXPECT_EQ(host.config.width, 300);
    EXPECT_TRUE(host.config.view.fullscreen);
}

TEST_F(KioskAppTest, FilePathBecomesFileUrl) {
    const fs::path page = test_dir / "page.html";
    std::ofstream(page) << "<p>hi</p>";

    LaunchOptions options;
    options.path = page.string();

    auto app = make_app(options);
    EXPECT_EQ(app.run(), 0);
    EXPECT_EQ(host.config.url, "file://" + page.string());
}

TEST_F(KioskAppTest, SingletonCleansUpAfterClose) {
    const auto options = singleton_options();
    bool lock_held_while_running = false;
    host.on_run = [&](HostRecord&) {
        lock_held_while_running = fs::exists(test_dir / "work" / "locks" / instance_id());
    };

    auto app = make_app(options);
    EXPECT_EQ(app.run(), 0);
    EXPECT_TRUE(lock_held_while_running);
    EXPECT_FALSE(fs::exists(test_dir / "work" / "locks" / instance_id()));
    EXPECT_FALSE(fs::exists(test_dir / "work" / "comms" / instance_id()));
}

TEST_F(KioskAppTest, FocusRequestReachesWindow) {
    const auto options = singleton_options();
    host.on_run = [&](HostRecord& p) {
        const CommChannel sender(test_dir / "work" / "comms", [] { return make_file_watcher(); });
        sender.send(instance_id(), "focus");
        wait_until([&] { return p.focus_requests == 1; });
    };

    auto app = make_app(options);
    EXPECT_EQ(app.run(), 0);
    EXPECT_EQ(host.focus_requests, 1);
}

TEST_F(KioskAppTest, FocusAfterTeardownNeverReachesWindow) {
    const fs::path record = test_dir / "work" / "comms" / instance_id();
    bool drained = false;
    host.after_teardown = [&](HostRecord&) {
        const CommChannel sender(test_dir / "work" / "comms", [] { return make_file_watcher(); });
        sender.send(instance_id(), "focus");
        drained = wait_until([&] { return !fs::exists(record); });
        // The record is removed before its commands are dispatched
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    };

    auto app = make_app(singleton_options());
    EXPECT_EQ(app.run(), 0);
    EXPECT_TRUE(drained);
    EXPECT_EQ(host.focus_after_teardown, 0);
    EXPECT_EQ(host.focus_requests, 0);
}

TEST_F(KioskAppTest, FocusWithoutWindowIsIgnored) {
    auto app = make_app(singleton_options());
    EXPECT_NO_THROW(app.request_focus());
    EXPECT_EQ(host.focus_requests, 0);
}

TEST_F(KioskAppTest, CloseBeforeWindowIsDeferred) {
    auto app = make_app(singleton_options());
    app.request_close();

    bool closed_at_start = false;
    host.on_run = [&](HostRecord& p) { closed_at_start = p.close_requested; };
    EXPECT_EQ(app.run(), 0);
    EXPECT_TRUE(closed_at_start);
}

TEST_F(KioskAppTest, TerminationSignalClosesWindow) {
    host.on_run = [](HostRecord& p) {
        kill(getpid(), SIGTERM);
        wait_until([&] { return p.close_requested.load(); });
    };

    auto app = make_app(singleton_options());
    EXPECT_EQ(app.run(), 0);
    EXPECT_TRUE(host.close_requested);
}

TEST_F(KioskAppTest, SecondLaunchDefersToLiveOwner) {
    // A forked copy of this test binary stands in for the running owner
    const pid_t owner = fork();
    ASSERT_GE(owner, 0);
    if (owner == 0) {
        pause();
        _exit(0);
    }

    const auto options = singleton_options();
    LockStore locks(test_dir / "work" / "locks");
    locks.acquire(instance_id(), static_cast<int>(owner));

    auto app = make_app(options);
    const int exit_code = app.run();

    kill(owner, SIGKILL);
    waitpid(owner, nullptr, 0);

    EXPECT_EQ(exit_code, 1);
    EXPECT_EQ(host.created, 0);
    EXPECT_EQ(locks.probe(instance_id()).pid, static_cast<int>(owner));

    std::ifstream in(test_dir / "work" / "comms" / instance_id());
    const std::string body((std::istreambuf_iterator<char>(in)), {});
    EXPECT_EQ(body, "focus\n");
}

TEST_F(KioskAppTest, DeadOwnerIsReplaced) {
    const pid_t owner = fork();
    ASSERT_GE(owner, 0);
    if (owner == 0) {
        _exit(0);
    }
    waitpid(owner, nullptr, 0);

    LockStore locks(test_dir / "work" / "locks");
    locks.acquire(instance_id(), static_cast<int>(owner));

    auto app = make_app(singleton_options());
    EXPECT_EQ(app.run(), 0);
    EXPECT_EQ(host.created, 1);
}
