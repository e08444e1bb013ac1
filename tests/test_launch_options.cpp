#include <gtest/gtest.h>
#include <errors.hpp>
#include <launch_options.hpp>
#include <logger.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace kiosk;

TEST(LaunchOptionsTest, Defaults) {
    const auto options = parse_launch_options({"--path", "https://example.com"});
    EXPECT_EQ(options.path, "https://example.com");
    EXPECT_EQ(options.width, 1024);
    EXPECT_EQ(options.height, 768);
    EXPECT_FALSE(options.singleton.has_value());
    EXPECT_FALSE(options.fullscreen);
    EXPECT_FALSE(options.always_on_top);
    EXPECT_FALSE(options.show_menu);
    EXPECT_FALSE(options.developer);
    EXPECT_FLOAT_EQ(options.zoom, 1.0f);
    EXPECT_EQ(options.log_level, LogLevel::Warn);
    EXPECT_FALSE(options.work_dir.has_value());
}

TEST(LaunchOptionsTest, ShortAliases) {
    const auto options = parse_launch_options(
        {"-p", "https://example.com", "-x", "800", "-y", "600", "-s", "sign", "-f", "-t", "-m", "-d", "-z", "1.5", "-l", "debug"});
    EXPECT_EQ(options.width, 800);
    EXPECT_EQ(options.height, 600);
    EXPECT_EQ(options.singleton, "sign");
    EXPECT_TRUE(options.fullscreen);
    EXPECT_TRUE(options.always_on_top);
    EXPECT_TRUE(options.show_menu);
    EXPECT_TRUE(options.developer);
    EXPECT_FLOAT_EQ(options.zoom, 1.5f);
    EXPECT_EQ(options.log_level, LogLevel::Debug);
}

TEST(LaunchOptionsTest, EqualsForm) {
    const auto options = parse_launch_options(
        {"--path=file:///tmp/a.html", "--width=640", "--singleton-id=lobby", "--fullscreen=false", "--show-menu=true"});
    EXPECT_EQ(options.path, "file:///tmp/a.html");
    EXPECT_EQ(options.width, 640);
    EXPECT_EQ(options.singleton, "lobby");
    EXPECT_FALSE(options.fullscreen);
    EXPECT_TRUE(options.show_menu);
}

TEST(LaunchOptionsTest, LongOnlyOptions) {
    const auto options = parse_launch_options(
        {"--path", "x", "--maximize", "--minimize", "--icon", "/tmp/i.png", "--work-dir", "/tmp/w", "--log-file", "/tmp/k.log"});
    EXPECT_TRUE(options.maximize);
    EXPECT_TRUE(options.minimize);
    EXPECT_EQ(options.icon, fs::path("/tmp/i.png"));
    EXPECT_EQ(options.work_dir, fs::path("/tmp/w"));
    EXPECT_EQ(options.log_file, fs::path("/tmp/k.log"));
}

TEST(LaunchOptionsTest, ZoomIsClamped) {
    EXPECT_FLOAT_EQ(parse_launch_options({"-p", "x", "-z", "100"}).zoom, kMaxZoom);
    EXPECT_FLOAT_EQ(parse_launch_options({"-p", "x", "-z", "0.01"}).zoom, kMinZoom);
}

TEST(LaunchOptionsTest, HelpAndVersionDoNotNeedPath) {
    EXPECT_TRUE(parse_launch_options({"--help"}).show_help);
    EXPECT_TRUE(parse_launch_options({"-v"}).show_version);
}

TEST(LaunchOptionsTest, UsageErrors) {
    EXPECT_THROW((void)parse_launch_options({}), UsageError);
    EXPECT_THROW((void)parse_launch_options({"--path"}), UsageError);
    EXPECT_THROW((void)parse_launch_options({"-p", "x", "--bogus"}), UsageError);
    EXPECT_THROW((void)parse_launch_options({"-p", "x", "--width", "wide"}), UsageError);
    EXPECT_THROW((void)parse_launch_options({"-p", "x", "--width", "-5"}), UsageError);
    EXPECT_THROW((void)parse_launch_options({"-p", "x", "--zoom", "abc"}), UsageError);
    EXPECT_THROW((void)parse_launch_options({"-p", "x", "--fullscreen=maybe"}), UsageError);
    EXPECT_THROW((void)parse_launch_options({"-p", "x", "--singleton="}), UsageError);
    EXPECT_THROW((void)parse_launch_options({"-p", "x", "stray"}), UsageError);
    EXPECT_THROW((void)parse_launch_options({"-p", "x", "-l", "loud"}), UsageError);
}

TEST(LaunchOptionsTest, ArgvSkipsProgramName) {
    char prog[] = "kiosk";
    char opt[] = "-p";
    char val[] = "https://example.com";
    char* argv[] = {prog, opt, val};
    EXPECT_EQ(parse_launch_options(3, argv).path, "https://example.com");
}

TEST(LaunchOptionsTest, HelpTextListsOptions) {
    const std::string help = build_help_text("kiosk");
    EXPECT_NE(help.find("--singleton"), std::string::npos);
    EXPECT_NE(help.find("--always-on-top"), std::string::npos);
    EXPECT_NE(help.find("Usage: kiosk"), std::string::npos);
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(parse_log_level("NONE"), LogLevel::None);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("Warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("TRACE"), LogLevel::Trace);
    EXPECT_THROW((void)parse_log_level("verbose"), UsageError);
    EXPECT_STREQ(to_string(LogLevel::Warn), "WARN");
}

TEST(LogLevelTest, FileSinkAppends) {
    const fs::path log = fs::temp_directory_path() / ("kiosk_log_test_" + std::to_string(getpid()) + ".log");
    fs::remove(log);

    init_logging(LogLevel::Info, log);
    spdlog::info("first line");
    spdlog::debug("filtered out");
    spdlog::default_logger()->flush();

    init_logging(LogLevel::Info, log);
    spdlog::warn("second line");
    spdlog::default_logger()->flush();

    std::ifstream in(log);
    const std::string body((std::istreambuf_iterator<char>(in)), {});
    EXPECT_NE(body.find("first line"), std::string::npos);
    EXPECT_NE(body.find("second line"), std::string::npos);
    EXPECT_EQ(body.find("filtered out"), std::string::npos);
    EXPECT_NE(body.find("[info]"), std::string::npos);

    init_logging(LogLevel::Warn);
    fs::remove(log);
}

class ResolveUrlTest : public ::testing::Test {
protected:
    fs::path test_file;

    void SetUp() override {
        test_file = fs::temp_directory_path() / ("kiosk_url_test_" + std::to_string(getpid()) + ".html");
        std::ofstream(test_file) << "<html></html>";
    }

    void TearDown() override {
        fs::remove(test_file);
    }
};

TEST_F(ResolveUrlTest, SchemesPassThrough) {
    EXPECT_EQ(resolve_url("http://a"), "http://a");
    EXPECT_EQ(resolve_url("https://a/b?c"), "https://a/b?c");
    EXPECT_EQ(resolve_url("file:///does/not/matter"), "file:///does/not/matter");
}

TEST_F(ResolveUrlTest, ExistingFileBecomesFileUrl) {
    EXPECT_EQ(resolve_url(test_file.string()), "file://" + test_file.string());
}

TEST_F(ResolveUrlTest, RelativeFileIsMadeAbsolute) {
    const fs::path previous = fs::current_path();
    fs::current_path(test_file.parent_path());
    const auto url = resolve_url(test_file.filename().string());
    fs::current_path(previous);

    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url->starts_with("file:///"));
    EXPECT_TRUE(url->ends_with(test_file.filename().string()));
}

TEST_F(ResolveUrlTest, RejectsOthers) {
    EXPECT_FALSE(resolve_url("").has_value());
    EXPECT_FALSE(resolve_url("ftp://a").has_value());
    EXPECT_FALSE(resolve_url("/no/such/file.html").has_value());
    EXPECT_FALSE(resolve_url(test_file.parent_path().string()).has_value());
}
