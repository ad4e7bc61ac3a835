#include <gtest/gtest.h>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string saved_home;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "qbridge_config_test" /
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "home");
        fs::create_directories(test_dir / "project");

        const char* home = std::getenv("HOME");
        saved_home = home ? home : "";
        setenv("HOME", (test_dir / "home").c_str(), 1);
    }

    void TearDown() override {
        if (saved_home.empty()) {
            unsetenv("HOME");
        } else {
            setenv("HOME", saved_home.c_str(), 1);
        }
        fs::remove_all(test_dir);
    }
};

TEST(ConfigParse, EmptyKeepsDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& s = r.value.session();
    EXPECT_EQ(s.executable, "q");
    EXPECT_EQ(s.chat_subcommand, "chat");
    EXPECT_EQ(s.log_level, "info");
    EXPECT_FALSE(s.trust_fs_write);
    EXPECT_FALSE(s.debug);
    EXPECT_EQ(s.timings.silence_done, 5000ms);
}

TEST(ConfigParse, OverridesKeys) {
    auto r = Config::parse(R"(
executable: /opt/q/bin/q
log_level: debug
working_dir: ~/chats
debug: true
trust:
  fs_write: true
timings:
  kick_after: 1500
  turn_deadline: 90000
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& s = r.value.session();
    EXPECT_EQ(s.executable, "/opt/q/bin/q");
    EXPECT_EQ(s.log_level, "debug");
    EXPECT_EQ(s.working_dir, "~/chats");
    EXPECT_TRUE(s.debug);
    EXPECT_TRUE(s.trust_fs_write);
    EXPECT_FALSE(s.trust_execute_bash);
    EXPECT_EQ(s.timings.kick_after, 1500ms);
    EXPECT_EQ(s.timings.turn_deadline, 90000ms);
    EXPECT_EQ(s.timings.prompt_quiet, 500ms);
}

TEST(ConfigParse, OverlayKeepsBaseValues) {
    auto base = Config::parse("log_level: warn\ntrust:\n  execute_bash: true\n");
    ASSERT_TRUE(base.is_ok());
    auto r = Config::parse("debug: true\n", base.value);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.session().log_level, "warn");
    EXPECT_TRUE(r.value.session().trust_execute_bash);
    EXPECT_TRUE(r.value.session().debug);
}

TEST(ConfigParse, RejectsInvalidLogLevel) {
    auto r = Config::parse("log_level: loud\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("loud"), std::string::npos);
}

TEST(ConfigParse, RejectsNonMapRoot) {
    EXPECT_TRUE(Config::parse("- a\n- b\n").is_err());
}

TEST(ConfigParse, RejectsMalformedYaml) {
    EXPECT_TRUE(Config::parse("trust: [unclosed\n").is_err());
}

TEST(ConfigParse, LogLevels) {
    for (const char* level : {"error", "warn", "info", "debug", "trace"}) {
        EXPECT_TRUE(is_valid_log_level(level)) << level;
    }
    EXPECT_FALSE(is_valid_log_level("INFO"));
    EXPECT_FALSE(is_valid_log_level(""));
}

TEST_F(ConfigTest, GlobalDefaultsWhenAbsent) {
    EXPECT_FALSE(global_config_exists());
    auto r = Config::load_global();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.session().executable, "q");
}

TEST_F(ConfigTest, DefaultGlobalConfigRoundTrips) {
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_TRUE(global_config_exists());
    EXPECT_EQ(get_global_config_path(), test_dir / "home" / ".qbridge" / "config.yaml");

    auto r = Config::load_global();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.session().working_dir, "~/amazon-q");
    EXPECT_EQ(r.value.session().timings.shutdown_wait, 2000ms);
}

TEST_F(ConfigTest, DefaultGlobalConfigIsNotOverwritten) {
    fs::create_directories(get_global_config_dir());
    std::ofstream(get_global_config_path()) << "log_level: trace\n";

    ASSERT_TRUE(create_default_global_config().is_ok());
    auto r = Config::load_global();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.session().log_level, "trace");
}

TEST_F(ConfigTest, ProjectOverridesGlobal) {
    fs::create_directories(get_global_config_dir());
    std::ofstream(get_global_config_path()) << "log_level: warn\ndebug: true\n";
    std::ofstream(test_dir / "project" / "qbridge.yaml") << "log_level: error\n";

    auto r = Config::load(test_dir / "project");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.session().log_level, "error");
    EXPECT_TRUE(r.value.session().debug);
}

TEST_F(ConfigTest, ResolveWorkingDir) {
    SessionConfig s;
    EXPECT_EQ(resolve_working_dir(s), test_dir / "home" / "amazon-q");

    s.working_dir = "~/elsewhere";
    EXPECT_EQ(resolve_working_dir(s), test_dir / "home" / "elsewhere");

    s.working_dir = "/srv/chat";
    EXPECT_EQ(resolve_working_dir(s), fs::path("/srv/chat"));
}

TEST(SessionConfigTools, ReadAlwaysTrusted) {
    SessionConfig s;
    EXPECT_EQ(s.trusted_tools(), std::vector<std::string>{"fs_read"});
    s.trust_execute_bash = true;
    EXPECT_EQ(s.trusted_tools(), (std::vector<std::string>{"fs_read", "execute_bash"}));
}

TEST_F(ConfigTest, ExpandUserAndEnsureDirectory) {
    EXPECT_EQ(platform::expand_user("~"), test_dir / "home");
    EXPECT_EQ(platform::expand_user("~user/x"), fs::path("~user/x"));

    fs::path nested = test_dir / "a" / "b" / "c";
    ASSERT_TRUE(platform::ensure_directory(nested).is_ok());
    EXPECT_TRUE(fs::is_directory(nested));

    // A regular file in the way
    std::ofstream(test_dir / "blocker") << "x";
    EXPECT_TRUE(platform::ensure_directory(test_dir / "blocker" / "sub").is_err());
}
