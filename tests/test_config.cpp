#include "test_helpers.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <fstream>
#include <sstream>

class ConfigTest : public ScratchDirTest {
protected:
    fs::path write_config(const std::string& content) {
        fs::path p = dir / "config.yaml";
        std::ofstream(p) << content;
        return p;
    }
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    Config c;
    EXPECT_EQ(c.app_id(), DEFAULT_APP_ID);
    EXPECT_EQ(c.poll_interval_ms(), DEFAULT_POLL_INTERVAL_MS);
    EXPECT_EQ(c.connect_timeout_ms(), DEFAULT_CONNECT_TIMEOUT_MS);
    EXPECT_EQ(c.read_timeout_ms(), DEFAULT_READ_TIMEOUT_MS);
    EXPECT_FALSE(c.port().has_value());
    EXPECT_TRUE(c.runtime_dir().empty());
    EXPECT_TRUE(c.log_file().empty());
}

TEST_F(ConfigTest, InstanceOptionsDefaultsMatchConstants) {
    InstanceOptions o;
    EXPECT_EQ(o.poll_interval_ms, DEFAULT_POLL_INTERVAL_MS);
    EXPECT_EQ(o.connect_timeout_ms, DEFAULT_CONNECT_TIMEOUT_MS);
    EXPECT_EQ(o.read_timeout_ms, DEFAULT_READ_TIMEOUT_MS);
    EXPECT_FALSE(o.port.has_value());

    Config c;
    InstanceOptions from_config = c.instance_options();
    EXPECT_EQ(from_config.poll_interval_ms, o.poll_interval_ms);
    EXPECT_EQ(from_config.connect_timeout_ms, o.connect_timeout_ms);
    EXPECT_EQ(from_config.read_timeout_ms, o.read_timeout_ms);
}

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
    auto r = Config::load(write_config(""));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.app_id(), DEFAULT_APP_ID);
    EXPECT_EQ(r.value.poll_interval_ms(), DEFAULT_POLL_INTERVAL_MS);
}

TEST_F(ConfigTest, LoadsAllKeys) {
    auto r = Config::load(write_config(
        "app_id: launcher\n"
        "runtime_dir: " + (dir / "run").string() + "\n"
        "poll_interval_ms: 100\n"
        "connect_timeout_ms: 2500\n"
        "read_timeout_ms: 750\n"
        "port: 40123\n"
        "log_file: " + (dir / "solo.log").string() + "\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;

    const Config& c = r.value;
    EXPECT_EQ(c.app_id(), "launcher");
    EXPECT_EQ(c.runtime_dir(), dir / "run");
    EXPECT_EQ(c.poll_interval_ms(), 100);
    EXPECT_EQ(c.connect_timeout_ms(), 2500);
    EXPECT_EQ(c.read_timeout_ms(), 750);
    EXPECT_EQ(c.port(), std::optional<int>(40123));
    EXPECT_EQ(c.log_file(), (dir / "solo.log").string());
}

TEST_F(ConfigTest, PortZeroMeansReadTheRegistry) {
    auto r = Config::load(write_config("port: 0\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.port().has_value());
}

TEST_F(ConfigTest, MissingFileIsError) {
    auto r = Config::load(dir / "nope.yaml");
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST_F(ConfigTest, RejectsOutOfRangeNumbers) {
    EXPECT_TRUE(Config::load(write_config("poll_interval_ms: 0\n")).is_err());
    EXPECT_TRUE(Config::load(write_config("poll_interval_ms: 999999\n")).is_err());
    EXPECT_TRUE(Config::load(write_config("connect_timeout_ms: 1\n")).is_err());
    EXPECT_TRUE(Config::load(write_config("read_timeout_ms: -5\n")).is_err());
    EXPECT_TRUE(Config::load(write_config("port: 70000\n")).is_err());

    auto r = Config::load(write_config("poll_interval_ms: 5\n"));
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("poll_interval_ms"), std::string::npos);
}

TEST_F(ConfigTest, RejectsWrongTypes) {
    EXPECT_TRUE(Config::load(write_config("poll_interval_ms: fast\n")).is_err());
    EXPECT_TRUE(Config::load(write_config("connect_timeout_ms: [1, 2]\n")).is_err());
}

TEST_F(ConfigTest, RejectsBadAppId) {
    EXPECT_TRUE(Config::load(write_config("app_id: ../escape\n")).is_err());
    EXPECT_TRUE(Config::load(write_config("app_id: a/b\n")).is_err());
    EXPECT_TRUE(Config::load(write_config("app_id: \"\"\n")).is_err());
}

TEST_F(ConfigTest, RejectsMalformedYaml) {
    EXPECT_TRUE(Config::load(write_config("app_id: [unclosed\n")).is_err());
    EXPECT_TRUE(Config::load(write_config("- just\n- a list\n")).is_err());
}

TEST_F(ConfigTest, OverrideAppId) {
    Config c;
    EXPECT_TRUE(c.override_app_id("other-app").is_ok());
    EXPECT_EQ(c.app_id(), "other-app");
    EXPECT_TRUE(c.override_app_id("bad/id").is_err());
    EXPECT_EQ(c.app_id(), "other-app");
}

TEST_F(ConfigTest, InstanceOptionsFallBackToTempDir) {
    Config c;
    InstanceOptions o = c.instance_options();
    EXPECT_EQ(o.app_id, DEFAULT_APP_ID);
    EXPECT_EQ(o.runtime_dir, fs::temp_directory_path());
    EXPECT_EQ(o.poll_interval_ms, DEFAULT_POLL_INTERVAL_MS);
    EXPECT_FALSE(o.port.has_value());
}

TEST_F(ConfigTest, InstanceOptionsCarryOverrides) {
    auto r = Config::load(write_config(
        "runtime_dir: " + dir.string() + "\nport: 1234\nconnect_timeout_ms: 300\n"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    InstanceOptions o = r.value.instance_options();
    EXPECT_EQ(o.runtime_dir, dir);
    EXPECT_EQ(o.port, std::optional<int>(1234));
    EXPECT_EQ(o.connect_timeout_ms, 300);
}

TEST_F(ConfigTest, DefaultConfigFileLoadsAsDefaults) {
    fs::path p = dir / "sub" / "config.yaml";
    ASSERT_TRUE(create_default_config(p).is_ok());
    ASSERT_TRUE(fs::exists(p));

    auto r = Config::load(p);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.app_id(), DEFAULT_APP_ID);
    EXPECT_EQ(r.value.poll_interval_ms(), DEFAULT_POLL_INTERVAL_MS);
    EXPECT_TRUE(r.value.runtime_dir().empty());
    EXPECT_FALSE(r.value.port().has_value());
}

TEST_F(ConfigTest, DefaultConfigDoesNotOverwrite) {
    fs::path p = write_config("app_id: mine\n");
    ASSERT_TRUE(create_default_config(p).is_ok());

    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "app_id: mine\n");
}
