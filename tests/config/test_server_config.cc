#include <cstdio>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "loopmux/config/server_config.h"

using namespace loopmux;
using namespace loopmux::config;

namespace {

class ServerConfigTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (!temp_path_.empty()) {
      std::remove(temp_path_.c_str());
    }
  }

  std::string writeTempFile(const std::string& content) {
    temp_path_ = ::testing::TempDir() + "loopmux_config_test.json";
    std::ofstream out(temp_path_);
    out << content;
    return temp_path_;
  }

  std::string temp_path_;
};

TEST_F(ServerConfigTest, Defaults) {
  ServerConfig config;

  EXPECT_EQ(config.port_range.min, 10000);
  EXPECT_EQ(config.port_range.max, 65535);
  EXPECT_EQ(config.bind_address, "127.0.0.1");
  EXPECT_TRUE(config.sse.enabled);
  EXPECT_EQ(config.sse.path, "/mcp");
  EXPECT_EQ(config.sse.message_path, "/messages");
  EXPECT_EQ(config.sse.heartbeat_interval, std::chrono::seconds(30));
  EXPECT_EQ(config.ping_interval, std::chrono::seconds(30));
  EXPECT_EQ(config.auth_header, "X-Claude-Code-IDE-Authorization");
  EXPECT_NO_THROW(config.validate());
}

TEST_F(ServerConfigTest, DurationParsing) {
  auto seconds = Duration::parse(std::string("30s"));
  EXPECT_TRUE(seconds.first);
  EXPECT_EQ(seconds.second.count(), 30000);

  auto minutes = Duration::parse(std::string("2m"));
  EXPECT_EQ(minutes.second.count(), 120000);

  auto millis = Duration::parse(json(250));
  EXPECT_TRUE(millis.first);
  EXPECT_EQ(millis.second.count(), 250);

  EXPECT_FALSE(Duration::parse(std::string("30 s")).first);
  EXPECT_FALSE(Duration::parse(std::string("-5s")).first);
  EXPECT_FALSE(Duration::parse(json(-1)).first);
  EXPECT_FALSE(Duration::parse(json::array()).first);

  EXPECT_EQ(Duration::toString(std::chrono::milliseconds(90000)), "90s");
  EXPECT_EQ(Duration::toString(std::chrono::milliseconds(3600000)), "1h");
  EXPECT_EQ(Duration::toString(std::chrono::milliseconds(1500)), "1500ms");
}

TEST_F(ServerConfigTest, FromJsonOverridesFields) {
  json j = {{"port_range", {{"min", 20000}, {"max", 20010}}},
            {"sse",
             {{"enabled", false},
              {"path", "/events"},
              {"heartbeat_interval", "5s"}}},
            {"ping_interval", 1000},
            {"log_level", "debug"}};

  ServerConfig config = ServerConfig::fromJson(j);
  EXPECT_EQ(config.port_range.min, 20000);
  EXPECT_EQ(config.port_range.max, 20010);
  EXPECT_FALSE(config.sse.enabled);
  EXPECT_EQ(config.sse.path, "/events");
  EXPECT_EQ(config.sse.message_path, "/messages");
  EXPECT_EQ(config.sse.heartbeat_interval.count(), 5000);
  EXPECT_EQ(config.ping_interval.count(), 1000);
  EXPECT_EQ(config.log_level, "debug");
  EXPECT_NO_THROW(config.validate());
}

TEST_F(ServerConfigTest, ToJsonRoundTripsThroughFromJson) {
  ServerConfig original;
  original.sse.path = "/stream";
  original.listen_backlog = 16;

  ServerConfig copy = ServerConfig::fromJson(original.toJson());
  EXPECT_EQ(copy.sse.path, "/stream");
  EXPECT_EQ(copy.listen_backlog, 16);
  EXPECT_EQ(copy.sse.heartbeat_interval, original.sse.heartbeat_interval);
}

TEST_F(ServerConfigTest, TypeErrorNamesField) {
  json j = {{"port_range", {{"min", "low"}}}};
  try {
    ServerConfig::fromJson(j);
    FAIL() << "expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ(e.field(), "port_range.min");
  }
}

TEST_F(ServerConfigTest, NonObjectRootRejected) {
  try {
    ServerConfig::fromJson(json::array());
    FAIL() << "expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ(e.field(), "root");
  }
}

TEST_F(ServerConfigTest, ValidationFailures) {
  ServerConfig inverted;
  inverted.port_range.min = 3000;
  inverted.port_range.max = 2000;
  EXPECT_THROW(inverted.validate(), ConfigValidationError);

  ServerConfig bad_path;
  bad_path.sse.path = "mcp";
  try {
    bad_path.validate();
    FAIL() << "expected ConfigValidationError";
  } catch (const ConfigValidationError& e) {
    EXPECT_EQ(e.field(), "sse.path");
    EXPECT_NE(std::string(e.what()).find("'sse.path'"), std::string::npos);
  }

  ServerConfig query_path;
  query_path.sse.message_path = "/messages?x=1";
  EXPECT_THROW(query_path.validate(), ConfigValidationError);

  ServerConfig bad_level;
  bad_level.log_level = "verbose";
  EXPECT_THROW(bad_level.validate(), ConfigValidationError);

  ServerConfig bad_header;
  bad_header.auth_header = "X-Auth: yes";
  EXPECT_THROW(bad_header.validate(), ConfigValidationError);
}

TEST_F(ServerConfigTest, LoadFromFile) {
  auto path = writeTempFile(R"({"bind_address": "127.0.0.1",
                                "sse": {"message_path": "/rpc"}})");
  ServerConfig config = loadServerConfigFile(path);
  EXPECT_EQ(config.sse.message_path, "/rpc");
}

TEST_F(ServerConfigTest, LoadErrors) {
  EXPECT_THROW(loadServerConfigFile("/nonexistent/loopmux.json"),
               ConfigParseError);

  auto path = writeTempFile("{ not json");
  EXPECT_THROW(loadServerConfigFile(path), ConfigParseError);
}

}  // namespace
