#include <catch2/catch.hpp>
#include "cli.hpp"
#include "config.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace chanscan;

namespace {
// Writes a scratch file that is removed again when the test ends.
struct TempFile {
  TempFile(const std::string &name, const std::string &text) : path(name) {
    std::ofstream out(path);
    out << text;
  }
  ~TempFile() { std::remove(path.c_str()); }
  std::string path;
};
} // namespace

TEST_CASE("Config file values override the defaults") {
  TempFile file("test_chanscan.conf", "# scanner\n"
                                      "demod = 6\n"
                                      "demodulator = am\n"
                                      "freq = 146e6 460e6-470e6\n"
                                      "threshold = 12  # dB\n"
                                      "channel_spacing = 12500\n"
                                      "write = yes\n"
                                      "log_type = fixed-field\n"
                                      "\n"
                                      "web_port = 9000\n");
  auto cfg = Config::load(file.path);
  REQUIRE(cfg.num_demod == 6);
  REQUIRE(cfg.demod == DemodKind::AM);
  REQUIRE(cfg.freq_specs.size() == 2);
  REQUIRE(cfg.threshold_db == 12);
  REQUIRE(cfg.channel_spacing == 12500);
  REQUIRE(cfg.record);
  REQUIRE(cfg.log_type == "fixed-field");
  REQUIRE(cfg.web_port == 9000);
  REQUIRE(cfg.quiet_timeout == 12.0);
  REQUIRE_NOTHROW(cfg.validate());

  auto spans = cfg.spans();
  REQUIRE(spans.size() == 2);
  REQUIRE(spans[0].is_point());
  REQUIRE(spans[1].low_hz == 460000000);
  REQUIRE(spans[1].high_hz == 470000000);
}

TEST_CASE("Missing config file keeps the defaults") {
  auto cfg = Config::load("does_not_exist.conf");
  REQUIRE(cfg.num_demod == 4);
  REQUIRE(cfg.channel_spacing == 5000);
  REQUIRE(cfg.active_timeout == 20.0);
  REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("Bad config entries are rejected") {
  Config cfg;
  REQUIRE_THROWS_AS(cfg.set("demod", "four"), ConfigError);
  REQUIRE_THROWS_AS(cfg.set("demod", "2.5"), ConfigError);
  REQUIRE_THROWS_AS(cfg.set("write", "maybe"), ConfigError);
  REQUIRE_THROWS_AS(cfg.set("demodulator", "ssb"), ConfigError);
  REQUIRE_THROWS_AS(cfg.set("colour", "blue"), ConfigError);

  TempFile file("test_chanscan_bad.conf", "demod 4\n");
  REQUIRE_THROWS_AS(Config::load(file.path), ConfigError);
}

TEST_CASE("Invalid settings fail validation") {
  Config cfg;
  cfg.num_demod = 0;
  REQUIRE_THROWS_AS(cfg.validate(), ConfigError);

  cfg = Config();
  cfg.channel_spacing = 0;
  REQUIRE_THROWS_AS(cfg.validate(), ConfigError);

  cfg = Config();
  cfg.quiet_timeout = -1.0;
  REQUIRE_THROWS_AS(cfg.validate(), ConfigError);

  cfg = Config();
  cfg.log_type = "syslog";
  REQUIRE_THROWS_AS(cfg.validate(), ConfigError);

  cfg = Config();
  cfg.log_type = "json-server";
  REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
  cfg.log_target = "http://127.0.0.1:8000/channels";
  REQUIRE_NOTHROW(cfg.validate());

  cfg = Config();
  cfg.freq_specs = {"470e6-460e6"};
  REQUIRE_THROWS_AS(cfg.validate(), ConfigError);

  cfg = Config();
  cfg.freq_specs.clear();
  REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
}

TEST_CASE("Frequency specs parse points and ranges") {
  auto p = parse_frequency_spec("146520000");
  REQUIRE(p.low_hz == 146520000);
  REQUIRE(p.high_hz == 146520000);
  auto r = parse_frequency_spec(" 4.5e8-4.59e8 ");
  REQUIRE(r.low_hz == 450000000);
  REQUIRE(r.high_hz == 459000000);
  REQUIRE_THROWS_AS(parse_frequency_spec("abc"), ConfigError);
  REQUIRE_THROWS_AS(parse_frequency_spec("460e6-460e6"), ConfigError);
  REQUIRE_THROWS_AS(parse_frequency_spec("-5"), ConfigError);
}

TEST_CASE("Engine settings follow the config") {
  Config cfg;
  cfg.num_demod = 3;
  cfg.threshold_db = 15;
  cfg.fft_size = 2048;
  cfg.log_type = "debug";
  auto e = cfg.engine_config();
  REQUIRE(e.num_demod == 3);
  REQUIRE(e.threshold_db == 15.0f);
  REQUIRE(e.expected_bins == 2048);
  REQUIRE(e.log_active_timeout == 15.0);

  cfg.log_type = "none";
  REQUIRE(cfg.engine_config().log_active_timeout == 0.0);
}

TEST_CASE("Command line overrides the config file") {
  TempFile file("test_chanscan_cli.conf", "demod = 6\nthreshold = 12\n");
  const char *argv[] = {"chanscan", "-c",  "test_chanscan_cli.conf",
                        "-t",       "20",  "-f",
                        "146e6",    "-f",  "460e6-470e6",
                        "-P",       "-B",  "12500"};
  Config cfg;
  const int argc = static_cast<int>(sizeof(argv) / sizeof(argv[0]));
  REQUIRE(parse_command_line(argc, argv, cfg));
  REQUIRE(cfg.num_demod == 6);
  REQUIRE(cfg.threshold_db == 20);
  REQUIRE(cfg.freq_specs.size() == 2);
  REQUIRE(cfg.auto_priority);
  REQUIRE_FALSE(cfg.record);
  REQUIRE(cfg.channel_spacing == 12500);
}

TEST_CASE("Malformed command lines raise config errors") {
  const char *unknown[] = {"chanscan", "--bogus"};
  Config cfg;
  REQUIRE_THROWS_AS(parse_command_line(2, unknown, cfg), ConfigError);

  const char *bad_value[] = {"chanscan", "-c", "none.conf", "-n", "x"};
  REQUIRE_THROWS_AS(parse_command_line(5, bad_value, cfg), ConfigError);
}
