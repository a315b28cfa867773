#include "channel_log.hpp"
#include "cli.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "data_store.hpp"
#include "demod_bank.hpp"
#include "frequency_files.hpp"
#include "http_poster.hpp"
#include "logging.hpp"
#include "rf_input.hpp"
#include "scan/scan_engine.hpp"
#include "thread_safe_queue.hpp"
#include "web_server.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {
std::atomic<bool> *g_running = nullptr;
void handle_signal(int) {
  if (g_running)
    g_running->store(false);
}

constexpr auto kCyclePeriod = std::chrono::milliseconds(100);
} // namespace

int main(int argc, char **argv) {
  chanscan::Config cfg;
  try {
    if (!chanscan::parse_command_line(argc, argv, cfg))
      return 0;
    cfg.validate();
  } catch (const chanscan::ConfigError &e) {
    chanscan::log::init();
    chanscan::log::error(e.what());
    return 1;
  }
  chanscan::log::init(chanscan::log::level_from_string(cfg.log_level),
                      cfg.debug_file);

  chanscan::PriorityList priorities;
  chanscan::LockoutSet lockouts;
  std::vector<chanscan::ScanStep> steps;
  chanscan::DataStore db(cfg.db_path);
  chanscan::CivetJsonPoster poster;
  std::unique_ptr<chanscan::ChannelLogSink> sink;
  try {
    if (!cfg.priority_file.empty())
      priorities =
          chanscan::load_priority_file(cfg.priority_file, cfg.channel_spacing);
    if (!cfg.lockout_file.empty())
      lockouts =
          chanscan::load_lockout_file(cfg.lockout_file, cfg.channel_spacing);
    steps = chanscan::build_steps(cfg.spans(), cfg.sample_rate);
    sink = chanscan::make_sink(cfg.log_type, cfg.log_target, db, &poster);
  } catch (const chanscan::ConfigError &e) {
    chanscan::log::error(e.what());
    return 1;
  }

  chanscan::log::info("chanscan starting: " + std::to_string(steps.size()) +
                      " capture windows, " + std::to_string(cfg.num_demod) +
                      " demodulators, channel log " + sink->name());
  if (cfg.auto_priority)
    chanscan::log::warn(
        "Auto priority enabled but no classifier is attached; recordings "
        "stay unclassified");

  chanscan::RfSettings rf_settings;
  rf_settings.device_index = cfg.device_index;
  rf_settings.sample_rate = static_cast<uint32_t>(cfg.sample_rate);
  rf_settings.gain_db = cfg.rf_gain_db;
  rf_settings.freq_correction_ppm = cfg.freq_correction;
  rf_settings.fft_size = static_cast<size_t>(cfg.fft_size);
  chanscan::RfInput rf(rf_settings);
  if (!rf.open())
    return 1;

  chanscan::DemodBank bank(static_cast<size_t>(cfg.num_demod), cfg.demod,
                           cfg.sample_rate, cfg.squelch_db, cfg.record, &rf);
  chanscan::ScanEngine engine(cfg.engine_config(), std::move(priorities),
                              std::move(lockouts), std::move(steps), bank,
                              &bank, nullptr, chanscan::wall_clock());

  std::atomic<bool> running{true};
  g_running = &running;
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  // Logger thread writes channel events to the selected sink, one write
  // per wakeup for everything queued.
  chanscan::ThreadSafeQueue<std::vector<chanscan::ChannelEvent>> log_queue;
  std::thread logger([&]() {
    std::vector<chanscan::ChannelEvent> batch;
    while (log_queue.pop(batch)) {
      for (auto &more : log_queue.drain())
        batch.insert(batch.end(), more.begin(), more.end());
      if (!sink->write(batch))
        chanscan::log::warn("Dropped " + std::to_string(batch.size()) +
                            " channel events");
    }
  });

  // Web server runs in its own thread using CivetWeb's internal loop.
  std::thread server_thread([&]() {
    try {
      chanscan::WebServer server(engine, bank, cfg.web_port);
      while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
      }
    } catch (const std::exception &e) {
      chanscan::log::error(std::string("Control server unavailable: ") +
                           e.what());
    }
  });

  if (!rf.start()) {
    chanscan::log::error("Failed to start RTL-SDR streaming");
    running = false;
  }

  while (running) {
    auto next = std::chrono::steady_clock::now() + kCyclePeriod;
    auto sample = rf.spectrum();
    // no complete FFT frame yet, typically right after a retune
    if (!sample.power_db.empty()) {
      auto report = engine.cycle(sample, chanscan::wall_clock());
      if (!report.events.empty())
        log_queue.push(std::move(report.events));
    }
    std::this_thread::sleep_until(next);
  }

  chanscan::log::info("Shutting down");
  server_thread.join();
  auto last = engine.shutdown(chanscan::wall_clock());
  if (!last.empty())
    log_queue.push(std::move(last));
  rf.stop();
  log_queue.stop();
  logger.join();
  db.close();
  chanscan::log::shutdown();
  return 0;
}
