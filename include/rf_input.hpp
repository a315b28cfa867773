#pragma once
#include "scan/scan_engine.hpp"
#include "scan/spectrum.hpp"
#include <atomic>
#include <complex>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

struct rtlsdr_dev; // forward declaration from librtlsdr
struct fftwf_plan_s;

namespace chanscan {

struct RfSettings {
  int device_index = 0;
  uint32_t sample_rate = 2400000;
  double gain_db = 0.0; // 0 selects automatic gain
  int freq_correction_ppm = 0;
  size_t fft_size = 1024;
};

// RTL-SDR capture turned into an averaged dB power spectrum. Every
// spectrum() call returns the average since the previous call.
class RfInput : public TunerControl {
public:
  explicit RfInput(RfSettings settings);
  ~RfInput();

  RfInput(const RfInput &) = delete;
  RfInput &operator=(const RfInput &) = delete;

  bool open();
  void close();

  // Retunes and drops the partial average of the previous window.
  bool set_center_frequency(int64_t freq_hz) override;

  bool start();
  void stop();

  // Empty power_db when no full FFT frame arrived since the last call.
  SpectrumSample spectrum();

private:
  static void rtlsdr_callback(unsigned char *buf, uint32_t len, void *ctx);
  void handle_samples(unsigned char *buf, uint32_t len);
  void reset_average();

  RfSettings settings_;
  rtlsdr_dev *dev_;
  std::thread worker_;
  std::atomic<bool> running_{false};

  // FFT input filled by the rtl-sdr callback thread.
  std::vector<std::complex<float>> fft_in_;
  std::vector<std::complex<float>> fft_out_;
  std::vector<float> window_;
  size_t fill_{};
  fftwf_plan_s *plan_;

  std::vector<double> power_sum_;
  size_t frames_{};
  int64_t center_hz_{};
  std::mutex mutex_;
};

} // namespace chanscan
