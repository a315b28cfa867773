#include "rf_input.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <fftw3.h>
#include <rtl-sdr.h>

namespace chanscan {

RfInput::RfInput(RfSettings settings)
    : settings_(settings), dev_(nullptr), fft_in_(settings.fft_size),
      fft_out_(settings.fft_size), window_(settings.fft_size),
      power_sum_(settings.fft_size, 0.0) {
  const size_t n = settings_.fft_size;
  for (size_t i = 0; i < n; ++i)
    window_[i] = 0.5f - 0.5f * std::cos(2.0f * static_cast<float>(M_PI) *
                                         static_cast<float>(i) /
                                         static_cast<float>(n - 1));
  plan_ = fftwf_plan_dft_1d(
      static_cast<int>(n), reinterpret_cast<fftwf_complex *>(fft_in_.data()),
      reinterpret_cast<fftwf_complex *>(fft_out_.data()), FFTW_FORWARD,
      FFTW_ESTIMATE);
}

RfInput::~RfInput() {
  stop();
  close();
  fftwf_destroy_plan(plan_);
}

bool RfInput::open() {
  if (rtlsdr_open(&dev_, static_cast<uint32_t>(settings_.device_index)) != 0) {
    log::error("Failed to open RTL-SDR device " +
               std::to_string(settings_.device_index));
    dev_ = nullptr;
    return false;
  }
  if (rtlsdr_set_sample_rate(dev_, settings_.sample_rate) != 0) {
    log::error("RTL-SDR rejected sample rate " +
               std::to_string(settings_.sample_rate));
    close();
    return false;
  }
  if (settings_.gain_db == 0.0) {
    if (rtlsdr_set_tuner_gain_mode(dev_, 0) != 0)
      log::warn("RTL-SDR rejected automatic gain mode");
  } else if (rtlsdr_set_tuner_gain_mode(dev_, 1) != 0 ||
             rtlsdr_set_tuner_gain(
                 dev_, static_cast<int>(std::lround(settings_.gain_db * 10))) !=
                 0) {
    log::warn("RTL-SDR rejected gain setting");
  }
  if (settings_.freq_correction_ppm != 0 &&
      rtlsdr_set_freq_correction(dev_, settings_.freq_correction_ppm) != 0)
    log::warn("RTL-SDR rejected frequency correction");
  return true;
}

void RfInput::close() {
  if (dev_) {
    rtlsdr_close(dev_);
    dev_ = nullptr;
  }
}

bool RfInput::set_center_frequency(int64_t freq_hz) {
  if (!dev_ || freq_hz <= 0 || freq_hz > UINT32_MAX)
    return false;
  if (rtlsdr_set_center_freq(dev_, static_cast<uint32_t>(freq_hz)) != 0)
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  center_hz_ = freq_hz;
  reset_average();
  return true;
}

bool RfInput::start() {
  if (!dev_ || running_)
    return false;
  running_ = true;
  worker_ = std::thread([this]() {
    rtlsdr_reset_buffer(dev_);
    rtlsdr_read_async(dev_, &RfInput::rtlsdr_callback, this, 0, 0);
  });
  return true;
}

void RfInput::stop() {
  if (running_) {
    running_ = false;
    rtlsdr_cancel_async(dev_);
    if (worker_.joinable()) {
      worker_.join();
    }
  }
}

void RfInput::rtlsdr_callback(unsigned char *buf, uint32_t len, void *ctx) {
  auto self = static_cast<RfInput *>(ctx);
  self->handle_samples(buf, len);
}

void RfInput::handle_samples(unsigned char *buf, uint32_t len) {
  const size_t n = settings_.fft_size;
  std::lock_guard<std::mutex> lock(mutex_);
  for (uint32_t i = 0; i + 1 < len; i += 2) {
    float i_val = (static_cast<int>(buf[i]) - 127.5f) / 127.5f;
    float q_val = (static_cast<int>(buf[i + 1]) - 127.5f) / 127.5f;
    fft_in_[fill_] = std::complex<float>(i_val, q_val) * window_[fill_];
    if (++fill_ < n)
      continue;
    fill_ = 0;
    fftwf_execute(plan_);
    // fftshift so bin 0 is the lowest frequency
    for (size_t k = 0; k < n; ++k) {
      const auto &v = fft_out_[(k + n / 2) % n];
      power_sum_[k] += static_cast<double>(std::norm(v));
    }
    ++frames_;
  }
}

void RfInput::reset_average() {
  std::fill(power_sum_.begin(), power_sum_.end(), 0.0);
  frames_ = 0;
  fill_ = 0;
}

SpectrumSample RfInput::spectrum() {
  std::lock_guard<std::mutex> lock(mutex_);
  SpectrumSample s;
  s.center_freq_hz = static_cast<double>(center_hz_);
  s.sample_rate = static_cast<double>(settings_.sample_rate);
  if (frames_ == 0)
    return s;
  const double scale =
      1.0 / (static_cast<double>(frames_) * settings_.fft_size);
  s.power_db.resize(power_sum_.size());
  for (size_t k = 0; k < power_sum_.size(); ++k)
    s.power_db[k] = static_cast<float>(
        10.0 * std::log10(power_sum_[k] * scale + 1e-20));
  reset_average();
  return s;
}

} // namespace chanscan
