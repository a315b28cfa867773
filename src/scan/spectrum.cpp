#include "scan/spectrum.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace chanscan {

double SpectrumSample::bin_width() const {
  if (power_db.empty())
    return 0.0;
  return sample_rate / static_cast<double>(power_db.size());
}

double SpectrumSample::bin_to_freq(double bin) const {
  const double n = static_cast<double>(power_db.size());
  return center_freq_hz + (bin - n / 2.0) * sample_rate / n;
}

bool SpectrumSample::valid(size_t expected_bins) const {
  if (power_db.empty() || !(sample_rate > 0.0) ||
      !std::isfinite(center_freq_hz))
    return false;
  if (expected_bins != 0 && power_db.size() != expected_bins)
    return false;
  for (float p : power_db) {
    if (!std::isfinite(p))
      return false;
  }
  return true;
}

int64_t round_to_spacing(double freq_hz, int64_t spacing_hz) {
  if (spacing_hz <= 0)
    return std::llround(freq_hz);
  return std::llround(freq_hz / static_cast<double>(spacing_hz)) * spacing_hz;
}

SpectrumEstimator::SpectrumEstimator(EstimatorOptions opts) : opts_(opts) {}

std::vector<Candidate>
SpectrumEstimator::estimate(const SpectrumSample &spectrum, float threshold_db,
                            int64_t channel_spacing_hz) const {
  std::vector<Candidate> out;
  if (!spectrum.valid())
    return out;

  const size_t n = spectrum.bins();
  const bool narrow_bins =
      static_cast<double>(channel_spacing_hz) > spectrum.bin_width();

  // bucket -> peak power, so clusters that round together merge
  std::map<int64_t, float> buckets;

  size_t k = 0;
  while (k < n) {
    if (spectrum.power_db[k] <= threshold_db) {
      ++k;
      continue;
    }
    size_t start = k;
    double weight_sum = 0.0;
    double moment = 0.0;
    float peak = spectrum.power_db[k];
    while (k < n && spectrum.power_db[k] > threshold_db) {
      // linear power weights, the dB domain would bias toward weak bins
      double w = std::pow(10.0, spectrum.power_db[k] / 10.0);
      weight_sum += w;
      moment += w * static_cast<double>(k);
      peak = std::max(peak, spectrum.power_db[k]);
      ++k;
    }
    size_t width = k - start;
    if (width == 1 && opts_.drop_single_bin && narrow_bins)
      continue;

    double centroid_bin = moment / weight_sum;
    int64_t freq =
        round_to_spacing(spectrum.bin_to_freq(centroid_bin), channel_spacing_hz);
    auto it = buckets.find(freq);
    if (it == buckets.end())
      buckets.emplace(freq, peak);
    else
      it->second = std::max(it->second, peak);
  }

  out.reserve(buckets.size());
  for (const auto &b : buckets)
    out.push_back(Candidate{b.first, b.second});
  std::sort(out.begin(), out.end(),
            [](const Candidate &a, const Candidate &b) {
              if (a.power_db != b.power_db)
                return a.power_db > b.power_db;
              return a.freq_hz < b.freq_hz;
            });
  return out;
}

} // namespace chanscan
