#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace chanscan {

// One power spectrum delivery from the capture front end. Bin k maps to
// center_freq_hz + (k - N/2) * sample_rate / N.
struct SpectrumSample {
  std::vector<float> power_db;
  double center_freq_hz{};
  double sample_rate{};

  size_t bins() const { return power_db.size(); }
  double bin_width() const;
  double bin_to_freq(double bin) const;

  // False for an empty or short sample, a non-positive rate or a
  // non-finite bin. expected_bins of 0 accepts any size.
  bool valid(size_t expected_bins = 0) const;
};

struct Candidate {
  int64_t freq_hz;
  float power_db;
};

struct EstimatorOptions {
  // Drop clusters one bin wide when a channel is wider than a bin.
  bool drop_single_bin = true;
};

int64_t round_to_spacing(double freq_hz, int64_t spacing_hz);

class SpectrumEstimator {
public:
  explicit SpectrumEstimator(EstimatorOptions opts = EstimatorOptions());

  // Candidates ordered by peak power descending, then frequency ascending.
  std::vector<Candidate> estimate(const SpectrumSample &spectrum,
                                  float threshold_db,
                                  int64_t channel_spacing_hz) const;

private:
  EstimatorOptions opts_;
};

} // namespace chanscan
