#include "dtwin/sim/time_sampler.hpp"
#include "dtwin/common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace dtwin {
namespace sim {

namespace {

std::uint32_t low32(std::uint64_t v) {
  return static_cast<std::uint32_t>(v & 0xffffffffULL);
}

std::uint32_t high32(std::uint64_t v) {
  return static_cast<std::uint32_t>(v >> 32);
}

}  // namespace

TimeSampler::TimeSampler(std::uint64_t seed, std::uint64_t stream,
                         std::uint64_t index) {
  std::seed_seq seq{low32(seed),   high32(seed),  low32(stream),
                    high32(stream), low32(index), high32(index)};
  engine_.seed(seq);
}

double TimeSampler::sample(double mean, double std, double quantity) {
  if (!(mean > 0.0) || !(std >= 0.0) || !(quantity > 0.0)) {
    std::ostringstream oss;
    oss << "invalid duration request: mean=" << mean << " std=" << std
        << " quantity=" << quantity;
    throw SamplingError(oss.str());
  }

  double centre = mean * quantity;
  double spread = std * std::sqrt(quantity);
  if (spread == 0.0) {
    return std::max(centre, kMinDuration);
  }
  std::normal_distribution<double> dist(centre, spread);
  return std::max(dist(engine_), kMinDuration);
}

double TimeSampler::exponential(double rate) {
  if (!(rate > 0.0)) {
    std::ostringstream oss;
    oss << "invalid exponential rate " << rate;
    throw SamplingError(oss.str());
  }
  std::exponential_distribution<double> dist(rate);
  return dist(engine_);
}

int TimeSampler::uniformInt(int lo, int hi) {
  if (lo > hi) {
    std::ostringstream oss;
    oss << "empty integer range [" << lo << ", " << hi << "]";
    throw SamplingError(oss.str());
  }
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(engine_);
}

double TimeSampler::uniformReal(double lo, double hi) {
  if (!(lo < hi)) {
    std::ostringstream oss;
    oss << "empty real range [" << lo << ", " << hi << ")";
    throw SamplingError(oss.str());
  }
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(engine_);
}

}  // namespace sim
}  // namespace dtwin
