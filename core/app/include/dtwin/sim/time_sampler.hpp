#pragma once

#include <cstdint>
#include <random>

namespace dtwin {
namespace sim {

// -----------------------------------------------------------------------------
// TimeSampler — seeded source of stochastic durations
// -----------------------------------------------------------------------------
//
// @brief  Draws stage durations, inter-arrival gaps and small uniform
//         choices from one private random stream.
//
// @details
// sample(mean, std, quantity) draws from Normal(mean * q, std * sqrt(q))
// and truncates at kMinDuration, so the clock always advances by a positive
// amount. Batching q units costs q times the mean but only sqrt(q) times the
// spread.
//
// Streams: a sampler is built from (seed, stream, index) through
// std::seed_seq. The simulation gives the arrival process one stream and
// every order its own, so that two runs differing only in a capacity see
// the same order contents and the same per-order service draws.
//
// No global state: two samplers never share an engine, so concurrent runs
// cannot cross-contaminate.
//
// Errors:
//   SamplingError on mean <= 0, std < 0, quantity <= 0, rate <= 0 or an
//   empty uniform range.
// -----------------------------------------------------------------------------
class TimeSampler {
 public:
  static constexpr double kMinDuration = 0.1;

  // Well-known stream numbers.
  static constexpr std::uint64_t kArrivalStream = 0;
  static constexpr std::uint64_t kOrderStream = 1;
  static constexpr std::uint64_t kBacklogStream = 2;
  static constexpr std::uint64_t kInventoryStream = 3;

  explicit TimeSampler(std::uint64_t seed, std::uint64_t stream = 0,
                       std::uint64_t index = 0);

  double sample(double mean, double std, double quantity = 1.0);

  // Exponential gap with the given rate (events per time unit).
  double exponential(double rate);

  // Uniform integer in [lo, hi].
  int uniformInt(int lo, int hi);

  // Uniform real in [lo, hi).
  double uniformReal(double lo, double hi);

 private:
  std::mt19937_64 engine_;
};

}  // namespace sim
}  // namespace dtwin
