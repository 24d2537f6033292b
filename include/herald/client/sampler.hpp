#pragma once

#include <functional>

namespace herald::client {

/// Source of uniform draws in [0, 1). Injected so tests can be deterministic.
using random_source_t = std::function<double()>;

/// Default source: a per-thread std::mt19937_64 seeded from
/// std::random_device.
random_source_t make_default_random_source();

/// Decide whether one submission is kept.
///
/// A rate of exactly 1 always keeps and exactly 0 always drops without
/// drawing; any other rate draws once and keeps iff the draw is below it.
/// Throws herald::common::configuration_error for a rate outside [0, 1].
bool sample(double rate, const random_source_t& random);

}  // namespace herald::client
