#include "utils/backoff.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace dumpsync::utils {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
BackoffPolicy::BackoffPolicy(Settings settings, uint64_t seed) : _settings(settings), _random(seed)
// The constructor
{
    if (!_settings.maxRetries)
        throw runtime_error("At least one attempt is required!");
    if (_settings.maxDelay < _settings.baseDelay)
        throw runtime_error("The delay ceiling must not be below the base delay!");
}
//---------------------------------------------------------------------------
chrono::milliseconds BackoffPolicy::delay(unsigned attempt, double jitter) const
// Compute base * 2^attempt * (0.5 + jitter) capped by the ceiling
{
    auto ceiling = static_cast<double>(_settings.maxDelay.count());
    // Large attempts saturate at the ceiling anyway
    auto exponential = static_cast<double>(_settings.baseDelay.count()) * ldexp(1.0, static_cast<int>(min(attempt, 63u)));
    auto jittered = exponential * (0.5 + clamp(jitter, 0.0, 1.0));
    return chrono::milliseconds(static_cast<int64_t>(min(jittered, ceiling)));
}
//---------------------------------------------------------------------------
chrono::milliseconds BackoffPolicy::nextDelay(unsigned attempt)
// Compute the delay with a random jitter
{
    uniform_real_distribution<double> distribution(0.0, 1.0);
    return delay(attempt, distribution(_random));
}
//---------------------------------------------------------------------------
void ThreadSleeper::sleep(chrono::milliseconds duration)
// Block the thread
{
    this_thread::sleep_for(duration);
}
//---------------------------------------------------------------------------
} // namespace dumpsync::utils
