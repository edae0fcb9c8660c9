#pragma once
#include <chrono>
#include <cstdint>
#include <random>
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
/// Exponential backoff with +-50% jitter and a ceiling
class BackoffPolicy {
    public:
    /// The settings
    struct Settings {
        /// The delay of the first retry
        std::chrono::milliseconds baseDelay{1000};
        /// The delay ceiling
        std::chrono::milliseconds maxDelay{60000};
        /// The maximum number of attempts per request
        unsigned maxRetries = 5;
    };

    private:
    /// The settings
    Settings _settings;
    /// The jitter source
    std::mt19937_64 _random;

    public:
    /// The constructor
    explicit BackoffPolicy(Settings settings, uint64_t seed = std::random_device()());

    /// The delay before the retry following the given attempt (0-based), jitter in [0, 1) maps to [0.5, 1.5)
    [[nodiscard]] std::chrono::milliseconds delay(unsigned attempt, double jitter) const;
    /// The delay before the retry following the given attempt with random jitter
    [[nodiscard]] std::chrono::milliseconds nextDelay(unsigned attempt);
    /// The maximum number of attempts
    [[nodiscard]] unsigned maxRetries() const { return _settings.maxRetries; }
    /// The delay ceiling
    [[nodiscard]] std::chrono::milliseconds maxDelay() const { return _settings.maxDelay; }
};
//---------------------------------------------------------------------------
/// Waits between retries, replaceable in tests
class Sleeper {
    public:
    /// The destructor
    virtual ~Sleeper() = default;
    /// Block for the duration
    virtual void sleep(std::chrono::milliseconds duration) = 0;
};
//---------------------------------------------------------------------------
/// Sleeps the calling thread
class ThreadSleeper : public Sleeper {
    public:
    /// Block for the duration
    void sleep(std::chrono::milliseconds duration) override;
};
//---------------------------------------------------------------------------
} // namespace dumpsync::utils
