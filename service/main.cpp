#include "backup/config.hpp"
#include "backup/dump_source.hpp"
#include "backup/orchestrator.hpp"
#include "backup/retention.hpp"
#include "cloud/b2_store.hpp"
#include "network/http_client.hpp"
#include "network/tls_context.hpp"
#include "utils/backoff.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "utils/utils.hpp"
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <pthread.h>
#include <thread>
#include <spdlog/spdlog.h>
//---------------------------------------------------------------------------
// DumpSync - Incremental Database Backup to Object Storage
// The DumpSync Authors, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
using namespace dumpsync;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// The stop flag shared with the running backup
atomic<bool> stopRequested(false);
/// Wakes the scheduler
mutex stopMutex;
condition_variable stopCondition;
//---------------------------------------------------------------------------
void waitForSignal(sigset_t signals)
// Set the stop flag on SIGINT or SIGTERM
{
    int signal = 0;
    if (sigwait(&signals, &signal)) {
        spdlog::error("Waiting for signals failed");
        return;
    }
    spdlog::info("Received signal {}, stopping", signal);
    {
        lock_guard lock(stopMutex);
        stopRequested = true;
    }
    stopCondition.notify_all();
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
int main(int /*argc*/, char** /*argv*/) {
    backup::Config config;
    try {
        config = backup::Config::fromEnvironment();
        utils::initLogging(config.logLevel, config.logFile);
    } catch (const ConfigError& e) {
        cerr << e.what() << endl;
        return 1;
    }

    // Signals are handled by the waiter thread only
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr)) {
        spdlog::critical("Cannot block termination signals");
        return 1;
    }
    thread signalThread(waitForSignal, signals);
    signalThread.detach();

    network::TLSContext::initOpenSSL();
    network::SocketHttpClient::Settings httpSettings;
    httpSettings.callTimeout = config.httpTimeout;
    utils::ThreadSleeper sleeper;

    unique_ptr<network::SocketHttpClient> client;
    unique_ptr<cloud::B2Store> store;
    try {
        client = make_unique<network::SocketHttpClient>(httpSettings);
        store = make_unique<cloud::B2Store>(config.b2, *client, sleeper, utils::BackoffPolicy(config.backoff));
    } catch (const runtime_error& e) {
        spdlog::critical("Cannot set up the remote store: {}", e.what());
        return 1;
    }
    backup::MongoDump dump(config.mongo);
    backup::KeepLatestRuns retention(config.retentionRuns);
    backup::Orchestrator orchestrator(*store, dump, &retention, {config.backupPath, config.chunkSize, config.diffPolicy}, stopRequested);

    spdlog::info("Backing up {} to bucket {} every {} hours", utils::maskCredentials(config.mongo.uri), config.b2.bucketName, config.interval.count());
    while (!stopRequested) {
        try {
            auto report = orchestrator.run();
            spdlog::info("Backup {} completed, uploaded {} of {} chunks", report.runDirectory, report.uploaded, report.chunks);
        } catch (const CancelledError& e) {
            spdlog::warn("{}", e.what());
            break;
        } catch (const exception& e) {
            spdlog::error("Backup failed: {}", e.what());
        }

        unique_lock lock(stopMutex);
        if (stopCondition.wait_for(lock, config.interval, [] { return stopRequested.load(); }))
            break;
        spdlog::info("Starting scheduled backup");
    }

    spdlog::info("Shutting down");
    spdlog::shutdown();
    return 0;
}
//---------------------------------------------------------------------------
