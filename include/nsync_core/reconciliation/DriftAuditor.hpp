/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// nsync_core/reconciliation/DriftAuditor.hpp
#pragma once

#include "common_types/NetworkTypes.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

class ReconciliationEngine;

/**
 * @brief Periodically cross-checks the local store against every cluster.
 */
class DriftAuditor
{
  public:
    static constexpr std::chrono::seconds DEFAULT_INTERVAL{300};

    /**
     * @param engine   Engine whose checkConsistency() is run.
     * @param interval Time between two audits; the first audit runs right after start().
     */
    explicit DriftAuditor(ReconciliationEngine& engine,
                          std::chrono::seconds interval = DEFAULT_INTERVAL);

    ~DriftAuditor();

    /// Start the audit thread.
    void start();

    /// Request shutdown and join the thread.
    void stop();

    /// Run one audit on the calling thread.
    DriftReport auditOnce();

    std::optional<DriftReport> lastReport() const;

  private:
    /// Main loop executed in the background thread.
    void run();

    ReconciliationEngine& m_engine;
    std::chrono::seconds m_interval;
    std::atomic<bool> m_running{false};
    std::thread m_thread;

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    std::optional<DriftReport> m_lastReport;
};
