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

#include "nsync_core/reconciliation/DriftAuditor.hpp"
#include "common_types/Errors.hpp"
#include "nsync_core/reconciliation/ReconciliationEngine.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"

DriftAuditor::DriftAuditor(ReconciliationEngine& engine, std::chrono::seconds interval)
    : m_engine(engine),
      m_interval(interval)
{
}

DriftAuditor::~DriftAuditor()
{
    stop();
}

void
DriftAuditor::start()
{
    if (m_running.exchange(true))
    {
        // Already running
        return;
    }
    m_thread = std::thread(&DriftAuditor::run, this);
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "DriftAuditor started, interval {}s.",
                       m_interval.count());
}

void
DriftAuditor::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_running.store(false);
    }
    m_wakeup.notify_all();
    if (m_thread.joinable())
    {
        m_thread.join();
        SPDLOG_LOGGER_INFO(Logger::instance(), "DriftAuditor stopped.");
    }
}

DriftReport
DriftAuditor::auditOnce()
{
    int64_t begin = utils::getCurrentTimeMillisSteadyClock();
    DriftReport report = m_engine.checkConsistency();
    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "Audit took {} ms",
                        utils::getCurrentTimeMillisSteadyClock() - begin);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastReport = report;
    return report;
}

std::optional<DriftReport>
DriftAuditor::lastReport() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastReport;
}

void
DriftAuditor::run()
{
    while (m_running.load())
    {
        try
        {
            auditOnce();
        }
        catch (const NetSyncError& e)
        {
            // Retried next round
            SPDLOG_LOGGER_ERROR(Logger::instance(), "Consistency audit failed: {}", e.what());
        }
        catch (const std::exception& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Consistency audit failed unexpectedly: {}",
                                e.what());
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        m_wakeup.wait_for(lock, m_interval, [this]() { return !m_running.load(); });
    }
}
