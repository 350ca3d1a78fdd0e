/*
 * FireSync - Desktop
 * Copyright (C) 2023-2025 Infomaniak Network SA
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "jobmanagerdata.h"

namespace FSC {

void JobManagerData::queue(std::shared_ptr<AbstractJob> job) {
    const std::scoped_lock lock(_mutex);
    (void) _managedJobs.try_emplace(job->jobId(), job);
    _queuedJobs.push_back(std::move(job));
}

void JobManagerData::requeue(std::shared_ptr<AbstractJob> job) {
    const std::scoped_lock lock(_mutex);
    (void) _runningJobs.erase(job->jobId());
    _queuedJobs.push_front(std::move(job));
}

std::shared_ptr<AbstractJob> JobManagerData::pop() {
    const std::scoped_lock lock(_mutex);
    if (_queuedJobs.empty()) return nullptr;

    auto job = std::move(_queuedJobs.front());
    _queuedJobs.pop_front();
    return job;
}

bool JobManagerData::hasQueuedJob() const {
    const std::scoped_lock lock(_mutex);
    return !_queuedJobs.empty();
}

bool JobManagerData::isManaged(const UniqueId jobId) const {
    const std::scoped_lock lock(_mutex);
    return _managedJobs.contains(jobId);
}

bool JobManagerData::addToRunningJobs(const UniqueId jobId) {
    const std::scoped_lock lock(_mutex);
    return _runningJobs.insert(jobId).second;
}

void JobManagerData::erase(const UniqueId jobId) {
    {
        const std::scoped_lock lock(_mutex);
        (void) _managedJobs.erase(jobId);
        (void) _runningJobs.erase(jobId);
    }
    _erased.notify_all();
}

void JobManagerData::waitUntilErased(const UniqueId jobId) const {
    std::unique_lock lock(_mutex);
    _erased.wait(lock, [this, jobId] { return !_managedJobs.contains(jobId); });
}

std::unordered_set<UniqueId> JobManagerData::runningJobs() const {
    const std::scoped_lock lock(_mutex);
    return _runningJobs;
}

std::shared_ptr<AbstractJob> JobManagerData::getJob(const UniqueId jobId) const {
    const std::scoped_lock lock(_mutex);
    const auto it = _managedJobs.find(jobId);
    return it == _managedJobs.end() ? nullptr : it->second;
}

void JobManagerData::clear() {
    {
        const std::scoped_lock lock(_mutex);
        _queuedJobs.clear();
        for (const auto &[_, job]: _managedJobs) {
            job->setMainCallback(nullptr);
        }
        _managedJobs.clear();
        _runningJobs.clear();
    }
    _erased.notify_all();
}

} // namespace FSC
