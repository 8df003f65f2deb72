/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStaticThreadPool.h>

#include <core/CLogger.h>

#include <algorithm>

namespace segreg {
namespace core {
namespace {
std::size_t computeSize(std::size_t hint) {
    std::size_t bound{std::thread::hardware_concurrency()};
    std::size_t size{bound > 0 ? std::min(hint, bound) : hint};
    return std::max(size, std::size_t{1});
}
}

CStaticThreadPool::CStaticThreadPool(std::size_t size) : m_Busy{false} {
    size = computeSize(size);
    m_Pool.reserve(size);
    for (std::size_t id = 0; id < size; ++id) {
        try {
            m_Pool.emplace_back([this] { this->worker(); });
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Failed to start worker " << id << ": " << e.what());
            this->shutdown();
            throw;
        }
    }
}

CStaticThreadPool::~CStaticThreadPool() {
    this->shutdown();
}

std::size_t CStaticThreadPool::size() const {
    return m_Pool.size();
}

void CStaticThreadPool::schedule(TTask&& task) {
    m_TaskQueue.push(CWrappedTask{std::move(task)});
}

bool CStaticThreadPool::busy() const {
    return m_Busy.load();
}

void CStaticThreadPool::busy(bool value) {
    m_Busy.store(value);
}

void CStaticThreadPool::shutdown() {
    // Each worker exits after executing exactly one finish task.
    for (std::size_t i = 0; i < m_Pool.size(); ++i) {
        m_TaskQueue.push(CWrappedTask{TTask{[] { return boost::any{}; }}, true});
    }

    for (auto& thread : m_Pool) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    m_Pool.clear();
}

void CStaticThreadPool::worker() {
    for (;;) {
        CWrappedTask task{m_TaskQueue.pop()};
        if (task()) {
            break;
        }
        if (m_TaskQueue.load() < 0.2) {
            std::this_thread::yield();
        }
    }
}

CStaticThreadPool::CWrappedTask::CWrappedTask(TTask&& task, bool finish)
    : m_Task{std::move(task)}, m_Finish{finish} {
}

bool CStaticThreadPool::CWrappedTask::operator()() {
    if (m_Task.valid()) {
        // Exceptions thrown by the callable are stored in the task's future.
        m_Task();
    }
    return m_Finish;
}
}
}
