/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_core_CStaticThreadPool_h
#define INCLUDED_segreg_core_CStaticThreadPool_h

#include <core/CConcurrentQueue.h>
#include <core/ImportExport.h>

#include <boost/any.hpp>

#include <atomic>
#include <future>
#include <thread>
#include <vector>

namespace segreg {
namespace core {

//! \brief A minimal fixed size thread pool for implementing CThreadPoolExecutor.
//!
//! IMPLEMENTATION:\n
//! This purposely has a very limited interface and is intended to support
//! the executor which exposes the pool to the rest of the code via calls to
//! core::async. All threads consume a single shared bounded queue.
class CORE_EXPORT CStaticThreadPool {
public:
    using TTask = std::packaged_task<boost::any()>;

public:
    explicit CStaticThreadPool(std::size_t size);

    ~CStaticThreadPool();

    CStaticThreadPool(const CStaticThreadPool&) = delete;
    CStaticThreadPool(CStaticThreadPool&&) = delete;
    CStaticThreadPool& operator=(const CStaticThreadPool&) = delete;
    CStaticThreadPool& operator=(CStaticThreadPool&&) = delete;

    //! Get the number of threads in the pool.
    std::size_t size() const;

    //! Schedule a Callable type to be executed by a thread in the pool.
    //!
    //! \note This can block if the task queue is full.
    void schedule(TTask&& task);

    //! Check if the thread pool has been marked as busy.
    bool busy() const;

    //! Mark the thread pool as busy or free.
    void busy(bool busy);

private:
    //! \brief Adds the ability to signal a worker to exit.
    class CWrappedTask {
    public:
        CWrappedTask() = default;
        explicit CWrappedTask(TTask&& task, bool finish = false);

        //! Execute the task and return true if the worker should exit.
        bool operator()();

    private:
        TTask m_Task;
        bool m_Finish{false};
    };
    using TWrappedTaskQueue = CConcurrentQueue<CWrappedTask, 50>;
    using TThreadVec = std::vector<std::thread>;

private:
    void shutdown();
    void worker();

private:
    std::atomic_bool m_Busy;
    TWrappedTaskQueue m_TaskQueue;
    TThreadVec m_Pool;
};
}
}

#endif // INCLUDED_segreg_core_CStaticThreadPool_h
