/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_core_Concurrency_h
#define INCLUDED_segreg_core_Concurrency_h

#include <core/CLogger.h>
#include <core/ImportExport.h>

#include <boost/any.hpp>

#include <algorithm>
#include <functional>
#include <future>
#include <type_traits>
#include <vector>

namespace segreg {
namespace core {
//! \brief The base executor hierarchy.
class CORE_EXPORT CExecutor {
public:
    virtual ~CExecutor() = default;
    virtual void schedule(std::packaged_task<boost::any()>&& f) = 0;
    virtual bool busy() const = 0;
    virtual void busy(bool value) = 0;
};

//! Setup the global default executor for async.
//!
//! \note This is not thread safe as the intention is that it is invoked once,
//! usually at the beginning of main or in single threaded test code.
//! \note If this is called with threads equal to zero it defaults to calling
//! std::thread::hardware_concurrency to size the thread pool.
CORE_EXPORT
void startDefaultAsyncExecutor(std::size_t threadPoolSize = 0);

//! Shutdown the thread pool and reset the executor to sequential in the same thread.
//!
//! \note This is not thread safe.
CORE_EXPORT
void stopDefaultAsyncExecutor();

//! The default async executor.
//!
//! If startDefaultAsyncExecutor hasn't been called execution happens serially
//! in the calling thread.
CORE_EXPORT
CExecutor& defaultAsyncExecutor();

//! Get the default async executor thread pool size, zero if not started.
CORE_EXPORT
std::size_t defaultAsyncThreadPoolSize();

namespace concurrency_detail {
template<typename F>
boost::any resultToAny(F& f, const std::false_type&) {
    return boost::any{f()};
}
template<typename F>
boost::any resultToAny(F& f, const std::true_type&) {
    f();
    return boost::any{};
}

template<typename R>
class CTypedFutureAnyWrapper {
public:
    CTypedFutureAnyWrapper() = default;
    CTypedFutureAnyWrapper(std::future<boost::any>&& future)
        : m_Future{std::move(future)} {}

    bool valid() const { return m_Future.valid(); }
    void wait() const { m_Future.wait(); }
    R get() { return boost::any_cast<R>(m_Future.get()); }

private:
    std::future<boost::any> m_Future;
};

template<>
class CTypedFutureAnyWrapper<void> {
public:
    CTypedFutureAnyWrapper() = default;
    CTypedFutureAnyWrapper(std::future<boost::any>&& future)
        : m_Future{std::move(future)} {}

    bool valid() const { return m_Future.valid(); }
    void wait() const { m_Future.wait(); }
    void get() { m_Future.get(); }

private:
    std::future<boost::any> m_Future;
};
}

template<typename R>
using future = concurrency_detail::CTypedFutureAnyWrapper<R>;

//! A version of std::async which uses a specified executor.
//!
//! \note f must be copy constructible.
//! \note f must be thread safe.
//! \note If f throws this will throw when the result is retrieved.
//! \warning Tasks waiting on tasks enqueued after them in the same pool can
//! deadlock. Prefer parallel_for_each which guards against this.
template<typename FUNCTION, typename... ARGS>
future<std::invoke_result_t<std::decay_t<FUNCTION>, std::decay_t<ARGS>...>>
async(CExecutor& executor, FUNCTION&& f, ARGS&&... args) {
    using R = std::invoke_result_t<std::decay_t<FUNCTION>, std::decay_t<ARGS>...>;

    // g stores copies of the arguments so it is safe to invoke later.
    auto g = std::bind<R>(std::forward<FUNCTION>(f), std::forward<ARGS>(args)...);

    std::packaged_task<boost::any()> task([g_ = std::move(g)]() mutable {
        return concurrency_detail::resultToAny(g_, std::is_same<R, void>{});
    });
    auto result = task.get_future();

    executor.schedule(std::move(task));

    return result;
}

//! Get the conjunction of all \p futures.
//!
//! \note This waits for every future, rethrowing the first exception only
//! after all have completed.
CORE_EXPORT
bool get_conjunction_of_all(std::vector<future<bool>>& futures);

namespace concurrency_detail {
//! \brief Marks the default executor busy for the lifetime of the object
//! unless it already was.
class CORE_EXPORT CDefaultAsyncExecutorBusyForScope {
public:
    CDefaultAsyncExecutorBusyForScope();
    ~CDefaultAsyncExecutorBusyForScope();
    CDefaultAsyncExecutorBusyForScope(const CDefaultAsyncExecutorBusyForScope&) = delete;
    CDefaultAsyncExecutorBusyForScope&
    operator=(const CDefaultAsyncExecutorBusyForScope&) = delete;

    bool wasBusy() const;

private:
    bool m_WasBusy;
};
}

//! Run \p f in parallel using async.
//!
//! This executes \p f on each index in the range [\p start, \p end) using the
//! default async executor.
//!
//! \param[in] partitions The number of tasks into which to partition the range.
//! \param[in] start The first index for which to execute \p f.
//! \param[in] end The end of the indices for which to execute \p f.
//! \param[in,out] f The function to execute on each index. This is expected
//! to be a Callable equivalent to std::function<void(std::size_t)>.
//! \return The copies of \p f used by each partition.
//! \note f must be copy constructible.
//! \note f must be thread safe.
//! \note If f throws this will throw.
template<typename FUNCTION>
std::vector<std::decay_t<FUNCTION>>
parallel_for_each(std::size_t partitions, std::size_t start, std::size_t end, FUNCTION&& f) {

    using TFunction = std::decay_t<FUNCTION>;

    if (end <= start) {
        return {TFunction{std::forward<FUNCTION>(f)}};
    }

    partitions = std::min(partitions, end - start);

    // Waiting on tasks from inside a task of the same pool can deadlock if
    // the tasks we wait for are queued behind us. If the default executor is
    // already busy further up the stack we simply run sequentially.
    concurrency_detail::CDefaultAsyncExecutorBusyForScope scope;

    if (partitions < 2 || scope.wasBusy()) {
        TFunction g{std::forward<FUNCTION>(f)};
        for (std::size_t i = start; i < end; ++i) {
            g(i);
        }
        return {std::move(g)};
    }

    std::vector<TFunction> functions(partitions, TFunction{std::forward<FUNCTION>(f)});

    // Partition offset visits [offset, offset + m, offset + 2m, ...] for m
    // partitions so threads read neighbouring memory at similar times.

    std::vector<future<bool>> tasks;
    tasks.reserve(partitions);

    for (std::size_t offset = 0; offset < partitions; ++offset) {
        // There is one copy of g for each task so capture by reference is
        // thread safe provided f is thread safe.
        auto& g = functions[offset];
        tasks.emplace_back(async(defaultAsyncExecutor(),
                                 [&g, partitions](std::size_t start_, std::size_t end_) {
                                     for (std::size_t i = start_; i < end_; i += partitions) {
                                         g(i);
                                     }
                                     return true;
                                 },
                                 start + offset, end));
    }

    get_conjunction_of_all(tasks);

    return functions;
}

//! Overload with the number of partitions equal to the thread pool size.
template<typename FUNCTION>
std::vector<std::decay_t<FUNCTION>>
parallel_for_each(std::size_t start, std::size_t end, FUNCTION&& f) {
    return parallel_for_each(defaultAsyncThreadPoolSize(), start, end,
                             std::forward<FUNCTION>(f));
}
}
}

#endif // INCLUDED_segreg_core_Concurrency_h
