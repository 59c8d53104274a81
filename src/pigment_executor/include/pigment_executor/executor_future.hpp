/**
 * @file executor_future.hpp
 * @brief 完成状态：ExecutorPromise / ExecutorFuture
 *
 * 会话退役、合成结果与管线预热共用此类型。promise 与 future 共享一个 FutureState：
 * - get() / wait_for() 在调用线程上阻塞等待，供拥有独立反应线程的原生构建使用；
 * - on_ready() 登记一个完成回调，由完成 promise 的线程（反应线程或宿主回调）直接调用，
 *   结果已就绪时在登记线程上立即调用。宿主事件循环上只能用这一种方式等待；
 * - then() 基于 on_ready：完成时才把续接任务交给 executor，不占用工作线程等待。
 * promise 未完成即销毁时，future 以 std::future_errc::broken_promise 失败。
 */

#pragma once

#include <executor/executor.hpp>

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace pigment::executor {

namespace detail {

/** void 结果的占位值 */
struct Unit {};

template <typename T>
using StoredType = std::conditional_t<std::is_void_v<T>, Unit, T>;

template <typename S>
class FutureState {
public:
    void SetValue(S value) {
        std::unique_lock lock(mutex_);
        if (ready_) throw std::future_error(std::future_errc::promise_already_satisfied);
        value_.emplace(std::move(value));
        Complete(lock);
    }

    void SetException(std::exception_ptr error) {
        std::unique_lock lock(mutex_);
        if (ready_) throw std::future_error(std::future_errc::promise_already_satisfied);
        error_ = std::move(error);
        Complete(lock);
    }

    /** promise 析构：未完成时以 broken_promise 完成 */
    void Abandon() {
        std::unique_lock lock(mutex_);
        if (ready_) return;
        error_ = std::make_exception_ptr(std::future_error(std::future_errc::broken_promise));
        Complete(lock);
    }

    /** 阻塞至就绪后取出结果；异常结果重新抛出 */
    S Take() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return ready_; });
        if (error_) std::rethrow_exception(error_);
        S value = std::move(*value_);
        value_.reset();
        return value;
    }

    bool IsReady() const {
        std::lock_guard lock(mutex_);
        return ready_;
    }

    template <typename Rep, typename Period>
    std::future_status WaitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return ready_; })
                   ? std::future_status::ready
                   : std::future_status::timeout;
    }

    /**
     * 登记完成回调，每个状态只能登记一次。
     * 已就绪时在当前线程立即调用，否则由完成线程在释放内部锁后调用。
     */
    void SetContinuation(std::function<void()> continuation) {
        std::unique_lock lock(mutex_);
        if (hasContinuation_) throw std::logic_error("ExecutorFuture: continuation already set");
        hasContinuation_ = true;
        if (!ready_) {
            continuation_ = std::move(continuation);
            return;
        }
        lock.unlock();
        continuation();
    }

private:
    void Complete(std::unique_lock<std::mutex>& lock) {
        ready_ = true;
        std::function<void()> continuation = std::move(continuation_);
        continuation_ = nullptr;
        cv_.notify_all();
        lock.unlock();
        if (continuation) continuation();
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool ready_ = false;
    bool hasContinuation_ = false;
    std::optional<S> value_;
    std::exception_ptr error_;
    std::function<void()> continuation_;
};

}  // namespace detail

template <typename T>
class ExecutorFuture;

template <typename T>
class ExecutorPromise {
public:
    using State = detail::FutureState<detail::StoredType<T>>;

    ExecutorPromise() : state_(std::make_shared<State>()) {}
    ~ExecutorPromise() {
        if (state_) state_->Abandon();
    }

    ExecutorPromise(ExecutorPromise&&) noexcept = default;
    ExecutorPromise& operator=(ExecutorPromise&& other) noexcept {
        if (this != &other) {
            if (state_) state_->Abandon();
            state_ = std::move(other.state_);
            retrieved_ = other.retrieved_;
        }
        return *this;
    }
    ExecutorPromise(const ExecutorPromise&) = delete;
    ExecutorPromise& operator=(const ExecutorPromise&) = delete;

    void set_value(detail::StoredType<T> value) { Checked().SetValue(std::move(value)); }

    template <typename U = T, typename = std::enable_if_t<std::is_void_v<U>>>
    void set_value() {
        Checked().SetValue(detail::Unit{});
    }

    void set_exception(std::exception_ptr e) { Checked().SetException(std::move(e)); }

    /** 每个 promise 只能取一次 future */
    ExecutorFuture<T> get_future() {
        if (retrieved_) throw std::future_error(std::future_errc::future_already_retrieved);
        Checked();
        retrieved_ = true;
        return ExecutorFuture<T>(state_);
    }

private:
    State& Checked() {
        if (!state_) throw std::future_error(std::future_errc::no_state);
        return *state_;
    }

    std::shared_ptr<State> state_;
    bool retrieved_ = false;
};

template <typename T>
class ExecutorFuture {
public:
    using State = detail::FutureState<detail::StoredType<T>>;

    ExecutorFuture() = default;
    explicit ExecutorFuture(std::shared_ptr<State> state) : state_(std::move(state)) {}

    ExecutorFuture(ExecutorFuture&&) noexcept = default;
    ExecutorFuture& operator=(ExecutorFuture&&) noexcept = default;
    ExecutorFuture(const ExecutorFuture&) = delete;
    ExecutorFuture& operator=(const ExecutorFuture&) = delete;

    /** 阻塞取结果，之后 future 失效 */
    T get() {
        std::shared_ptr<State> state = Release();
        if constexpr (std::is_void_v<T>) {
            state->Take();
        } else {
            return state->Take();
        }
    }

    bool valid() const { return state_ != nullptr; }

    /** 结果（值或异常）是否已就绪，不阻塞 */
    bool is_ready() const { return state_ && state_->IsReady(); }

    template <typename Rep, typename Period>
    std::future_status wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        if (!state_) throw std::future_error(std::future_errc::no_state);
        return state_->WaitFor(timeout);
    }

    /**
     * 完成时调用 callback。future 保持有效，回调内可无阻塞地 get()。
     * 每个 future 只能登记一次。
     */
    void on_ready(std::function<void()> callback) {
        if (!state_) throw std::future_error(std::future_errc::no_state);
        state_->SetContinuation(std::move(callback));
    }

    /** 完成后在 ex 上以结果调用 func，返回 func 结果的 future；本 future 随之失效 */
    template <typename Executor, typename F>
    auto then(Executor& ex, F&& func);

private:
    std::shared_ptr<State> Release() {
        if (!state_) throw std::future_error(std::future_errc::no_state);
        return std::move(state_);
    }

    std::shared_ptr<State> state_;
};

namespace detail {

/** 以上游结果调用 func 并写入下游 promise；上游异常直接转交下游 */
template <typename T, typename R, typename F>
void RunContinuation(FutureState<StoredType<T>>& upstream, F& func, ExecutorPromise<R>& next) {
    try {
        if constexpr (std::is_void_v<T>) {
            upstream.Take();
            if constexpr (std::is_void_v<R>) {
                std::invoke(func);
                next.set_value();
            } else {
                next.set_value(std::invoke(func));
            }
        } else {
            if constexpr (std::is_void_v<R>) {
                std::invoke(func, upstream.Take());
                next.set_value();
            } else {
                next.set_value(std::invoke(func, upstream.Take()));
            }
        }
    } catch (...) {
        next.set_exception(std::current_exception());
    }
}

template <typename T, typename F, bool IsVoid = std::is_void_v<T>>
struct ContinuationResult {
    using type = std::invoke_result_t<F, T>;
};

template <typename T, typename F>
struct ContinuationResult<T, F, true> {
    using type = std::invoke_result_t<F>;
};

}  // namespace detail

template <typename T>
template <typename Executor, typename F>
auto ExecutorFuture<T>::then(Executor& ex, F&& func) {
    using R = typename detail::ContinuationResult<T, std::decay_t<F>>::type;

    // 续接任务在 executor 上运行，promise 与 func 由共享块持有以便任务可复制
    struct Link {
        std::shared_ptr<State> upstream;
        std::decay_t<F> func;
        ExecutorPromise<R> next;
    };
    auto link = std::make_shared<Link>(Link{Release(), std::forward<F>(func), {}});
    ExecutorFuture<R> result = link->next.get_future();

    link->upstream->SetContinuation([&ex, link]() {
        ex.submit([link]() {
            detail::RunContinuation<T>(*link->upstream, link->func, link->next);
        });
    });
    return result;
}

/** 已就绪的 future：值或异常立即可取 */
template <typename T>
ExecutorFuture<T> make_ready_future(T value) {
    ExecutorPromise<T> p;
    auto f = p.get_future();
    p.set_value(std::move(value));
    return f;
}

inline ExecutorFuture<void> make_ready_future() {
    ExecutorPromise<void> p;
    auto f = p.get_future();
    p.set_value();
    return f;
}

template <typename T>
ExecutorFuture<T> make_exceptional_future(std::exception_ptr e) {
    ExecutorPromise<T> p;
    auto f = p.get_future();
    p.set_exception(std::move(e));
    return f;
}

}  // namespace pigment::executor
