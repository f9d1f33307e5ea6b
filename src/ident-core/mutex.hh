#pragma once

#include <ident-core/fwd.hh>
#include <ident-core/utility.hh>

#include <condition_variable>
#include <functional>
#include <mutex>
#include <utility>

/// A value of type T that can only be touched while its lock is held.
///
///   ic::mutex<signal_state> state;
///   state.lock([](signal_state& s) { s.is_complete = true; });
///   bool done = state.lock([](signal_state const& s) { return s.is_complete; });
///
/// The callback result is returned by value (auto), so references into T do not escape the lock.
template <class T>
struct ic::mutex
{
    mutex() = default;

    template <class... Args>
    explicit mutex(Args&&... args) : _value(ic::forward<Args>(args)...)
    {
    }

    mutex(mutex const&) = delete;
    mutex& operator=(mutex const&) = delete;

    /// Runs f(value) with the lock held
    template <class F>
    auto lock(F&& f)
    {
        std::lock_guard guard(_mutex);
        return std::invoke(ic::forward<F>(f), _value);
    }

    /// Blocks on cv until pred(value) holds, then runs f(value) without releasing the lock in between
    template <class Pred, class F>
    auto wait(std::condition_variable& cv, Pred&& pred, F&& f)
    {
        std::unique_lock guard(_mutex);
        cv.wait(guard, [&] { return std::invoke(pred, std::as_const(_value)); });
        return std::invoke(ic::forward<F>(f), _value);
    }

    /// Blocks on cv until pred(value) holds
    template <class Pred>
    void wait(std::condition_variable& cv, Pred&& pred)
    {
        wait(cv, ic::forward<Pred>(pred), [](T&) {});
    }

private:
    T _value;
    std::mutex _mutex;
};
