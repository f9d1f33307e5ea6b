#pragma once

#include <ident-core/fwd.hh>

#include <functional>
#include <memory>

/// Shared handle to a one-shot completion event.
///
/// Used to sequence work behind other work, e.g. releasing a container's storage
/// only after the readers that still look at it are done:
///
///   auto readers_done = ic::completion_signal::create_pending();
///   auto released = map.dispose_after(readers_done);
///   ... readers run ...
///   readers_done.complete();   // storage is released here
///   released.wait();
///
/// Copies share the same event. A default-constructed signal is already complete.
/// All operations are thread-safe.
struct ic::completion_signal
{
    // construction
public:
    /// An already completed signal
    completion_signal() = default;

    /// A signal that completes once complete() is called on it (or any copy of it)
    [[nodiscard]] static completion_signal create_pending();

    // operations
public:
    /// Marks the signal complete, wakes all waiters and runs the registered continuations
    /// in registration order on the calling thread.
    /// Completing an already complete signal is a no-op.
    void complete() const;

    /// Runs `fn` once this signal is complete: right away if it already is,
    /// otherwise on the thread that completes it.
    /// Returns a signal that completes after `fn` returned.
    completion_signal then(std::move_only_function<void()> fn) const;

    /// Blocks until the signal is complete
    void wait() const;

    [[nodiscard]] bool is_complete() const;

private:
    struct shared_state;

    explicit completion_signal(std::shared_ptr<shared_state> state);

    // nullptr means "completed from the start"
    std::shared_ptr<shared_state> _state;
};
