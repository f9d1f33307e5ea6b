#include "completion_signal.hh"

#include <ident-core/assert.hh>
#include <ident-core/mutex.hh>
#include <ident-core/utility.hh>

#include <condition_variable>
#include <vector>

namespace
{
struct signal_data
{
    bool is_complete = false;
    std::vector<std::move_only_function<void()>> continuations;
};
} // namespace

struct ic::completion_signal::shared_state
{
    ic::mutex<signal_data> data;
    std::condition_variable completed;
};

ic::completion_signal::completion_signal(std::shared_ptr<shared_state> state) : _state(ic::move(state)) {}

ic::completion_signal ic::completion_signal::create_pending()
{
    return completion_signal(std::make_shared<shared_state>());
}

void ic::completion_signal::complete() const
{
    if (_state == nullptr)
        return;

    // continuations run outside the lock so they can touch this signal again
    auto continuations = _state->data.lock(
        [](signal_data& d)
        {
            std::vector<std::move_only_function<void()>> result;
            if (!d.is_complete)
            {
                d.is_complete = true;
                result = ic::move(d.continuations);
                d.continuations.clear();
            }
            return result;
        });

    _state->completed.notify_all();

    for (auto& fn : continuations)
        fn();
}

ic::completion_signal ic::completion_signal::then(std::move_only_function<void()> fn) const
{
    IC_ASSERT(fn != nullptr, "continuation must be callable");

    auto result = create_pending();

    auto continuation = [fn = ic::move(fn), result]() mutable
    {
        fn();
        result.complete();
    };

    bool const run_now = _state == nullptr
                      || _state->data.lock(
                             [&](signal_data& d)
                             {
                                 if (d.is_complete)
                                     return true;
                                 d.continuations.emplace_back(ic::move(continuation));
                                 return false;
                             });

    if (run_now)
        continuation();

    return result;
}

void ic::completion_signal::wait() const
{
    if (_state == nullptr)
        return;

    _state->data.wait(_state->completed, [](signal_data const& d) { return d.is_complete; });
}

bool ic::completion_signal::is_complete() const
{
    if (_state == nullptr)
        return true;

    return _state->data.lock([](signal_data const& d) { return d.is_complete; });
}
