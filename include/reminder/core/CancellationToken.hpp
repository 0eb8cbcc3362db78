#pragma once

#include <memory>

namespace reminder {
namespace core {

// Shared cooperative cancellation flag. Copies refer to the same state.
// A child token is cancelled together with its parent, so one shutdown
// token can be broadcast to every monitor and the dispatcher while each
// monitor still has a token of its own.
class CancellationToken
{
public:
    CancellationToken();

    CancellationToken createChild() const;

    void cancel();
    bool isCancelled() const;

    // Blocks up to timeoutMs. Returns true if the token is (or becomes) cancelled.
    bool waitFor(int timeoutMs) const;

private:
    struct State;
    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> m_state;
};

} // namespace core
} // namespace reminder
