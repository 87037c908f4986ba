#include "gmailcli/retry_policy.hpp"
#include "gmailcli/constants.hpp"

#include <algorithm>

RetryPolicy::RetryPolicy(int maxAttempts, int baseDelayMs) :
    _maxAttempts(maxAttempts < 1 ? 1 : maxAttempts),
    _baseDelayMs(baseDelayMs < 0 ? 0 : baseDelayMs)
{
}

bool RetryPolicy::isRetryableStatus(long status) {
    return (status == 429) || (status >= 500 && status <= 599);
}

RetryDecision RetryPolicy::decide(long status, int attempt) const {
    RetryDecision decision { false, 0 };
    if (!isRetryableStatus(status) || attempt >= _maxAttempts) {
        return decision;
    }
    decision.retry = true;
    int shift = std::min(std::max(attempt - 1, 0), 20);
    long long delay = (long long)_baseDelayMs << shift;
    decision.delayMs = (int)std::min(delay, (long long)RETRY_MAX_DELAY_MS);
    return decision;
}

int RetryPolicy::maxAttempts() const {
    return _maxAttempts;
}

int RetryPolicy::baseDelayMs() const {
    return _baseDelayMs;
}
