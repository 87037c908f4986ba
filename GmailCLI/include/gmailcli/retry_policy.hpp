/** RetryPolicy [GmailCLI]
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
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

#ifndef RetryPolicy_hpp
#define RetryPolicy_hpp

#include <stdio.h>




struct RetryDecision {
    bool retry;
    int delayMs;
};

/*
 Only 429 and 5xx responses are retried. `attempt` is 1-based and counts the
 request that just failed, so with the default of three attempts a request is
 sent at most three times, waiting base, then 2 x base between them. Waits
 are capped at RETRY_MAX_DELAY_MS however large the attempt count.
 */
class RetryPolicy {
    int _maxAttempts;
    int _baseDelayMs;

public:
    RetryPolicy(int maxAttempts = 3, int baseDelayMs = 500);

    RetryDecision decide(long status, int attempt) const;

    int maxAttempts() const;
    int baseDelayMs() const;

    static bool isRetryableStatus(long status);
};

#endif /* RetryPolicy_hpp */
