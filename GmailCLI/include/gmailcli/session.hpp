/** Session [GmailCLI]
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

#ifndef Session_hpp
#define Session_hpp

#include <stdio.h>
#include <time.h>
#include <functional>
#include <string>
#include "spdlog/spdlog.h"




struct OAuthToken {
    std::string accessToken;
    std::string refreshToken;
    time_t expiryDate;
};

typedef std::function<OAuthToken(std::string refreshToken)> TokenRefresher;
typedef std::function<time_t()> Clock;

/*
 The credentials of a single invocation. Every GmailClient request asks the
 session for an Authorization header; the session refreshes the access token
 through the injected refresher when it is missing or about to expire.
 */
class Session {
    OAuthToken _token;
    TokenRefresher _refresher;
    Clock _clock;
    std::function<void(const OAuthToken &)> _onRefresh;
    std::shared_ptr<spdlog::logger> logger;

public:
    Session(OAuthToken token, TokenRefresher refresher, Clock clock = nullptr);

    std::string authorization();

    bool canRefresh();
    void forceRefresh();

    // Called after every successful refresh, typically to persist the token.
    void setOnRefresh(std::function<void(const OAuthToken &)> onRefresh);

    OAuthToken token();
};

#endif /* Session_hpp */
