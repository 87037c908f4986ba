/** TokenStore [GmailCLI]
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

#ifndef TokenStore_hpp
#define TokenStore_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

#include "gmailcli/session.hpp"
#include "gmailcli/http_transport.hpp"




struct OAuthClient {
    std::string clientId;
    std::string clientSecret;
    std::string authUri;
    std::string tokenUri;
    std::string redirectUri;
};

/*
 Reads the OAuth client secrets downloaded from the Google Cloud console
 (credentials.json) and reads / writes the user's token (token.json). The
 token file layout matches the one written by google-auth, so a token created
 by other tooling can be reused.
 */
class TokenStore {
    std::string _credentialsPath;
    std::string _tokenPath;
    std::shared_ptr<spdlog::logger> logger;

public:
    TokenStore(std::string credentialsPath, std::string tokenPath);

    OAuthClient loadClient();

    bool hasToken();
    OAuthToken loadToken();
    void saveToken(const OAuthToken & token, const OAuthClient & client);

    // Builds a session whose refreshes go to the client's token endpoint
    // and are written back to token.json.
    std::shared_ptr<Session> openSession(std::shared_ptr<HTTPTransport> transport);

    std::string authorizationURL(const OAuthClient & client);
    OAuthToken exchangeCode(HTTPTransport & transport, const OAuthClient & client, std::string code);

    static OAuthToken tokenFromResponse(const nlohmann::json & response, time_t now);
};

#endif /* TokenStore_hpp */
