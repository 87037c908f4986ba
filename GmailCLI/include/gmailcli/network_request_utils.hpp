/** NetworkRequestUtils [GmailCLI]
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

#ifndef NetworkRequestUtils_hpp
#define NetworkRequestUtils_hpp

#include <curl/curl.h>
#include <stdio.h>
#include "nlohmann/json.hpp"

#include "gmailcli/http_transport.hpp"

struct OAuthClient;



size_t _onAppendToString(void *contents, size_t length, size_t nmemb, void *userp);

std::string FindLinuxCertsBundle();

std::string EscapeURLComponent(const std::string & value);

CURL * CreateJSONRequest(const HTTPRequest & request, struct curl_slist ** headers);

HTTPResponse PerformRequest(CURL * curl_handle);

void ValidateRequestResp(CURLcode res, CURL * curl_handle);

// Decodes a response body, wrapping non-JSON text as {"text": body}.
nlohmann::json ParseJSONResponse(const HTTPResponse & response);

// Picks the human readable message out of a Google API or OAuth error body.
std::string ProviderErrorMessage(const HTTPResponse & response);

// OAuth token endpoint calls. Both throw AuthenticationError on rejection.

const nlohmann::json MakeOAuthRefreshRequest(HTTPTransport & transport, const OAuthClient & client, std::string refreshToken);
const nlohmann::json MakeOAuthCodeExchangeRequest(HTTPTransport & transport, const OAuthClient & client, std::string code);

#endif /* NetworkRequestUtils_hpp */
