/** HTTPTransport [GmailCLI]
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

#ifndef HTTPTransport_hpp
#define HTTPTransport_hpp

#include <stdio.h>
#include <string>
#include <vector>




struct HTTPRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::string body;
};

struct HTTPResponse {
    long status = 0;
    std::string body;
};

/*
 Everything the tool sends to Google goes through an HTTPTransport. A
 transport returns the provider's status and body as-is and only throws
 when no response was received at all (DNS, TLS, connection failures).
 */
class HTTPTransport {
public:
    virtual ~HTTPTransport() {}
    virtual HTTPResponse perform(const HTTPRequest & request) = 0;
};

class CurlHTTPTransport : public HTTPTransport {
public:
    CurlHTTPTransport();
    ~CurlHTTPTransport();

    HTTPResponse perform(const HTTPRequest & request) override;
};


#endif /* HTTPTransport_hpp */
