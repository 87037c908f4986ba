/** GmailException [GmailCLI]
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

#ifndef GmailException_hpp
#define GmailException_hpp

#include <stdio.h>
#include <exception>
#include <string>
#include <curl/curl.h>
#include "nlohmann/json.hpp"




class GmailException : public std::exception {
    bool retryable = false;

public:
    GmailException(std::string key, std::string message, std::string di = "", bool retryable = false);
    GmailException(CURLcode c, std::string di);
    std::string key;
    std::string message;
    std::string debuginfo;

    // The provider's HTTP status, 0 when the error never reached Gmail.
    long httpStatus = 0;

    const char * what() const noexcept override;
    bool isRetryable();

    // The uniform error envelope printed by every command.
    nlohmann::json toJSON();
};


#endif /* GmailException_hpp */
