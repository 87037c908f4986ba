/** Config [GmailCLI]
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

#ifndef Config_hpp
#define Config_hpp

#include <stdio.h>
#include <string>




/*
 Runtime configuration, read from the environment:

   GMAILCLI_CONFIG_DIR     directory holding credentials.json, token.json and
                           the log file (default: $HOME/.gmailcli)
   GMAILCLI_API_ROOT       Gmail REST root, ending in a slash
   GMAILCLI_MAX_ATTEMPTS   attempts for 429 / 5xx responses (default: 3)
 */
class Config {

public:
    std::string configDir;
    std::string apiRoot;
    int maxAttempts;
    int retryBaseDelayMs;

    Config();

    static Config FromEnvironment();

    std::string credentialsPath() const;
    std::string tokenPath() const;
    std::string logPath() const;
};

#endif /* Config_hpp */
