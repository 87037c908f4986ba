/** SPDLogExtensions [GmailCLI]
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


#ifndef SPDLogExtensions_hpp
#define SPDLogExtensions_hpp

#include <stdio.h>
#include <memory>
#include <string>
#include "spdlog/spdlog.h"




/*
 Builds the process logger: a stderr sink (warnings, or everything with
 `verbose`) plus a rotating file at `logPath`. Pass an empty path to skip the
 file. A log file that cannot be opened is reported on stderr and skipped,
 stdout stays reserved for the JSON result either way.
 */
std::shared_ptr<spdlog::logger> CreateGmailLogger(const std::string & name, const std::string & logPath, bool verbose);

#endif /* SPDLogExtensions_hpp */
