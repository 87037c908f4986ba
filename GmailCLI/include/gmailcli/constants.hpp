/** constants [GmailCLI]
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

#ifndef constants_hpp
#define constants_hpp

#include <string>
#include <vector>

#define AS_MCSTR(X)         mailcore::String::uniquedStringWithUTF8Characters(X.c_str())

#ifdef _MSC_VER
#define FS_PATH_SEP "\\"
#else
#define FS_PATH_SEP "/"
#endif

// Error types reported in the `error_type` field of the error envelope

static std::string ERROR_MISSING_CREDENTIALS = "MissingCredentials";
static std::string ERROR_AUTHENTICATION = "AuthenticationError";
static std::string ERROR_VALIDATION = "ValidationError";
static std::string ERROR_SEARCH = "SearchError";
static std::string ERROR_SEND = "SendError";
static std::string ERROR_LABEL = "LabelError";
static std::string ERROR_NETWORK = "NetworkError";

// Remote endpoints

static std::string GMAIL_API_ROOT = "https://gmail.googleapis.com/gmail/v1/users/me/";
static std::string GOOGLE_AUTH_URI = "https://accounts.google.com/o/oauth2/auth";
static std::string GOOGLE_TOKEN_URI = "https://oauth2.googleapis.com/token";
static std::string GOOGLE_OOB_REDIRECT_URI = "urn:ietf:wg:oauth:2.0:oob";

static std::vector<std::string> GMAIL_SCOPES = {
    "https://www.googleapis.com/auth/gmail.modify",
    "https://www.googleapis.com/auth/gmail.send",
    "https://www.googleapis.com/auth/gmail.labels",
};

// Request limits

static int SEARCH_DEFAULT_MAX_RESULTS = 10;
static int SEARCH_MAX_RESULTS_LIMIT = 100;
static int BULK_DEFAULT_MAX_RESULTS = 500;
static int LIST_PAGE_SIZE = 100;
static int BATCH_MODIFY_DEFAULT_SIZE = 100;
static int BATCH_MODIFY_SIZE_LIMIT = 1000;

static int RETRY_MAX_DELAY_MS = 60000;

static long long MAX_ATTACHMENT_BYTES = 25LL * 1024 * 1024;

// Labels owned by Gmail. Anything prefixed with CATEGORY_ is also reserved.

static std::vector<std::string> SYSTEM_LABEL_NAMES = {
    "INBOX", "SENT", "DRAFT", "SPAM", "TRASH", "UNREAD", "STARRED", "IMPORTANT", "CHAT",
};
static std::string SYSTEM_LABEL_CATEGORY_PREFIX = "CATEGORY_";

#endif /* constants_hpp */
