/** GmailUtils [GmailCLI]
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

#ifndef GmailUtils_hpp
#define GmailUtils_hpp

#include <memory>
#include <string>
#include <vector>

#include <stdio.h>
#include <time.h>

class GmailUtils {

public:
    static std::string toBase64(const char * pbegin, size_t len);
    static std::string toBase64URL(const char * pbegin, size_t len);

    // Accepts both the standard and URL-safe alphabets, with or without padding.
    static std::string fromBase64URL(const std::string & encoded);

    static std::string getEnvUTF8(std::string key);

    static std::string trim(const std::string & str);
    static std::string toUpper(std::string str);
    static std::vector<std::string> splitCSV(const std::string & csv);
    static std::string joinCSV(const std::vector<std::string> & values);

    static bool isValidEmailAddress(const std::string & address);

    static std::string timestampForTime(time_t time);
    static time_t timeForTimestamp(const std::string & timestamp);

    static bool fileExists(const std::string & path);
    static bool directoryExists(const std::string & path);

    // Returns -1 if the file cannot be stat'd.
    static long long fileSize(const std::string & path);

    // Both throw a GmailException of type `errorKey` on failure.
    static std::string readFile(const std::string & path, const std::string & errorKey);
    static void writeFileAtomically(const std::string & path, const std::string & contents, const std::string & errorKey);

    template<typename T>
    static std::vector<std::vector<T>> chunksOfVector(std::vector<T> & v, size_t chunkSize) {
        std::vector<std::vector<T>> results{};

        while (v.size() > 0) {
            auto from = v.begin();
            auto to = v.size() > chunkSize ? from + chunkSize : v.end();

            results.push_back(std::vector<T>{std::make_move_iterator(from), std::make_move_iterator(to)});
            v.erase(from, to);
        }
        return results;
    }
};

#endif /* GmailUtils_hpp */
