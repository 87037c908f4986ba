#include "gmailcli/gmail_utils.hpp"
#include "gmailcli/gmail_exception.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <regex>
#include <sstream>
#include <sys/stat.h>
#include <stdlib.h>
#include <string.h>

static const char * BASE64_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string GmailUtils::toBase64(const char * pbegin, size_t len) {
    std::string result;
    result.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < len) {
        unsigned int n = ((unsigned char)pbegin[i] << 16) | ((unsigned char)pbegin[i + 1] << 8) | (unsigned char)pbegin[i + 2];
        result.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(n >> 6) & 0x3F]);
        result.push_back(BASE64_ALPHABET[n & 0x3F]);
        i += 3;
    }
    if (i < len) {
        unsigned int n = (unsigned char)pbegin[i] << 16;
        bool two = (i + 1 < len);
        if (two) {
            n |= (unsigned char)pbegin[i + 1] << 8;
        }
        result.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        result.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        result.push_back(two ? BASE64_ALPHABET[(n >> 6) & 0x3F] : '=');
        result.push_back('=');
    }
    return result;
}

std::string GmailUtils::toBase64URL(const char * pbegin, size_t len) {
    std::string result = toBase64(pbegin, len);
    for (auto & c : result) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    // Gmail accepts unpadded base64url for `raw`
    while (!result.empty() && result.back() == '=') {
        result.pop_back();
    }
    return result;
}

std::string GmailUtils::fromBase64URL(const std::string & encoded) {
    std::string result;
    result.reserve((encoded.size() * 3) / 4);

    unsigned int buffer = 0;
    int bits = 0;

    for (char c : encoded) {
        int value = -1;
        if (c >= 'A' && c <= 'Z') value = c - 'A';
        else if (c >= 'a' && c <= 'z') value = c - 'a' + 26;
        else if (c >= '0' && c <= '9') value = c - '0' + 52;
        else if (c == '+' || c == '-') value = 62;
        else if (c == '/' || c == '_') value = 63;
        else if (c == '=') break;
        else continue; // line breaks, whitespace

        buffer = (buffer << 6) | (unsigned int)value;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back((char)((buffer >> bits) & 0xFF));
        }
    }
    return result;
}

std::string GmailUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

std::string GmailUtils::trim(const std::string & str) {
    const char * ws = " \t\r\n";
    size_t start = str.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(ws);
    return str.substr(start, end - start + 1);
}

std::string GmailUtils::toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), ::toupper);
    return str;
}

std::vector<std::string> GmailUtils::splitCSV(const std::string & csv) {
    std::vector<std::string> results;
    std::stringstream stream(csv);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (item != "") {
            results.push_back(item);
        }
    }
    return results;
}

std::string GmailUtils::joinCSV(const std::vector<std::string> & values) {
    std::string result;
    for (const auto & value : values) {
        if (!result.empty()) {
            result += ", ";
        }
        result += value;
    }
    return result;
}

bool GmailUtils::isValidEmailAddress(const std::string & address) {
    static const std::regex pattern(
        "^[A-Za-z0-9.!#$%&'*+/=?^_`{|}~-]+"
        "@[A-Za-z0-9](?:[A-Za-z0-9-]{0,61}[A-Za-z0-9])?"
        "(?:\\.[A-Za-z0-9](?:[A-Za-z0-9-]{0,61}[A-Za-z0-9])?)+$");

    if (address.size() > 254) {
        return false;
    }
    size_t at = address.find('@');
    if (at == std::string::npos || at == 0 || at > 64) {
        return false;
    }
    // no leading, trailing or doubled dots in the local part
    std::string local = address.substr(0, at);
    if (local.front() == '.' || local.back() == '.' || local.find("..") != std::string::npos) {
        return false;
    }
    return std::regex_match(address, pattern);
}

std::string GmailUtils::timestampForTime(time_t time) {
    tm * ptm = gmtime(&time);
    char buffer[32];
    strftime(buffer, 32, "%Y-%m-%dT%H:%M:%SZ", ptm);
    return std::string(buffer);
}

time_t GmailUtils::timeForTimestamp(const std::string & timestamp) {
    tm parsed;
    memset(&parsed, 0, sizeof(parsed));
    // fractional seconds and the zone designator are ignored, timestamps are always UTC
    if (strptime(timestamp.c_str(), "%Y-%m-%dT%H:%M:%S", &parsed) == nullptr) {
        return 0;
    }
    return timegm(&parsed);
}

bool GmailUtils::fileExists(const std::string & path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0) && S_ISREG(buffer.st_mode);
}

bool GmailUtils::directoryExists(const std::string & path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0) && S_ISDIR(buffer.st_mode);
}

long long GmailUtils::fileSize(const std::string & path) {
    struct stat buffer;
    if (stat(path.c_str(), &buffer) != 0) {
        return -1;
    }
    return (long long)buffer.st_size;
}

std::string GmailUtils::readFile(const std::string & path, const std::string & errorKey) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw GmailException(errorKey, "Unable to read file: " + path, strerror(errno));
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

void GmailUtils::writeFileAtomically(const std::string & path, const std::string & contents, const std::string & errorKey) {
    std::string tmpPath = path + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) {
            throw GmailException(errorKey, "Unable to write file: " + tmpPath, strerror(errno));
        }
        out << contents;
        out.flush();
        if (!out) {
            throw GmailException(errorKey, "Unable to write file: " + tmpPath, strerror(errno));
        }
    }
    if (chmod(tmpPath.c_str(), S_IRUSR | S_IWUSR) != 0) {
        std::string reason = strerror(errno);
        remove(tmpPath.c_str());
        throw GmailException(errorKey, "Unable to set permissions on file: " + tmpPath, reason);
    }
    if (rename(tmpPath.c_str(), path.c_str()) != 0) {
        std::string reason = strerror(errno);
        remove(tmpPath.c_str());
        throw GmailException(errorKey, "Unable to replace file: " + path, reason);
    }
}
