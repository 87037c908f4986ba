#include "gmailcli/config.hpp"
#include "gmailcli/constants.hpp"
#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/gmail_utils.hpp"

Config::Config() :
    configDir(""),
    apiRoot(GMAIL_API_ROOT),
    maxAttempts(3),
    retryBaseDelayMs(500)
{
}

Config Config::FromEnvironment() {
    Config config;

    config.configDir = GmailUtils::getEnvUTF8("GMAILCLI_CONFIG_DIR");
    if (config.configDir == "") {
        std::string home = GmailUtils::getEnvUTF8("HOME");
        if (home == "") {
            throw GmailException(ERROR_MISSING_CREDENTIALS, "Neither GMAILCLI_CONFIG_DIR nor HOME is set, unable to locate credentials.");
        }
        config.configDir = home + FS_PATH_SEP + ".gmailcli";
    }

    std::string apiRoot = GmailUtils::getEnvUTF8("GMAILCLI_API_ROOT");
    if (apiRoot != "") {
        if (apiRoot.back() != '/') {
            apiRoot += "/";
        }
        config.apiRoot = apiRoot;
    }

    std::string maxAttempts = GmailUtils::getEnvUTF8("GMAILCLI_MAX_ATTEMPTS");
    if (maxAttempts != "") {
        size_t consumed = 0;
        try {
            config.maxAttempts = std::stoi(maxAttempts, &consumed);
        } catch (std::exception &) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != maxAttempts.size()) {
            throw GmailException(ERROR_VALIDATION, "GMAILCLI_MAX_ATTEMPTS must be an integer, got: " + maxAttempts);
        }
        if (config.maxAttempts < 1) {
            throw GmailException(ERROR_VALIDATION, "GMAILCLI_MAX_ATTEMPTS must be at least 1.");
        }
    }

    return config;
}

std::string Config::credentialsPath() const {
    return configDir + FS_PATH_SEP + "credentials.json";
}

std::string Config::tokenPath() const {
    return configDir + FS_PATH_SEP + "token.json";
}

std::string Config::logPath() const {
    return configDir + FS_PATH_SEP + "gmailcli.log";
}
