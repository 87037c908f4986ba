#include "gmailcli/token_store.hpp"
#include "gmailcli/constants.hpp"
#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/gmail_utils.hpp"
#include "gmailcli/network_request_utils.hpp"

TokenStore::TokenStore(std::string credentialsPath, std::string tokenPath) :
    _credentialsPath(credentialsPath),
    _tokenPath(tokenPath),
    logger(spdlog::get("logger"))
{
}

OAuthClient TokenStore::loadClient() {
    if (!GmailUtils::fileExists(_credentialsPath)) {
        throw GmailException(ERROR_MISSING_CREDENTIALS, "OAuth client credentials not found at " + _credentialsPath + ". Download them from the Google Cloud console (OAuth client ID, Desktop app).");
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(GmailUtils::readFile(_credentialsPath, ERROR_MISSING_CREDENTIALS));
    } catch (nlohmann::json::exception & ex) {
        throw GmailException(ERROR_MISSING_CREDENTIALS, "Unable to parse " + _credentialsPath, ex.what());
    }

    // Desktop clients are stored under "installed", web clients under "web"
    nlohmann::json section = json;
    if (json.count("installed")) {
        section = json["installed"];
    } else if (json.count("web")) {
        section = json["web"];
    }

    if (!section.count("client_id") || !section["client_id"].is_string()) {
        throw GmailException(ERROR_MISSING_CREDENTIALS, _credentialsPath + " does not contain a client_id.");
    }

    OAuthClient client;
    client.clientId = section["client_id"].get<std::string>();
    client.clientSecret = section.value("client_secret", "");
    client.authUri = section.value("auth_uri", GOOGLE_AUTH_URI);
    client.tokenUri = section.value("token_uri", GOOGLE_TOKEN_URI);
    client.redirectUri = "http://localhost";
    if (section.count("redirect_uris") && section["redirect_uris"].is_array() && section["redirect_uris"].size() > 0) {
        client.redirectUri = section["redirect_uris"][0].get<std::string>();
    }
    return client;
}

bool TokenStore::hasToken() {
    return GmailUtils::fileExists(_tokenPath);
}

OAuthToken TokenStore::loadToken() {
    if (!hasToken()) {
        throw GmailException(ERROR_MISSING_CREDENTIALS, "No OAuth token found at " + _tokenPath + ". Run `gmailcli auth` to authorize this tool.");
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(GmailUtils::readFile(_tokenPath, ERROR_MISSING_CREDENTIALS));
    } catch (nlohmann::json::exception & ex) {
        throw GmailException(ERROR_AUTHENTICATION, "Unable to parse " + _tokenPath, ex.what());
    }

    OAuthToken token;
    token.accessToken = json.count("token") ? json.value("token", "") : json.value("access_token", "");
    token.refreshToken = json.value("refresh_token", "");
    token.expiryDate = 0;
    if (json.count("expiry")) {
        if (json["expiry"].is_string()) {
            token.expiryDate = GmailUtils::timeForTimestamp(json["expiry"].get<std::string>());
        } else if (json["expiry"].is_number()) {
            token.expiryDate = json["expiry"].get<time_t>();
        }
    }
    return token;
}

void TokenStore::saveToken(const OAuthToken & token, const OAuthClient & client) {
    nlohmann::json scopes = nlohmann::json::array();
    for (const auto & scope : GMAIL_SCOPES) {
        scopes.push_back(scope);
    }

    nlohmann::json json = {
        {"token", token.accessToken},
        {"refresh_token", token.refreshToken},
        {"token_uri", client.tokenUri},
        {"client_id", client.clientId},
        {"client_secret", client.clientSecret},
        {"scopes", scopes},
    };
    if (token.expiryDate != 0) {
        json["expiry"] = GmailUtils::timestampForTime(token.expiryDate);
    }

    // Other invocations may be reading the file, so replace it rather than
    // rewriting it in place.
    GmailUtils::writeFileAtomically(_tokenPath, json.dump(2), ERROR_AUTHENTICATION);
    logger->debug("Saved OAuth token to {}", _tokenPath);
}

std::shared_ptr<Session> TokenStore::openSession(std::shared_ptr<HTTPTransport> transport) {
    OAuthClient client = loadClient();
    OAuthToken token = loadToken();

    auto refresher = [transport, client](std::string refreshToken) {
        nlohmann::json resp = MakeOAuthRefreshRequest(*transport, client, refreshToken);
        return TokenStore::tokenFromResponse(resp, time(0));
    };

    auto session = std::make_shared<Session>(token, refresher);
    std::string credentialsPath = _credentialsPath;
    std::string tokenPath = _tokenPath;
    session->setOnRefresh([credentialsPath, tokenPath, client](const OAuthToken & refreshed) {
        TokenStore(credentialsPath, tokenPath).saveToken(refreshed, client);
    });
    return session;
}

std::string TokenStore::authorizationURL(const OAuthClient & client) {
    std::string scope = "";
    for (const auto & s : GMAIL_SCOPES) {
        scope += (scope == "" ? "" : " ") + s;
    }
    return client.authUri +
        "?response_type=code" +
        "&client_id=" + EscapeURLComponent(client.clientId) +
        "&redirect_uri=" + EscapeURLComponent(client.redirectUri) +
        "&scope=" + EscapeURLComponent(scope) +
        "&access_type=offline&prompt=consent";
}

OAuthToken TokenStore::exchangeCode(HTTPTransport & transport, const OAuthClient & client, std::string code) {
    nlohmann::json resp = MakeOAuthCodeExchangeRequest(transport, client, code);
    OAuthToken token = tokenFromResponse(resp, time(0));
    if (token.refreshToken == "") {
        logger->warn("Google did not return a refresh token, the token will stop working when it expires.");
    }
    saveToken(token, client);
    return token;
}

OAuthToken TokenStore::tokenFromResponse(const nlohmann::json & response, time_t now) {
    OAuthToken token;
    token.accessToken = response.value("access_token", "");
    token.refreshToken = response.value("refresh_token", "");
    token.expiryDate = 0;
    if (response.count("expires_in") && response["expires_in"].is_number()) {
        token.expiryDate = now + response["expires_in"].get<int>();
    }
    return token;
}
