#include "gmailcli/network_request_utils.hpp"
#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/token_store.hpp"
#include "gmailcli/constants.hpp"

#include <algorithm>
#include <sys/stat.h>

std::string FindLinuxCertsBundle() {
#ifdef __linux__
    std::string certificatePaths[] = {
        // Debian, Ubuntu, Arch: maintained by update-ca-certificates
        "/etc/ssl/certs/ca-certificates.crt",
        // Red Hat 5+, Fedora, Centos
        "/etc/pki/tls/certs/ca-bundle.crt",
        // Red Hat 4
        "/usr/share/ssl/certs/ca-bundle.crt",
        // FreeBSD (security/ca-root-nss package)
        "/usr/local/share/certs/ca-root-nss.crt",
        // OpenBSD
        "/etc/ssl/cert.pem",
        // OpenSUSE
        "/etc/ssl/ca-bundle.pem",
    };
    for (const auto & path : certificatePaths) {
        struct stat buffer;
        if (stat (path.c_str(), &buffer) == 0) {
            return path;
        }
    }
#endif
    return "";
}

size_t _onAppendToString(void *contents, size_t length, size_t nmemb, void *userp) {
    std::string * buffer = (std::string *)userp;
    size_t real_size = length * nmemb;

    size_t oldLength = buffer->size();
    size_t newLength = oldLength + real_size;

    buffer->resize(newLength);
    std::copy((char*)contents, (char*)contents+real_size, buffer->begin() + oldLength);

    return real_size;
}

std::string EscapeURLComponent(const std::string & value) {
    CURL * curl_handle = curl_easy_init();
    if (curl_handle == nullptr) {
        throw GmailException(ERROR_NETWORK, "Unable to initialize libcurl");
    }
    char * escaped = curl_easy_escape(curl_handle, value.c_str(), (int)value.size());
    std::string result = escaped ? std::string(escaped) : "";
    curl_free(escaped);
    curl_easy_cleanup(curl_handle);
    return result;
}

CURL * CreateJSONRequest(const HTTPRequest & request, struct curl_slist ** headers) {
    CURL * curl_handle = curl_easy_init();
    if (curl_handle == nullptr) {
        throw GmailException(ERROR_NETWORK, "Unable to initialize libcurl");
    }
    curl_easy_setopt(curl_handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, 20);

    for (const auto & header : request.headers) {
        *headers = curl_slist_append(*headers, header.c_str());
    }
    if (request.body.size() > 0) {
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)request.body.size());
    }
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, *headers);
    curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());

    // Ensure /all/ curl code paths run this code for RHEL 7.6 and other linux distros
    std::string explicitCertsBundlePath = FindLinuxCertsBundle();
    if (explicitCertsBundlePath != "") {
        curl_easy_setopt(curl_handle, CURLOPT_CAINFO, explicitCertsBundlePath.c_str());
    }

    return curl_handle;
}

HTTPResponse PerformRequest(CURL * curl_handle) {
    HTTPResponse response;
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, _onAppendToString);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, (void *)&response.body);
    CURLcode res = curl_easy_perform(curl_handle);
    ValidateRequestResp(res, curl_handle);
    curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

void ValidateRequestResp(CURLcode res, CURL * curl_handle) {
    if (res == CURLE_OK) {
        return;
    }
    char * _url = nullptr;
    std::string url = "";
    if (curl_easy_getinfo(curl_handle, CURLINFO_EFFECTIVE_URL, &_url) == CURLE_OK && _url != nullptr) {
        url = std::string(_url);
    }
    throw GmailException(res, url);
}

nlohmann::json ParseJSONResponse(const HTTPResponse & response) {
    if (response.body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (nlohmann::json::exception &) {
        return {{"text", response.body}};
    }
}

std::string ProviderErrorMessage(const HTTPResponse & response) {
    nlohmann::json body = ParseJSONResponse(response);
    if (body.is_object() && body.count("error")) {
        nlohmann::json & error = body["error"];
        // Google APIs: {"error": {"code": 400, "message": "..."}}
        if (error.is_object() && error.count("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
        // OAuth endpoints: {"error": "invalid_grant", "error_description": "..."}
        if (error.is_string()) {
            if (body.count("error_description") && body["error_description"].is_string()) {
                return error.get<std::string>() + ": " + body["error_description"].get<std::string>();
            }
            return error.get<std::string>();
        }
    }
    if (response.body != "") {
        return response.body;
    }
    return "HTTP " + std::to_string(response.status);
}

static const nlohmann::json PerformOAuthTokenRequest(HTTPTransport & transport, const OAuthClient & client, std::string payload) {
    HTTPRequest request;
    request.method = "POST";
    request.url = client.tokenUri;
    request.headers.push_back("Accept: application/json");
    request.headers.push_back("Content-Type: application/x-www-form-urlencoded");
    request.body = payload;

    HTTPResponse response = transport.perform(request);
    if (response.status < 200 || response.status > 299) {
        throw GmailException(ERROR_AUTHENTICATION, ProviderErrorMessage(response), request.url + " RETURNED " + response.body);
    }

    nlohmann::json result = ParseJSONResponse(response);
    if (!result.count("access_token") || !result["access_token"].is_string()) {
        throw GmailException(ERROR_AUTHENTICATION, "Token endpoint did not return an access token.", response.body);
    }
    return result;
}

const nlohmann::json MakeOAuthRefreshRequest(HTTPTransport & transport, const OAuthClient & client, std::string refreshToken) {
    std::string payload = "grant_type=refresh_token"
        "&client_id=" + EscapeURLComponent(client.clientId) +
        "&client_secret=" + EscapeURLComponent(client.clientSecret) +
        "&refresh_token=" + EscapeURLComponent(refreshToken);
    return PerformOAuthTokenRequest(transport, client, payload);
}

const nlohmann::json MakeOAuthCodeExchangeRequest(HTTPTransport & transport, const OAuthClient & client, std::string code) {
    std::string payload = "grant_type=authorization_code"
        "&client_id=" + EscapeURLComponent(client.clientId) +
        "&client_secret=" + EscapeURLComponent(client.clientSecret) +
        "&redirect_uri=" + EscapeURLComponent(client.redirectUri) +
        "&code=" + EscapeURLComponent(code);
    return PerformOAuthTokenRequest(transport, client, payload);
}
