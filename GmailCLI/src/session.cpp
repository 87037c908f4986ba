#include "gmailcli/session.hpp"
#include "gmailcli/gmail_exception.hpp"
#include "gmailcli/constants.hpp"

Session::Session(OAuthToken token, TokenRefresher refresher, Clock clock) :
    _token(token),
    _refresher(refresher),
    _clock(clock),
    logger(spdlog::get("logger"))
{
    if (!_clock) {
        _clock = []() { return time(0); };
    }
}

std::string Session::authorization() {
    // buffer of 60 sec since we actually need time to use the token. An
    // expiry of zero means the token store did not record one.
    bool expired = (_token.expiryDate != 0) && (_token.expiryDate <= _clock() + 60);
    if (_token.accessToken == "" || expired) {
        forceRefresh();
    }
    return "Bearer " + _token.accessToken;
}

bool Session::canRefresh() {
    return _refresher && _token.refreshToken != "";
}

void Session::forceRefresh() {
    if (!canRefresh()) {
        throw GmailException(ERROR_AUTHENTICATION, "The access token has expired and no refresh token is available. Run `gmailcli auth` to authorize again.");
    }

    logger->info("Refreshing OAuth access token");
    OAuthToken updated = _refresher(_token.refreshToken);
    if (updated.accessToken == "") {
        throw GmailException(ERROR_AUTHENTICATION, "Token refresh did not return an access token.");
    }
    // Google only returns a refresh token when it rotates it
    if (updated.refreshToken == "") {
        updated.refreshToken = _token.refreshToken;
    }
    _token = updated;

    if (_onRefresh) {
        _onRefresh(_token);
    }
}

void Session::setOnRefresh(std::function<void(const OAuthToken &)> onRefresh) {
    _onRefresh = onRefresh;
}

OAuthToken Session::token() {
    return _token;
}
