#include "gmailcli/models/label.hpp"

Label::Label(nlohmann::json json) :
    _data(json)
{
}

std::string Label::id() const {
    return _data.value("id", "");
}

std::string Label::name() const {
    return _data.value("name", "");
}

std::string Label::type() const {
    return _data.value("type", "user");
}

bool Label::isSystem() const {
    return type() == "system";
}

nlohmann::json Label::toJSON() const {
    nlohmann::json json = {
        {"id", id()},
        {"name", name()},
        {"type", type()},
    };
    const char * optionalKeys[] = {"messageListVisibility", "labelListVisibility", "messagesTotal", "messagesUnread", "threadsTotal", "threadsUnread"};
    for (const auto key : optionalKeys) {
        if (_data.count(key)) {
            json[key] = _data[key];
        }
    }
    return json;
}
