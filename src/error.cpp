#include "error.hpp"

namespace ouroboros {

std::string Error::getCategoryName() const {
    switch (category) {
        case ErrorCategory::Configuration:
            return "Configuration";
        case ErrorCategory::Validation:
            return "Validation";
        case ErrorCategory::NotFound:
            return "NotFound";
        case ErrorCategory::Conflict:
            return "Conflict";
        case ErrorCategory::Parse:
            return "Parse";
        case ErrorCategory::Io:
            return "Io";
        case ErrorCategory::Internal:
            return "Internal";
        default:
            return "Unknown";
    }
}

crow::response Error::toHttpResponse() const {
    return crow::response(http_status_code, toJson());
}

crow::json::wvalue Error::toJson() const {
    crow::json::wvalue error_json;
    error_json["success"] = false;
    error_json["error"]["category"] = getCategoryName();
    error_json["error"]["message"] = message;

    if (!details.empty()) {
        error_json["error"]["details"] = details;
    }

    if (!errors.empty()) {
        std::vector<crow::json::wvalue> items;
        for (const auto& detail : errors) {
            crow::json::wvalue item;
            item["location"] = detail.location;
            item["code"] = detail.code;
            item["message"] = detail.message;
            items.push_back(std::move(item));
        }
        error_json["error"]["errors"] = std::move(items);
    }

    return error_json;
}

Error SpecOperationError::toError() const {
    switch (category_) {
        case ErrorCategory::NotFound:
            return Error::NotFound(what());
        case ErrorCategory::Conflict:
            return Error::Conflict(what());
        case ErrorCategory::Validation:
            return Error::Validation(what());
        case ErrorCategory::Parse:
            return Error::Parse(what());
        case ErrorCategory::Io:
            return Error::Io(what());
        case ErrorCategory::Configuration:
            return Error::Config(what());
        default:
            return Error::Internal(what());
    }
}

} // namespace ouroboros
