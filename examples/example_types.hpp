#pragma once

// Hand-written types the example client is generated against: result
// types, one input object, one enum and one custom scalar.

#include "value.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace example {

enum class Status { Active, Disabled };

NLOHMANN_JSON_SERIALIZE_ENUM(Status, {
    {Status::Active,   "ACTIVE"},
    {Status::Disabled, "DISABLED"},
})

/// ISO-8601 timestamp.
struct DateTime {
    std::string iso8601;
};

inline std::string serializeDateTime(const DateTime& value) {
    return value.iso8601;
}

inline DateTime parseDateTime(const nlohmann::json& value) {
    return DateTime{value.get<std::string>()};
}

namespace inputs {

struct UserFilter : graphql_codegen::BaseModel {
    graphql_codegen::Optional<std::string> nameContains;
    graphql_codegen::Optional<Status>      status;
    graphql_codegen::Optional<int>         minAge;

    graphql_codegen::Value::Mapping fields() const override {
        return {
            {"nameContains", nameContains},
            {"status", status},
            {"minAge", minAge},
        };
    }
};

} // namespace inputs

struct User {
    std::string id;
    std::string name;

    static User fromJson(const nlohmann::json& json) {
        return User{json.at("id").get<std::string>(), json.at("name").get<std::string>()};
    }
};

struct GetUser {
    std::optional<User> user;

    static GetUser parse(const nlohmann::json& data) {
        GetUser result;
        if (!data.at("user").is_null()) {
            result.user = User::fromJson(data.at("user"));
        }
        return result;
    }
};

struct SearchUsers {
    std::vector<User> users;

    static SearchUsers parse(const nlohmann::json& data) {
        SearchUsers result;
        for (const auto& user : data.at("searchUsers")) {
            result.users.push_back(User::fromJson(user));
        }
        return result;
    }
};

struct UploadAvatar {
    bool ok = false;

    static UploadAvatar parse(const nlohmann::json& data) {
        return UploadAvatar{data.at("uploadAvatar").at("ok").get<bool>()};
    }
};

struct LogVisits {
    int count = 0;

    static LogVisits parse(const nlohmann::json& data) {
        return LogVisits{data.at("logVisits").get<int>()};
    }
};

} // namespace example
