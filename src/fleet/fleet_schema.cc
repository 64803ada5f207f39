#include "fleet_schema.h"

#include <cerrno>
#include <cstdlib>
#include <cctype>
#include <set>

#include <yaml-cpp/yaml.h>

#include "../common/config.h"

namespace FleetLayout {

namespace {

const std::set<std::string> kTopLevelProperties = {"nshards", "images", "servers"};
const std::set<std::string> kServerProperties = {"type", "uuid", "memory", "az", "rack"};

bool IsNullText(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

bool IsBooleanText(const std::string& s) {
    return s == "true" || s == "True" || s == "TRUE" ||
           s == "false" || s == "False" || s == "FALSE";
}

// [-+]?[0-9]+
bool IsIntegerText(const std::string& s) {
    size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    if (i == s.size()) {
        return false;
    }
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)? and the .inf/.nan forms
bool IsNumberText(const std::string& s) {
    size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    std::string rest = s.substr(i);
    if (rest == ".inf" || rest == ".Inf" || rest == ".INF") {
        return true;
    }
    if (i == 0 && (s == ".nan" || s == ".NaN" || s == ".NAN")) {
        return true;
    }

    size_t digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        ++i;
        ++digits;
    }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            ++i;
            ++digits;
        }
    }
    if (digits == 0) {
        return false;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
            ++i;
        }
        size_t exponent_digits = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            ++i;
            ++exponent_digits;
        }
        if (exponent_digits == 0) {
            return false;
        }
    }
    return i == s.size();
}

// Names the type of a node the way the error messages refer to it
std::string TypeName(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Sequence:
            return "array";
        case YAML::NodeType::Map:
            return "object";
        case YAML::NodeType::Scalar:
            switch (ClassifyScalar(node)) {
                case ScalarKind::NUL:     return "null";
                case ScalarKind::BOOLEAN: return "boolean";
                case ScalarKind::INTEGER: return "integer";
                case ScalarKind::NUMBER:  return "number";
                case ScalarKind::STRING:  return "string";
            }
            return "string";
        default:
            return "null";
    }
}

std::string PropertyError(const std::string& path, const std::string& message) {
    return "property \"" + path + "\": " + message;
}

std::string TypeError(const std::string& path, const YAML::Node& node, const std::string& expected) {
    return PropertyError(path, TypeName(node) + " value found, but " + expected + " is required");
}

bool CheckRequired(const YAML::Node& parent, const std::string& key, const std::string& path,
        std::string* error) {
    if (!parent[key]) {
        *error = PropertyError(path, "is missing and it is required");
        return false;
    }
    return true;
}

bool CheckInteger(const YAML::Node& node, const std::string& path, int64_t min, int64_t max,
        std::string* error) {
    int64_t value;
    if (!node.IsScalar() || ClassifyScalar(node) != ScalarKind::INTEGER) {
        *error = TypeError(path, node, "an integer");
        return false;
    }
    if (!ScalarToInteger(node, &value)) {
        *error = PropertyError(path, "integer value is out of range");
        return false;
    }
    if (value < min) {
        *error = PropertyError(path, "must have a minimum value of " + std::to_string(min));
        return false;
    }
    if (value > max) {
        *error = PropertyError(path, "must have a maximum value of " + std::to_string(max));
        return false;
    }
    return true;
}

bool CheckNonEmptyString(const YAML::Node& node, const std::string& path, std::string* error) {
    if (!IsStringScalar(node)) {
        *error = TypeError(path, node, "a string");
        return false;
    }
    if (node.Scalar().empty()) {
        *error = PropertyError(path, "must be at least 1 characters long");
        return false;
    }
    return true;
}

bool CheckNoExtraProperties(const YAML::Node& node, const std::set<std::string>& allowed,
        const std::string& prefix, std::string* error) {
    for (const auto& kv : node) {
        const std::string key = kv.first.Scalar();
        if (allowed.count(key) == 0) {
            *error = PropertyError(prefix + key, "unsupported property");
            return false;
        }
    }
    return true;
}

bool CheckServer(const YAML::Node& server, const std::string& path, std::string* error) {
    if (!server.IsMap()) {
        *error = TypeError(path, server, "an object");
        return false;
    }

    if (!CheckRequired(server, "type", path + ".type", error)) {
        return false;
    }
    const YAML::Node type = server["type"];
    if (!IsStringScalar(type)) {
        *error = TypeError(path + ".type", type, "a string");
        return false;
    }
    if (type.Scalar() != "metadata" && type.Scalar() != "storage") {
        *error = PropertyError(path + ".type", "does not have a value in the enumeration "
                "[\"metadata\", \"storage\"]");
        return false;
    }

    if (!CheckRequired(server, "uuid", path + ".uuid", error) ||
            !CheckNonEmptyString(server["uuid"], path + ".uuid", error)) {
        return false;
    }

    if (!CheckRequired(server, "memory", path + ".memory", error) ||
            !CheckInteger(server["memory"], path + ".memory",
                MIN_SERVER_MEMORY_GB, MAX_SERVER_MEMORY_GB, error)) {
        return false;
    }

    for (const char* optional : {"az", "rack"}) {
        if (server[optional] &&
                !CheckNonEmptyString(server[optional], path + "." + optional, error)) {
            return false;
        }
    }

    return CheckNoExtraProperties(server, kServerProperties, path + ".", error);
}

} // namespace

bool IsStringScalar(const YAML::Node& node) {
    if (!node.IsScalar()) {
        return false;
    }
    // The parser tags every scalar "?" or "!"; an empty tag was set from code
    return node.Tag().empty() || ClassifyScalar(node) == ScalarKind::STRING;
}

ScalarKind ClassifyScalar(const YAML::Node& node) {
    if (!node.IsScalar()) {
        return ScalarKind::NUL;
    }
    // Quoted and explicitly tagged "!" scalars are never resolved
    if (node.Tag() == "!") {
        return ScalarKind::STRING;
    }
    const std::string& text = node.Scalar();
    if (IsNullText(text)) {
        return ScalarKind::NUL;
    }
    if (IsBooleanText(text)) {
        return ScalarKind::BOOLEAN;
    }
    if (IsIntegerText(text)) {
        return ScalarKind::INTEGER;
    }
    if (IsNumberText(text)) {
        return ScalarKind::NUMBER;
    }
    return ScalarKind::STRING;
}

bool ScalarToInteger(const YAML::Node& node, int64_t* value) {
    if (ClassifyScalar(node) != ScalarKind::INTEGER) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(node.Scalar().c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0') {
        return false;
    }
    *value = static_cast<int64_t>(parsed);
    return true;
}

bool ValidateFleetSchema(const YAML::Node& root, std::string* error) {
    if (!root.IsMap()) {
        *error = "fleet description: " + TypeName(root) + " value found, but an object is required";
        return false;
    }

    if (!CheckRequired(root, "nshards", "nshards", error) ||
            !CheckInteger(root["nshards"], "nshards", MIN_SHARDS, MAX_SHARDS, error)) {
        return false;
    }

    if (root["images"] && !root["images"].IsMap()) {
        *error = TypeError("images", root["images"], "an object");
        return false;
    }

    if (!CheckRequired(root, "servers", "servers", error)) {
        return false;
    }
    const YAML::Node servers = root["servers"];
    if (!servers.IsSequence()) {
        *error = TypeError("servers", servers, "an array");
        return false;
    }
    if (servers.size() == 0) {
        *error = PropertyError("servers", "must have at least 1 item");
        return false;
    }
    for (size_t i = 0; i < servers.size(); ++i) {
        if (!CheckServer(servers[i], "servers[" + std::to_string(i) + "]", error)) {
            return false;
        }
    }

    return CheckNoExtraProperties(root, kTopLevelProperties, "", error);
}

} // namespace FleetLayout
