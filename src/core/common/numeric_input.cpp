#include "humidor/core/numeric_input.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <cerrno>
#include <limits>

namespace humidor {
namespace {

std::string Trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

void SetError(std::string* error, const std::string& message) {
    if (error != nullptr) {
        *error = message;
    }
}

}  // namespace

bool ParseDecimalText(const std::string& text, double* out, std::string* error) {
    if (out == nullptr) {
        SetError(error, "decimal output is null");
        return false;
    }
    auto normalized = Trim(text);
    if (!normalized.empty() && normalized.front() == '$') {
        normalized = Trim(normalized.substr(1));
    }
    if (normalized.empty()) {
        SetError(error, "empty numeric value");
        return false;
    }

    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(normalized.c_str(), &end);
    if (end == normalized.c_str() || *end != '\0' || errno == ERANGE || !std::isfinite(parsed)) {
        SetError(error, "not a number: " + text);
        return false;
    }
    *out = parsed;
    return true;
}

bool ParseCountText(const std::string& text, std::int32_t* out, std::string* error) {
    if (out == nullptr) {
        SetError(error, "count output is null");
        return false;
    }
    const auto normalized = Trim(text);
    if (normalized.empty()) {
        SetError(error, "empty count value");
        return false;
    }

    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(normalized.c_str(), &end, 10);
    if (end == normalized.c_str() || *end != '\0' || errno == ERANGE) {
        SetError(error, "not a whole number: " + text);
        return false;
    }
    if (parsed < 0 || parsed > std::numeric_limits<std::int32_t>::max()) {
        SetError(error, "count out of range: " + text);
        return false;
    }
    *out = static_cast<std::int32_t>(parsed);
    return true;
}

}  // namespace humidor
