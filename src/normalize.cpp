#include "mdns_browser/normalize.hpp"
#include "mdns_browser/errors.hpp"

#include <cctype>
#include <vector>

#include <fmt/core.h>

namespace mdns_browser
{

namespace
{

constexpr std::string_view kWhitespace = " \t\r\n\f\v";
constexpr std::size_t kMaxNameLength = 255;
constexpr std::size_t kMaxLabelLength = 63;

bool EndsWith(std::string_view str, std::string_view suffix)
{
    return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
}

char LowerAscii(char c)
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

}

std::string NormalizeServiceType(std::string_view input)
{
    const auto first = input.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return "";
    }
    const auto last = input.find_last_not_of(kWhitespace);
    std::string service(input.substr(first, last - first + 1));

    if (EndsWith(service, ".local.")) {
        return service;
    }
    if (EndsWith(service, ".local")) {
        return service + ".";
    }
    if (EndsWith(service, ".")) {
        return service + "local.";
    }
    return service + ".local.";
}

void ValidateServiceType(std::string_view serviceType)
{
    const std::string query(serviceType);
    if (serviceType.empty()) {
        throw InvalidQueryError(query, "empty service type");
    }
    if (serviceType.size() > kMaxNameLength) {
        throw InvalidQueryError(query, fmt::format("name longer than {} characters", kMaxNameLength));
    }
    if (IsMetaQueryName(serviceType)) {
        throw InvalidQueryError(query, "the service enumeration name is browsed automatically");
    }

    std::size_t labelStart = 0;
    for (std::size_t i = 0; i <= serviceType.size(); ++i) {
        if (i < serviceType.size()) {
            const auto c = static_cast<unsigned char>(serviceType[i]);
            if (std::isspace(c) || std::iscntrl(c)) {
                throw InvalidQueryError(query, "whitespace or control character in name");
            }
            if (c != '.') {
                continue;
            }
        }
        const auto labelLength = i - labelStart;
        // The trailing dot terminates the name, the empty tail is not a label
        const bool isTail = (i == serviceType.size());
        if (labelLength == 0 && !isTail) {
            throw InvalidQueryError(query, "empty label");
        }
        if (labelLength > kMaxLabelLength) {
            throw InvalidQueryError(query, fmt::format("label longer than {} characters", kMaxLabelLength));
        }
        labelStart = i + 1;
    }
}

std::string ServiceTypeFromName(std::string_view name)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto dot = name.find('.', start);
        if (dot == std::string_view::npos) {
            parts.push_back(name.substr(start));
            break;
        }
        parts.push_back(name.substr(start, dot - start));
        start = dot + 1;
    }

    if (parts.size() <= 4) {
        return std::string(name);
    }

    std::string folded;
    for (auto it = parts.end() - 4; it != parts.end(); ++it) {
        if (it != parts.end() - 4) {
            folded += '.';
        }
        folded += *it;
    }
    return folded;
}

bool IsMetaQueryName(std::string_view name)
{
    return NamesEqual(name, kMetaQueryName);
}

bool NamesEqual(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (LowerAscii(lhs[i]) != LowerAscii(rhs[i])) {
            return false;
        }
    }
    return true;
}

bool NameEndsWith(std::string_view name, std::string_view suffix)
{
    return name.size() >= suffix.size() && NamesEqual(name.substr(name.size() - suffix.size()), suffix);
}

std::string ToLowerName(std::string_view name)
{
    std::string lower(name);
    for (auto& c : lower) {
        c = LowerAscii(c);
    }
    return lower;
}

}
