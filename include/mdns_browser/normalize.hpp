#pragma once

#include <string>
#include <string_view>

namespace mdns_browser
{

// DNS-SD service type enumeration name
inline constexpr std::string_view kMetaQueryName = "_services._dns-sd._udp.local.";

// Trims whitespace and makes sure the result ends with ".local."
// Best effort only, see ValidateServiceType().
// NormalizeServiceType("  _http._tcp ") == "_http._tcp.local."
std::string NormalizeServiceType(std::string_view input);

// Throws InvalidQueryError if the normalized type can not be browsed
void ValidateServiceType(std::string_view serviceType);

// Folds sub-type names to their parent type by keeping the last four parts,
// "_printer._sub._http._tcp.local." -> "_http._tcp.local."
std::string ServiceTypeFromName(std::string_view name);

[[nodiscard]] bool IsMetaQueryName(std::string_view name);

// DNS names compare case-insensitively (ASCII only)
[[nodiscard]] bool NamesEqual(std::string_view lhs, std::string_view rhs);
[[nodiscard]] bool NameEndsWith(std::string_view name, std::string_view suffix);
std::string ToLowerName(std::string_view name);

}
