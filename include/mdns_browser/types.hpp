#pragma once

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace mdns_browser
{

// From mdns.h mdns_record_type
enum class RecordType : std::uint16_t {
    PTR = 12, // Domain name pointer
    SRV = 33, // Server Selection [RFC2782]
    TXT = 16, // Arbitrary text string
    A = 1, // Address
    AAAA = 28, // IP6 Address [Thomson]
    ANY = 255 // Any available records
};
std::string ToString(RecordType type);

enum class EntryType {
    UNKNOWN,
    QUESTION,
    ANSWER,
    AUTHORITY,
    ADDITIONAL
};
std::string ToString(EntryType entry);

struct RecordHeader {
    std::string ip_address; // Sender, possibly including port
    EntryType entry_type{EntryType::UNKNOWN};
    std::string entry_string; // Owner name, example: "_services._dns-sd._udp.local."

    std::uint16_t record_type{0}; // Value may not be in RecordType!
    std::uint16_t rclass{0}; // Without the cache-flush bit
    bool cache_flush{false};
    std::uint32_t ttl{0}; // Seconds, 0 announces the record is gone
    std::size_t record_length{0};
};
bool operator==(const RecordHeader& lhs, const RecordHeader& rhs);
std::ostream& operator<<(std::ostream& os, const RecordHeader& header);

struct DomainNamePointerRecord {
    RecordHeader header;

    std::string name_string; // examples: "_http._tcp.local.", "My Printer._ipp._tcp.local."
};
bool operator==(const DomainNamePointerRecord& lhs, const DomainNamePointerRecord& rhs);
std::ostream& operator<<(std::ostream& os, const DomainNamePointerRecord& record);

struct ServiceRecord {
    RecordHeader header;

    std::string target; // Host name, example: "printer.local."
    std::uint16_t priority{0};
    std::uint16_t weight{0};
    std::uint16_t port{0};
};
bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs);
std::ostream& operator<<(std::ostream& os, const ServiceRecord& record);

struct ARecord {
    RecordHeader header;

    std::string address_string;
};
bool operator==(const ARecord& lhs, const ARecord& rhs);
std::ostream& operator<<(std::ostream& os, const ARecord& record);

struct AAAARecord {
    RecordHeader header;

    std::string address_string;
};
bool operator==(const AAAARecord& lhs, const AAAARecord& rhs);
std::ostream& operator<<(std::ostream& os, const AAAARecord& record);

constexpr std::uint16_t kMdnsPort = 5353;
constexpr std::size_t kDnsHeaderSize = 12;

// True for a packet a responder may send: the QR bit is set and it comes from
// port 5353 (RFC 6762 section 6). Queries carrying known answers are not responses.
[[nodiscard]] bool IsResponsePacket(const std::uint8_t* packet, std::size_t size, std::uint16_t sourcePort);

// Keys are unique and compared case-insensitively, a key without '=' is a flag and has no value.
// Values are raw bytes.
using TxtProperties = std::map<std::string, std::optional<std::string>>;

// Parses TXT rdata (length prefixed strings) following RFC 6763 section 6.
// Strings with an empty key are skipped and the first occurrence of a key wins.
// Throws MalformedPacketError if a string runs past the end of the data.
TxtProperties ParseTxtData(const std::uint8_t* data, std::size_t size);

// Valid UTF-8 is returned as is, anything else as lowercase hex
std::string TxtValueToDisplayString(const std::optional<std::string>& value);

struct TXTRecord {
    RecordHeader header;

    TxtProperties txt;
};
bool operator==(const TXTRecord& lhs, const TXTRecord& rhs);
std::ostream& operator<<(std::ostream& os, const TXTRecord& record);

struct AnyRecord {
    RecordHeader header;
};
bool operator==(const AnyRecord& lhs, const AnyRecord& rhs);
std::ostream& operator<<(std::ostream& os, const AnyRecord& record);

using Record = std::variant<DomainNamePointerRecord,
                            ServiceRecord,
                            ARecord,
                            AAAARecord,
                            TXTRecord,
                            AnyRecord>;
std::ostream& operator<<(std::ostream& os, const Record& record);

const RecordHeader& HeaderOf(const Record& record);
RecordHeader& HeaderOf(Record& record);

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

}
