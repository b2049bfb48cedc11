#include "mdns_browser/types.hpp"
#include "mdns_browser/errors.hpp"
#include "mdns_browser/normalize.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace mdns_browser
{

std::string ToString(RecordType type)
{
    switch (type) {
        case RecordType::PTR: return "PTR";
        case RecordType::SRV: return "SRV";
        case RecordType::TXT: return "TXT";
        case RecordType::A: return "A";
        case RecordType::AAAA: return "AAAA";
        case RecordType::ANY: return "ANY";
    }
    return fmt::format("type {}", static_cast<std::uint16_t>(type));
}

std::string ToString(EntryType entry)
{
    switch (entry) {
        case EntryType::QUESTION: return "question";
        case EntryType::ANSWER: return "answer";
        case EntryType::AUTHORITY: return "authority";
        case EntryType::ADDITIONAL: return "additional";
        case EntryType::UNKNOWN: break;
    }
    return "unknown";
}

bool operator==(const RecordHeader& lhs, const RecordHeader& rhs)
{
    return lhs.ip_address == rhs.ip_address
        && lhs.entry_type == rhs.entry_type
        && lhs.entry_string == rhs.entry_string
        && lhs.record_type == rhs.record_type
        && lhs.rclass == rhs.rclass
        && lhs.cache_flush == rhs.cache_flush
        && lhs.ttl == rhs.ttl
        && lhs.record_length == rhs.record_length;
}

std::ostream& operator<<(std::ostream& os, const RecordHeader& header)
{
    os << fmt::format("{} : {} {}", header.ip_address, ToString(header.entry_type), header.entry_string);
    return os;
}

bool operator==(const DomainNamePointerRecord& lhs, const DomainNamePointerRecord& rhs)
{
    return lhs.header == rhs.header
        && lhs.name_string == rhs.name_string;
}

std::ostream& operator<<(std::ostream& os, const DomainNamePointerRecord& record)
{
    os << record.header << fmt::format(" PTR {} rclass {:#x} ttl {} length {}", record.name_string, record.header.rclass, record.header.ttl, record.header.record_length);
    return os;
}

bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs)
{
    return lhs.header == rhs.header
        && lhs.target == rhs.target
        && lhs.priority == rhs.priority
        && lhs.weight == rhs.weight
        && lhs.port == rhs.port;
}

std::ostream& operator<<(std::ostream& os, const ServiceRecord& record)
{
    os << record.header << fmt::format(" SRV {} priority {} weight {} port {} ttl {}", record.target, record.priority, record.weight, record.port, record.header.ttl);
    return os;
}

bool operator==(const ARecord& lhs, const ARecord& rhs)
{
    return lhs.header == rhs.header
        && lhs.address_string == rhs.address_string;
}

std::ostream& operator<<(std::ostream& os, const ARecord& record)
{
    os << record.header << fmt::format(" A {} ttl {}", record.address_string, record.header.ttl);
    return os;
}

bool operator==(const AAAARecord& lhs, const AAAARecord& rhs)
{
    return lhs.header == rhs.header
        && lhs.address_string == rhs.address_string;
}

std::ostream& operator<<(std::ostream& os, const AAAARecord& record)
{
    os << record.header << fmt::format(" AAAA {} ttl {}", record.address_string, record.header.ttl);
    return os;
}

bool IsResponsePacket(const std::uint8_t* packet, std::size_t size, std::uint16_t sourcePort)
{
    if (sourcePort != kMdnsPort || size < kDnsHeaderSize) {
        return false;
    }
    return (packet[2] & 0x80) != 0;
}

TxtProperties ParseTxtData(const std::uint8_t* data, std::size_t size)
{
    TxtProperties txt;
    std::size_t offset = 0;
    while (offset < size) {
        const std::size_t length = data[offset++];
        if (length > size - offset) {
            throw MalformedPacketError(fmt::format("TXT string of {} bytes overruns rdata of {} bytes", length, size));
        }
        const std::string entry(reinterpret_cast<const char*>(data + offset), length);
        offset += length;

        // A single zero byte is the empty TXT record
        if (entry.empty()) {
            continue;
        }
        const auto separator = entry.find('=');
        if (separator == 0) {
            continue;
        }
        const std::string key = entry.substr(0, separator);
        const bool seen = std::any_of(txt.begin(), txt.end(), [&key](const auto& property){
            return NamesEqual(property.first, key);
        });
        if (seen) {
            continue;
        }
        if (separator == std::string::npos) {
            txt.emplace(key, std::nullopt);
        } else {
            txt.emplace(key, entry.substr(separator + 1));
        }
    }
    return txt;
}

namespace
{

bool IsValidUtf8(const std::string& str)
{
    std::size_t i = 0;
    while (i < str.size()) {
        const auto c = static_cast<unsigned char>(str[i]);
        std::size_t continuation = 0;
        if (c < 0x80) {
            continuation = 0;
        } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
            continuation = 1;
        } else if ((c & 0xF0) == 0xE0) {
            continuation = 2;
        } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
            continuation = 3;
        } else {
            return false;
        }
        if (continuation > str.size() - i - 1) {
            return false;
        }
        for (std::size_t k = 1; k <= continuation; ++k) {
            if ((static_cast<unsigned char>(str[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }
        // No overlong forms, no surrogates, nothing above U+10FFFF
        if (continuation > 1) {
            const auto next = static_cast<unsigned char>(str[i + 1]);
            if ((c == 0xE0 && next < 0xA0) || (c == 0xED && next > 0x9F)
                || (c == 0xF0 && next < 0x90) || (c == 0xF4 && next > 0x8F)) {
                return false;
            }
        }
        i += continuation + 1;
    }
    return true;
}

}

std::string TxtValueToDisplayString(const std::optional<std::string>& value)
{
    if (!value) {
        return "";
    }
    if (IsValidUtf8(*value)) {
        return *value;
    }
    std::string hex;
    hex.reserve(value->size() * 2);
    for (const auto c : *value) {
        hex += fmt::format("{:02x}", static_cast<unsigned char>(c));
    }
    return hex;
}

bool operator==(const TXTRecord& lhs, const TXTRecord& rhs)
{
    return lhs.header == rhs.header
        && lhs.txt == rhs.txt;
}

std::ostream& operator<<(std::ostream& os, const TXTRecord& record)
{
    os << record.header << " TXT";
    for (const auto& [key, value] : record.txt) {
        if (value) {
            os << fmt::format(" {}={}", key, TxtValueToDisplayString(value));
        } else {
            os << fmt::format(" {}", key);
        }
    }
    return os;
}

bool operator==(const AnyRecord& lhs, const AnyRecord& rhs)
{
    return lhs.header == rhs.header;
}

std::ostream& operator<<(std::ostream& os, const AnyRecord& record)
{
    os << record.header << fmt::format(" type {} rclass {:#x} ttl {} length {}", record.header.record_type, record.header.rclass, record.header.ttl, record.header.record_length);
    return os;
}

std::ostream& operator<<(std::ostream& os, const Record& record)
{
    std::visit([&os](const auto& rec){
        os << rec;
    }, record);
    return os;
}

const RecordHeader& HeaderOf(const Record& record)
{
    return std::visit([](const auto& rec) -> const RecordHeader& {
        return rec.header;
    }, record);
}

RecordHeader& HeaderOf(Record& record)
{
    return std::visit([](auto& rec) -> RecordHeader& {
        return rec.header;
    }, record);
}

}
