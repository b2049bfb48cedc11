#pragma once

#include "mdns.h"
#include "mdns_browser/errors.hpp"
#include "mdns_browser/log.hpp"
#include "mdns_browser/network_interfaces.hpp"
#include "mdns_browser/types.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>

#include <fmt/core.h>

namespace mdns_browser
{

constexpr std::uint16_t kCacheFlushBit = 0x8000;

inline EntryType ParseEntryType(mdns_entry_type_t old_entry_type) {
	switch (old_entry_type) {
		case MDNS_ENTRYTYPE_QUESTION : return EntryType::QUESTION;
		case MDNS_ENTRYTYPE_ANSWER : return EntryType::ANSWER;
		case MDNS_ENTRYTYPE_AUTHORITY : return EntryType::AUTHORITY;
		case MDNS_ENTRYTYPE_ADDITIONAL : return EntryType::ADDITIONAL;
	}
	return EntryType::UNKNOWN;
}

inline std::string IPV4AddressToString(const sockaddr_in *addr, size_t addrlen) {
  char host[NI_MAXHOST] = {0};
  char service[NI_MAXSERV] = {0};
  const int ret = getnameinfo((const struct sockaddr *)addr, (socklen_t)addrlen, host, NI_MAXHOST, service, NI_MAXSERV, NI_NUMERICSERV | NI_NUMERICHOST);
  if (ret == 0) {
    if (addr->sin_port != 0) {
	  return fmt::format("{}:{}", host, service);
    } else {
	  return fmt::format("{}", host);
    }
  }
  return "";
}

inline std::string IPV6AddressToString(const sockaddr_in6 *addr, size_t addrlen) {
  char host[NI_MAXHOST] = {0};
  char service[NI_MAXSERV] = {0};
  const int ret = getnameinfo((const struct sockaddr *)addr, (socklen_t)addrlen, host, NI_MAXHOST, service, NI_MAXSERV, NI_NUMERICSERV | NI_NUMERICHOST);
  if (ret == 0) {
    if (addr->sin6_port != 0) {
	  return fmt::format("[{}]:{}", host, service);
    } else {
	  return fmt::format("{}", host);
    }
  }
  return "";
}

inline std::string IPAddressToString(const sockaddr *addr, size_t addrlen) {
  if (addr->sa_family == AF_INET6) {
    return IPV6AddressToString((const struct sockaddr_in6 *)addr, addrlen);
  }
  return IPV4AddressToString((const struct sockaddr_in *)addr, addrlen);
}

// Owns one mdns socket, closed on destruction
class Socket
{
public:
	Socket(int fd, NetworkInterface networkInterface)
	: m_fd(fd), m_interface(std::move(networkInterface))
	{}

	~Socket()
	{
		if (m_fd >= 0) {
			mdns_socket_close(m_fd);
		}
	}

	Socket(Socket&& other) noexcept
	: m_fd(std::exchange(other.m_fd, -1)), m_interface(std::move(other.m_interface))
	{}

	Socket& operator=(Socket&& other) noexcept
	{
		if (this != &other) {
			if (m_fd >= 0) {
				mdns_socket_close(m_fd);
			}
			m_fd = std::exchange(other.m_fd, -1);
			m_interface = std::move(other.m_interface);
		}
		return *this;
	}

	Socket(const Socket&) = delete;
	Socket& operator=(const Socket&) = delete;

	[[nodiscard]] int Fd() const { return m_fd; }
	[[nodiscard]] const NetworkInterface& Interface() const { return m_interface; }

private:
	int m_fd{-1};
	NetworkInterface m_interface;
};

// Opens a socket on the mDNS port that sends through and joins the multicast
// group on the given interface. Throws BindError.
inline Socket OpenInterfaceSocket(const NetworkInterface& networkInterface)
{
	struct sockaddr_in saddr4;
	std::memset(&saddr4, 0, sizeof(saddr4));
	if (inet_pton(AF_INET, networkInterface.address.c_str(), &saddr4.sin_addr) == 1) {
		saddr4.sin_family = AF_INET;
		saddr4.sin_port = htons(MDNS_PORT);
#ifdef __APPLE__
		saddr4.sin_len = sizeof(struct sockaddr_in);
#endif
		const int sock = mdns_socket_open_ipv4(&saddr4);
		if (sock < 0) {
			throw BindError(networkInterface.name, std::strerror(errno));
		}
		return Socket(sock, networkInterface);
	}

	struct sockaddr_in6 saddr6;
	std::memset(&saddr6, 0, sizeof(saddr6));
	if (inet_pton(AF_INET6, networkInterface.address.c_str(), &saddr6.sin6_addr) == 1) {
		saddr6.sin6_family = AF_INET6;
		saddr6.sin6_port = htons(MDNS_PORT);
		saddr6.sin6_scope_id = if_nametoindex(networkInterface.name.c_str());
#ifdef __APPLE__
		saddr6.sin6_len = sizeof(struct sockaddr_in6);
#endif
		const int sock = mdns_socket_open_ipv6(&saddr6);
		if (sock < 0) {
			throw BindError(networkInterface.name, std::strerror(errno));
		}
		return Socket(sock, networkInterface);
	}

	throw BindError(networkInterface.name, fmt::format("\"{}\" is not an IP address", networkInterface.address));
}

inline void SendQueryOn(const Socket& socket, std::string_view name, RecordType type, void* buffer, size_t capacity)
{
	const int res = mdns_query_send(socket.Fd(), static_cast<mdns_record_type_t>(type), name.data(), name.size(),
	                                buffer, capacity, 0);
	if (res < 0) {
		throw SendError(fmt::format("Failed to send {} query for {} on {}: {}", ToString(type), name,
		                            socket.Interface().name, std::strerror(errno)));
	}
}

struct ReceivedPacket {
	std::vector<Record> records;
	std::size_t malformed{0};
	// Someone else's query or not from port 5353, none of its records are used
	bool ignored{false};
};

inline std::uint16_t SourcePort(const struct sockaddr* from)
{
	if (from->sa_family == AF_INET6) {
		return ntohs(reinterpret_cast<const struct sockaddr_in6*>(from)->sin6_port);
	}
	return ntohs(reinterpret_cast<const struct sockaddr_in*>(from)->sin_port);
}

// Throws MalformedPacketError
inline Record ParseRecord(const struct sockaddr* from, size_t addrlen, mdns_entry_type_t entry,
                          uint16_t rtype, uint16_t rclass, uint32_t ttl, const void* data, size_t size,
                          size_t name_offset, size_t record_offset, size_t record_length)
{
	if (record_offset > size || record_length > size - record_offset) {
		throw MalformedPacketError("record data runs past the end of the packet");
	}

	RecordHeader header;
	header.ip_address = IPAddressToString(from, addrlen);
	header.entry_type = ParseEntryType(entry);
	char entrybuffer[256];
	const mdns_string_t entrystr = mdns_string_extract(data, size, &name_offset, entrybuffer, sizeof(entrybuffer));
	if (entrystr.length == 0) {
		throw MalformedPacketError("record without owner name");
	}
	header.entry_string = std::string(entrystr.str, entrystr.length);
	header.record_type = rtype;
	header.rclass = rclass & ~kCacheFlushBit;
	header.cache_flush = (rclass & kCacheFlushBit) != 0;
	header.ttl = ttl;
	header.record_length = record_length;

	if (rtype == MDNS_RECORDTYPE_PTR) {
		DomainNamePointerRecord ptrRecord;
		ptrRecord.header = std::move(header);

		char namebuffer[256];
		const mdns_string_t namestr = mdns_record_parse_ptr(data, size, record_offset, record_length,
		                                                    namebuffer, sizeof(namebuffer));
		if (namestr.length == 0) {
			throw MalformedPacketError(fmt::format("PTR {} without target", ptrRecord.header.entry_string));
		}
		ptrRecord.name_string = std::string(namestr.str, namestr.length);
		return ptrRecord;
	}
	if (rtype == MDNS_RECORDTYPE_SRV) {
		ServiceRecord srvRecord;
		srvRecord.header = std::move(header);

		char namebuffer[256];
		const mdns_record_srv_t srv = mdns_record_parse_srv(data, size, record_offset, record_length,
		                                                    namebuffer, sizeof(namebuffer));
		if (srv.name.length == 0) {
			throw MalformedPacketError(fmt::format("SRV {} without target", srvRecord.header.entry_string));
		}
		srvRecord.target = std::string(srv.name.str, srv.name.length);
		srvRecord.priority = srv.priority;
		srvRecord.weight = srv.weight;
		srvRecord.port = srv.port;
		return srvRecord;
	}
	if (rtype == MDNS_RECORDTYPE_A) {
		if (record_length != 4) {
			throw MalformedPacketError(fmt::format("A record of {} bytes", record_length));
		}
		ARecord aRecord;
		aRecord.header = std::move(header);

		struct sockaddr_in addr;
		mdns_record_parse_a(data, size, record_offset, record_length, &addr);
		aRecord.address_string = IPV4AddressToString(&addr, sizeof(addr));
		return aRecord;
	}
	if (rtype == MDNS_RECORDTYPE_AAAA) {
		if (record_length != 16) {
			throw MalformedPacketError(fmt::format("AAAA record of {} bytes", record_length));
		}
		AAAARecord aaaaRecord;
		aaaaRecord.header = std::move(header);

		struct sockaddr_in6 addr;
		mdns_record_parse_aaaa(data, size, record_offset, record_length, &addr);
		aaaaRecord.address_string = IPV6AddressToString(&addr, sizeof(addr));
		return aaaaRecord;
	}
	if (rtype == MDNS_RECORDTYPE_TXT) {
		TXTRecord txtRecord;
		txtRecord.header = std::move(header);
		txtRecord.txt = ParseTxtData(static_cast<const std::uint8_t*>(data) + record_offset, record_length);
		return txtRecord;
	}

	AnyRecord anyRecord;
	anyRecord.header = std::move(header);
	return anyRecord;
}

// mdns.h record callback, user_data is a ReceivedPacket
inline int RecordCallback(int sock, const struct sockaddr* from, size_t addrlen,
                          mdns_entry_type_t entry, uint16_t query_id, uint16_t rtype,
                          uint16_t rclass, uint32_t ttl, const void* data, size_t size,
                          size_t name_offset, size_t name_length, size_t record_offset,
                          size_t record_length, void* user_data)
{
	(void)sock;
	(void)query_id;
	(void)name_length;

	auto packet = reinterpret_cast<ReceivedPacket*>(user_data);
	if (packet->ignored) {
		return 0;
	}
	if (!IsResponsePacket(static_cast<const std::uint8_t*>(data), size, SourcePort(from))) {
		packet->ignored = true;
		packet->records.clear();
		return 0;
	}
	if (entry == MDNS_ENTRYTYPE_QUESTION) {
		return 0;
	}

	try {
		packet->records.push_back(ParseRecord(from, addrlen, entry, rtype, rclass, ttl, data, size,
		                                      name_offset, record_offset, record_length));
	} catch (const MalformedPacketError& e) {
		++packet->malformed;
		Log(LogLevel::Debug, fmt::format("Dropped malformed record from {}: {}", IPAddressToString(from, addrlen), e.what()));
	}
	return 0;
}

}
