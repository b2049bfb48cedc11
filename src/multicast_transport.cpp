#include "mdns_browser/multicast_transport.hpp"
#include "mdns_browser/log.hpp"
#include "mdns_utils.hpp"

#include <array>
#include <ostream>
#include <thread>

#include <sys/select.h>

#include <fmt/core.h>
#include <fmt/ostream.h>

namespace mdns_browser
{

std::ostream& operator<<(std::ostream& os, const TransportStats& stats)
{
	os << fmt::format("{} packets ({} ignored), {} records, {} malformed, {} queries sent, {} send failures",
		stats.packets_received, stats.packets_ignored, stats.records_delivered, stats.malformed_dropped,
		stats.queries_sent, stats.send_failures);
	return os;
}

class MulticastTransport::TransportImpl
{
private:
	std::vector<Socket> m_sockets;
	RecordHandler m_handler;
	TransportStats m_stats;
	// Large enough for a jumbo mDNS packet
	std::array<char, 9000> m_buffer;

public:
	~TransportImpl()
	{
		Close();
	}

	OpenResult Open(const InterfaceSelector& selector)
	{
		if (!m_sockets.empty()) {
			Close();
		}

		std::vector<NetworkInterface> candidates;
		if (selector.IsAll()) {
			candidates = EnumerateNetworkInterfaces();
			if (candidates.empty()) {
				throw BindError(selector.ToString(), "no multicast capable interface found");
			}
		} else {
			candidates.push_back(selector.Interface());
		}

		OpenResult result;
		for (const auto& candidate : candidates) {
			try {
				m_sockets.push_back(OpenInterfaceSocket(candidate));
				result.opened.push_back(candidate);
				Log(LogLevel::Debug, fmt::format("Socket opened for interface {} with local address {}", candidate.name, candidate.address));
			} catch (const BindError& e) {
				Log(LogLevel::Warn, e.what());
				if (!selector.IsAll()) {
					throw;
				}
				result.bind_errors.push_back(e);
			}
		}

		if (m_sockets.empty()) {
			throw BindError(selector.ToString(), "no socket could be bound");
		}

		const auto num_sockets = m_sockets.size();
		Log(LogLevel::Info, fmt::format("Opened {} socket{} for mDNS discovery on {}.", num_sockets, num_sockets > 1 ? "s" : "", selector.ToString()));
		return result;
	}

	bool SendQuery(std::string_view name, RecordType type)
	{
		std::size_t sent = 0;
		for (const auto& socket : m_sockets) {
			try {
				SendQueryOn(socket, name, type, m_buffer.data(), m_buffer.size());
				++sent;
			} catch (const SendError& e) {
				++m_stats.send_failures;
				Log(LogLevel::Warn, e.what());
			}
		}
		m_stats.queries_sent += sent;
		Log(LogLevel::Debug, fmt::format("Query {} {} sent on {} socket{}", ToString(type), name, sent, sent == 1 ? "" : "s"));
		return sent > 0;
	}

	void Subscribe(RecordHandler handler)
	{
		m_handler = std::move(handler);
	}

	void Poll(std::chrono::milliseconds maxWait)
	{
		if (m_sockets.empty()) {
			std::this_thread::sleep_for(maxWait);
			return;
		}

		int nfds = 0;
		fd_set readfs;
		FD_ZERO(&readfs);
		for (const auto& socket : m_sockets) {
			if (socket.Fd() >= nfds)
				nfds = socket.Fd() + 1;
			FD_SET(socket.Fd(), &readfs);
		}

		struct timeval timeout;
		timeout.tv_sec = static_cast<long>(maxWait.count() / 1000);
		timeout.tv_usec = static_cast<long>((maxWait.count() % 1000) * 1000);

		const int numberOfReadyDescriptors = select(nfds, &readfs, nullptr, nullptr, &timeout);
		if (numberOfReadyDescriptors < 0) {
			if (errno != EINTR) {
				Log(LogLevel::Warn, fmt::format("select() failed: {}", std::strerror(errno)));
			}
			return;
		}
		if (numberOfReadyDescriptors == 0) {
			return;
		}

		for (const auto& socket : m_sockets) {
			if (!FD_ISSET(socket.Fd(), &readfs)) {
				continue;
			}
			ReceivedPacket packet;
			mdns_query_recv(socket.Fd(), m_buffer.data(), m_buffer.size(), RecordCallback, &packet, 0);
			++m_stats.packets_received;
			if (packet.ignored) {
				++m_stats.packets_ignored;
				continue;
			}
			m_stats.malformed_dropped += packet.malformed;

			for (const auto& record : packet.records) {
				Log(LogLevel::Debug, fmt::format("Got record: {}", fmt::streamed(record)));
				++m_stats.records_delivered;
				if (m_handler) {
					m_handler(record);
				}
			}
		}
	}

	void Close()
	{
		if (m_sockets.empty()) {
			return;
		}
		const auto num_sockets = m_sockets.size();
		m_sockets.clear();
		Log(LogLevel::Debug, fmt::format("Closed {} socket{}. {}", num_sockets, num_sockets > 1 ? "s" : "", fmt::streamed(m_stats)));
	}

	[[nodiscard]] bool IsOpen() const
	{
		return !m_sockets.empty();
	}
};

MulticastTransport::MulticastTransport()
: m_impl(std::make_unique<TransportImpl>())
{}

MulticastTransport::~MulticastTransport() = default;

OpenResult MulticastTransport::Open(const InterfaceSelector& selector)
{
	return m_impl->Open(selector);
}

bool MulticastTransport::SendQuery(std::string_view name, RecordType type)
{
	return m_impl->SendQuery(name, type);
}

void MulticastTransport::Subscribe(RecordHandler handler)
{
	m_impl->Subscribe(std::move(handler));
}

void MulticastTransport::Poll(std::chrono::milliseconds maxWait)
{
	m_impl->Poll(maxWait);
}

void MulticastTransport::Close()
{
	m_impl->Close();
}

bool MulticastTransport::IsOpen() const
{
	return m_impl->IsOpen();
}

}
