#include "mdns_browser/scan_session.hpp"
#include "mdns_browser/event_loop.hpp"
#include "mdns_browser/log.hpp"
#include "mdns_browser/multicast_transport.hpp"
#include "mdns_browser/normalize.hpp"
#include "mdns_browser/record_store.hpp"
#include "mdns_browser/resolver.hpp"
#include "mdns_browser/service_instance_browser.hpp"
#include "mdns_browser/service_type_browser.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>

#include <fmt/core.h>
#include <fmt/ostream.h>

namespace mdns_browser
{

std::string ToString(SessionState state)
{
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Starting: return "Starting";
        case SessionState::Running: return "Running";
        case SessionState::Stopping: return "Stopping";
    }
    return "";
}

std::chrono::milliseconds ResolvePolicy::BackoffFor(unsigned retry) const
{
    if (backoff == BackoffMode::Fixed || retry <= 1) {
        return std::min(initial_backoff, max_backoff);
    }
    auto delay = initial_backoff;
    for (unsigned i = 1; i < retry && delay < max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_backoff);
}

std::ostream& operator<<(std::ostream& os, const SessionEvent& event)
{
    std::visit(Overloaded{
        [&os](const StateChanged& changed) { os << "State " << ToString(changed.state) << " (generation " << changed.generation << ")"; },
        [&os](const CacheChanged& changed) { os << changed.change; },
        [&os](const SessionWarning& warning) { os << "Warning: " << warning.message; },
        [&os](const SessionError& error) { os << "Error: " << error.message; },
    }, event);
    return os;
}

class ScanSession::SessionImpl
{
private:
	// Everything belonging to one generation. Declaration order is teardown order
	// reversed: the loop outlives the components that hold timers on it.
	struct Runtime
	{
		std::uint64_t generation{0};
		std::unique_ptr<Transport> transport;
		std::unique_ptr<EventLoop> loop;
		RecordStore store;
		std::unique_ptr<ServiceTypeBrowser> typeBrowser;
		std::map<std::string, std::unique_ptr<ServiceInstanceBrowser>> instanceBrowsers; // lowercase type
		std::unique_ptr<Resolver> resolver;
		std::map<std::string, EventLoop::TimerId> retryTimers; // lowercase instance name
		std::map<std::string, unsigned> attempts; // lowercase instance name
		std::set<std::string> manualTypes; // lowercase
		std::optional<EventLoop::TimerId> sweepTimer;
	};

	SessionSettings m_settings;
	DiscoveryCache m_cache;

	mutable std::mutex m_controlMutex;
	std::atomic<SessionState> m_state{SessionState::Idle};
	std::atomic<std::uint64_t> m_generation{0};
	InterfaceSelector m_selector;
	std::unique_ptr<Runtime> m_runtime;

	mutable std::mutex m_interfacesMutex;
	std::vector<NetworkInterface> m_interfaces;

	std::mutex m_handlersMutex;
	std::map<SubscriptionId, SessionEventHandler> m_handlers;
	SubscriptionId m_nextSubscription{1};

public:
	explicit SessionImpl(SessionSettings settings)
	: m_settings(std::move(settings))
	, m_cache([this](const CacheChange& change){ Emit(CacheChanged{change}); })
	{}

	~SessionImpl()
	{
		Stop();
	}

	bool SetSettings(SessionSettings settings)
	{
		std::lock_guard<std::mutex> lock(m_controlMutex);
		if (m_state.load() != SessionState::Idle) {
			Log(LogLevel::Warn, "Settings can only be changed while the session is idle.");
			return false;
		}
		m_settings = std::move(settings);
		return true;
	}

	const SessionSettings& Settings() const
	{
		return m_settings;
	}

	bool Start(const InterfaceSelector& selector)
	{
		std::lock_guard<std::mutex> lock(m_controlMutex);
		if (m_state.load() != SessionState::Idle) {
			Log(LogLevel::Warn, fmt::format("Start ignored, the session is {}.", ToString(m_state.load())));
			return false;
		}

		const auto generation = ++m_generation;
		m_cache.Reset(generation);
		SetState(SessionState::Starting);
		m_selector = selector;

		auto runtime = std::make_unique<Runtime>();
		runtime->generation = generation;

		OpenResult opened;
		try {
			runtime->transport = m_settings.transport_factory ? m_settings.transport_factory() : std::make_unique<MulticastTransport>();
			if (!runtime->transport) {
				throw Error("the transport factory returned no transport");
			}
			opened = runtime->transport->Open(selector);
		} catch (const std::exception& e) {
			FailStart(e.what());
			return false;
		}
		for (const auto& bindError : opened.bind_errors) {
			Log(LogLevel::Warn, fmt::format("Scanning without interface {}", bindError.InterfaceName()));
			Emit(SessionWarning{bindError.what()});
		}
		{
			std::lock_guard<std::mutex> interfacesLock(m_interfacesMutex);
			m_interfaces = opened.opened;
		}

		auto& rt = *runtime;
		rt.loop = std::make_unique<EventLoop>(*rt.transport, m_settings.poll_interval);
		rt.resolver = std::make_unique<Resolver>(*rt.loop, *rt.transport, rt.store);
		rt.typeBrowser = std::make_unique<ServiceTypeBrowser>(*rt.loop, *rt.transport, rt.store, m_settings.query_schedule,
			[this, &rt](const TypeEvent& event){ OnTypeEvent(rt, event); });
		rt.transport->Subscribe([this, &rt](const Record& record){ OnRecord(rt, record); });

		// The worker is not running yet, nothing else touches the runtime
		if (m_settings.browse_all_types) {
			rt.typeBrowser->Start();
		}
		ScheduleSweep(rt);
		m_runtime = std::move(runtime);
		try {
			m_runtime->loop->Start();
		} catch (const std::exception& e) {
			for (const auto& error : Teardown(*m_runtime)) {
				Log(LogLevel::Warn, error);
			}
			m_runtime.reset();
			FailStart(e.what());
			return false;
		}

		SetState(SessionState::Running);
		return true;
	}

	// Caller holds the control mutex
	void FailStart(const std::string& reason)
	{
		{
			std::lock_guard<std::mutex> interfacesLock(m_interfacesMutex);
			m_interfaces.clear();
		}
		Log(LogLevel::Error, reason);
		Emit(SessionError{fmt::format("Scan could not start: {}", reason)});
		SetState(SessionState::Idle);
	}

	void Stop()
	{
		std::lock_guard<std::mutex> lock(m_controlMutex);
		const auto state = m_state.load();
		if (state == SessionState::Idle) {
			return;
		}
		if (m_runtime && m_runtime->loop->InLoopThread()) {
			Log(LogLevel::Error, "The session can not be stopped from its own worker thread.");
			return;
		}

		SetState(SessionState::Stopping);
		std::vector<std::string> errors;
		if (m_runtime) {
			errors = Teardown(*m_runtime);
			m_runtime.reset();
		}
		{
			std::lock_guard<std::mutex> interfacesLock(m_interfacesMutex);
			m_interfaces.clear();
		}
		// A new generation so nothing of the old one can land in the cache
		m_cache.Reset(++m_generation);

		if (!errors.empty()) {
			std::string message = "Teardown incomplete:";
			for (const auto& error : errors) {
				message += " " + error + ";";
			}
			message.pop_back();
			Log(LogLevel::Error, message);
			Emit(SessionError{message});
		}
		SetState(SessionState::Idle);
	}

	bool Rescan()
	{
		InterfaceSelector selector;
		{
			std::lock_guard<std::mutex> lock(m_controlMutex);
			if (m_state.load() != SessionState::Running) {
				Log(LogLevel::Warn, fmt::format("Rescan ignored, the session is {}.", ToString(m_state.load())));
				return false;
			}
			selector = m_selector;
		}
		Log(LogLevel::Info, fmt::format("Rescanning {}", selector.ToString()));
		Stop();
		return Start(selector);
	}

	bool ManualQuery(std::string_view text)
	{
		const auto serviceType = NormalizeServiceType(text);
		ValidateServiceType(serviceType);

		std::lock_guard<std::mutex> lock(m_controlMutex);
		if (m_state.load() != SessionState::Running || !m_runtime) {
			Log(LogLevel::Warn, fmt::format("Query for {} ignored, the session is not running.", serviceType));
			return false;
		}
		auto& rt = *m_runtime;
		rt.loop->Invoke([this, &rt, &serviceType](){
			BrowseType(rt, serviceType);
		});
		return true;
	}

	std::size_t QueryPresets(const std::vector<std::string>& presets)
	{
		std::vector<std::string> serviceTypes;
		serviceTypes.reserve(presets.size());
		for (const auto& preset : presets) {
			serviceTypes.push_back(NormalizeServiceType(preset));
			ValidateServiceType(serviceTypes.back());
		}

		std::lock_guard<std::mutex> lock(m_controlMutex);
		if (m_state.load() != SessionState::Running || !m_runtime) {
			Log(LogLevel::Warn, "Preset query ignored, the session is not running.");
			return 0;
		}
		auto& rt = *m_runtime;
		std::size_t browsed = 0;
		rt.loop->Invoke([this, &rt, &serviceTypes, &browsed](){
			for (const auto& serviceType : serviceTypes) {
				if (BrowseType(rt, serviceType)) {
					++browsed;
				}
			}
		});
		Log(LogLevel::Info, fmt::format("Querying {} preset service type{}", browsed, browsed == 1 ? "" : "s"));
		return browsed;
	}

	SessionState State() const
	{
		return m_state.load();
	}

	std::uint64_t Generation() const
	{
		return m_generation.load();
	}

	std::vector<NetworkInterface> Interfaces() const
	{
		std::lock_guard<std::mutex> lock(m_interfacesMutex);
		return m_interfaces;
	}

	const DiscoveryCache& Cache() const
	{
		return m_cache;
	}

	SubscriptionId Subscribe(SessionEventHandler handler)
	{
		std::lock_guard<std::mutex> lock(m_handlersMutex);
		const auto id = m_nextSubscription++;
		m_handlers.emplace(id, std::move(handler));
		return id;
	}

	void Unsubscribe(SubscriptionId id)
	{
		std::lock_guard<std::mutex> lock(m_handlersMutex);
		m_handlers.erase(id);
	}

private:
	void SetState(SessionState state)
	{
		m_state.store(state);
		Log(LogLevel::Info, fmt::format("Scan session {} (generation {})", ToString(state), m_generation.load()));
		Emit(StateChanged{state, m_generation.load()});
	}

	void Emit(const SessionEvent& event)
	{
		std::vector<SessionEventHandler> handlers;
		{
			std::lock_guard<std::mutex> lock(m_handlersMutex);
			handlers.reserve(m_handlers.size());
			for (const auto& [id, handler] : m_handlers) {
				handlers.push_back(handler);
			}
		}
		for (const auto& handler : handlers) {
			try {
				handler(event);
			} catch (const std::exception& e) {
				Log(LogLevel::Error, fmt::format("Session event handler failed on \"{}\": {}", fmt::streamed(event), e.what()));
			}
		}
	}

	// Worker thread from here on, except Teardown() which runs after the worker stopped

	void OnRecord(Runtime& rt, const Record& record)
	{
		if (!rt.store.Apply(record)) {
			return;
		}
		Dispatch(rt, record);
	}

	void Dispatch(Runtime& rt, const Record& record)
	{
		rt.typeBrowser->HandleRecord(record);
		for (const auto& [key, browser] : rt.instanceBrowsers) {
			browser->HandleRecord(record);
		}
		rt.resolver->HandleRecord(record);
	}

	void ScheduleSweep(Runtime& rt)
	{
		rt.sweepTimer = rt.loop->ScheduleAfter(m_settings.sweep_interval, [this, &rt](){
			const auto expired = rt.store.Expire();
			if (!expired.empty()) {
				Log(LogLevel::Debug, fmt::format("{} record{} expired", expired.size(), expired.size() == 1 ? "" : "s"));
			}
			for (const auto& goodbye : expired) {
				Dispatch(rt, goodbye);
			}
			ScheduleSweep(rt);
		});
	}

	void OnTypeEvent(Runtime& rt, const TypeEvent& event)
	{
		std::visit(Overloaded{
			[&](const TypeAdded& added) {
				m_cache.ApplyTypeEvent(rt.generation, event);
				EnsureInstanceBrowser(rt, added.service_type);
			},
			[&](const TypeRemoved& removed) {
				const auto key = ToLowerName(removed.service_type);
				if (rt.manualTypes.count(key) > 0) {
					Log(LogLevel::Debug, fmt::format("Keeping queried type {}", removed.service_type));
					return;
				}
				const auto browser = rt.instanceBrowsers.find(key);
				if (browser != rt.instanceBrowsers.end()) {
					browser->second->Stop();
					for (const auto& instance : browser->second->Instances()) {
						CancelResolution(rt, instance);
					}
					rt.instanceBrowsers.erase(browser);
				}
				m_cache.ApplyTypeEvent(rt.generation, event);
			},
		}, event);
	}

	// Returns true if the type was not browsed before
	bool BrowseType(Runtime& rt, const std::string& serviceType)
	{
		rt.manualTypes.insert(ToLowerName(serviceType));
		m_cache.ApplyTypeEvent(rt.generation, TypeAdded{serviceType});
		return EnsureInstanceBrowser(rt, serviceType);
	}

	bool EnsureInstanceBrowser(Runtime& rt, const std::string& serviceType)
	{
		const auto key = ToLowerName(serviceType);
		if (rt.instanceBrowsers.count(key) > 0) {
			return false;
		}
		auto browser = std::make_unique<ServiceInstanceBrowser>(serviceType, *rt.loop, *rt.transport, rt.store, m_settings.query_schedule,
			[this, &rt](const InstanceEvent& event){ OnInstanceEvent(rt, event); });
		auto& started = *rt.instanceBrowsers.emplace(key, std::move(browser)).first->second;
		started.Start();
		return true;
	}

	void OnInstanceEvent(Runtime& rt, const InstanceEvent& event)
	{
		m_cache.ApplyInstanceEvent(rt.generation, event);
		std::visit(Overloaded{
			[&](const InstanceAdded& added) { MaybeResolve(rt, added.instance); },
			[&](const InstanceUpdated& updated) { MaybeResolve(rt, updated.instance); },
			[&](const InstanceRemoved& removed) { CancelResolution(rt, removed.key); },
		}, event);
	}

	void MaybeResolve(Runtime& rt, const ServiceInstance& instance)
	{
		if (instance.status == ResolutionStatus::Resolved) {
			return;
		}
		const auto name = ToLowerName(instance.name);
		if (rt.resolver->IsPending(instance.Key()) || rt.retryTimers.count(name) > 0) {
			return;
		}
		// Out of retries, wait until the records complete it
		const auto attempts = rt.attempts.find(name);
		if (attempts != rt.attempts.end() && attempts->second > m_settings.resolve_policy.retry_limit && !instance.IsComplete()) {
			return;
		}
		StartResolve(rt, instance.Key());
	}

	void StartResolve(Runtime& rt, const InstanceKey& key)
	{
		++rt.attempts[ToLowerName(key.name)];
		rt.resolver->Resolve(key, [this, &rt](const InstanceKey& resolvedKey, const ResolveOutcome& outcome){
			OnResolved(rt, resolvedKey, outcome);
		}, m_settings.resolve_policy.timeout);
	}

	void OnResolved(Runtime& rt, const InstanceKey& key, const ResolveOutcome& outcome)
	{
		const auto name = ToLowerName(key.name);
		std::visit(Overloaded{
			[&](const ServiceInstance&) {
				rt.attempts.erase(name);
				const auto browser = rt.instanceBrowsers.find(ToLowerName(key.service_type));
				if (browser == rt.instanceBrowsers.end()) {
					return;
				}
				if (const auto resolved = browser->second->MarkResolved(key.name)) {
					m_cache.ApplyResolution(rt.generation, *resolved);
				}
			},
			[&](const ResolveError& error) {
				if (error == ResolveError::Cancelled) {
					Log(LogLevel::Debug, fmt::format("Resolution of {} cancelled", key.name));
					return;
				}
				const auto& policy = m_settings.resolve_policy;
				const auto attempts = rt.attempts[name];
				if (attempts > policy.retry_limit) {
					Log(LogLevel::Info, fmt::format("Giving up on {} after {} attempt{}, it stays unresolved", key.name, attempts, attempts == 1 ? "" : "s"));
					return;
				}
				const auto delay = policy.BackoffFor(attempts);
				Log(LogLevel::Info, fmt::format("Retrying {} in {} ms", key.name, delay.count()));
				rt.retryTimers[name] = rt.loop->ScheduleAfter(delay, [this, &rt, key, name](){
					rt.retryTimers.erase(name);
					const auto browser = rt.instanceBrowsers.find(ToLowerName(key.service_type));
					if (browser != rt.instanceBrowsers.end() && browser->second->Find(key.name)) {
						StartResolve(rt, key);
					}
				});
			},
		}, outcome);
	}

	void CancelResolution(Runtime& rt, const InstanceKey& key)
	{
		const auto name = ToLowerName(key.name);
		rt.resolver->Cancel(key);
		const auto retry = rt.retryTimers.find(name);
		if (retry != rt.retryTimers.end()) {
			rt.loop->CancelTimer(retry->second);
			rt.retryTimers.erase(retry);
		}
		rt.attempts.erase(name);
	}

	// Best effort, every step runs even if an earlier one failed
	std::vector<std::string> Teardown(Runtime& rt)
	{
		std::vector<std::string> errors;
		const auto step = [&errors](std::string_view what, const std::function<void()>& action){
			try {
				action();
			} catch (const std::exception& e) {
				errors.push_back(fmt::format("{}: {}", what, e.what()));
			}
		};

		step("stopping the worker", [&rt](){ rt.loop->Stop(); });
		step("cancelling resolutions", [&rt](){
			const auto cancelled = rt.resolver->CancelAll();
			if (cancelled > 0) {
				Log(LogLevel::Info, fmt::format("Cancelled {} pending resolution{}", cancelled, cancelled == 1 ? "" : "s"));
			}
			for (const auto& [name, timer] : rt.retryTimers) {
				rt.loop->CancelTimer(timer);
			}
			rt.retryTimers.clear();
		});
		step("stopping the browsers", [&rt](){
			for (const auto& [key, browser] : rt.instanceBrowsers) {
				browser->Stop();
			}
			rt.typeBrowser->Stop();
		});
		step("closing the transport", [&rt](){ rt.transport->Close(); });
		return errors;
	}
};

ScanSession::ScanSession(SessionSettings settings)
: m_impl(std::make_unique<SessionImpl>(std::move(settings)))
{}

ScanSession::~ScanSession() = default;

bool ScanSession::SetSettings(SessionSettings settings)
{
    return m_impl->SetSettings(std::move(settings));
}

const SessionSettings& ScanSession::Settings() const
{
    return m_impl->Settings();
}

bool ScanSession::Start(const InterfaceSelector& selector)
{
    return m_impl->Start(selector);
}

void ScanSession::Stop()
{
    m_impl->Stop();
}

bool ScanSession::Rescan()
{
    return m_impl->Rescan();
}

bool ScanSession::ManualQuery(std::string_view serviceType)
{
    return m_impl->ManualQuery(serviceType);
}

std::size_t ScanSession::QueryPresets(const std::vector<std::string>& serviceTypes)
{
    return m_impl->QueryPresets(serviceTypes);
}

SessionState ScanSession::State() const
{
    return m_impl->State();
}

std::uint64_t ScanSession::Generation() const
{
    return m_impl->Generation();
}

std::vector<NetworkInterface> ScanSession::Interfaces() const
{
    return m_impl->Interfaces();
}

const DiscoveryCache& ScanSession::Cache() const
{
    return m_impl->Cache();
}

SubscriptionId ScanSession::Subscribe(SessionEventHandler handler)
{
    return m_impl->Subscribe(std::move(handler));
}

void ScanSession::Unsubscribe(SubscriptionId id)
{
    return m_impl->Unsubscribe(id);
}

}
