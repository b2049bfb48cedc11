#include "mdns_browser/mdns_browser.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>
#include <fmt/ostream.h>

namespace bpo = boost::program_options;
using namespace mdns_browser;

namespace
{

// bpo notifier for options that only make sense above a lower bound
std::function<void(int)> AtLeast(int minimum, const char* option)
{
    return [minimum, option](int value) {
        if (value < minimum) {
            throw bpo::validation_error(bpo::validation_error::invalid_option_value, option, std::to_string(value));
        }
    };
}

const std::vector<std::string> kDantePresets = {
    "_dante-safe._udp",
    "_dante-upgr._udp",
    "_netaudio-arc._udp",
    "_netaudio-chan._udp",
    "_netaudio-cmc._udp",
    "_netaudio-dbc._udp",
    "_dante-ddm-d._udp",
    "_dante-ddm-c._tcp",
};

void PrintInterfaces()
{
    const auto interfaces = EnumerateNetworkInterfaces();
    if (interfaces.empty()) {
        std::cout << "No multicast capable interface found." << std::endl;
        return;
    }
    for (const auto& networkInterface : interfaces) {
        std::cout << fmt::format("{:<16} {}", networkInterface.name, networkInterface.address) << std::endl;
    }
}

void PrintInstance(const ServiceInstance& instance)
{
    std::cout << instance.Label() << std::endl;
    std::cout << "  type:      " << instance.service_type << std::endl;
    std::cout << "  status:    " << ToString(instance.status) << std::endl;
    std::cout << "  server:    " << (instance.host.empty() ? "-" : instance.host) << std::endl;
    for (const auto& endpoint : instance.Endpoints()) {
        std::cout << "  address:   " << endpoint << std::endl;
    }
    if (instance.has_service) {
        std::cout << fmt::format("  priority:  {} weight: {}", instance.priority, instance.weight) << std::endl;
    }
    for (const auto& [key, value] : instance.txt) {
        if (value) {
            std::cout << fmt::format("  property:  {}={}", key, TxtValueToDisplayString(value)) << std::endl;
        } else {
            std::cout << fmt::format("  property:  {}", key) << std::endl;
        }
    }
}

}

int main(int argc, char** argv)
{
    // clang-format off
    bpo::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help screen")
        ("interface,i", bpo::value<std::string>(), "Scan on one interface, by name or address")
        ("list-interfaces,l", "List the usable interfaces and exit")
        ("query,q", bpo::value<std::vector<std::string>>(), "Browse a service type, example: _http._tcp")
        ("dante", "Browse the Dante service types")
        ("types-only", "Only report service types")
        ("filter,f", bpo::value<std::string>()->default_value(""), "Only print instances whose type contains this")
        ("duration,d", bpo::value<int>()->default_value(10)->notifier(AtLeast(1, "duration")), "Seconds to scan")
        ("timeout,t", bpo::value<int>()->default_value(3000)->notifier(AtLeast(1, "timeout")), "Resolve timeout in milliseconds")
        ("retries,r", bpo::value<int>()->default_value(2)->notifier(AtLeast(0, "retries")), "Resolve retries after a timeout")
        ("verbose,v", "Debug logging")
        ;
    // clang-format on

    bpo::variables_map opts;
    try {
        bpo::store(bpo::parse_command_line(argc, argv, desc), opts);
        bpo::notify(opts);
    } catch (bpo::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (opts.count("help")) {
        std::cout << "Usage: " << argv[0] << " [Options]" << std::endl;
        std::cout << desc << std::endl;
        return 0;
    }
    if (opts.count("verbose")) {
        SetLogLevel(LogLevel::Debug);
    }
    if (opts.count("list-interfaces")) {
        PrintInterfaces();
        return 0;
    }

    auto selector = InterfaceSelector::All();
    if (opts.count("interface")) {
        const auto wanted = opts["interface"].as<std::string>();
        const auto found = FindNetworkInterface(EnumerateNetworkInterfaces(), wanted);
        if (!found) {
            std::cerr << "Error: unknown interface " << wanted << ", see --list-interfaces" << std::endl;
            return 1;
        }
        selector = InterfaceSelector::Single(*found);
    }

    SessionSettings settings;
    settings.resolve_policy.timeout = std::chrono::milliseconds(opts["timeout"].as<int>());
    settings.resolve_policy.retry_limit = static_cast<unsigned>(opts["retries"].as<int>());

    const bool typesOnly = opts.count("types-only") > 0;
    const auto filter = opts["filter"].as<std::string>();

    ScanSession session(settings);
    session.Subscribe([typesOnly](const SessionEvent& event){
        std::visit(Overloaded{
            [](const StateChanged&) {},
            [typesOnly](const CacheChanged& changed) {
                const auto& change = changed.change;
                switch (change.kind) {
                    case ChangeKind::TypeAdded:
                        std::cout << "+ type     " << change.service_type << std::endl;
                        break;
                    case ChangeKind::TypeRemoved:
                        std::cout << "- type     " << change.service_type << std::endl;
                        break;
                    case ChangeKind::InstanceAdded:
                        if (!typesOnly) std::cout << "+ instance " << change.instance_name << std::endl;
                        break;
                    case ChangeKind::InstanceRemoved:
                        if (!typesOnly) std::cout << "- instance " << change.instance_name << std::endl;
                        break;
                    case ChangeKind::InstanceResolved:
                        if (!typesOnly) std::cout << "* resolved " << change.instance_name << std::endl;
                        break;
                    case ChangeKind::InstanceUpdated:
                    case ChangeKind::Cleared:
                        break;
                }
            },
            [](const SessionWarning& warning) { std::cerr << "Warning: " << warning.message << std::endl; },
            [](const SessionError& error) { std::cerr << "Error: " << error.message << std::endl; },
        }, event);
    });

    if (!session.Start(selector)) {
        return 1;
    }

    try {
        if (opts.count("query")) {
            for (const auto& query : opts["query"].as<std::vector<std::string>>()) {
                session.ManualQuery(query);
            }
        }
        if (opts.count("dante")) {
            session.QueryPresets(kDantePresets);
        }
    } catch (const InvalidQueryError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        session.Stop();
        return 1;
    }

    std::this_thread::sleep_for(std::chrono::seconds(opts["duration"].as<int>()));

    const auto& cache = session.Cache();
    std::cout << std::endl << fmt::format("Found {} service type{}", cache.TypeCount(), cache.TypeCount() == 1 ? "" : "s") << std::endl;
    if (typesOnly) {
        for (const auto& serviceType : cache.GetTypes()) {
            std::cout << "  " << serviceType << std::endl;
        }
    } else {
        for (const auto& instance : cache.FindInstances(filter)) {
            std::cout << std::endl;
            PrintInstance(instance);
        }
    }

    session.Stop();
    return 0;
}
