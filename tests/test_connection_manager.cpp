#include "tvdeck/tv/ConnectionManager.hpp"
#include "support/TestSupport.hpp"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using namespace tvdeck;
using namespace tvdeck::tv;

namespace {

core::Device device(const std::string& id, const std::string& address) {
    core::Device d;
    d.id = id;
    d.address = address;
    return d;
}

void testSingleFlightEnsure() {
    auto transport = std::make_shared<test::MockTransport>();
    transport->setOpenLatency(150ms);
    ConnectionManager manager(transport);
    const auto tv = device("living-room", "192.168.1.50");

    std::vector<ConnectionPtr> links(8);
    std::vector<std::thread> callers;
    for (std::size_t i = 0; i < links.size(); ++i) {
        callers.emplace_back([&, i] {
            auto link = manager.ensure(tv);
            if (link) links[i] = *link;
        });
    }
    for (auto& t : callers) t.join();

    ASSERT_EQ(transport->opens(), 1, "one connect for concurrent callers");
    ASSERT_EQ(transport->probes(), 1, "one probe for concurrent callers");
    bool allSame = true;
    for (const auto& link : links) {
        allSame = allSame && link && link == links.front();
    }
    ASSERT_TRUE(allSame, "every caller shares the established link");

    auto again = manager.ensure(tv);
    ASSERT_TRUE(again && *again == links.front(), "recently verified link reused");
    ASSERT_EQ(transport->opens(), 1, "no reconnect while fresh");
    ASSERT_EQ(transport->probes(), 1, "no re-probe inside the interval");
}

void testInvalidateOnce() {
    auto transport = std::make_shared<test::MockTransport>();
    ConnectionManager manager(transport);
    const auto tv = device("bedroom", "192.168.1.51");

    auto link = manager.ensure(tv);
    ASSERT_TRUE(link.has_value(), "initial ensure");
    if (!link) return;

    ASSERT_TRUE(manager.invalidate(tv.id, *link), "first report tears down");
    ASSERT_TRUE(!manager.invalidate(tv.id, *link), "second report of same link is ignored");
    ASSERT_EQ(transport->closes(), 1, "closed once");
    ASSERT_TRUE(!manager.hasConnection(tv.id), "slot cleared");

    auto replacement = manager.ensure(tv);
    ASSERT_TRUE(replacement && *replacement != *link, "fresh link after invalidate");
    ASSERT_EQ(transport->opens(), 2, "one reconnect");
    ASSERT_TRUE(!manager.invalidate(tv.id, *link), "stale pointer cannot drop the new link");
    ASSERT_TRUE(manager.hasConnection(tv.id), "new link kept");
}

void testProbeFailureReconnects() {
    auto transport = std::make_shared<test::MockTransport>();
    ConnectionSettings settings;
    settings.probeInterval = 0ms;
    ConnectionManager manager(transport, settings);
    const auto tv = device("den", "192.168.1.52");

    auto first = manager.ensure(tv);
    ASSERT_TRUE(first.has_value(), "first ensure");

    auto probed = manager.ensure(tv);
    ASSERT_TRUE(probed && first && *probed == *first, "healthy link survives re-probe");
    ASSERT_EQ(transport->opens(), 1, "no reconnect for a healthy link");

    transport->failProbes(1);
    auto reconnected = manager.ensure(tv);
    ASSERT_TRUE(reconnected.has_value(), "stale link replaced");
    ASSERT_TRUE(reconnected && first && *reconnected != *first, "new link object");
    ASSERT_EQ(transport->opens(), 2, "reconnected after failed probe");
    ASSERT_TRUE(first && !(*first)->isOpen(), "failed link closed");
}

void testOpenFailures() {
    auto transport = std::make_shared<test::MockTransport>();
    ConnectionManager manager(transport);
    const auto tv = device("garage", "192.168.1.53");

    transport->failOpens(1);
    auto failed = manager.ensure(tv);
    ASSERT_TRUE(!failed && failed.error().kind == core::ErrorKind::Connection, "open failure is Connection");
    ASSERT_EQ(failed ? std::string() : failed.error().deviceId, std::string("garage"), "device named");

    auto recovered = manager.ensure(tv);
    ASSERT_TRUE(recovered.has_value(), "next ensure reconnects");

    manager.closeAll();
    ASSERT_TRUE(!manager.hasConnection(tv.id), "closeAll drops links");

    transport->failOpens(-1);
    ASSERT_TRUE(!manager.isReachable(tv), "unreachable while opens fail");

    transport->failOpens(0);
    transport->failProbes(1);
    auto probeFail = manager.ensure(tv);
    ASSERT_TRUE(!probeFail && probeFail.error().kind == core::ErrorKind::Connection, "new link failing probe");
    ASSERT_TRUE(manager.isReachable(tv), "reachable once probes pass");
}

void testDevicesIndependent() {
    auto transport = std::make_shared<test::MockTransport>();
    transport->setOpenLatency(200ms);
    ConnectionManager manager(transport);
    const auto a = device("a", "192.168.1.60");
    const auto b = device("b", "192.168.1.61");

    const auto start = std::chrono::steady_clock::now();
    std::thread ta([&] { (void)manager.ensure(a); });
    std::thread tb([&] { (void)manager.ensure(b); });
    ta.join();
    tb.join();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(transport->opens(), 2, "each device connects");
    ASSERT_TRUE(elapsed < 380ms, "connects to different devices overlap");
}

} // namespace

int main() {
    testSingleFlightEnsure();
    testInvalidateOnce();
    testProbeFailureReconnects();
    testOpenFailures();
    testDevicesIndependent();
    return test::finish("ConnectionManager");
}
