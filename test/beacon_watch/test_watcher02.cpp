#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>

#include <thread>
#include <atomic>
#include <unordered_set>
#include <vector>
#include <memory>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <beacon_watch/BeaconWatcher.hpp>
#include <beacon_watch/SimulatedAdvertisementSource.hpp>

#include "bw_test_listener.hpp"

using namespace beacon_watch;
using namespace jau::fractions_i64_literals;

static const jau::EUI48 addr_1234 = to_EUI48(0x1234);

static void sleep_ms(const int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

TEST_CASE( "BeaconWatcher Timeout Test 01", "[watcher][timeout]" ) {
    SimulatedAdvertisementSourceRef source = std::make_shared<SimulatedAdvertisementSource>(50_ms);
    std::shared_ptr<StaticDeviceInfoResolver> resolver = std::make_shared<StaticDeviceInfoResolver>();
    resolver->put(addr_1234, "A");
    resolver->put(to_EUI48(0x5678), "B");
    BeaconWatcher watcher(source, resolver);
    std::shared_ptr<RecordingWatchListener> l = std::make_shared<RecordingWatchListener>();
    watcher.setHeartbeatTimeout(1_s);
    watcher.startListening();
    watcher.addStatusListener(l);

    source->inject(addr_1234, -60);
    REQUIRE( true == watcher.waitForPendingResolves(2_s) );
    REQUIRE( 1 == watcher.getDiscoveredDevices().size() );
    REQUIRE( 0 == l->count("timeout:A") );

    sleep_ms(300);
    // B keeps advertising, A stays silent
    source->inject(to_EUI48(0x5678), -60);
    REQUIRE( true == watcher.waitForPendingResolves(2_s) );
    REQUIRE( 2 == watcher.getDiscoveredDevices().size() );

    sleep_ms(800);
    source->inject(to_EUI48(0x5678), -60);
    REQUIRE( true == watcher.waitForPendingResolves(2_s) );
    {
        BeaconWatcher::device_list_t devices = watcher.getDiscoveredDevices();
        REQUIRE( 1 == devices.size() );
        REQUIRE( "B" == devices[0]->name );
    }
    REQUIRE( 1 == l->count("timeout:A") );
    REQUIRE( 0 == l->count("timeout:B") );

    // evicted once only
    REQUIRE( 1 == watcher.getDiscoveredDevices().size() );
    REQUIRE( 0 == watcher.evictTimedOutDevices() );
    REQUIRE( 1 == l->count("timeout:A") );

    // re-appearing is a new discovery
    source->inject(addr_1234, -60);
    REQUIRE( true == watcher.waitForPendingResolves(2_s) );
    REQUIRE( 2 == l->count("new:A") );
    REQUIRE( 2 == watcher.getDiscoveredDevices().size() );
}

TEST_CASE( "BeaconWatcher Stale Timestamp Test 02", "[watcher][timeout]" ) {
    SimulatedAdvertisementSourceRef source = std::make_shared<SimulatedAdvertisementSource>(50_ms);
    std::shared_ptr<StaticDeviceInfoResolver> resolver = std::make_shared<StaticDeviceInfoResolver>();
    resolver->put(addr_1234, "A");
    BeaconWatcher watcher(source, resolver);
    std::shared_ptr<RecordingWatchListener> l = std::make_shared<RecordingWatchListener>();
    watcher.setHeartbeatTimeout(1_s);
    watcher.startListening();
    watcher.addStatusListener(l);

    const uint64_t now = jau::getCurrentMilliseconds();
    REQUIRE( now > 10000 );
    source->inject( AdvertisementReport{ addr_1234, now - 10000, -60 } );
    REQUIRE( true == watcher.waitForPendingResolves(2_s) );
    REQUIRE( "observed:A,new:A" == l->joined() );
    REQUIRE( 1 == watcher.getDiscoveredDeviceCount() );

    // concurrent readers evict the stale record exactly once
    std::vector<std::thread> readers;
    for(int i=0; i<8; ++i) {
        readers.push_back( std::thread([&watcher]() { (void)watcher.getDiscoveredDevices(); }) );
    }
    for(std::thread& t : readers) {
        t.join();
    }
    REQUIRE( 0 == watcher.getDiscoveredDevices().size() );
    REQUIRE( "observed:A,new:A,timeout:A" == l->joined() );
}

TEST_CASE( "BeaconWatcher External Halt Test 03", "[watcher][halt]" ) {
    SimulatedAdvertisementSourceRef source = std::make_shared<SimulatedAdvertisementSource>(50_ms);
    std::shared_ptr<StaticDeviceInfoResolver> resolver = std::make_shared<StaticDeviceInfoResolver>();
    resolver->put(addr_1234, "A");
    BeaconWatcher watcher(source, resolver);
    std::shared_ptr<RecordingWatchListener> l = std::make_shared<RecordingWatchListener>();
    watcher.addStatusListener(l);
    watcher.startListening();
    source->inject(addr_1234, -60);
    REQUIRE( true == watcher.waitForPendingResolves(2_s) );

    REQUIRE( true == source->simulateHalt() );
    REQUIRE( false == watcher.isListening() );
    REQUIRE( "started,observed:A,new:A,stopped" == l->joined() );
    // devices are kept on an external halt
    REQUIRE( 1 == watcher.getDiscoveredDeviceCount() );

    // no further advertisements while halted
    REQUIRE( false == source->inject(addr_1234, -60) );

    // stopListening after an external halt does not publish again, nor clear the kept devices
    watcher.stopListening();
    REQUIRE( 1 == l->count("stopped") );
    REQUIRE( 1 == watcher.getDiscoveredDeviceCount() );

    REQUIRE( true == watcher.startListening() );
    REQUIRE( 2 == l->count("started") );
    source->inject(addr_1234, -60);
    REQUIRE( true == watcher.waitForPendingResolves(2_s) );
    REQUIRE( 1 == l->count("new:A") );
    REQUIRE( 2 == l->count("observed:A") );
}

TEST_CASE( "BeaconWatcher Stop Race Test 04", "[watcher][race]" ) {
    SimulatedAdvertisementSourceRef source = std::make_shared<SimulatedAdvertisementSource>(50_ms);
    std::shared_ptr<StaticDeviceInfoResolver> resolver = std::make_shared<StaticDeviceInfoResolver>();
    resolver->put(addr_1234, "A");
    BeaconWatcher watcher(source, resolver);
    std::shared_ptr<RecordingWatchListener> l = std::make_shared<RecordingWatchListener>();
    watcher.startListening();
    watcher.addStatusListener(l);

    // enrichment completes after stopListening
    resolver->setPending(addr_1234);
    source->inject(addr_1234, -60);
    REQUIRE( 1 == watcher.getPendingResolveCount() );
    watcher.stopListening();
    REQUIRE( 0 == watcher.getDiscoveredDevices().size() );
    resolver->releasePending(addr_1234);
    REQUIRE( true == watcher.waitForPendingResolves(2_s) );
    REQUIRE( 0 == watcher.getDiscoveredDevices().size() );
    REQUIRE( "stopped" == l->joined() );

    // enrichment of the previous session completes within the next session
    l->clear();
    watcher.startListening();
    resolver->setPending(addr_1234);
    source->inject(addr_1234, -60);
    watcher.stopListening();
    watcher.startListening();
    resolver->releasePending(addr_1234);
    REQUIRE( true == watcher.waitForPendingResolves(2_s) );
    REQUIRE( 0 == watcher.getDiscoveredDevices().size() );
    REQUIRE( "started,stopped,started" == l->joined() );
}

TEST_CASE( "BeaconWatcher Out Of Order Test 05", "[watcher][race]" ) {
    // two radio addresses resolving to the same device identity
    const jau::EUI48 a1 = to_EUI48(0x0001);
    const jau::EUI48 a2 = to_EUI48(0x0002);
    SimulatedAdvertisementSourceRef source = std::make_shared<SimulatedAdvertisementSource>(50_ms);
    std::shared_ptr<StaticDeviceInfoResolver> resolver = std::make_shared<StaticDeviceInfoResolver>();
    resolver->put( std::make_shared<DeviceInfo>("beacon-X", a1, "X", false, true, false) );
    resolver->put( std::make_shared<DeviceInfo>("beacon-X", a2, "X", false, true, false) );
    BeaconWatcher watcher(source, resolver);
    std::shared_ptr<RecordingWatchListener> l = std::make_shared<RecordingWatchListener>();
    watcher.startListening();
    watcher.addStatusListener(l);

    const uint64_t t0 = jau::getCurrentMilliseconds();
    resolver->setPending(a1);
    source->inject( AdvertisementReport{ a1, t0, -60 } );
    source->inject( AdvertisementReport{ a2, t0 + 10, -70 } );

    // the later advertisement completes first
    for(int i=0; i<200 && 1 < watcher.getPendingResolveCount(); ++i) {
        sleep_ms(10);
    }
    REQUIRE( 1 == watcher.getPendingResolveCount() );
    {
        BeaconDeviceRef d = watcher.findDiscoveredDevice("beacon-X");
        REQUIRE( nullptr != d );
        REQUIRE( a2 == d->address );
        REQUIRE( t0 + 10 == d->broadcastTime );
    }
    REQUIRE( "observed:X,new:X" == l->joined() );

    // last applied write wins
    resolver->releasePending(a1);
    REQUIRE( true == watcher.waitForPendingResolves(2_s) );
    {
        BeaconWatcher::device_list_t devices = watcher.getDiscoveredDevices();
        REQUIRE( 1 == devices.size() );
        REQUIRE( a1 == devices[0]->address );
        REQUIRE( t0 == devices[0]->broadcastTime );
        REQUIRE( -60 == devices[0]->rssi );
    }
    REQUIRE( "observed:X,new:X,observed:X" == l->joined() );
}

TEST_CASE( "BeaconWatcher Concurrent Readers Test 06", "[watcher][concurrency]" ) {
    const int addr_count = 20;
    const int injector_count = 4;
    const int loops = 100;

    SimulatedAdvertisementSourceRef source = std::make_shared<SimulatedAdvertisementSource>(50_ms);
    std::shared_ptr<StaticDeviceInfoResolver> resolver = std::make_shared<StaticDeviceInfoResolver>();
    for(int a=1; a<=addr_count; ++a) {
        resolver->put(to_EUI48(a), "N"+std::to_string(a));
    }
    BeaconWatcher watcher(source, resolver);
    std::shared_ptr<RecordingWatchListener> l = std::make_shared<RecordingWatchListener>();
    watcher.addStatusListener(l);
    watcher.startListening();

    std::atomic<bool> injecting { true };
    std::atomic<int> inconsistent { 0 };
    std::atomic<int> reads { 0 };

    std::vector<std::thread> readers;
    for(int r=0; r<3; ++r) {
        readers.push_back( std::thread([&]() {
            while( injecting ) {
                BeaconWatcher::device_list_t snapshot = watcher.getDiscoveredDevices();
                std::unordered_set<std::string> ids;
                for(const BeaconDeviceRef& d : snapshot) {
                    const uint64_t a = to_uint64(d->address);
                    if( d->deviceID != DeviceInfoResolver::makeDeviceID(d->address) ||
                        d->name != "N"+std::to_string(a) ||
                        !ids.insert(d->deviceID).second )
                    {
                        inconsistent++;
                    }
                }
                reads++;
            }
        }) );
    }
    std::vector<std::thread> injectors;
    for(int i=0; i<injector_count; ++i) {
        injectors.push_back( std::thread([&, i]() {
            for(int j=0; j<loops; ++j) {
                source->inject(to_EUI48( 1 + ( i * loops + j ) % addr_count ), static_cast<int16_t>( -40 - j % 50 ));
            }
        }) );
    }
    for(std::thread& t : injectors) {
        t.join();
    }
    REQUIRE( true == watcher.waitForPendingResolves(10_s) );
    injecting = false;
    for(std::thread& t : readers) {
        t.join();
    }
    INFO_STR("Reads "+std::to_string(reads)+", "+watcher.toString());
    REQUIRE( 0 == inconsistent );
    REQUIRE( (size_t)addr_count == watcher.getDiscoveredDevices().size() );
    for(int a=1; a<=addr_count; ++a) {
        REQUIRE( 1 == l->count("new:N"+std::to_string(a)) );
    }
    REQUIRE( injector_count * loops == resolver->getResolveCount() );
}

TEST_CASE( "BeaconWatcher Destroy While Injecting Test 07", "[watcher][race]" ) {
    const int addr_count = 8;
    SimulatedAdvertisementSourceRef source = std::make_shared<SimulatedAdvertisementSource>(50_ms);
    std::shared_ptr<StaticDeviceInfoResolver> resolver = std::make_shared<StaticDeviceInfoResolver>();
    for(int a=1; a<=addr_count; ++a) {
        resolver->put(to_EUI48(a), "N"+std::to_string(a));
    }
    std::unique_ptr<BeaconWatcher> watcher( new BeaconWatcher(source, resolver) );
    std::shared_ptr<RecordingWatchListener> l = std::make_shared<RecordingWatchListener>();
    watcher->addStatusListener(l);
    REQUIRE( true == watcher->startListening() );

    // keep the source running after the watcher stops it
    std::atomic<bool> injecting { true };
    std::atomic<int> injected { 0 };
    std::thread injector([&]() {
        int j = 0;
        while( injecting ) {
            if( !source->isRunning() ) {
                source->start();
            }
            source->inject(to_EUI48( 1 + j % addr_count ), -60);
            injected++;
            ++j;
        }
    });
    for(int i=0; i<200 && 50 > injected; ++i) {
        sleep_ms(5);
    }
    REQUIRE( 50 <= injected );

    watcher.reset();
    REQUIRE( 0 == source->getListenerCount() );
    const int resolvedAtDestroy = resolver->getResolveCount();

    // no enrichment reaches the destroyed watcher
    const int injectedAtDestroy = injected;
    for(int i=0; i<200 && injectedAtDestroy + 50 > injected; ++i) {
        sleep_ms(5);
    }
    injecting = false;
    injector.join();
    source->stop();
    INFO_STR("Injected "+std::to_string(injected)+", resolved "+std::to_string(resolvedAtDestroy));
    REQUIRE( resolvedAtDestroy == resolver->getResolveCount() );
    REQUIRE( 0 < l->count("new:N1") );
}

/**
 * Closes the watcher from within its first device notification.
 */
class ClosingWatchListener : public BeaconWatchListener {
    public:
        BeaconWatcher* watcher = nullptr;
        std::atomic<bool> closed { false };

        void deviceObserved(const BeaconDeviceRef& device, const DeviceChange changes) override {
            (void)device;
            (void)changes;
            if( !closed ) {
                watcher->close();
                closed = true;
            }
        }
};

TEST_CASE( "BeaconWatcher Close From Listener Test 08", "[watcher][listener]" ) {
    SimulatedAdvertisementSourceRef source = std::make_shared<SimulatedAdvertisementSource>(50_ms);
    std::shared_ptr<StaticDeviceInfoResolver> resolver = std::make_shared<StaticDeviceInfoResolver>();
    resolver->put(addr_1234, "A");
    std::unique_ptr<BeaconWatcher> watcher( new BeaconWatcher(source, resolver) );
    std::shared_ptr<ClosingWatchListener> l = std::make_shared<ClosingWatchListener>();
    l->watcher = watcher.get();
    watcher->addStatusListener(l);
    watcher->startListening();

    source->inject(addr_1234, -60);
    for(int i=0; i<200 && !l->closed; ++i) {
        sleep_ms(10);
    }
    REQUIRE( true == l->closed );
    REQUIRE( true == watcher->waitForPendingResolves(2_s) );
    REQUIRE( false == watcher->isListening() );
    REQUIRE( 0 == source->getListenerCount() );
    REQUIRE( 0 == watcher->getDiscoveredDeviceCount() );
    REQUIRE( false == watcher->startListening() );
    watcher.reset();
}

TEST_CASE( "BeaconWatcher Listening State Test 09", "[watcher][lifecycle]" ) {
    SimulatedAdvertisementSourceRef source = std::make_shared<SimulatedAdvertisementSource>(50_ms);
    std::shared_ptr<StaticDeviceInfoResolver> resolver = std::make_shared<StaticDeviceInfoResolver>();
    resolver->put(addr_1234, "A");
    BeaconWatcher watcher(source, resolver);

    // follows the source, even if started elsewhere
    REQUIRE( false == watcher.isListening() );
    source->start();
    REQUIRE( true == watcher.isListening() );
    source->simulateHalt();
    REQUIRE( false == watcher.isListening() );

    // waiting for a parked enrichment times out
    watcher.startListening();
    resolver->setPending(addr_1234);
    source->inject(addr_1234, -60);
    const uint64_t t0 = jau::getCurrentMilliseconds();
    REQUIRE( false == watcher.waitForPendingResolves(20_ms) );
    REQUIRE( t0 + 19 <= jau::getCurrentMilliseconds() );
    REQUIRE( 1 == watcher.getPendingResolveCount() );
    resolver->releasePending(addr_1234);
    REQUIRE( true == watcher.waitForPendingResolves(2_s) );
    REQUIRE( 0 == watcher.getPendingResolveCount() );
}
