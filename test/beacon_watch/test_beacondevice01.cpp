#include <iostream>
#include <cassert>
#include <cinttypes>
#include <cstring>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/basic_types.hpp>
#include <beacon_watch/BWConst.hpp>
#include <beacon_watch/BWTypes.hpp>
#include <beacon_watch/BeaconDevice.hpp>
#include <beacon_watch/DeviceInfoResolver.hpp>

using namespace beacon_watch;

static BeaconDevice makeDevice(const uint64_t addr, const std::string& name, const int16_t rssi, const uint64_t ts) {
    const jau::EUI48 address = to_EUI48(addr);
    return BeaconDevice(DeviceInfoResolver::makeDeviceID(address), address, name, rssi, ts,
                        false /* connected */, true /* canPair */, false /* paired */);
}

TEST_CASE( "Address Conversion Test 01", "[datatype][address]" ) {
    {
        const jau::EUI48 a = to_EUI48(0x1234);
        INFO_STR("0x1234 -> "+a.toString());
        REQUIRE( "00:00:00:00:12:34" == a.toString() );
        REQUIRE( 0x1234 == to_uint64(a) );
    }
    {
        const jau::EUI48 a("C0:10:22:A0:10:00");
        REQUIRE( UINT64_C(0xC01022A01000) == to_uint64(a) );
        REQUIRE( a == to_EUI48( to_uint64(a) ) );
    }
    {
        // upper 16 bits are not part of the address
        const jau::EUI48 a = to_EUI48(UINT64_C(0xFFFF000000000001));
        REQUIRE( "00:00:00:00:00:01" == a.toString() );
    }
    REQUIRE( "BluetoothLE#00:00:00:00:12:34" == DeviceInfoResolver::makeDeviceID(to_EUI48(0x1234)) );
}

TEST_CASE( "Blank Name Test 01", "[datatype][name]" ) {
    REQUIRE( true == isBlankName("") );
    REQUIRE( true == isBlankName("   ") );
    REQUIRE( true == isBlankName(" \t\n") );
    REQUIRE( false == isBlankName("A") );
    REQUIRE( false == isBlankName("  beacon ") );
}

TEST_CASE( "DeviceChange Test 01", "[datatype][devicechange]" ) {
    DeviceChange m = DeviceChange::NONE;
    REQUIRE( "[]" == to_string(m) );
    REQUIRE( false == is_set(m, DeviceChange::OBSERVED) );

    set(m, DeviceChange::OBSERVED);
    set(m, DeviceChange::NEW);
    REQUIRE( true == is_set(m, DeviceChange::OBSERVED) );
    REQUIRE( true == is_set(m, DeviceChange::NEW) );
    REQUIRE( false == is_set(m, DeviceChange::NAME) );
    REQUIRE( "[OBSERVED, NEW]" == to_string(m) );
    REQUIRE( 5 == number(m) );
    REQUIRE( ( DeviceChange::OBSERVED | DeviceChange::NEW ) == m );
    REQUIRE( DeviceChange::NAME != m );
}

TEST_CASE( "BeaconDevice Test 01", "[device]" ) {
    const uint64_t t0 = jau::getCurrentMilliseconds();
    const BeaconDevice d0 = makeDevice(0x1234, "A", -60, t0);
    const BeaconDevice d1(d0);

    REQUIRE( d0 == d1 );
    REQUIRE( "BluetoothLE#00:00:00:00:12:34" == d0.deviceID );
    REQUIRE( 0x1234 == d0.getAddress48() );
    REQUIRE( true == d0.hasName() );
    REQUIRE( "A 00:00:00:00:12:34 (-60)" == d0.toString() );
    REQUIRE( 10 == d0.getAge(t0 + 10) );

    const BeaconDevice d2 = makeDevice(0x1234, " ", -61, t0 + 1);
    REQUIRE( false == d2.hasName() );
    REQUIRE( "[No Name] 00:00:00:00:12:34 (-61)" == d2.toString() );
    REQUIRE( d0 != d2 );
    REQUIRE( d0.toString() == to_string(d0) );
    INFO_STR(d0.toDetailString());
}

TEST_CASE( "BeaconDevice Classify Test 01", "[device][classify]" ) {
    const uint64_t t0 = jau::getCurrentMilliseconds();
    const BeaconDevice a0 = makeDevice(0x1234, "A", -60, t0);
    const BeaconDevice a1 = makeDevice(0x1234, "A", -58, t0 + 100);
    const BeaconDevice b = makeDevice(0x1234, "B", -58, t0 + 200);
    const BeaconDevice blank = makeDevice(0x1234, "", -58, t0 + 300);

    // first observation
    REQUIRE( ( DeviceChange::OBSERVED | DeviceChange::NEW ) == BeaconDevice::classify(nullptr, a0) );
    REQUIRE( ( DeviceChange::OBSERVED | DeviceChange::NEW ) == BeaconDevice::classify(nullptr, blank) );

    // same name
    REQUIRE( DeviceChange::OBSERVED == BeaconDevice::classify(&a0, a1) );

    // renamed A -> B
    const DeviceChange c_ab = BeaconDevice::classify(&a1, b);
    REQUIRE( ( DeviceChange::OBSERVED | DeviceChange::NAME ) == c_ab );
    REQUIRE( false == is_set(c_ab, DeviceChange::NEW) );

    // blank name never reports a name change
    REQUIRE( DeviceChange::OBSERVED == BeaconDevice::classify(&b, blank) );

    // blank -> named is a name change
    REQUIRE( ( DeviceChange::OBSERVED | DeviceChange::NAME ) == BeaconDevice::classify(&blank, a0) );
}

TEST_CASE( "Constants Test 01", "[datatype][const]" ) {
    REQUIRE( 8000 == THREAD_SHUTDOWN_TIMEOUT.to_ms() );
    REQUIRE( 30000 == DEFAULT_HEARTBEAT_TIMEOUT.to_ms() );
    REQUIRE( 1000 == DEFAULT_SIM_EMIT_INTERVAL.to_ms() );
    REQUIRE( 50 == SIM_EMIT_POLL_PERIOD.to_ms() );
    REQUIRE( SIM_EMIT_POLL_PERIOD < DEFAULT_SIM_EMIT_INTERVAL );
}
