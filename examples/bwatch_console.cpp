/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <iostream>

#include <cinttypes>

#include <jau/basic_types.hpp>
#include <jau/debug.hpp>
#include <jau/darray.hpp>

#include <beacon_watch/BWTypes.hpp>
#include <beacon_watch/BeaconWatcher.hpp>
#include <beacon_watch/DeviceInfoResolver.hpp>
#include <beacon_watch/SimulatedAdvertisementSource.hpp>

extern "C" {
    #include <unistd.h>
}

using namespace beacon_watch;
using namespace jau;
using namespace jau::fractions_i64_literals;

/** \file
 * This console playground watches a SimulatedAdvertisementSource
 * with synthetic beacons and prints all BeaconWatcher events.
 *
 * ### bwatch_console Invocation Examples:
 * Using `sudo` is not required.
 *
 * * Six beacons, 5s heartbeat timeout and debug logging
 * ~~~
 * ../dist-amd64/bin/bwatch_console -beacons 6 -heartbeat 5000 -bw_debug true
 * ~~~
 *
 * Commands read from stdin, one per line:
 * * _empty line_: print the discovered devices
 * * `start`, `stop`: start or stop listening
 * * `halt`: simulate an external radio halt
 * * `rm <n>`: stop advertising beacon `n`, it will time out
 * * `add <n>`: advertise beacon `n` again
 * * `rename <n> <name>`: resolve beacon `n` with the new name
 * * `quit`
 */

static int BEACON_COUNT = 4;
static int RESOLVE_LATENCY_MS = 0;

class MyBeaconWatchListener : public BeaconWatchListener {
    void startedListening(BeaconWatcher& watcher) override {
        fprintf_td(stderr, "****** Started listening: %s\n", watcher.toString().c_str());
    }

    void stoppedListening(BeaconWatcher& watcher) override {
        fprintf_td(stderr, "****** Stopped listening: %s\n", watcher.toString().c_str());
    }

    void newDeviceDiscovered(const BeaconDeviceRef& device) override {
        fprintf_td(stderr, "****** New device: %s\n", device->toString().c_str());
    }

    void deviceNameChanged(const BeaconDeviceRef& device) override {
        fprintf_td(stderr, "****** Device name changed: %s\n", device->toString().c_str());
    }

    void deviceTimeout(const BeaconDeviceRef& device) override {
        fprintf_td(stderr, "****** Device timeout: %s\n", device->toString().c_str());
    }

  public:
    std::string toString() const noexcept override {
        return "MyBeaconWatchListener[this "+to_hexstring(this)+"]";
    }
};

static jau::EUI48 beaconAddress(const int n) {
    return to_EUI48( UINT64_C(0xC0DE00000000) + static_cast<uint64_t>(n) );
}

static void printDevices(BeaconWatcher& watcher) {
    BeaconWatcher::device_list_t devices = watcher.getDiscoveredDevices();
    jau::PLAIN_PRINT(true, "%zu devices......", (size_t)devices.size());
    const uint64_t now = getCurrentMilliseconds();
    for(const BeaconDeviceRef& d : devices) {
        jau::PLAIN_PRINT(true, "%s, age %" PRIu64 " ms", d->toString().c_str(), d->getAge(now));
    }
}

int main(int argc, char *argv[])
{
    int64_t heartbeat_ms = -1;
    int64_t interval_ms = -1;

    for(int i=1; i<argc; i++) {
        fprintf(stderr, "arg[%d/%d]: '%s'\n", i, argc, argv[i]);

        if( !strcmp("-bw_debug", argv[i]) && argc > (i+1) ) {
            setenv("beacon_watch.debug", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-bw_verbose", argv[i]) && argc > (i+1) ) {
            setenv("beacon_watch.verbose", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-bw_watcher", argv[i]) && argc > (i+1) ) {
            setenv("beacon_watch.watcher", argv[++i], 1 /* overwrite */);
        } else if( !strcmp("-interval", argv[i]) && argc > (i+1) ) {
            interval_ms = atoi(argv[++i]);
        } else if( !strcmp("-heartbeat", argv[i]) && argc > (i+1) ) {
            heartbeat_ms = atoi(argv[++i]);
        } else if( !strcmp("-beacons", argv[i]) && argc > (i+1) ) {
            BEACON_COUNT = atoi(argv[++i]);
        } else if( !strcmp("-latency", argv[i]) && argc > (i+1) ) {
            RESOLVE_LATENCY_MS = atoi(argv[++i]);
        }
    }
    fprintf_td(stderr, "pid %d\n", getpid());

    fprintf_td(stderr, "Run with '[-beacons <count>] [-heartbeat <ms>] [-interval <ms>] [-latency <ms>] "
                    "[-bw_debug true|false|auto|timestamp] [-bw_verbose true|false] "
                    "[-bw_watcher <property:value>]'\n");
    fprintf_td(stderr, "BEACON_COUNT %d\n", BEACON_COUNT);
    fprintf_td(stderr, "RESOLVE_LATENCY %d ms\n", RESOLVE_LATENCY_MS);

    std::shared_ptr<SimulatedAdvertisementSource> source = 0 < interval_ms ?
            std::make_shared<SimulatedAdvertisementSource>( 1_ms * interval_ms ) :
            std::make_shared<SimulatedAdvertisementSource>();
    std::shared_ptr<StaticDeviceInfoResolver> resolver = std::make_shared<StaticDeviceInfoResolver>();
    resolver->setLatency( 1_ms * static_cast<int64_t>(RESOLVE_LATENCY_MS) );
    for(int n=0; n<BEACON_COUNT; ++n) {
        const jau::EUI48 a = beaconAddress(n);
        // every third beacon advertises without a name
        resolver->put(a, 0 == n % 3 ? "" : "Beacon-"+std::to_string(n));
        source->addBeacon(a, static_cast<int16_t>( -45 - 5 * n ));
    }

    BeaconWatcher watcher(source, resolver);
    if( 0 < heartbeat_ms ) {
        try {
            watcher.setHeartbeatTimeout( 1_ms * heartbeat_ms );
        } catch (std::exception &e) {
            fprintf_td(stderr, "Invalid heartbeat %" PRIi64 " ms: %s\n", heartbeat_ms, e.what());
            return 1;
        }
    }
    watcher.addStatusListener(std::make_shared<MyBeaconWatchListener>());
    fprintf_td(stderr, "%s\n", watcher.toString().c_str());

    if( !watcher.startListening() ) {
        fprintf_td(stderr, "****** Could not start listening: %s\n", watcher.toString().c_str());
        return 1;
    }

    std::string line;
    while( std::getline(std::cin, line) ) {
        if( line.empty() ) {
            printDevices(watcher);
        } else if( "quit" == line ) {
            break;
        } else if( "start" == line ) {
            watcher.startListening();
        } else if( "stop" == line ) {
            watcher.stopListening();
        } else if( "halt" == line ) {
            source->simulateHalt();
        } else if( 0 == line.rfind("rm ", 0) ) {
            const int n = atoi(line.c_str()+3);
            fprintf_td(stderr, "Beacon %d removed %d\n", n, source->removeBeacon(beaconAddress(n)));
        } else if( 0 == line.rfind("add ", 0) ) {
            const int n = atoi(line.c_str()+4);
            source->addBeacon(beaconAddress(n), -60);
        } else if( 0 == line.rfind("rename ", 0) ) {
            const std::string args = line.substr(7);
            const size_t sp = args.find(' ');
            const int n = atoi(args.c_str());
            const std::string name = std::string::npos == sp ? "" : args.substr(sp+1);
            fprintf_td(stderr, "Beacon %d renamed %d\n", n, resolver->rename(beaconAddress(n), name));
        } else if( "list" == line ) {
            watcher.printDeviceList();
        } else {
            fprintf_td(stderr, "Unknown command '%s'\n", line.c_str());
        }
    }
    watcher.close();
    fprintf_td(stderr, "****** EXIT: %s\n", watcher.toString().c_str());
    return 0;
}
