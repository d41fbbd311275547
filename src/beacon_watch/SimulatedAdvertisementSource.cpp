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

#include <algorithm>
#include <thread>
#include <chrono>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>
#include <jau/functional.hpp>

#include "BWConst.hpp"
#include "BWEnv.hpp"
#include "SimulatedAdvertisementSource.hpp"

using namespace beacon_watch;

SimulatedAdvertisementSource::SimulatedAdvertisementSource() noexcept
: SimulatedAdvertisementSource( BeaconWatchEnv::get().SIM_EMIT_INTERVAL )
{ }

SimulatedAdvertisementSource::SimulatedAdvertisementSource(const jau::fraction_i64& emitInterval_) noexcept
: emitInterval( emitInterval_ ),
  running( false ), emitCount( 0 ),
  rssiJitter( static_cast<std::minstd_rand::result_type>( jau::getCurrentMilliseconds() ) ),
  emitter_service("SimulatedAdvertisementSource::emitter", THREAD_SHUTDOWN_TIMEOUT,
                  jau::bind_member(this, &SimulatedAdvertisementSource::emitterWork))
{ }

SimulatedAdvertisementSource::~SimulatedAdvertisementSource() noexcept {
    DBG_PRINT("SimulatedAdvertisementSource::dtor: ... %s", toString().c_str());
    stopImpl("dtor");
    removeAllListener();
}

bool SimulatedAdvertisementSource::start() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_lifecycle); // RAII-style acquire and relinquish via destructor
    if( running ) {
        DBG_PRINT("SimulatedAdvertisementSource::start: Already running: %s", toString().c_str());
        return true;
    }
    running = true;
    emitter_service.start();
    WORDY_PRINT("SimulatedAdvertisementSource::start: %s", toString().c_str());
    return true;
}

void SimulatedAdvertisementSource::stop() noexcept {
    stopImpl("stop");
}

bool SimulatedAdvertisementSource::simulateHalt() noexcept {
    return stopImpl("halt");
}

bool SimulatedAdvertisementSource::stopImpl(const std::string& cause) noexcept {
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_lifecycle); // RAII-style acquire and relinquish via destructor
        if( !running ) {
            return false;
        }
        running = false;
        if( !emitter_service.stop() ) {
            WARN_PRINT("SimulatedAdvertisementSource::stop(%s): emitter service not stopped: %s", cause.c_str(), toString().c_str());
        }
    }
    WORDY_PRINT("SimulatedAdvertisementSource::stop(%s): %s", cause.c_str(), toString().c_str());
    sendStopped();
    return true;
}

bool SimulatedAdvertisementSource::inject(const AdvertisementReport& report) noexcept {
    if( !running ) {
        DBG_PRINT("SimulatedAdvertisementSource::inject: Not running, dropped %s", report.toString().c_str());
        return false;
    }
    sendAdvertisement(report);
    return true;
}

bool SimulatedAdvertisementSource::inject(const jau::EUI48& address, const int16_t rssi) noexcept {
    return inject( AdvertisementReport{ address, jau::getCurrentMilliseconds(), rssi } );
}

void SimulatedAdvertisementSource::addBeacon(const jau::EUI48& address, const int16_t rssi) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_beacons); // RAII-style acquire and relinquish via destructor
    for(Beacon& b : beacons) {
        if( b.address == address ) {
            b.rssi = rssi;
            return;
        }
    }
    beacons.push_back( Beacon{ address, rssi } );
}

bool SimulatedAdvertisementSource::removeBeacon(const jau::EUI48& address) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_beacons); // RAII-style acquire and relinquish via destructor
    for(auto it = beacons.begin(); it != beacons.end(); ++it) {
        if( it->address == address ) {
            beacons.erase(it);
            return true;
        }
    }
    return false;
}

AdvertisementSource::size_type SimulatedAdvertisementSource::getBeaconCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_beacons); // RAII-style acquire and relinquish via destructor
    return beacons.size();
}

int SimulatedAdvertisementSource::emitAll() noexcept {
    jau::darray<AdvertisementReport> reports;
    {
        const std::lock_guard<std::mutex> lock(mtx_beacons); // RAII-style acquire and relinquish via destructor
        const uint64_t ts = jau::getCurrentMilliseconds();
        for(const Beacon& b : beacons) {
            // +/- 3 dB
            const int16_t jitter = static_cast<int16_t>( rssiJitter() % 7 ) - 3;
            reports.push_back( AdvertisementReport{ b.address, ts, static_cast<int16_t>( b.rssi + jitter ) } );
        }
    }
    int count = 0;
    for(const AdvertisementReport& r : reports) {
        if( !running ) {
            break;
        }
        sendAdvertisement(r);
        ++count;
    }
    return count;
}

void SimulatedAdvertisementSource::emitterWork(jau::service_runner& sr) noexcept {
    const int count = emitAll();
    emitCount += count;
    DBG_PRINT("SimulatedAdvertisementSource::emitterWork: emitted %d, total %d", count, getEmitCount());

    const int64_t interval_ms = emitInterval.to_ms();
    const int64_t poll_ms = SIM_EMIT_POLL_PERIOD.to_ms();
    int64_t waited_ms = 0;
    while( !sr.shall_stop() && waited_ms < interval_ms ) {
        const int64_t sleep_ms = std::min(poll_ms, interval_ms - waited_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
        waited_ms += sleep_ms;
    }
}

std::string SimulatedAdvertisementSource::toString() const noexcept {
    return "SimulatedAdvertisementSource[running "+std::to_string(isRunning())+
           ", beacons "+std::to_string(getBeaconCount())+
           ", interval "+std::to_string(emitInterval.to_ms())+" ms, emitted "+std::to_string(getEmitCount())+
           ", listener "+std::to_string(getListenerCount())+"]";
}
