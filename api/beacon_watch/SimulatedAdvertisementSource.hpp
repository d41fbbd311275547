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

#ifndef BW_SIMULATED_ADVERTISEMENT_SOURCE_HPP_
#define BW_SIMULATED_ADVERTISEMENT_SOURCE_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <mutex>
#include <random>

#include <jau/darray.hpp>
#include <jau/fraction_type.hpp>
#include <jau/ordered_atomic.hpp>
#include <jau/service_runner.hpp>

#include "AdvertisementSource.hpp"

namespace beacon_watch {

    /** \addtogroup BWUserAPI
     *
     *  @{
     */

    /**
     * Radio-less AdvertisementSource.
     *
     * Advertisements are produced either
     * - synchronously on the caller's thread via inject(), or
     * - periodically by a background service advertising each beacon registered via addBeacon()
     *   once per emit interval with a jittered RSSI.
     *
     * simulateHalt() models an externally caused halt, e.g. a disabled radio.
     *
     * Controlling Environment variables, see BeaconWatchEnv:
     * - 'beacon_watch.sim.interval': emit interval of the background service
     */
    class SimulatedAdvertisementSource : public AdvertisementSource {
        private:
            struct Beacon {
                jau::EUI48 address;
                int16_t rssi;
            };

            const jau::fraction_i64 emitInterval;
            jau::sc_atomic_bool running;
            jau::relaxed_atomic_int emitCount;
            mutable std::recursive_mutex mtx_lifecycle;
            mutable std::mutex mtx_beacons;
            jau::darray<Beacon> beacons;
            std::minstd_rand rssiJitter;
            jau::service_runner emitter_service;

            void emitterWork(jau::service_runner& sr) noexcept;

            /** Emits all registered beacons once, returns number of emitted advertisements. */
            int emitAll() noexcept;

            /** Transition running to stopped, returns true if this call performed the transition. */
            bool stopImpl(const std::string& cause) noexcept;

        public:
            /**
             * Creates a stopped instance, using the emit interval of BeaconWatchEnv.
             */
            SimulatedAdvertisementSource() noexcept;

            /**
             * Creates a stopped instance using the given emit interval.
             */
            explicit SimulatedAdvertisementSource(const jau::fraction_i64& emitInterval_) noexcept;

            ~SimulatedAdvertisementSource() noexcept override;

            bool start() noexcept override;

            void stop() noexcept override;

            bool isRunning() const noexcept override { return running; }

            /**
             * Delivers the given advertisement synchronously to all listener on the calling thread.
             * @return false if not running, the report is dropped
             */
            bool inject(const AdvertisementReport& report) noexcept;

            /**
             * Delivers an advertisement of the given address using the current monotonic time as its timestamp.
             * @see inject(const AdvertisementReport&)
             */
            bool inject(const jau::EUI48& address, const int16_t rssi) noexcept;

            /**
             * Registers a synthetic beacon for the background emitter or updates its base RSSI.
             */
            void addBeacon(const jau::EUI48& address, const int16_t rssi) noexcept;

            /**
             * Removes the synthetic beacon, it will no longer be advertised.
             * @return true if removed
             */
            bool removeBeacon(const jau::EUI48& address) noexcept;

            size_type getBeaconCount() const noexcept;

            /**
             * Returns the number of advertisements emitted by the background service so far.
             */
            int getEmitCount() const noexcept { return emitCount; }

            jau::fraction_i64 getEmitInterval() const noexcept { return emitInterval; }

            /**
             * Simulates an external halt of the radio, not initiated via stop().
             * <p>
             * Listener are notified via AdvertisementListener::sourceStopped().
             * </p>
             * @return true if the source was running
             */
            bool simulateHalt() noexcept;

            std::string toString() const noexcept override;
    };
    typedef std::shared_ptr<SimulatedAdvertisementSource> SimulatedAdvertisementSourceRef;

    /**@}*/

} // namespace beacon_watch

#endif /* BW_SIMULATED_ADVERTISEMENT_SOURCE_HPP_ */
