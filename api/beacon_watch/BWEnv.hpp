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

#ifndef BW_ENV_HPP_
#define BW_ENV_HPP_

#include <cstdint>

#include <jau/environment.hpp>
#include <jau/fraction_type.hpp>

namespace beacon_watch {

    /** \addtogroup BWUserAPI
     *
     *  @{
     */

    /**
     * Beacon watch singleton runtime environment properties
     * <p>
     * Also see {@link jau::environment::getExplodingProperties(const std::string & prefixDomain)}.
     * </p>
     */
    class BeaconWatchEnv : public jau::root_environment {
        private:
            BeaconWatchEnv() noexcept; // NOLINT(modernize-use-equals-delete)

        public:
            /** Global Debug flag, retrieved first to triggers environment initialization. */
            const bool DEBUG_GLOBAL;

        private:
            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Default heartbeat timeout of a BeaconWatcher, defaults to 30s (1ms minimum).
             * <p>
             * Environment variable is 'beacon_watch.watcher.heartbeat.timeout'.
             * </p>
             */
            const jau::fraction_i64 HEARTBEAT_TIMEOUT;

            /**
             * Emit interval of the SimulatedAdvertisementSource background service, defaults to 1s (10ms minimum).
             * <p>
             * Environment variable is 'beacon_watch.sim.interval'.
             * </p>
             */
            const jau::fraction_i64 SIM_EMIT_INTERVAL;

            /**
             * Debug all BeaconWatcher events.
             * <p>
             * Environment variable is 'beacon_watch.debug.watcher.event'.
             * </p>
             */
            const bool DEBUG_EVENT;

        public:
            static BeaconWatchEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 *
                 * Avoiding non-working double checked locking.
                 */
                static BeaconWatchEnv e;
                return e;
            }
    };

    /**@}*/

} // namespace beacon_watch

#endif /* BW_ENV_HPP_ */
