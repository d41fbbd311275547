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

#ifndef BW_CONST_HPP_
#define BW_CONST_HPP_

#include <cstddef>

#include <jau/int_types.hpp>
#include <jau/fraction_type.hpp>

namespace beacon_watch {

    /** \addtogroup BWUserAPI
     *
     *  @{
     */

    /**
     * Maximum time to wait for a thread shutdown.
     *
     * Used for the BeaconWatcher's in-flight enrichment threads
     * and the SimulatedAdvertisementSource emitter service.
     */
    inline constexpr const jau::fraction_i64 THREAD_SHUTDOWN_TIMEOUT = jau::fraction_i64(8, 1);

    /**
     * Default heartbeat timeout, i.e. the maximum silence interval
     * before a discovered device is considered gone.
     *
     * May be overridden via environment variable 'beacon_watch.watcher.heartbeat.timeout',
     * see BeaconWatchEnv.
     */
    inline constexpr const jau::fraction_i64 DEFAULT_HEARTBEAT_TIMEOUT = jau::fraction_i64(30, 1);

    /**
     * Default interval of the SimulatedAdvertisementSource emitter,
     * advertising each registered synthetic beacon once per interval.
     */
    inline constexpr const jau::fraction_i64 DEFAULT_SIM_EMIT_INTERVAL = jau::fraction_i64(1, 1);

    /** Poll period of the SimulatedAdvertisementSource emitter while waiting for the next interval. */
    inline constexpr const jau::fraction_i64 SIM_EMIT_POLL_PERIOD = jau::fraction_i64(50, 1000);

    /**@}*/

} // namespace beacon_watch

#endif /* BW_CONST_HPP_ */
