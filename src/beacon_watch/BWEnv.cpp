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
#include <cstdint>

#include <jau/environment.hpp>

#include "BWConst.hpp"
#include "BWEnv.hpp"

using namespace beacon_watch;
using namespace jau::fractions_i64_literals;

BeaconWatchEnv::BeaconWatchEnv() noexcept
: DEBUG_GLOBAL( jau::environment::get("beacon_watch").debug ),
  exploding( jau::environment::getExplodingProperties("beacon_watch.watcher") ),
  HEARTBEAT_TIMEOUT( jau::environment::getFractionProperty("beacon_watch.watcher.heartbeat.timeout", DEFAULT_HEARTBEAT_TIMEOUT, 1_ms /* min */, 365_d /* max */) ),
  SIM_EMIT_INTERVAL( jau::environment::getFractionProperty("beacon_watch.sim.interval", DEFAULT_SIM_EMIT_INTERVAL, 10_ms /* min */, 365_d /* max */) ),
  DEBUG_EVENT( jau::environment::getBooleanProperty("beacon_watch.debug.watcher.event", false) )
{
}
