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

#include <jau/basic_types.hpp>

#include "BeaconDevice.hpp"

using namespace beacon_watch;

DeviceChange BeaconDevice::classify(const BeaconDevice* previous, const BeaconDevice& current) noexcept {
    DeviceChange res = DeviceChange::OBSERVED;
    if( nullptr == previous ) {
        set(res, DeviceChange::NEW);
    } else if( current.hasName() && current.name != previous->name ) {
        set(res, DeviceChange::NAME);
    }
    return res;
}

std::string BeaconDevice::toString() const noexcept {
    return ( hasName() ? name : "[No Name]" )+" "+address.toString()+" ("+std::to_string(rssi)+")";
}

std::string BeaconDevice::toDetailString() const noexcept {
    const uint64_t t0 = jau::getCurrentMilliseconds();
    return "BeaconDevice[id '"+deviceID+"', "+address.toString()+", name['"+name+
           "'], rssi "+std::to_string(rssi)+", age "+std::to_string(getAge(t0))+
           " ms, connected "+std::to_string(connected)+", pairing[can "+std::to_string(canPair)+
           ", paired "+std::to_string(paired)+"]]";
}

bool beacon_watch::operator==(const BeaconDevice& lhs, const BeaconDevice& rhs) noexcept {
    if( &lhs == &rhs ) {
        return true;
    }
    return lhs.deviceID == rhs.deviceID &&
           lhs.address == rhs.address &&
           lhs.name == rhs.name &&
           lhs.rssi == rhs.rssi &&
           lhs.broadcastTime == rhs.broadcastTime &&
           lhs.connected == rhs.connected &&
           lhs.canPair == rhs.canPair &&
           lhs.paired == rhs.paired;
}
