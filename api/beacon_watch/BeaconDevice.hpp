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

#ifndef BW_BEACON_DEVICE_HPP_
#define BW_BEACON_DEVICE_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/eui48.hpp>

#include "BWTypes.hpp"

namespace beacon_watch {

    /** \addtogroup BWUserAPI
     *
     *  @{
     */

    /**
     * BeaconDevice is an immutable snapshot of one remote beacon device,
     * as observed by one resolved advertisement.
     * <p>
     * A new observation produces a new BeaconDevice instance, replacing the previous one
     * within the BeaconWatcher's registry. Fields are never mutated nor merged.
     * </p>
     * <p>
     * Instances are shared via BeaconDeviceRef, hence a snapshot handed out
     * by BeaconWatcher::getDiscoveredDevices() stays valid and unchanged.
     * </p>
     */
    class BeaconDevice {
        public:
            /** Stable unique device identity, derived from its address. */
            const std::string deviceID;

            /** The device's 48-bit radio address. */
            const jau::EUI48 address;

            /** The device name, may be empty. */
            const std::string name;

            /** Signal strength in dB of the advertisement producing this snapshot. */
            const int16_t rssi;

            /**
             * Timestamp in monotonic milliseconds of the advertisement producing this snapshot.
             * @see jau::getCurrentMilliseconds()
             */
            const uint64_t broadcastTime;

            const bool connected;
            const bool canPair;
            const bool paired;

            BeaconDevice(std::string deviceID_, const jau::EUI48& address_, std::string name_,
                         const int16_t rssi_, const uint64_t broadcastTime_,
                         const bool connected_, const bool canPair_, const bool paired_) noexcept
            : deviceID(std::move(deviceID_)), address(address_), name(std::move(name_)),
              rssi(rssi_), broadcastTime(broadcastTime_),
              connected(connected_), canPair(canPair_), paired(paired_)
            { }

            BeaconDevice(const BeaconDevice&) = default;
            BeaconDevice& operator=(const BeaconDevice&) = delete;

            /** Returns the address as 48-bit integer, see to_uint64(). */
            uint64_t getAddress48() const noexcept { return to_uint64(address); }

            /** Returns true if name is neither empty nor whitespace only. */
            bool hasName() const noexcept { return !isBlankName(name); }

            /**
             * Returns the age of this snapshot in milliseconds relative to the given monotonic timestamp.
             */
            uint64_t getAge(const uint64_t ts_now) const noexcept {
                return ts_now > broadcastTime ? ts_now - broadcastTime : 0;
            }

            /**
             * Returns the DeviceChange set of notifications caused by replacing `previous` with `current`.
             *
             * - DeviceChange::OBSERVED is always set.
             * - DeviceChange::NEW is set if `previous` is `nullptr`.
             * - DeviceChange::NAME is set if `previous` exists, `current` name is not blank
             *   and differs from the `previous` name.
             *
             * @param previous the previously registered snapshot of the same device or `nullptr` if unknown
             * @param current the newly resolved snapshot
             */
            static DeviceChange classify(const BeaconDevice* previous, const BeaconDevice& current) noexcept;

            /** Returns a short user friendly string: `name address (rssi)`, using `[No Name]` for a blank name. */
            std::string toString() const noexcept;

            /** Returns a verbose string containing all fields. */
            std::string toDetailString() const noexcept;
    };
    typedef std::shared_ptr<const BeaconDevice> BeaconDeviceRef;

    /**
     * Returns true if both snapshots carry identical field values.
     */
    bool operator==(const BeaconDevice& lhs, const BeaconDevice& rhs) noexcept;

    inline bool operator!=(const BeaconDevice& lhs, const BeaconDevice& rhs) noexcept
    { return !(lhs == rhs); }

    inline std::string to_string(const BeaconDevice& d) noexcept { return d.toString(); }

    /**@}*/

} // namespace beacon_watch

#endif /* BW_BEACON_DEVICE_HPP_ */
