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

#ifndef BW_DEVICE_INFO_RESOLVER_HPP_
#define BW_DEVICE_INFO_RESOLVER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <mutex>
#include <condition_variable>
#include <unordered_map>
#include <unordered_set>

#include <jau/eui48.hpp>
#include <jau/fraction_type.hpp>
#include <jau/ordered_atomic.hpp>

#include "BWTypes.hpp"

namespace beacon_watch {

    /** \addtogroup BWUserAPI
     *
     *  @{
     */

    /**
     * Device profile as resolved by a DeviceInfoResolver for one radio address.
     */
    class DeviceInfo {
        public:
            const std::string deviceID;
            const jau::EUI48 address;
            const std::string name;
            const bool connected;
            const bool canPair;
            const bool paired;

            DeviceInfo(std::string deviceID_, const jau::EUI48& address_, std::string name_,
                       const bool connected_, const bool canPair_, const bool paired_) noexcept
            : deviceID(std::move(deviceID_)), address(address_), name(std::move(name_)),
              connected(connected_), canPair(canPair_), paired(paired_)
            { }

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<const DeviceInfo> DeviceInfoRef;

    /**
     * Enrichment lookup, resolving a bare radio address into a DeviceInfo.
     * <p>
     * resolve() is invoked off-thread by the BeaconWatcher, once per received advertisement.
     * It may block for an arbitrary duration and will be called concurrently for multiple addresses,
     * hence implementations shall be thread safe.
     * </p>
     * <p>
     * An unreachable or no more enumerable device shall be reported by returning `nullptr`.
     * A thrown exception is treated the same way by the BeaconWatcher.
     * </p>
     */
    class DeviceInfoResolver {
        public:
            virtual ~DeviceInfoResolver() noexcept = default;

            /**
             * Resolves the given address.
             * @return the resolved DeviceInfo or `nullptr` if not resolvable
             */
            virtual DeviceInfoRef resolve(const jau::EUI48& address) = 0;

            virtual std::string toString() const noexcept = 0;

            /**
             * Returns the default stable device identity derived from the given address,
             * i.e. `BluetoothLE#` followed by the EUI48 string.
             */
            static std::string makeDeviceID(const jau::EUI48& address) noexcept;
    };
    typedef std::shared_ptr<DeviceInfoResolver> DeviceInfoResolverRef;

    /**
     * Table based DeviceInfoResolver, resolving known addresses only.
     * <p>
     * Besides demonstration purposes, it allows reproducing slow and out of order enrichment:
     * - setLatency() delays each resolve() call
     * - setPending() parks resolve() calls of one address until releasePending()
     * </p>
     * <p>
     * All methods are thread safe.
     * </p>
     */
    class StaticDeviceInfoResolver : public DeviceInfoResolver {
        private:
            std::unordered_map<uint64_t, DeviceInfoRef> table;
            std::unordered_set<uint64_t> pending;
            jau::fraction_i64 latency;
            mutable std::mutex mtx_table;
            std::condition_variable cv_pending;
            jau::relaxed_atomic_int resolveCount;

        public:
            StaticDeviceInfoResolver() noexcept;

            ~StaticDeviceInfoResolver() noexcept override;

            /**
             * Adds or replaces the DeviceInfo for its address.
             */
            void put(const DeviceInfoRef& info) noexcept;

            /**
             * Adds or replaces the DeviceInfo for the given address,
             * using DeviceInfoResolver::makeDeviceID() as its identity.
             */
            void put(const jau::EUI48& address, const std::string& name,
                     const bool connected=false, const bool canPair=true, const bool paired=false) noexcept;

            /**
             * Replaces the name of the known device, retaining all other fields.
             * @return false if the address is unknown
             */
            bool rename(const jau::EUI48& address, const std::string& name) noexcept;

            /**
             * Removes the given address, resolve() will return `nullptr` afterwards.
             * @return true if the address was known
             */
            bool remove(const jau::EUI48& address) noexcept;

            /** Removes all entries and releases all pending addresses. */
            void clear() noexcept;

            /** Delays each resolve() by the given duration, zero disables the delay. */
            void setLatency(const jau::fraction_i64& v) noexcept;

            jau::fraction_i64 getLatency() const noexcept;

            /**
             * Parks all following resolve() calls for the given address until releasePending().
             */
            void setPending(const jau::EUI48& address) noexcept;

            /**
             * Releases parked resolve() calls for the given address.
             */
            void releasePending(const jau::EUI48& address) noexcept;

            /** Returns the number of resolve() calls so far. */
            int getResolveCount() const noexcept { return resolveCount; }

            size_t size() const noexcept;

            DeviceInfoRef resolve(const jau::EUI48& address) override;

            std::string toString() const noexcept override;
    };

    /**@}*/

} // namespace beacon_watch

#endif /* BW_DEVICE_INFO_RESOLVER_HPP_ */
