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

#ifndef BW_BEACON_WATCHER_HPP_
#define BW_BEACON_WATCHER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <mutex>
#include <thread>
#include <condition_variable>
#include <unordered_map>

#include <jau/darray.hpp>
#include <jau/cow_darray.hpp>
#include <jau/fraction_type.hpp>
#include <jau/ordered_atomic.hpp>

#include "BWConst.hpp"
#include "BWEnv.hpp"
#include "BWTypes.hpp"
#include "BeaconDevice.hpp"
#include "AdvertisementSource.hpp"
#include "DeviceInfoResolver.hpp"

namespace beacon_watch {

    /** \addtogroup BWUserAPI
     *
     *  @{
     */

    class BeaconWatcher; // forward

    /**
     * BeaconWatcher status listener for listening state and discovered device events.
     * <p>
     * All methods are called from an arbitrary thread, i.e.
     * the thread which completed the enrichment of an advertisement or which triggered the eviction.
     * Notifications of different advertisements are not serialized with each other.
     * </p>
     * <p>
     * Implementations may call back into the BeaconWatcher, e.g. BeaconWatcher::getDiscoveredDevices().
     * </p>
     */
    class BeaconWatchListener {
        public:
            /**
             * The watcher has started listening, i.e. transitioned from stopped to started.
             */
            virtual void startedListening(BeaconWatcher& watcher) {
                (void)watcher;
            }

            /**
             * The watcher has stopped listening, either via BeaconWatcher::stopListening()
             * or caused by the halted AdvertisementSource.
             */
            virtual void stoppedListening(BeaconWatcher& watcher) {
                (void)watcher;
            }

            /**
             * A device advertisement has been resolved and applied to the registry.
             * <p>
             * Always called first for each applied advertisement.
             * </p>
             * @param device the new device record
             * @param changes DeviceChange::OBSERVED, plus DeviceChange::NAME and DeviceChange::NEW as applicable
             */
            virtual void deviceObserved(const BeaconDeviceRef& device, const DeviceChange changes) {
                (void)device;
                (void)changes;
            }

            /**
             * A known device reported a new non-blank name, called after deviceObserved().
             * @param device the new device record carrying the new name
             */
            virtual void deviceNameChanged(const BeaconDeviceRef& device) {
                (void)device;
            }

            /**
             * A device not known to the registry has been discovered, called after deviceObserved().
             */
            virtual void newDeviceDiscovered(const BeaconDeviceRef& device) {
                (void)device;
            }

            /**
             * A device has been evicted from the registry, not advertised within the heartbeat timeout.
             * <p>
             * Called exactly once per evicted device record.
             * </p>
             * @param device the last device record before eviction
             */
            virtual void deviceTimeout(const BeaconDeviceRef& device) {
                (void)device;
            }

            virtual ~BeaconWatchListener() noexcept = default;

            virtual std::string toString() const noexcept;

            /**
             * Default comparison operator, merely testing for same memory reference.
             * <p>
             * Specializations may override.
             * </p>
             */
            virtual bool operator==(const BeaconWatchListener& rhs) const noexcept
            { return this == &rhs; }

            bool operator!=(const BeaconWatchListener& rhs) const noexcept
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<BeaconWatchListener> BeaconWatchListenerRef;

    /**
     * Live registry of currently visible beacon devices.
     * <p>
     * The watcher subscribes to an AdvertisementSource,
     * resolves each received advertisement via a DeviceInfoResolver on its own detached thread,
     * reconciles the resolved BeaconDevice into its registry keyed by BeaconDevice::deviceID
     * and publishes the changes to all BeaconWatchListener.
     * </p>
     * <p>
     * Devices not advertised within the heartbeat timeout are evicted
     * at the start of each advertisement ingestion and each getDiscoveredDevices() call.
     * </p>
     * <p>
     * Results of enrichments started before the last stopListening() or source halt are discarded,
     * i.e. they cannot re-populate the registry of a stopped or new listening session.
     * </p>
     *
     * Controlling Environment variables, see {@link BeaconWatchEnv}.
     */
    class BeaconWatcher {
        public:
            typedef jau::nsize_t size_type;
            typedef jau::darray<BeaconDeviceRef, size_type> device_list_t;

        private:
            /**
             * Forwards source events to the watcher.
             * <p>
             * The source may still hold a reference to this listener while delivering on its own thread
             * after the watcher has been destroyed, hence detach() must be called before the watcher goes away.
             * </p>
             */
            class SourceListener : public AdvertisementListener {
                private:
                    std::mutex mtx_delivery;
                    std::condition_variable cv_delivery;
                    BeaconWatcher* watcher;
                    /** Threads currently delivering to watcher, guarded by mtx_delivery. */
                    jau::darray<std::thread::id> delivering;

                    BeaconWatcher* enterDelivery() noexcept;
                    void leaveDelivery() noexcept;
                    bool isDeliveringOther(const std::thread::id self) const noexcept;

                public:
                    SourceListener(BeaconWatcher& watcher_) noexcept
                    : watcher(&watcher_) {}

                    void advertisementReceived(AdvertisementSource& source, const AdvertisementReport& report) override;

                    void sourceStopped(AdvertisementSource& source) override;

                    /**
                     * Disconnects from the watcher and waits until all deliveries on other threads have left it.
                     * A delivery on the calling thread is not waited for.
                     */
                    void detach() noexcept;

                    std::string toString() const noexcept override;
            };

            typedef jau::cow_darray<BeaconWatchListenerRef, size_type> statusListenerList_t;
            static statusListenerList_t::equal_comparator statusListenerRefEqComparator;

            const BeaconWatchEnv& env;
            const AdvertisementSourceRef source;
            const DeviceInfoResolverRef resolver;
            std::shared_ptr<SourceListener> sourceListener;
            statusListenerList_t statusListenerList;

            jau::sc_atomic_bool closed;
            mutable std::recursive_mutex mtx_lifecycle;

            /** Registry state, guarded by mtx_devices. */
            mutable std::mutex mtx_devices;
            std::unordered_map<std::string, BeaconDeviceRef> devices;
            jau::fraction_i64 heartbeatTimeout;
            uint64_t sessionGeneration;
            jau::sc_atomic_bool sessionActive;

            /** In-flight ingestions including their enrichment threads, guarded by mtx_pending. */
            mutable std::mutex mtx_pending;
            std::condition_variable cv_pending;
            int pendingResolves;

            void ingest(const AdvertisementReport& report) noexcept;

            /** Detached enrichment thread of one advertisement. */
            void resolveWork(const AdvertisementReport report, const uint64_t generation) noexcept;

            /**
             * Applies the resolved record to the registry, unless its session has ended.
             * @return DeviceChange::NONE if discarded, otherwise the classified changes
             */
            DeviceChange apply(const BeaconDeviceRef& device, const uint64_t generation) noexcept;

            void pendingResolveDone() noexcept;

            /** Waits until no more than ownPending ingestions are in flight, i.e. those of the calling thread. */
            bool waitForPendingResolvesImpl(const jau::fraction_i64& timeout, const int ownPending) noexcept;

            /**
             * Ends the current session: bumps the session generation and optionally clears the registry.
             * @return number of removed devices
             */
            size_type endSession(const bool clearDevices) noexcept;

            void sourceHalted() noexcept;

            void sendStartedListening() noexcept;
            void sendStoppedListening() noexcept;
            void sendDeviceObserved(const BeaconDeviceRef& device, const DeviceChange changes) noexcept;
            void sendDeviceNameChanged(const BeaconDeviceRef& device) noexcept;
            void sendNewDeviceDiscovered(const BeaconDeviceRef& device) noexcept;
            void sendDeviceTimeout(const BeaconDeviceRef& device) noexcept;

        public:
            /**
             * Creates a stopped watcher using the given collaborators
             * and the default heartbeat timeout of BeaconWatchEnv.
             *
             * @param source_ the advertisement source, must not be null
             * @param resolver_ the device info resolver, must not be null
             * @throws jau::IllegalArgumentException if source_ or resolver_ is null
             */
            BeaconWatcher(const AdvertisementSourceRef& source_, const DeviceInfoResolverRef& resolver_);

            BeaconWatcher(const BeaconWatcher&) = delete;
            void operator=(const BeaconWatcher&) = delete;

            /**
             * Releases this instance, see close().
             */
            ~BeaconWatcher() noexcept;

            /**
             * Stops listening, removes all listener, deregisters from the source
             * and waits for all in-flight enrichment threads to finish.
             * <p>
             * Once closed, the watcher cannot be started again.
             * </p>
             */
            void close() noexcept;

            const AdvertisementSourceRef& getSource() const noexcept { return source; }

            const DeviceInfoResolverRef& getResolver() const noexcept { return resolver; }

            /**
             * Returns true if listening, i.e. the source's running state.
             */
            bool isListening() const noexcept;

            /**
             * Starts the AdvertisementSource if not listening already.
             * <p>
             * BeaconWatchListener::startedListening() is published once per stopped to started transition.
             * </p>
             * @return true if listening afterwards
             */
            bool startListening() noexcept;

            /**
             * Stops the AdvertisementSource if listening and clears the registry.
             * <p>
             * BeaconWatchListener::stoppedListening() is published once per started to stopped transition.
             * </p>
             */
            void stopListening() noexcept;

            jau::fraction_i64 getHeartbeatTimeout() const noexcept;

            /**
             * Sets the heartbeat timeout, i.e. the maximum silence interval before a device is evicted.
             * @throws jau::IllegalArgumentException if not positive
             */
            void setHeartbeatTimeout(const jau::fraction_i64& v);

            /**
             * Evicts timed out devices, then returns a snapshot of all discovered devices.
             * <p>
             * The returned list is a copy and not affected by later registry changes.
             * </p>
             */
            device_list_t getDiscoveredDevices() noexcept;

            /** Returns the number of discovered devices, without eviction. */
            size_type getDiscoveredDeviceCount() const noexcept;

            /** Returns the discovered device of the given id, without eviction, or nullptr. */
            BeaconDeviceRef findDiscoveredDevice(const std::string& deviceID) const noexcept;

            /**
             * Removes all devices not advertised within the heartbeat timeout
             * and publishes BeaconWatchListener::deviceTimeout() for each.
             * @return number of evicted devices
             */
            size_type evictTimedOutDevices() noexcept;

            /** Returns the number of in-flight ingestions, i.e. advertisements not yet applied or dropped. */
            int getPendingResolveCount() const noexcept;

            /**
             * Blocks until all in-flight ingestions have completed or the timeout expired.
             * @param timeout maximum duration to wait
             * @return true if no enrichment is pending anymore
             */
            bool waitForPendingResolves(const jau::fraction_i64& timeout) noexcept;

            /**
             * Add the given listener to the list if not already present.
             * @return true if added, false if already present or null
             */
            bool addStatusListener(const BeaconWatchListenerRef& l) noexcept;

            /**
             * Remove the given listener from the list.
             * @return true if removed
             */
            bool removeStatusListener(const BeaconWatchListenerRef& l) noexcept;

            /**
             * Remove the given listener from the list.
             * @return true if removed
             */
            bool removeStatusListener(const BeaconWatchListener * l) noexcept;

            /** Remove all status listener, returns number of removed listener. */
            size_type removeAllStatusListener() noexcept;

            size_type getStatusListenerCount() const noexcept { return statusListenerList.size(); }

            /**
             * Print the discovered device list and the status listener list to stderr via jau::PLAIN_PRINT().
             */
            void printDeviceList() noexcept;

            std::string toString() const noexcept { return toString(false); }

            std::string toString(bool includeDiscoveredDevices) const noexcept;
    };

    /**@}*/

} // namespace beacon_watch

#endif /* BW_BEACON_WATCHER_HPP_ */
