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
#include <cinttypes>

#include <thread>
#include <system_error>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>
#include <jau/basic_algos.hpp>
#include <jau/fraction_type.hpp>

#include "BeaconWatcher.hpp"

using namespace beacon_watch;
using namespace jau::fractions_i64_literals;

namespace {
    /** Watcher whose in-flight ingestions the current thread executes, see PendingScope. */
    thread_local const BeaconWatcher* tl_pending_watcher = nullptr;
    /** Number of tl_pending_watcher's in-flight ingestions on the current thread. */
    thread_local int tl_pending_count = 0;

    class PendingScope {
        private:
            const BeaconWatcher* prev_watcher;
            int prev_count;

        public:
            PendingScope(const BeaconWatcher* watcher) noexcept
            : prev_watcher(tl_pending_watcher), prev_count(tl_pending_count)
            {
                if( watcher != tl_pending_watcher ) {
                    tl_pending_watcher = watcher;
                    tl_pending_count = 0;
                }
                ++tl_pending_count;
            }
            ~PendingScope() noexcept {
                tl_pending_watcher = prev_watcher;
                tl_pending_count = prev_count;
            }
            PendingScope(const PendingScope&) = delete;
            void operator=(const PendingScope&) = delete;
    };

    int ownPendingCount(const BeaconWatcher* watcher) noexcept {
        return watcher == tl_pending_watcher ? tl_pending_count : 0;
    }
}

std::string BeaconWatchListener::toString() const noexcept {
    return "BeaconWatchListener["+jau::to_hexstring(this)+"]";
}

BeaconWatcher* BeaconWatcher::SourceListener::enterDelivery() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_delivery); // RAII-style acquire and relinquish via destructor
    if( nullptr != watcher ) {
        delivering.push_back( std::this_thread::get_id() );
    }
    return watcher;
}

void BeaconWatcher::SourceListener::leaveDelivery() noexcept {
    const std::lock_guard<std::mutex> lock(mtx_delivery); // RAII-style acquire and relinquish via destructor
    const std::thread::id self = std::this_thread::get_id();
    for(auto it = delivering.begin(); it != delivering.end(); ++it) {
        if( self == *it ) {
            delivering.erase(it);
            break;
        }
    }
    cv_delivery.notify_all();
}

bool BeaconWatcher::SourceListener::isDeliveringOther(const std::thread::id self) const noexcept {
    for(const std::thread::id& id : delivering) {
        if( self != id ) {
            return true;
        }
    }
    return false;
}

void BeaconWatcher::SourceListener::advertisementReceived(AdvertisementSource& source, const AdvertisementReport& report) {
    (void)source;
    BeaconWatcher* w = enterDelivery();
    if( nullptr == w ) {
        return;
    }
    w->ingest(report);
    leaveDelivery();
}

void BeaconWatcher::SourceListener::sourceStopped(AdvertisementSource& source) {
    (void)source;
    BeaconWatcher* w = enterDelivery();
    if( nullptr == w ) {
        return;
    }
    w->sourceHalted();
    leaveDelivery();
}

void BeaconWatcher::SourceListener::detach() noexcept {
    std::unique_lock<std::mutex> lock(mtx_delivery); // RAII-style acquire and relinquish via destructor
    watcher = nullptr;
    const std::thread::id self = std::this_thread::get_id();
    while( isDeliveringOther(self) ) {
        const jau::fraction_timespec timeout_time = jau::getMonotonicTime() + jau::fraction_timespec(THREAD_SHUTDOWN_TIMEOUT);
        std::cv_status s = jau::wait_until(cv_delivery, lock, timeout_time);
        if( std::cv_status::timeout == s && isDeliveringOther(self) ) {
            WARN_PRINT("BeaconWatcher::SourceListener::detach: Still %zu deliveries after %s",
                    (size_t)delivering.size(), THREAD_SHUTDOWN_TIMEOUT.to_string().c_str());
        }
    }
}

std::string BeaconWatcher::SourceListener::toString() const noexcept {
    return "BeaconWatcher::SourceListener["+jau::to_hexstring(this)+"]";
}

BeaconWatcher::statusListenerList_t::equal_comparator BeaconWatcher::statusListenerRefEqComparator =
        [](const BeaconWatchListenerRef &a, const BeaconWatchListenerRef &b) -> bool { return *a == *b; };

BeaconWatcher::BeaconWatcher(const AdvertisementSourceRef& source_, const DeviceInfoResolverRef& resolver_)
: env( BeaconWatchEnv::get() ),
  source( source_ ), resolver( resolver_ ),
  sourceListener( nullptr ),
  closed( false ),
  heartbeatTimeout( env.HEARTBEAT_TIMEOUT ),
  sessionGeneration( 0 ), sessionActive( false ),
  pendingResolves( 0 )
{
    if( nullptr == source ) {
        throw jau::IllegalArgumentException("AdvertisementSource is null", E_FILE_LINE);
    }
    if( nullptr == resolver ) {
        throw jau::IllegalArgumentException("DeviceInfoResolver is null", E_FILE_LINE);
    }
    sourceListener = std::make_shared<SourceListener>(*this);
    if( !source->addListener(sourceListener) ) {
        throw jau::IllegalStateException("Could not register with "+source->toString(), E_FILE_LINE);
    }
    DBG_PRINT("BeaconWatcher::ctor: %s", toString().c_str());
}

BeaconWatcher::~BeaconWatcher() noexcept {
    DBG_PRINT("BeaconWatcher::dtor: ... %s", toString().c_str());
    close();
    DBG_PRINT("BeaconWatcher::dtor: XXX");
}

void BeaconWatcher::close() noexcept {
    {
        const std::lock_guard<std::recursive_mutex> lock(mtx_lifecycle); // RAII-style acquire and relinquish via destructor
        if( !closed ) {
            DBG_PRINT("BeaconWatcher::close: ... %s", toString().c_str());
            stopListening();
            {
                const std::lock_guard<std::mutex> lock2(mtx_pending); // RAII-style acquire and relinquish via destructor
                closed = true;
            }
            statusListenerList.clear();
        }
    }
    // a repeated close() still waits, e.g. the destructor after a listener closed from its callback
    // outside mtx_lifecycle, a delivery's listener may still acquire it
    source->removeListener(sourceListener);
    sourceListener->detach();

    // in-flight ingestions reference this instance, except those of a listener closing from its callback
    const int own = ownPendingCount(this);
    while( !waitForPendingResolvesImpl(THREAD_SHUTDOWN_TIMEOUT, own) ) {
        WARN_PRINT("BeaconWatcher::close: Still %d pending enrichments after %s", getPendingResolveCount(),
                   THREAD_SHUTDOWN_TIMEOUT.to_string().c_str());
    }
    {
        const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        devices.clear();
    }
    DBG_PRINT("BeaconWatcher::close: XXX");
}

bool BeaconWatcher::isListening() const noexcept {
    return source->isRunning();
}

bool BeaconWatcher::startListening() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_lifecycle); // RAII-style acquire and relinquish via destructor
    if( closed ) {
        WARN_PRINT("BeaconWatcher::startListening: Closed: %s", toString().c_str());
        return false;
    }
    if( sessionActive && source->isRunning() ) {
        DBG_PRINT("BeaconWatcher::startListening: Already listening: %s", toString().c_str());
        return true;
    }
    {
        const std::lock_guard<std::mutex> lock2(mtx_devices); // RAII-style acquire and relinquish via destructor
        sessionActive = true;
    }
    if( !source->start() ) {
        ERR_PRINT("BeaconWatcher::startListening: Could not start %s", source->toString().c_str());
        endSession(false);
        return false;
    }
    WORDY_PRINT("BeaconWatcher::startListening: %s", toString().c_str());
    sendStartedListening();
    return true;
}

void BeaconWatcher::stopListening() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_lifecycle); // RAII-style acquire and relinquish via destructor
    if( !sessionActive ) {
        DBG_PRINT("BeaconWatcher::stopListening: Not listening: %s", toString().c_str());
        return;
    }
    const size_type removed = endSession(true);
    WORDY_PRINT("BeaconWatcher::stopListening: Removed %zu devices, stopping %s", (size_t)removed, source->toString().c_str());
    // stoppedListening is published via SourceListener::sourceStopped()
    source->stop();
}

BeaconWatcher::size_type BeaconWatcher::endSession(const bool clearDevices) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
    sessionActive = false;
    ++sessionGeneration;
    if( !clearDevices ) {
        return 0;
    }
    const size_type count = static_cast<size_type>( devices.size() );
    devices.clear();
    return count;
}

void BeaconWatcher::sourceHalted() noexcept {
    const std::lock_guard<std::recursive_mutex> lock(mtx_lifecycle); // RAII-style acquire and relinquish via destructor
    // Discovered devices are kept on an external halt until they time out.
    endSession(false);
    WORDY_PRINT("BeaconWatcher::sourceHalted: %s", toString().c_str());
    sendStoppedListening();
}

jau::fraction_i64 BeaconWatcher::getHeartbeatTimeout() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
    return heartbeatTimeout;
}

void BeaconWatcher::setHeartbeatTimeout(const jau::fraction_i64& v) {
    if( v <= 0_s ) {
        throw jau::IllegalArgumentException("Heartbeat timeout must be positive: "+v.to_string(), E_FILE_LINE);
    }
    const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
    heartbeatTimeout = v;
}

BeaconWatcher::size_type BeaconWatcher::evictTimedOutDevices() noexcept {
    device_list_t evicted;
    {
        const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        const uint64_t now = jau::getCurrentMilliseconds();
        const uint64_t timeout_ms = static_cast<uint64_t>( heartbeatTimeout.to_ms() );
        if( now <= timeout_ms ) {
            return 0;
        }
        const uint64_t threshold = now - timeout_ms;
        for(auto it = devices.begin(); it != devices.end(); ) {
            if( it->second->broadcastTime < threshold ) {
                evicted.push_back( it->second );
                it = devices.erase(it);
            } else {
                ++it;
            }
        }
    }
    for(const BeaconDeviceRef& d : evicted) {
        COND_PRINT(env.DEBUG_EVENT, "BeaconWatcher::evict: %s", d->toString().c_str());
        sendDeviceTimeout(d);
    }
    return evicted.size();
}

BeaconWatcher::device_list_t BeaconWatcher::getDiscoveredDevices() noexcept {
    evictTimedOutDevices();
    const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
    device_list_t res( static_cast<size_type>( devices.size() ) );
    for(const auto& p : devices) {
        res.push_back( p.second );
    }
    return res;
}

BeaconWatcher::size_type BeaconWatcher::getDiscoveredDeviceCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
    return static_cast<size_type>( devices.size() );
}

BeaconDeviceRef BeaconWatcher::findDiscoveredDevice(const std::string& deviceID) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
    auto it = devices.find(deviceID);
    if( devices.end() == it ) {
        return nullptr;
    }
    return it->second;
}

void BeaconWatcher::ingest(const AdvertisementReport& report) noexcept {
    {
        // in flight from here on, close() waits for it
        const std::lock_guard<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
        if( closed ) {
            return;
        }
        ++pendingResolves;
    }
    const PendingScope pendingScope(this);
    COND_PRINT(env.DEBUG_EVENT, "BeaconWatcher::ingest: %s", report.toString().c_str());
    evictTimedOutDevices();

    uint64_t generation = 0;
    bool active;
    {
        const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        active = sessionActive;
        if( active ) {
            generation = sessionGeneration;
        }
    }
    if( !active ) {
        DBG_PRINT("BeaconWatcher::ingest: Not listening, dropped %s", report.toString().c_str());
        pendingResolveDone();
        return;
    }
    try {
        std::thread bg(&BeaconWatcher::resolveWork, this, report, generation); // @suppress("Invalid arguments")
        bg.detach();
    } catch (std::system_error &e) {
        ERR_PRINT("BeaconWatcher::ingest: Could not start enrichment of %s: %s", report.toString().c_str(), e.what());
        pendingResolveDone();
    }
}

void BeaconWatcher::resolveWork(const AdvertisementReport report, const uint64_t generation) noexcept {
    const PendingScope pendingScope(this);
    DeviceInfoRef info;
    try {
        info = resolver->resolve(report.address);
    } catch (std::exception &e) {
        WARN_PRINT("BeaconWatcher::resolve: %s failed for %s: Caught exception %s",
                resolver->toString().c_str(), report.toString().c_str(), e.what());
        info = nullptr;
    }
    if( nullptr == info ) {
        DBG_PRINT("BeaconWatcher::resolve: Unresolved, dropped %s", report.toString().c_str());
    } else {
        BeaconDeviceRef device = std::make_shared<const BeaconDevice>(info->deviceID, report.address, info->name,
                                                                      report.rssi, report.timestamp,
                                                                      info->connected, info->canPair, info->paired);
        const DeviceChange changes = apply(device, generation);
        if( DeviceChange::NONE != changes ) {
            COND_PRINT(env.DEBUG_EVENT, "BeaconWatcher::resolve: %s: %s", to_string(changes).c_str(), device->toString().c_str());
            sendDeviceObserved(device, changes);
            if( is_set(changes, DeviceChange::NAME) ) {
                sendDeviceNameChanged(device);
            }
            if( is_set(changes, DeviceChange::NEW) ) {
                sendNewDeviceDiscovered(device);
            }
        }
    }
    pendingResolveDone();
}

DeviceChange BeaconWatcher::apply(const BeaconDeviceRef& device, const uint64_t generation) noexcept {
    BeaconDeviceRef previous;
    {
        const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        if( !sessionActive || generation != sessionGeneration ) {
            DBG_PRINT("BeaconWatcher::apply: Session %" PRIu64 " ended (now %" PRIu64 "), dropped %s",
                    generation, sessionGeneration, device->toString().c_str());
            return DeviceChange::NONE;
        }
        auto it = devices.find(device->deviceID);
        if( devices.end() == it ) {
            devices.emplace(device->deviceID, device);
        } else {
            previous = it->second;
            it->second = device;
        }
    }
    return BeaconDevice::classify(previous.get(), *device);
}

void BeaconWatcher::pendingResolveDone() noexcept {
    // notify while locked, a waiting close() may destroy this instance right after
    const std::lock_guard<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
    --pendingResolves;
    cv_pending.notify_all();
}

int BeaconWatcher::getPendingResolveCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
    return pendingResolves;
}

bool BeaconWatcher::waitForPendingResolves(const jau::fraction_i64& timeout) noexcept {
    return waitForPendingResolvesImpl(timeout, ownPendingCount(this));
}

bool BeaconWatcher::waitForPendingResolvesImpl(const jau::fraction_i64& timeout, const int ownPending) noexcept {
    std::unique_lock<std::mutex> lock(mtx_pending); // RAII-style acquire and relinquish via destructor
    const jau::fraction_timespec timeout_time = jau::getMonotonicTime() + jau::fraction_timespec(timeout);
    while( ownPending < pendingResolves ) {
        std::cv_status s = jau::wait_until(cv_pending, lock, timeout_time);
        if( std::cv_status::timeout == s && ownPending < pendingResolves ) {
            return false;
        }
    }
    return true;
}

bool BeaconWatcher::addStatusListener(const BeaconWatchListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("BeaconWatchListener ref is null");
        return false;
    }
    return statusListenerList.push_back_unique(l, statusListenerRefEqComparator);
}

bool BeaconWatcher::removeStatusListener(const BeaconWatchListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("BeaconWatchListener ref is null");
        return false;
    }
    const size_type count = statusListenerList.erase_matching(l, false /* all_matching */, statusListenerRefEqComparator);
    return count > 0;
}

bool BeaconWatcher::removeStatusListener(const BeaconWatchListener * l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("BeaconWatchListener ref is null");
        return false;
    }
    auto it = statusListenerList.begin(); // lock mutex and copy_store
    for (; !it.is_end(); ++it ) {
        if ( **it == *l ) {
            it.erase();
            it.write_back();
            return true;
        }
    }
    return false;
}

BeaconWatcher::size_type BeaconWatcher::removeAllStatusListener() noexcept {
    const size_type count = statusListenerList.size();
    statusListenerList.clear();
    return count;
}

void BeaconWatcher::sendStartedListening() noexcept {
    int i=0;
    jau::for_each_fidelity(statusListenerList, [&](BeaconWatchListenerRef &l) {
        try {
            l->startedListening(*this);
        } catch (std::exception &e) {
            ERR_PRINT("BeaconWatcher::sendStartedListening-CBs %d/%zd: %s: Caught exception %s",
                    i+1, (size_t)statusListenerList.size(),
                    l->toString().c_str(), e.what());
        }
        i++;
    });
}

void BeaconWatcher::sendStoppedListening() noexcept {
    int i=0;
    jau::for_each_fidelity(statusListenerList, [&](BeaconWatchListenerRef &l) {
        try {
            l->stoppedListening(*this);
        } catch (std::exception &e) {
            ERR_PRINT("BeaconWatcher::sendStoppedListening-CBs %d/%zd: %s: Caught exception %s",
                    i+1, (size_t)statusListenerList.size(),
                    l->toString().c_str(), e.what());
        }
        i++;
    });
}

void BeaconWatcher::sendDeviceObserved(const BeaconDeviceRef& device, const DeviceChange changes) noexcept {
    int i=0;
    jau::for_each_fidelity(statusListenerList, [&](BeaconWatchListenerRef &l) {
        try {
            l->deviceObserved(device, changes);
        } catch (std::exception &e) {
            ERR_PRINT("BeaconWatcher::sendDeviceObserved-CBs %d/%zd: %s of %s: Caught exception %s",
                    i+1, (size_t)statusListenerList.size(),
                    l->toString().c_str(), device->toString().c_str(), e.what());
        }
        i++;
    });
}

void BeaconWatcher::sendDeviceNameChanged(const BeaconDeviceRef& device) noexcept {
    int i=0;
    jau::for_each_fidelity(statusListenerList, [&](BeaconWatchListenerRef &l) {
        try {
            l->deviceNameChanged(device);
        } catch (std::exception &e) {
            ERR_PRINT("BeaconWatcher::sendDeviceNameChanged-CBs %d/%zd: %s of %s: Caught exception %s",
                    i+1, (size_t)statusListenerList.size(),
                    l->toString().c_str(), device->toString().c_str(), e.what());
        }
        i++;
    });
}

void BeaconWatcher::sendNewDeviceDiscovered(const BeaconDeviceRef& device) noexcept {
    int i=0;
    jau::for_each_fidelity(statusListenerList, [&](BeaconWatchListenerRef &l) {
        try {
            l->newDeviceDiscovered(device);
        } catch (std::exception &e) {
            ERR_PRINT("BeaconWatcher::sendNewDeviceDiscovered-CBs %d/%zd: %s of %s: Caught exception %s",
                    i+1, (size_t)statusListenerList.size(),
                    l->toString().c_str(), device->toString().c_str(), e.what());
        }
        i++;
    });
}

void BeaconWatcher::sendDeviceTimeout(const BeaconDeviceRef& device) noexcept {
    int i=0;
    jau::for_each_fidelity(statusListenerList, [&](BeaconWatchListenerRef &l) {
        try {
            l->deviceTimeout(device);
        } catch (std::exception &e) {
            ERR_PRINT("BeaconWatcher::sendDeviceTimeout-CBs %d/%zd: %s of %s: Caught exception %s",
                    i+1, (size_t)statusListenerList.size(),
                    l->toString().c_str(), device->toString().c_str(), e.what());
        }
        i++;
    });
}

void BeaconWatcher::printDeviceList() noexcept {
    device_list_t list;
    {
        const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        for(const auto& p : devices) { list.push_back(p.second); }
    }
    const size_t sz = list.size();
    jau::PLAIN_PRINT(true, "- BeaconWatcher::DiscoveredDevices : %zu elements", sz);
    int idx = 0;
    for(const BeaconDeviceRef& d : list) {
        jau::PLAIN_PRINT(true, "  - %d / %zu: %s", (idx+1), sz, d->toDetailString().c_str());
        ++idx;
    }
    auto begin = statusListenerList.begin(); // lock mutex and copy_store
    jau::PLAIN_PRINT(true, "- BeaconWatcher::StatusListener    : %zu elements", (size_t)begin.size());
    for(int ii=0; !begin.is_end(); ++ii, ++begin ) {
        jau::PLAIN_PRINT(true, "  - %d / %zu: %p, %s", (ii+1), (size_t)begin.size(), begin->get(), (*begin)->toString().c_str());
    }
}

std::string BeaconWatcher::toString(bool includeDiscoveredDevices) const noexcept {
    device_list_t list;
    jau::fraction_i64 hb;
    {
        const std::lock_guard<std::mutex> lock(mtx_devices); // RAII-style acquire and relinquish via destructor
        for(const auto& p : devices) { list.push_back(p.second); }
        hb = heartbeatTimeout;
    }
    std::string out("BeaconWatcher[listening "+std::to_string(isListening())+", closed "+std::to_string(closed)+
                    ", heartbeat "+hb.to_string()+", devices "+std::to_string(list.size())+
                    ", pending "+std::to_string(getPendingResolveCount())+
                    ", "+source->toString()+", "+resolver->toString()+"]");
    if( includeDiscoveredDevices && list.size() > 0 ) {
        out.append("\n");
        for(const BeaconDeviceRef& d : list) {
            out.append("  ").append(d->toString()).append("\n");
        }
    }
    return out;
}
