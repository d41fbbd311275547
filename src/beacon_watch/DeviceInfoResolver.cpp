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

#include <thread>
#include <chrono>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "DeviceInfoResolver.hpp"

using namespace beacon_watch;
using namespace jau::fractions_i64_literals;

std::string DeviceInfo::toString() const noexcept {
    return "DeviceInfo[id '"+deviceID+"', "+address.toString()+", name['"+name+
           "'], connected "+std::to_string(connected)+", pairing[can "+std::to_string(canPair)+
           ", paired "+std::to_string(paired)+"]]";
}

std::string DeviceInfoResolver::makeDeviceID(const jau::EUI48& address) noexcept {
    return "BluetoothLE#"+address.toString();
}

StaticDeviceInfoResolver::StaticDeviceInfoResolver() noexcept
: latency( 0_s ), resolveCount( 0 )
{ }

StaticDeviceInfoResolver::~StaticDeviceInfoResolver() noexcept {
    clear();
}

void StaticDeviceInfoResolver::put(const DeviceInfoRef& info) noexcept {
    if( nullptr == info ) {
        ERR_PRINT("DeviceInfo ref is null");
        return;
    }
    const std::lock_guard<std::mutex> lock(mtx_table); // RAII-style acquire and relinquish via destructor
    table[ to_uint64(info->address) ] = info;
}

void StaticDeviceInfoResolver::put(const jau::EUI48& address, const std::string& name,
                                   const bool connected, const bool canPair, const bool paired) noexcept {
    put( std::make_shared<DeviceInfo>(makeDeviceID(address), address, name, connected, canPair, paired) );
}

bool StaticDeviceInfoResolver::rename(const jau::EUI48& address, const std::string& name) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_table); // RAII-style acquire and relinquish via destructor
    auto it = table.find( to_uint64(address) );
    if( table.end() == it ) {
        return false;
    }
    const DeviceInfoRef old = it->second;
    it->second = std::make_shared<DeviceInfo>(old->deviceID, old->address, name, old->connected, old->canPair, old->paired);
    return true;
}

bool StaticDeviceInfoResolver::remove(const jau::EUI48& address) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_table); // RAII-style acquire and relinquish via destructor
    return 0 < table.erase( to_uint64(address) );
}

void StaticDeviceInfoResolver::clear() noexcept {
    {
        const std::lock_guard<std::mutex> lock(mtx_table); // RAII-style acquire and relinquish via destructor
        table.clear();
        pending.clear();
    }
    cv_pending.notify_all();
}

void StaticDeviceInfoResolver::setLatency(const jau::fraction_i64& v) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_table); // RAII-style acquire and relinquish via destructor
    latency = v;
}

jau::fraction_i64 StaticDeviceInfoResolver::getLatency() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_table); // RAII-style acquire and relinquish via destructor
    return latency;
}

void StaticDeviceInfoResolver::setPending(const jau::EUI48& address) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_table); // RAII-style acquire and relinquish via destructor
    pending.insert( to_uint64(address) );
}

void StaticDeviceInfoResolver::releasePending(const jau::EUI48& address) noexcept {
    {
        const std::lock_guard<std::mutex> lock(mtx_table); // RAII-style acquire and relinquish via destructor
        pending.erase( to_uint64(address) );
    }
    cv_pending.notify_all();
}

size_t StaticDeviceInfoResolver::size() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_table); // RAII-style acquire and relinquish via destructor
    return table.size();
}

DeviceInfoRef StaticDeviceInfoResolver::resolve(const jau::EUI48& address) {
    const uint64_t key = to_uint64(address);
    resolveCount++;

    const int64_t delay_ms = getLatency().to_ms();
    if( 0 < delay_ms ) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
    std::unique_lock<std::mutex> lock(mtx_table); // RAII-style acquire and relinquish via destructor
    if( pending.end() != pending.find(key) ) {
        DBG_PRINT("StaticDeviceInfoResolver::resolve: %s pending ...", address.toString().c_str());
        cv_pending.wait(lock, [&]{ return pending.end() == pending.find(key); });
        DBG_PRINT("StaticDeviceInfoResolver::resolve: %s released", address.toString().c_str());
    }
    auto it = table.find(key);
    if( table.end() == it ) {
        return nullptr;
    }
    return it->second;
}

std::string StaticDeviceInfoResolver::toString() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_table); // RAII-style acquire and relinquish via destructor
    return "StaticDeviceInfoResolver[entries "+std::to_string(table.size())+", pending "+std::to_string(pending.size())+
           ", latency "+std::to_string(latency.to_ms())+" ms, resolved "+std::to_string(getResolveCount())+"]";
}
