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

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>
#include <jau/basic_algos.hpp>

#include "AdvertisementSource.hpp"

using namespace beacon_watch;

std::string AdvertisementReport::toString() const noexcept {
    return "AdvReport["+address.toString()+", rssi "+std::to_string(rssi)+", ts "+std::to_string(timestamp)+"]";
}

std::string AdvertisementListener::toString() const noexcept {
    return "AdvertisementListener["+jau::to_hexstring(this)+"]";
}

AdvertisementSource::listenerList_t::equal_comparator AdvertisementSource::listenerRefEqComparator =
        [](const AdvertisementListenerRef &a, const AdvertisementListenerRef &b) -> bool { return *a == *b; };

AdvertisementSource::~AdvertisementSource() noexcept {
    listenerList.clear();
}

bool AdvertisementSource::addListener(const AdvertisementListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("AdvertisementListener ref is null");
        return false;
    }
    return listenerList.push_back_unique(l, listenerRefEqComparator);
}

bool AdvertisementSource::removeListener(const AdvertisementListenerRef& l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("AdvertisementListener ref is null");
        return false;
    }
    const size_type count = listenerList.erase_matching(l, false /* all_matching */, listenerRefEqComparator);
    return count > 0;
}

bool AdvertisementSource::removeListener(const AdvertisementListener * l) noexcept {
    if( nullptr == l ) {
        ERR_PRINT("AdvertisementListener ref is null");
        return false;
    }
    auto it = listenerList.begin(); // lock mutex and copy_store
    for (; !it.is_end(); ++it ) {
        if ( **it == *l ) {
            it.erase();
            it.write_back();
            return true;
        }
    }
    return false;
}

AdvertisementSource::size_type AdvertisementSource::removeAllListener() noexcept {
    const size_type count = listenerList.size();
    listenerList.clear();
    return count;
}

void AdvertisementSource::sendAdvertisement(const AdvertisementReport& report) noexcept {
    int i=0;
    jau::for_each_fidelity(listenerList, [&](AdvertisementListenerRef &l) {
        try {
            l->advertisementReceived(*this, report);
        } catch (std::exception &e) {
            ERR_PRINT("AdvertisementSource::sendAdvertisement-CBs %d/%zd: %s of %s: Caught exception %s",
                    i+1, (size_t)listenerList.size(),
                    l->toString().c_str(), report.toString().c_str(), e.what());
        }
        i++;
    });
}

void AdvertisementSource::sendStopped() noexcept {
    int i=0;
    jau::for_each_fidelity(listenerList, [&](AdvertisementListenerRef &l) {
        try {
            l->sourceStopped(*this);
        } catch (std::exception &e) {
            ERR_PRINT("AdvertisementSource::sendStopped-CBs %d/%zd: %s: Caught exception %s",
                    i+1, (size_t)listenerList.size(),
                    l->toString().c_str(), e.what());
        }
        i++;
    });
}
