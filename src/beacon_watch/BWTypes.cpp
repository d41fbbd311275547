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
#include <cctype>

#include "BWTypes.hpp"

using namespace beacon_watch;

template<typename T>
static void append_bitstr(std::string& out, T mask, T bit, const std::string& bitstr, bool& comma) {
    if( bit == ( mask & bit ) ) {
        if( comma ) { out.append(", "); }
        out.append(bitstr); comma = true;
    }
}
#define APPEND_BITSTR(U,V,M) append_bitstr(out, M, U::V, #V, comma);

uint64_t beacon_watch::to_uint64(const jau::EUI48& address) noexcept {
    // EUI48::b is stored in little endian, b[5] being the first octet
    uint64_t res = 0;
    for(int i=5; i>=0; --i) {
        res = ( res << 8 ) | address.b[i];
    }
    return res;
}

jau::EUI48 beacon_watch::to_EUI48(const uint64_t address) noexcept {
    jau::EUI48 res;
    uint64_t v = address;
    for(int i=0; i<6; ++i) {
        res.b[i] = static_cast<uint8_t>( v & 0xff );
        v >>= 8;
    }
    return res;
}

bool beacon_watch::isBlankName(const std::string& name) noexcept {
    for(const char c : name) {
        if( !std::isspace( static_cast<unsigned char>(c) ) ) {
            return false;
        }
    }
    return true;
}

#define DEVICECHANGE_ENUM(X,M) \
    X(DeviceChange,OBSERVED,M) \
    X(DeviceChange,NAME,M) \
    X(DeviceChange,NEW,M)

std::string beacon_watch::to_string(const DeviceChange mask) noexcept {
    std::string out("[");
    bool comma = false;
    DEVICECHANGE_ENUM(APPEND_BITSTR,mask)
    out.append("]");
    return out;
}
