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

#ifndef BW_TYPES_HPP_
#define BW_TYPES_HPP_

#include <cstdint>
#include <string>

#include <jau/eui48.hpp>

namespace beacon_watch {

    /** \addtogroup BWUserAPI
     *
     *  @{
     */

    /**
     * Returns the 48-bit radio address as an integer,
     * the most significant byte being the first octet of the EUI48 string representation.
     */
    uint64_t to_uint64(const jau::EUI48& address) noexcept;

    /**
     * Returns the EUI48 radio address of the lower 48 bits of the given integer.
     * <p>
     * The upper 16 bits are ignored.
     * </p>
     */
    jau::EUI48 to_EUI48(const uint64_t address) noexcept;

    /**
     * Returns true if the given device name is empty or consists of whitespace only.
     */
    bool isBlankName(const std::string& name) noexcept;

    /**
     * Bit mask of changes detected by ingesting one device observation,
     * determining the notifications to be sent.
     *
     * @see BeaconDevice::classify()
     */
    enum class DeviceChange : uint8_t {
        NONE     = 0,
        /** Device has been observed, always set for a successfully resolved advertisement. */
        OBSERVED = (1 << 0),
        /** Device was already known and advertised a different non-blank name. */
        NAME     = (1 << 1),
        /** Device was not known before. */
        NEW      = (1 << 2)
    };
    constexpr uint8_t number(const DeviceChange rhs) noexcept { return static_cast<uint8_t>(rhs); }

    constexpr DeviceChange operator |(const DeviceChange lhs, const DeviceChange rhs) noexcept {
        return static_cast<DeviceChange> ( number(lhs) | number(rhs) );
    }
    constexpr DeviceChange operator &(const DeviceChange lhs, const DeviceChange rhs) noexcept {
        return static_cast<DeviceChange> ( number(lhs) & number(rhs) );
    }
    constexpr bool operator ==(const DeviceChange lhs, const DeviceChange rhs) noexcept {
        return number(lhs) == number(rhs);
    }
    constexpr bool operator !=(const DeviceChange lhs, const DeviceChange rhs) noexcept {
        return !( lhs == rhs );
    }
    constexpr bool is_set(const DeviceChange mask, const DeviceChange bit) noexcept { return bit == ( mask & bit ); }
    constexpr void set(DeviceChange &mask, const DeviceChange bit) noexcept { mask = mask | bit; }
    std::string to_string(const DeviceChange mask) noexcept;

    /**@}*/

} // namespace beacon_watch

#endif /* BW_TYPES_HPP_ */
