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

#ifndef BW_ADVERTISEMENT_SOURCE_HPP_
#define BW_ADVERTISEMENT_SOURCE_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/eui48.hpp>
#include <jau/cow_darray.hpp>

namespace beacon_watch {

    /** \addtogroup BWUserAPI
     *
     *  @{
     */

    /**
     * One raw advertisement as received by the radio.
     */
    struct AdvertisementReport {
        /** The advertising device's radio address */
        jau::EUI48 address;
        /** Timestamp in monotonic milliseconds when the advertisement was received, see jau::getCurrentMilliseconds(). */
        uint64_t timestamp;
        /** Raw signal strength in dB */
        int16_t rssi;

        std::string toString() const noexcept;
    };

    class AdvertisementSource; // forward

    /**
     * AdvertisementSource listener for raw advertisements and the source's halt.
     * <p>
     * Methods are called from the source's delivery thread,
     * possibly concurrently for different advertisements.
     * User implementations shall return as early as possible.
     * </p>
     */
    class AdvertisementListener {
        public:
            /**
             * A raw advertisement has been received.
             * @param source the emitting source
             * @param report the advertisement
             */
            virtual void advertisementReceived(AdvertisementSource& source, const AdvertisementReport& report) {
                (void)source;
                (void)report;
            }

            /**
             * The source has halted for any reason,
             * i.e. either via AdvertisementSource::stop() or caused externally, e.g. radio disabled.
             * @param source the halted source
             */
            virtual void sourceStopped(AdvertisementSource& source) {
                (void)source;
            }

            virtual ~AdvertisementListener() noexcept = default;

            virtual std::string toString() const noexcept;

            /**
             * Default comparison operator, merely testing for same memory reference.
             */
            virtual bool operator==(const AdvertisementListener& rhs) const noexcept
            { return this == &rhs; }

            bool operator!=(const AdvertisementListener& rhs) const noexcept
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<AdvertisementListener> AdvertisementListenerRef;

    /**
     * Push source of raw advertisements, representing the radio stack.
     * <p>
     * This base class manages the unique set of AdvertisementListener
     * and delivers events to them via sendAdvertisement() and sendStopped().
     * </p>
     * <p>
     * Implementations shall
     * - call sendStopped() exactly once per running to stopped transition, regardless of its cause
     * - call sendAdvertisement() only while running
     * </p>
     */
    class AdvertisementSource {
        public:
            typedef jau::nsize_t size_type;

        private:
            typedef jau::cow_darray<AdvertisementListenerRef, size_type> listenerList_t;
            static listenerList_t::equal_comparator listenerRefEqComparator;
            listenerList_t listenerList;

        protected:
            /** Delivers the given advertisement to all listener. */
            void sendAdvertisement(const AdvertisementReport& report) noexcept;

            /** Delivers the halt of this source to all listener. */
            void sendStopped() noexcept;

        public:
            AdvertisementSource() noexcept = default;

            AdvertisementSource(const AdvertisementSource&) = delete;
            void operator=(const AdvertisementSource&) = delete;

            virtual ~AdvertisementSource() noexcept;

            /**
             * Starts receiving advertisements, if not running already.
             * @return true if running
             */
            virtual bool start() noexcept = 0;

            /**
             * Stops receiving advertisements, if running.
             * <p>
             * Listener are notified via AdvertisementListener::sourceStopped()
             * on the calling thread before this method returns.
             * </p>
             */
            virtual void stop() noexcept = 0;

            virtual bool isRunning() const noexcept = 0;

            /**
             * Add the given listener to the list if not already present.
             * @return true if added, false if already present or null
             */
            bool addListener(const AdvertisementListenerRef& l) noexcept;

            /**
             * Remove the given listener from the list.
             * @return true if removed
             */
            bool removeListener(const AdvertisementListenerRef& l) noexcept;

            /**
             * Remove the given listener from the list.
             * @return true if removed
             */
            bool removeListener(const AdvertisementListener * l) noexcept;

            /** Remove all listener, returns number of removed listener. */
            size_type removeAllListener() noexcept;

            size_type getListenerCount() const noexcept { return listenerList.size(); }

            virtual std::string toString() const noexcept = 0;
    };
    typedef std::shared_ptr<AdvertisementSource> AdvertisementSourceRef;

    /**@}*/

} // namespace beacon_watch

#endif /* BW_ADVERTISEMENT_SOURCE_HPP_ */
