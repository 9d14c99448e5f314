#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade for packet sources: events + counters.
 */

#include <cstdint>
#include <memory>

#include "strata/core/packet.hpp"
#include "strata/source/packet_data_source.hpp"

namespace strata::obs {

    /** @struct Counters
     *  @brief Cumulative counters for one observer.
     */
    struct Counters {
        uint64_t packets{0};          ///< Packets built from source data
        uint64_t decode_failures{0};  ///< Packets whose decoded part ended in a failure
        uint64_t source_errors{0};    ///< Source errors other than end-of-stream
        uint64_t end_of_stream{0};    ///< End-of-stream notifications

        friend bool operator==(const Counters&, const Counters&) = default;
    };

    /** @class Observer
     *  @brief Sink for PacketSource events. Called from the reading thread
     *         (the caller for next_packet(), the producer thread for packets()).
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// A packet was built. Lazy packets are reported before any decoding.
        virtual void on_packet(const core::Packet& p) = 0;
        /// The source reported an error other than end-of-stream.
        virtual void on_source_error(const source::SourceError& e) = 0;
        /// The source reported end-of-stream.
        virtual void on_end_of_stream() = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide observer that counts events and logs them through logger().
    Observer* make_logging_observer();

    /// Fresh counting/logging observer owned by the caller.
    std::unique_ptr<Observer> make_counting_observer();

} // namespace strata::obs
