/**
* @file observability.cpp
 * @brief Mutex-protected Observer that counts events and logs via spdlog.
 */
#include "strata/obs/observability.hpp"
#include "strata/obs/log.hpp"
#include <memory>
#include <mutex>

namespace strata::obs {

    class LoggingObserver : public Observer {
    public:
        void on_packet(const core::Packet& p) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.packets++;
            // const view: never forces decoding of a lazy packet
            if (const auto* err = p.error_layer()) {
                ctr_.decode_failures++;
                logger()->debug("packet #{} partially decoded: {}", ctr_.packets, err->error().what());
            } else {
                logger()->trace("packet #{}: {} bytes, {} layer(s) decoded",
                                ctr_.packets, p.data().size(), p.layers().size());
            }
        }
        void on_source_error(const source::SourceError& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.source_errors++;
            logger()->debug("source error {}: {}", source::to_string(e.code), e.message);
        }
        void on_end_of_stream() override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.end_of_stream++;
            logger()->debug("end of stream after {} packet(s)", ctr_.packets);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_logging_observer() {
        static LoggingObserver obs; // process-wide singleton
        return &obs;
    }

    std::unique_ptr<Observer> make_counting_observer() {
        return std::make_unique<LoggingObserver>();
    }

} // namespace strata::obs
