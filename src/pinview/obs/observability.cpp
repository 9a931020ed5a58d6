/**
* @file observability.cpp
 * @brief Printf-backed and counting implementations of Observer.
 */
#include "pinview/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace pinview::obs {

    const char* to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::Pin:                return "pin";
            case EventKind::Unpin:              return "unpin";
            case EventKind::DeferredUnpin:      return "deferred_unpin";
            case EventKind::UseAfterRelease:    return "use_after_release";
            case EventKind::Leak:               return "leak";
            case EventKind::ExtractionFallback: return "extraction_fallback";
            case EventKind::Failure:            return "failure";
        }
        return "unknown";
    }

    class CountingObserver : public Observer {
    public:
        explicit CountingObserver(bool print) noexcept : print_(print) {}

        void record(const ViewEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            switch (e.kind) {
                case EventKind::Pin:                ctr_.pins++; break;
                case EventKind::Unpin:              ctr_.unpins++; break;
                case EventKind::DeferredUnpin:      ctr_.unpins++; ctr_.deferred_releases++; break;
                case EventKind::UseAfterRelease:    ctr_.use_after_release++; break;
                case EventKind::Leak:               ctr_.leaks++; break;
                case EventKind::ExtractionFallback: ctr_.extraction_fallbacks++; break;
                case EventKind::Failure:            ctr_.failures++; break;
            }
            if (!print_) return;
            // JSON-ish line (swap for structured logger later)
            std::printf(
              R"({"event":"%s","view_id":%llu,"elements":%zu,"bytes":%zu,"detail":"%s"})" "\n",
              to_string(e.kind), static_cast<unsigned long long>(e.view_id),
              e.elements, e.bytes, e.detail.c_str());
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        const bool print_;
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static CountingObserver obs(true); // process-wide singleton
        return &obs;
    }

    Observer* make_quiet_observer() {
        static CountingObserver obs(false); // process-wide singleton
        return &obs;
    }

    std::unique_ptr<Observer> make_counting_observer() {
        return std::make_unique<CountingObserver>(false);
    }

} // namespace pinview::obs
