#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: view lifecycle events + counters.
 * @details Pins, releases and safety diagnostics are reported here. The simple
 *          sink prints JSON-ish lines; swap in a structured logger by
 *          implementing Observer.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace pinview::obs {

    /** @enum EventKind
     *  @brief What happened to a view.
     */
    enum class EventKind : std::uint8_t {
        Pin,                ///< View built, storage pinned
        Unpin,              ///< Synchronous release
        DeferredUnpin,      ///< Release executed by a deferred job
        UseAfterRelease,    ///< Checked access through an invalidated token
        Leak,               ///< Handle destroyed while still Active
        ExtractionFallback, ///< Backing storage uninterpretable, empty view produced
        Failure             ///< Unpin or scheduling failed; see detail
    };

    /// @brief Stable name for an EventKind ("pin", "unpin", ...).
    const char* to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Process-level counters for view lifecycles.
     */
    struct Counters {
        uint64_t pins{0};                 ///< Views built over pinned storage
        uint64_t unpins{0};               ///< Pins released (sync + deferred)
        uint64_t deferred_releases{0};    ///< Pins released by deferred jobs
        uint64_t use_after_release{0};    ///< Rejected checked accesses
        uint64_t leaks{0};                ///< Handles destroyed without release
        uint64_t extraction_fallbacks{0}; ///< Empty views produced by fallback
        uint64_t failures{0};             ///< Unpin/schedule failures
    };

    /** @struct ViewEvent
     *  @brief Payload describing a single lifecycle event.
     */
    struct ViewEvent {
        EventKind   kind{EventKind::Pin}; ///< Event type
        uint64_t    view_id{0};           ///< Builder-assigned id (0 if unknown)
        std::size_t elements{0};          ///< Element count of the view
        std::size_t bytes{0};             ///< Byte length of the view
        std::string detail;               ///< Reason label (for humans/logs)
    };

    /** @class Observer
     *  @brief Observability sink interface. Implementations must be thread-safe:
     *         deferred releases report from job workers.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single event.
        virtual void record(const ViewEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide sink that counts and prints one line per event.
    Observer* make_simple_observer();

    /// Process-wide sink that only counts.
    Observer* make_quiet_observer();

    /// Fresh, independently owned counting sink (one per test/fixture).
    std::unique_ptr<Observer> make_counting_observer();

} // namespace pinview::obs
