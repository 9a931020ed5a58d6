#pragma once
/**
 * @file view_builder.hpp
 * @brief Entry points that pin managed storage and describe it as an unmanaged view.
 *
 * Every entry point is the same operation, pin_and_describe(), with a
 * different storage source:
 *   - ArraySource: the array itself, count = its length
 *   - SequenceSource: the sequence's current backing array via
 *                     mem::get_backing_storage, count = its logical size
 *
 * Checks, in order: absent container (NullInput), element size mismatch on the
 * _as variants (TypeSizeMismatch), storage extraction (sequences only), pin. None
 * copy data.
 *
 * The builder owns the PinRegistry its handles release through; it must
 * outlive every handle it produced and every deferred release still queued.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>

#include "pinview/config/config_loader.hpp"
#include "pinview/error.hpp"
#include "pinview/gc/heap.hpp"
#include "pinview/gc/managed_array.hpp"
#include "pinview/gc/managed_list.hpp"
#include "pinview/jobs/job_system.hpp"
#include "pinview/mem/backing_storage.hpp"
#include "pinview/mem/pin_registry.hpp"
#include "pinview/obs/observability.hpp"
#include "pinview/safety/safety_token.hpp"
#include "pinview/view/view_descriptor.hpp"
#include "pinview/view/view_handle.hpp"

namespace pinview::view {

/// @brief A built view: the descriptor workers read plus the handle that releases it.
template <class T>
struct View {
    ViewDescriptor<T> descriptor;
    ViewHandle        handle;
};

class ViewBuilder final {
public:
    /**
     * @param heap     Heap whose objects are pinned.
     * @param jobs     Executor deferred releases are scheduled on.
     * @param cfg      Safety mode and extractor fallback.
     * @param observer Event sink; nullptr picks the process-wide sink
     *                 (printing if cfg.log_events).
     */
    ViewBuilder(gc::Heap& heap, jobs::JobSystem& jobs,
                config::RuntimeConfig cfg = config::Loader::defaults(),
                obs::Observer* observer = nullptr);

    ViewBuilder(const ViewBuilder&)            = delete;
    ViewBuilder& operator=(const ViewBuilder&) = delete;

    template <class T>
    [[nodiscard]] Expected<View<T>> from_array(const gc::ManagedArray<T>& array) {
        return from_array_as<T, T>(array);
    }

    /// @brief View of @p array's elements as T2. Requires sizeof(T1) == sizeof(T2).
    template <class T1, class T2>
    [[nodiscard]] Expected<View<T2>> from_array_as(const gc::ManagedArray<T1>& array) {
        if (array.is_null()) return fail(Error::NullInput);
        return pin_and_describe<T1, T2>(ArraySource<T1>{array});
    }

    template <class T>
    [[nodiscard]] Expected<View<T>> from_list(const gc::ManagedList<T>& list) {
        return from_list_as<T, T>(list);
    }

    /// @brief View of @p list's first size() elements as T2. The count is a snapshot.
    template <class T1, class T2>
    [[nodiscard]] Expected<View<T2>> from_list_as(const gc::ManagedList<T1>& list) {
        return from_sequence_as<T2>(list);
    }

    /// @brief View of any sequence that hands out its own backing storage.
    template <class T2, mem::ExposesBackingStorage Seq>
    [[nodiscard]] Expected<View<T2>> from_sequence_as(const Seq& seq) {
        if (seq.is_null()) return fail(Error::NullInput);
        return pin_and_describe<typename Seq::value_type, T2>(
            SequenceSource<Seq>{seq, cfg_.storage_fallback, observer_});
    }

    [[nodiscard]] config::SafetyMode safety_mode() const noexcept { return policy_->mode(); }
    [[nodiscard]] const config::RuntimeConfig& runtime_config() const noexcept { return cfg_; }
    [[nodiscard]] obs::Observer* observer() const noexcept { return observer_; }
    [[nodiscard]] const mem::PinRegistry& registry() const noexcept { return registry_; }

    /// Views built so far (including empty fallback views).
    [[nodiscard]] std::uint64_t views_built() const noexcept {
        return next_view_id_.load(std::memory_order_relaxed) - 1;
    }

private:
    template <class T>
    struct ArraySource {
        const gc::ManagedArray<T>& array;
        Expected<mem::Storage<T>> acquire() const { return mem::Storage<T>{array, array.length()}; }
    };

    template <class Seq>
    struct SequenceSource {
        const Seq&              seq;
        config::StorageFallback fallback;
        obs::Observer*          observer;
        Expected<mem::Storage<typename Seq::value_type>> acquire() const {
            return mem::get_backing_storage(seq, fallback, observer);
        }
    };

    template <class T1, class T2, class Source>
    Expected<View<T2>> pin_and_describe(const Source& source) {
        static_assert(std::is_trivially_copyable_v<T2>, "view element type must be trivially copyable");
        if (sizeof(T1) != sizeof(T2)) return fail(Error::TypeSizeMismatch);

        auto storage = source.acquire();
        if (!storage) return fail(storage.error());

        const std::uint64_t id = next_view_id_.fetch_add(1, std::memory_order_relaxed);
        safety::SafetyToken token = policy_->issue(id);

        if (storage->empty_fallback()) {
            ViewDescriptor<T2> desc(nullptr, 0, token);
            return View<T2>{std::move(desc), ViewHandle(ctx_, id, mem::PinEntry{}, std::move(token), 0, 0)};
        }

        auto pinned = registry_.pin(storage->array.root());
        if (!pinned) return fail(pinned.error());

        const std::size_t count = storage->size;
        T2* data = static_cast<T2*>(pinned->address);
        record_pin(id, count, count * sizeof(T2));

        ViewDescriptor<T2> desc(data, count, token);
        return View<T2>{std::move(desc),
                        ViewHandle(ctx_, id, std::move(pinned->entry), std::move(token),
                                   count, count * sizeof(T2))};
    }

    void record_pin(std::uint64_t id, std::size_t elements, std::size_t bytes);

    config::RuntimeConfig                 cfg_;
    obs::Observer*                        observer_;
    mem::PinRegistry                      registry_;
    std::unique_ptr<safety::SafetyPolicy> policy_;
    ViewContext                           ctx_;
    std::atomic<std::uint64_t>            next_view_id_{1};
};

} // namespace pinview::view
