#include <cellgraph/types/variable.h>

#include <algorithm>
#include <exception>

namespace cellgraph {

    VariableBase::~VariableBase() {
        // Detach from the Variables we track, their observer lists outlive us.
        for (auto &link : _sources) {
            try {
                link.source->blocked().unobserve(link.blocked_handle);
                link.source->unobserve_change(link.value_handle);
            } catch (const std::exception &e) {
                fmt::print(stderr, "Warning: exception while detaching a destroyed Variable: {}\n", e.what());
            }
            link.source->remove_tracker(this);
        }
        // Our own observer lists die with us, the trackers only need to forget the relationship.
        for (auto *tracker : _trackers) {
            tracker->forget_source(this);
        }
    }

    void VariableBase::block() {
        if (!is_blocked()) {
            capture_pending();
            _blocked.set(true);
        }
    }

    void VariableBase::unblock() {
        if (is_blocked()) {
            std::weak_ptr<const bool> alive{_alive};
            flush_pending();
            // An observer of the flushed value may have destroyed this Variable.
            if (alive.expired()) { return; }
            _blocked.set(false);
        }
    }

    void VariableBase::set_blocked(bool blocked) {
        if (blocked) {
            block();
        } else {
            unblock();
        }
    }

    CoalescingScope VariableBase::updates_coalesced() { return CoalescingScope{*this}; }

    void VariableBase::untrack(VariableBase &source) {
        auto it = std::find_if(_sources.begin(), _sources.end(),
                               [&source](const TrackedSource &link) { return link.source == &source; });
        if (it == _sources.end()) {
            throw_error<subscriber_not_found>("Variable {} does not track Variable {}", fmt::ptr(this),
                                              fmt::ptr(&source));
        }
        auto link = std::move(*it);
        _sources.erase(it);
        source.remove_tracker(this);
        source.blocked().unobserve(link.blocked_handle);
        source.unobserve_change(link.value_handle);
        _blocked.set(false);
    }

    bool VariableBase::is_tracking(const VariableBase &source) const noexcept {
        return std::any_of(_sources.begin(), _sources.end(),
                           [&source](const TrackedSource &link) { return link.source == &source; });
    }

    void VariableBase::attach_source(VariableBase &source, blocked_type::observer_ptr blocked_handle,
                                     change_handle value_handle) {
        _sources.push_back(TrackedSource{&source, std::move(blocked_handle), std::move(value_handle)});
        source._trackers.push_back(this);
    }

    void VariableBase::remove_tracker(const VariableBase *tracker) noexcept {
        auto it = std::find(_trackers.begin(), _trackers.end(), tracker);
        if (it != _trackers.end()) { _trackers.erase(it); }
    }

    void VariableBase::forget_source(const VariableBase *source) noexcept {
        std::erase_if(_sources, [source](const TrackedSource &link) { return link.source == source; });
    }

    CoalescingScope::CoalescingScope(VariableBase &variable)
        : _variable{variable}, _uncaught_on_entry{std::uncaught_exceptions()} {
        _variable.block();
    }

    CoalescingScope::~CoalescingScope() noexcept(false) {
        if (std::uncaught_exceptions() == _uncaught_on_entry) {
            _variable.unblock();
            return;
        }
        // Unwinding: a second exception would terminate, report it and let the first one propagate.
        try {
            _variable.unblock();
        } catch (const std::exception &e) {
            fmt::print(stderr, "Warning: exception while unblocking during unwinding: {}\n", e.what());
        }
    }
} // namespace cellgraph
