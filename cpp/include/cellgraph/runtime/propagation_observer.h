#ifndef CELLGRAPH_PROPAGATION_OBSERVER_H
#define CELLGRAPH_PROPAGATION_OBSERVER_H

#include <cellgraph/cellgraph_base.h>

namespace cellgraph {

    /**
     * Receives the life-cycle events of a propagation. An observer is attached explicitly to the cells and
     * algorithms it is interested in, there is no process-wide registration.
     *
     * The after hooks are called from guard destructors, including while an exception unwinds, so they must
     * not throw.
     */
    struct PropagationLifeCycleObserver {
        using ptr = PropagationLifeCycleObserver*;

        virtual ~PropagationLifeCycleObserver() = default;

        virtual void on_before_notify(std::string_view /*label*/) {
        };

        virtual void on_after_notify(std::string_view /*label*/) noexcept {
        };

        virtual void on_before_update(const Algorithm &) {
        };

        virtual void on_after_update(const Algorithm &) noexcept {
        };
    };

    /**
     * Brackets a notification pass with on_before_notify / on_after_notify, tolerates a null observer.
     * The label is copied, the notifying cell may be destroyed by one of its observers before the pass ends.
     */
    struct NotifyGuard {
        NotifyGuard(PropagationLifeCycleObserver::ptr observer, std::string_view label)
            : _observer{observer}, _label{observer ? std::string{label} : std::string{}} {
            if (_observer) { _observer->on_before_notify(_label); }
        }

        ~NotifyGuard() {
            if (_observer) { _observer->on_after_notify(_label); }
        }

        NotifyGuard(const NotifyGuard &) = delete;

        NotifyGuard &operator=(const NotifyGuard &) = delete;

    private:
        PropagationLifeCycleObserver::ptr _observer;
        std::string _label;
    };

} // namespace cellgraph

#endif  // CELLGRAPH_PROPAGATION_OBSERVER_H
