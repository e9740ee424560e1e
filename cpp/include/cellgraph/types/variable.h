//
// Gated observable values, tracking and linking.
//

#ifndef CELLGRAPH_VARIABLE_H
#define CELLGRAPH_VARIABLE_H

#include <cellgraph/cellgraph_base.h>
#include <cellgraph/types/observable.h>

#include <typeinfo>
#include <utility>

namespace cellgraph {

    /**
     * The element-type independent part of a Variable: the observable blocked flag, block / unblock and the
     * bookkeeping of tracking relationships.
     *
     * While blocked, writes are buffered in a pending slot and observers are not notified. Unblocking pushes
     * the pending value through the normal change / notify path, then clears the blocked flag, so observers
     * see the value notification before the blocked=false notification.
     *
     * Tracking relationships are recorded on both ends. Destroying either end removes the subscriptions, so
     * a link never keeps a Variable alive and never leaves a dangling observer behind.
     */
    class CELLGRAPH_EXPORT VariableBase {
    public:
        using blocked_type = Observable<bool>;
        using change_handle = std::shared_ptr<void>;

        virtual ~VariableBase();

        VariableBase(const VariableBase &) = delete;

        VariableBase &operator=(const VariableBase &) = delete;

        [[nodiscard]] blocked_type &blocked() noexcept { return _blocked; }

        [[nodiscard]] const blocked_type &blocked() const noexcept { return _blocked; }

        [[nodiscard]] bool is_blocked() const noexcept { return _blocked.get().value_or(false); }

        /**
         * Capture the current value into the pending slot and raise the blocked flag. No-op when blocked.
         */
        void block();

        /**
         * Flush the pending value through the change / notify path and clear the blocked flag. No-op when not
         * blocked. If an observer of the flushed value destroys this Variable, the blocked flag is not touched.
         */
        void unblock();

        void set_blocked(bool blocked);

        /**
         * Block now and unblock when the returned scope is destroyed.
         */
        [[nodiscard]] CoalescingScope updates_coalesced();

        /**
         * Remove the subscriptions made by track(source) and force the blocked flag to false. The flag is
         * written directly, a pending value buffered while blocked is discarded.
         * @throws subscriber_not_found if this Variable does not track source
         */
        void untrack(VariableBase &source);

        [[nodiscard]] bool is_tracking(const VariableBase &source) const noexcept;

        [[nodiscard]] std::size_t tracked_source_count() const noexcept { return _sources.size(); }

        [[nodiscard]] std::size_t tracker_count() const noexcept { return _trackers.size(); }

        [[nodiscard]] virtual bool has_value() const = 0;

        [[nodiscard]] virtual const std::type_info &element_type() const noexcept = 0;

        [[nodiscard]] virtual std::string describe() const = 0;

        /**
         * Subscribe a callback that only needs to know the value changed, used where the element type is not
         * known (Algorithm inputs).
         */
        [[nodiscard]] virtual change_handle observe_change(std::function<void()> callback) = 0;

        virtual void unobserve_change(const change_handle &handle) = 0;

    protected:
        VariableBase() = default;

        virtual void capture_pending() = 0;

        virtual void flush_pending() = 0;

        void attach_source(VariableBase &source, blocked_type::observer_ptr blocked_handle, change_handle value_handle);

    private:
        struct TrackedSource {
            VariableBase *source;
            blocked_type::observer_ptr blocked_handle;
            change_handle value_handle;
        };

        void remove_tracker(const VariableBase *tracker) noexcept;

        void forget_source(const VariableBase *source) noexcept;

        blocked_type _blocked{false};
        std::vector<TrackedSource> _sources;
        std::vector<VariableBase *> _trackers;
        std::shared_ptr<const bool> _alive{std::make_shared<const bool>(true)};
    };

    /**
     * Blocks a Variable for the lifetime of the scope, observers of the Variable see at most the last value
     * written inside the scope.
     *
     * The destructor unblocks on every exit path. If the scope is left by an exception and unblocking throws
     * as well, the second error is reported on stderr and the original exception keeps propagating.
     */
    class CELLGRAPH_EXPORT CoalescingScope {
    public:
        explicit CoalescingScope(VariableBase &variable);

        ~CoalescingScope() noexcept(false);

        CoalescingScope(const CoalescingScope &) = delete;

        CoalescingScope &operator=(const CoalescingScope &) = delete;

    private:
        VariableBase &_variable;
        int _uncaught_on_entry;
    };

    template<typename Fn>
    void coalesce_updates(VariableBase &variable, Fn &&fn) {
        CoalescingScope scope{variable};
        std::forward<Fn>(fn)();
    }

    /**
     * An Observable whose writes can be blocked. See VariableBase for the blocking rules.
     */
    template<typename T, typename Equality>
    class Variable : public VariableBase, public Observable<T, Equality> {
    public:
        using base_type = Observable<T, Equality>;
        using typename base_type::value_type;
        using typename base_type::observer_ptr;

        Variable() = default;

        explicit Variable(value_type initial_value) : base_type{std::move(initial_value)} {}

        [[nodiscard]] const value_type &get() const override {
            return is_blocked() ? _pending : base_type::get();
        }

        /**
         * Buffer the value when blocked (no equality test, no notification), otherwise write through.
         */
        void set(value_type value) override {
            if (is_blocked()) {
                _pending = std::move(value);
            } else {
                base_type::set(std::move(value));
            }
        }

        /**
         * Follow source: its blocked transitions and value changes are applied here. The current value is
         * pulled immediately, the current blocked state is not; only later blocked transitions propagate.
         */
        template<typename OtherEquality>
        void track(Variable<T, OtherEquality> &source) {
            auto blocked_handle = source.blocked().observe(
                [this](const std::optional<bool> &blocked) { set_blocked(blocked.value_or(false)); });
            auto value_handle = source.observe([this](const value_type &value) { set(value); });
            attach_source(source, std::move(blocked_handle), std::move(value_handle));
            set(source.get());
        }

        template<typename OtherEquality>
        void track(const std::shared_ptr<Variable<T, OtherEquality>> &source) { track(*source); }

        using VariableBase::untrack;

        void untrack(const variable_base_s_ptr &source) { untrack(*source); }

        [[nodiscard]] bool has_value() const override { return get().has_value(); }

        [[nodiscard]] const std::type_info &element_type() const noexcept override { return typeid(T); }

        [[nodiscard]] std::string describe() const override { return cellgraph::to_string(get()); }

        [[nodiscard]] change_handle observe_change(std::function<void()> callback) override {
            return base_type::observe([callback = std::move(callback)](const value_type &) { callback(); });
        }

        void unobserve_change(const change_handle &handle) override {
            base_type::unobserve(std::static_pointer_cast<typename base_type::observer_type>(handle));
        }

        /**
         * The buffered value, only meaningful while blocked.
         */
        [[nodiscard]] const value_type &pending() const noexcept { return _pending; }

    protected:
        void capture_pending() override { _pending = base_type::get(); }

        void flush_pending() override { base_type::set(_pending); }

    private:
        value_type _pending{};
    };

    template<typename T>
    using IdentityVariable = Variable<T, IdentityEquality>;

    template<typename T>
    using AlwaysUpdateVariable = Variable<T, AlwaysDifferent>;

    template<typename T, typename Equality = ValueEquality>
    variable_s_ptr<T, Equality> make_variable() {
        return std::make_shared<Variable<T, Equality>>();
    }

    template<typename T, typename Equality = ValueEquality>
    variable_s_ptr<T, Equality> make_variable(std::optional<T> initial_value) {
        return std::make_shared<Variable<T, Equality>>(std::move(initial_value));
    }

    /**
     * Link two Variables bidirectionally: v2 tracks v1, then v1 tracks v2, so v1's value wins at link time.
     * When both are blocked and then unblocked, the value of the one unblocked first is kept.
     */
    template<typename T, typename E1, typename E2>
    void link_variables(Variable<T, E1> &v1, Variable<T, E2> &v2) {
        v2.track(v1);
        v1.track(v2);
    }

    template<typename T, typename E1, typename E2>
    void unlink_variables(Variable<T, E1> &v1, Variable<T, E2> &v2) {
        v1.untrack(v2);
        v2.untrack(v1);
    }
} // namespace cellgraph

#endif  // CELLGRAPH_VARIABLE_H
