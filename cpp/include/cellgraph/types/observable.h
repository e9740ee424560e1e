#pragma once

/**
 * @file observable.h
 * @brief The basic observable value and its equality policies.
 */

#include <cellgraph/cellgraph_base.h>
#include <cellgraph/runtime/propagation_observer.h>
#include <cellgraph/types/observer.h>
#include <cellgraph/util/errors.h>
#include <cellgraph/util/string_utils.h>

#include <exception>
#include <memory>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace cellgraph {

/**
 * @brief Equality policy: values are equal when operator== says so.
 */
struct ValueEquality {
    template<typename T>
    bool operator()(const T& lhs, const T& rhs) const {
        return lhs == rhs;
    }
};

template<typename T>
concept pointer_like = std::is_pointer_v<T> || requires(const T& p) { p.operator->(); };

/**
 * @brief Equality policy: values are equal only when they refer to the same object.
 *
 * Two absent values are identical, an absent and a present value never are.
 */
struct IdentityEquality {
    template<pointer_like T>
    bool operator()(const std::optional<T>& lhs, const std::optional<T>& rhs) const {
        if (!lhs.has_value() || !rhs.has_value()) {
            return lhs.has_value() == rhs.has_value();
        }
        return std::to_address(*lhs) == std::to_address(*rhs);
    }
};

/**
 * @brief Equality policy: every set is a change, so every set notifies.
 */
struct AlwaysDifferent {
    template<typename T>
    bool operator()(const T&, const T&) const {
        return false;
    }
};

/**
 * @brief An observable value.
 *
 * Observers are called synchronously, in subscription order, with the new value whenever set() stores a
 * value the Equality policy considers different from the current one. The absent sentinel is std::nullopt
 * and is the default initial value.
 */
template<typename T, typename Equality>
class Observable {
public:
    using element_type = T;
    using value_type = std::optional<T>;
    using equality_type = Equality;
    using observer_type = Observer<value_type>;
    using observer_ptr = std::shared_ptr<observer_type>;
    using callback_type = std::function<void(const value_type&)>;

    Observable() = default;

    explicit Observable(value_type initial_value) : _value{std::move(initial_value)} {}

    virtual ~Observable() = default;

    Observable(const Observable&) = delete;
    Observable& operator=(const Observable&) = delete;

    [[nodiscard]] virtual const value_type& get() const { return _value; }

    /**
     * Store the value and notify observers if it differs from the current value.
     * If the equality policy throws, the value is left untouched and equality_test_failure is raised with the
     * original exception nested.
     */
    virtual void set(value_type value) {
        bool changed{false};
        try {
            changed = !Equality{}(_value, value);
        } catch (const std::exception& e) {
            std::throw_with_nested(equality_test_failure{fmt::format(
                "Equality test failed in {}: ({}), ({}): {}",
                typeid(*this).name(), cellgraph::to_string(_value), cellgraph::to_string(value), e.what())});
        }
        if (changed) {
            _value = std::move(value);
            notify();
        }
    }

    observer_ptr observe(callback_type callback) {
        return observe(std::make_shared<FunctionObserver<value_type>>(std::move(callback)));
    }

    observer_ptr observe(observer_ptr observer) {
        _observers.subscribe(observer);
        return observer;
    }

    /**
     * Register ahead of every existing observer, used by the diagnostics so their output precedes the
     * effects of downstream observers.
     */
    observer_ptr observe_front(callback_type callback) {
        auto observer = std::make_shared<FunctionObserver<value_type>>(std::move(callback));
        _observers.subscribe_front(observer);
        return observer;
    }

    void unobserve(const observer_ptr& observer) { _observers.unsubscribe(observer); }

    [[nodiscard]] bool is_observed_by(const observer_ptr& observer) const noexcept {
        return _observers.is_subscribed(observer);
    }

    [[nodiscard]] std::size_t observer_count() const noexcept { return _observers.size(); }

    /**
     * Call every observer with the current value, whether or not it changed.
     */
    void notify() {
        NotifyGuard guard{_life_cycle_observer, _label};
        _observers.notify(_value);
    }

    void set_life_cycle_observer(PropagationLifeCycleObserver::ptr observer, std::string label = {}) {
        _life_cycle_observer = observer;
        _label = std::move(label);
    }

    [[nodiscard]] PropagationLifeCycleObserver::ptr life_cycle_observer() const noexcept { return _life_cycle_observer; }

    [[nodiscard]] const std::string& label() const noexcept { return _label; }

private:
    value_type _value{};
    ObserverList<value_type> _observers;
    PropagationLifeCycleObserver::ptr _life_cycle_observer{nullptr};
    std::string _label;
};

} // namespace cellgraph
