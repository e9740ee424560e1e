#pragma once

/**
 * @file observer.h
 * @brief Typed observer interface and the ordered observer list used by every Observable.
 *
 * Key concepts:
 * - An observer is a single-method capability receiving the new value
 * - Registration order is notification order
 * - The same observer may be registered more than once and then fires once per registration
 */

#include <cellgraph/cellgraph_base.h>
#include <cellgraph/util/errors.h>

#include <algorithm>
#include <utility>

namespace cellgraph {

/**
 * @brief Receives the new value of an Observable.
 */
template<typename T>
struct Observer {
    virtual ~Observer() = default;

    virtual void notify(const T& value) = 0;
};

/**
 * @brief Observer adapting a plain callable, this is what Observable::observe creates for a callback.
 */
template<typename T>
class FunctionObserver final : public Observer<T> {
public:
    using callback_type = std::function<void(const T&)>;

    explicit FunctionObserver(callback_type callback) : _callback(std::move(callback)) {}

    void notify(const T& value) override { _callback(value); }

private:
    callback_type _callback;
};

/**
 * @brief Ordered list of observers.
 *
 * Notification walks a snapshot of the registrations, so observers subscribed during a pass are first
 * called on the next pass. Each registration carries its own removed flag: a registration unsubscribed
 * during a pass is not called once removed, while other registrations of the same observer still are.
 * Destroying the list marks every registration removed, so a pass in progress stops calling observers
 * when an observer destroys the owning cell.
 */
template<typename T>
class ObserverList {
public:
    using observer_type = Observer<T>;
    using observer_ptr = std::shared_ptr<observer_type>;

    ObserverList() = default;

    ~ObserverList() {
        for (auto& registration : _registrations) { registration->removed = true; }
    }

    ObserverList(const ObserverList&) = delete;
    ObserverList& operator=(const ObserverList&) = delete;

    ObserverList(ObserverList&&) = delete;
    ObserverList& operator=(ObserverList&&) = delete;

    /**
     * @brief Append an observer, it is notified after all current observers.
     */
    void subscribe(observer_ptr observer) {
        if (observer) {
            _registrations.push_back(std::make_shared<Registration>(std::move(observer)));
        }
    }

    /**
     * @brief Insert an observer ahead of all current observers.
     */
    void subscribe_front(observer_ptr observer) {
        if (observer) {
            _registrations.insert(_registrations.begin(), std::make_shared<Registration>(std::move(observer)));
        }
    }

    /**
     * @brief Remove the first registration of the observer.
     * @throws subscriber_not_found if the observer is not subscribed
     */
    void unsubscribe(const observer_ptr& observer) {
        auto it = find(observer);
        if (it == _registrations.end()) {
            throw_error<subscriber_not_found>("Observer {} is not subscribed", fmt::ptr(observer.get()));
        }
        (*it)->removed = true;
        _registrations.erase(it);
    }

    [[nodiscard]] bool is_subscribed(const observer_ptr& observer) const noexcept {
        return observer && find(observer) != _registrations.end();
    }

    [[nodiscard]] bool has_observers() const noexcept { return !_registrations.empty(); }

    [[nodiscard]] std::size_t size() const noexcept { return _registrations.size(); }

    /**
     * @brief Notify every observer, in subscription order, with the supplied value.
     *
     * The value is passed by reference so each observer sees the cell's value as it stands when that
     * observer is called. Once the first observer is called the list itself is not touched again, only
     * the snapshot.
     */
    void notify(const T& value) {
        auto snapshot = _registrations;
        for (const auto& registration : snapshot) {
            if (registration->removed) { continue; }
            registration->observer->notify(value);
        }
    }

private:
    struct Registration {
        explicit Registration(observer_ptr observer_) : observer{std::move(observer_)} {}

        observer_ptr observer;
        bool removed{false};
    };

    using registration_ptr = std::shared_ptr<Registration>;

    [[nodiscard]] auto find(const observer_ptr& observer) const {
        return std::find_if(_registrations.begin(), _registrations.end(),
                            [&observer](const registration_ptr& r) { return r->observer == observer; });
    }

    std::vector<registration_ptr> _registrations;
};

} // namespace cellgraph
