#pragma once

#include <cellgraph/runtime/propagation_observer.h>
#include <cellgraph/types/variable.h>

#include <iosfwd>
#include <optional>
#include <string>
#include <type_traits>

namespace cellgraph {

    struct TraceOptions {
        /**
         * Where trace lines go, std::cerr when null.
         */
        std::ostream *out{nullptr};
        /**
         * Log a line each time an attached cell starts notifying.
         */
        bool notifications{false};
        /**
         * Log a line around each update of an attached algorithm.
         */
        bool updates{false};
        /**
         * Only report labels / algorithm names containing this substring.
         */
        std::optional<std::string> filter;
    };

    /**
     * Formats one trace line: depth dashes, then "name: value".
     */
    CELLGRAPH_EXPORT std::string format_trace_line(std::string_view name, std::string_view value, std::size_t depth);

    /**
     * @brief Pretty-prints a propagation as it runs.
     *
     * The trace counts how deeply notifications of the cells it is attached to are nested, and indents the
     * lines printed through it accordingly. The depth belongs to this instance and returns to zero when the
     * top-level propagation completes, also when it completes by an exception.
     */
    class CELLGRAPH_EXPORT PropagationTrace : public PropagationLifeCycleObserver {
    public:
        explicit PropagationTrace(TraceOptions options = {});

        void on_before_notify(std::string_view label) override;

        void on_after_notify(std::string_view label) noexcept override;

        void on_before_update(const Algorithm &algorithm) override;

        void on_after_update(const Algorithm &algorithm) noexcept override;

        [[nodiscard]] std::size_t depth() const noexcept { return _depth; }

        [[nodiscard]] const TraceOptions &options() const noexcept { return _options; }

        /**
         * Write "name: value" at the current depth.
         */
        void print(std::string_view name, std::string_view value) const;

        /**
         * Report the notifications of an observable under the given label.
         */
        template<typename T, typename Equality>
        void attach(Observable<T, Equality> &observable, std::string label) {
            observable.set_life_cycle_observer(this, std::move(label));
        }

        void attach(Algorithm &algorithm);

    private:
        [[nodiscard]] bool _should_log(std::string_view name) const;

        void _print(const std::string &line) const;

        TraceOptions _options;
        std::size_t _depth{0};
    };

    /**
     * A callback printing "name: value" through the trace, usable as an observer of any cell.
     */
    inline auto pp(PropagationTrace &trace, std::string name) {
        return [&trace, name = std::move(name)](const auto &value) { trace.print(name, cellgraph::to_string(value)); };
    }

    /**
     * Attach the trace to a Variable and its blocked flag, and print both ahead of every other observer:
     * "<name> value: <value>" and "<name> blocked: <blocked> value: [<value>]".
     *
     * block() and unblock() leave the stored value equal to the pending value whenever the blocked flag
     * changes. When they differ the flag was written directly (untrack does this), and the discarded pending
     * value is reported as "<name> blocked flag written directly: value: [<value>] pending: [<pending>]".
     * Variables that treat every value as different are not checked.
     */
    template<typename T, typename Equality>
    void debug_variable(PropagationTrace &trace, Variable<T, Equality> &variable, const std::string &name) {
        trace.attach(variable, name + " value");
        trace.attach(variable.blocked(), name + " blocked");
        variable.observe_front(pp(trace, name + " value"));
        variable.blocked().observe_front([&trace, &variable, name](const std::optional<bool> &blocked) {
            trace.print(name + " blocked", fmt::format("{} value: [{}]", cellgraph::to_string(blocked), variable.describe()));
            if constexpr (!std::is_same_v<Equality, AlwaysDifferent>) {
                const auto &stored = variable.Observable<T, Equality>::get();
                if (!Equality{}(stored, variable.pending())) {
                    trace.print(name + " blocked flag written directly",
                                fmt::format("value: [{}] pending: [{}]", cellgraph::to_string(stored),
                                            cellgraph::to_string(variable.pending())));
                }
            }
        });
    }
} // namespace cellgraph
