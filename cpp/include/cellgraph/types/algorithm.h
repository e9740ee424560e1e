//
// Algorithm: a fixed set of input and output Variables plus a recompute step.
//

#ifndef CELLGRAPH_ALGORITHM_H
#define CELLGRAPH_ALGORITHM_H

#include <cellgraph/cellgraph_base.h>
#include <cellgraph/runtime/propagation_observer.h>
#include <cellgraph/types/variable.h>

#include <any>
#include <map>
#include <typeinfo>

namespace cellgraph {

    /**
     * Declaration of one named port. The factories build the Variable backing the port, the predicate
     * checks that a Variable supplied by the caller has the declared type.
     */
    struct PortSpec {
        using factory_type = std::function<variable_base_s_ptr()>;
        using seeded_factory_type = std::function<variable_base_s_ptr(const std::any &)>;
        using accepts_type = std::function<bool(const VariableBase &)>;

        std::string name;
        factory_type make;
        seeded_factory_type make_seeded;
        accepts_type accepts;
    };

    /**
     * Declares a port backed by Variable<T, Equality>. A seed may be a T or a std::optional<T>.
     */
    template<typename T, typename Equality = ValueEquality>
    PortSpec port(std::string name) {
        using variable_type = Variable<T, Equality>;
        auto port_name = name;
        return PortSpec{
            std::move(name),
            [] { return std::make_shared<variable_type>(); },
            [port_name](const std::any &seed) -> variable_base_s_ptr {
                if (const auto *value = std::any_cast<T>(&seed)) {
                    return std::make_shared<variable_type>(*value);
                }
                if (const auto *value = std::any_cast<std::optional<T>>(&seed)) {
                    return std::make_shared<variable_type>(*value);
                }
                throw_error<construction_contract_violation>("Seed for port '{}' has type {}, expected {}", port_name,
                                                             seed.type().name(), typeid(T).name());
            },
            [](const VariableBase &variable) { return dynamic_cast<const variable_type *>(&variable) != nullptr; }
        };
    }

    /**
     * The declarative description of an Algorithm type: its ordered inputs and outputs, and whether
     * instances start enabled.
     */
    struct AlgorithmSpec {
        std::string name;
        std::vector<PortSpec> inputs;
        std::vector<PortSpec> outputs;
        bool start_enabled{true};
    };

    /**
     * Per-instance configuration. Ports named in bindings use the supplied Variable as is, ports named in
     * seeds get a fresh Variable holding the seed, all others are default constructed.
     */
    struct AlgorithmOptions {
        std::optional<bool> enabled;
        std::map<std::string, std::any> seeds;
        std::map<std::string, variable_base_s_ptr> bindings;
    };

    class Algorithm;

    void CELLGRAPH_EXPORT initialise_algorithm(Algorithm &algorithm);

    /**
     * A container connecting input Variables to output Variables.
     *
     * update() runs whenever an input value changes, an input blocked flag changes or enabled changes, but
     * only while the algorithm is enabled and no input is blocked. The combined state is published on
     * outputs_blocked, and every output mirrors it through its own blocked flag. update() runs before
     * outputs_blocked is lowered, so outputs written by it flush exactly once when the inputs settle.
     *
     * Construct instances with make_algorithm, the first gate evaluation needs the subclass to be complete.
     */
    class CELLGRAPH_EXPORT Algorithm : public std::enable_shared_from_this<Algorithm> {
    public:
        struct Port {
            std::string name;
            variable_base_s_ptr variable;
        };

        using flag_type = Observable<bool>;

        virtual ~Algorithm();

        Algorithm(const Algorithm &) = delete;

        Algorithm &operator=(const Algorithm &) = delete;

        [[nodiscard]] const AlgorithmSpec &spec() const noexcept { return _spec; }

        [[nodiscard]] const std::string &name() const noexcept { return _spec.name; }

        [[nodiscard]] flag_type &enabled() noexcept { return _enabled; }

        [[nodiscard]] const flag_type &enabled() const noexcept { return _enabled; }

        [[nodiscard]] bool is_enabled() const noexcept { return _enabled.get().value_or(false); }

        [[nodiscard]] flag_type &outputs_blocked() noexcept { return _outputs_blocked; }

        [[nodiscard]] const flag_type &outputs_blocked() const noexcept { return _outputs_blocked; }

        [[nodiscard]] bool is_outputs_blocked() const noexcept { return _outputs_blocked.get().value_or(false); }

        [[nodiscard]] const std::vector<Port> &inputs() const noexcept { return _inputs; }

        [[nodiscard]] const std::vector<Port> &outputs() const noexcept { return _outputs; }

        /**
         * @throws std::out_of_range if no input has this name
         */
        [[nodiscard]] VariableBase &input(std::string_view name) const;

        /**
         * @throws std::out_of_range if no output has this name
         */
        [[nodiscard]] VariableBase &output(std::string_view name) const;

        /**
         * Typed port access, throws std::bad_cast when the port is not a V.
         */
        template<typename V>
        [[nodiscard]] V &input_as(std::string_view name) const {
            return dynamic_cast<V &>(input(name));
        }

        template<typename V>
        [[nodiscard]] V &output_as(std::string_view name) const {
            return dynamic_cast<V &>(output(name));
        }

        template<typename T>
        [[nodiscard]] Variable<T> &input(std::string_view name) const {
            return input_as<Variable<T>>(name);
        }

        template<typename T>
        [[nodiscard]] Variable<T> &output(std::string_view name) const {
            return output_as<Variable<T>>(name);
        }

        /**
         * True if any input holds the absent sentinel.
         */
        [[nodiscard]] bool any_input_absent() const;

        [[nodiscard]] bool is_initialised() const noexcept { return _initialised; }

        /**
         * Re-evaluate the gate, run update() if it is open, then publish the blocked state to the outputs.
         * An algorithm owned by a shared_ptr stays alive until the call returns, even if an observer of an
         * output releases the last owner.
         */
        void check_blocks_and_update();

        /**
         * The recompute step. Calling it directly bypasses the gate.
         */
        virtual void update() = 0;

        void set_life_cycle_observer(PropagationLifeCycleObserver::ptr observer) noexcept { _life_cycle_observer = observer; }

        /**
         * Keep a dependency alive for as long as this algorithm lives.
         */
        void retain(std::shared_ptr<const void> dependency);

    protected:
        explicit Algorithm(AlgorithmSpec spec, AlgorithmOptions options = {});

        /**
         * Subscribe to the inputs and enabled flag, bind the outputs to outputs_blocked and evaluate the gate
         * once. Called by make_algorithm, a second call is a no-op.
         */
        void initialise();

    private:
        struct InputHooks {
            flag_type::observer_ptr blocked_handle;
            VariableBase::change_handle value_handle;
        };

        void resolve_ports(const std::vector<PortSpec> &declared, std::vector<Port> &ports, AlgorithmOptions &options);

        void run_update();

        friend void initialise_algorithm(Algorithm &algorithm);

        AlgorithmSpec _spec;
        flag_type _enabled;
        flag_type _outputs_blocked{false};
        std::vector<Port> _inputs;
        std::vector<Port> _outputs;
        std::vector<InputHooks> _input_hooks;
        std::vector<std::shared_ptr<const void>> _retained;
        PropagationLifeCycleObserver::ptr _life_cycle_observer{nullptr};
        bool _initialised{false};
    };

    /**
     * Construct an algorithm and run its initial gate evaluation.
     */
    template<typename A, typename... Args>
    std::shared_ptr<A> make_algorithm(Args &&... args) {
        auto algorithm = std::make_shared<A>(std::forward<Args>(args)...);
        initialise_algorithm(*algorithm);
        return algorithm;
    }
} // namespace cellgraph

#endif  // CELLGRAPH_ALGORITHM_H
