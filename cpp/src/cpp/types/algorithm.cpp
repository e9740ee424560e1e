#include <cellgraph/types/algorithm.h>

#include <algorithm>
#include <exception>
#include <set>
#include <stdexcept>

namespace cellgraph {

    namespace {
        struct UpdateGuard {
            UpdateGuard(PropagationLifeCycleObserver::ptr observer, const Algorithm &algorithm)
                : _observer{observer}, _algorithm{algorithm} {
                if (_observer) { _observer->on_before_update(_algorithm); }
            }

            ~UpdateGuard() {
                if (_observer) { _observer->on_after_update(_algorithm); }
            }

        private:
            PropagationLifeCycleObserver::ptr _observer;
            const Algorithm &_algorithm;
        };

        const Algorithm::Port *find_port(const std::vector<Algorithm::Port> &ports, std::string_view name) {
            auto it = std::find_if(ports.begin(), ports.end(), [name](const Algorithm::Port &p) { return p.name == name; });
            return it == ports.end() ? nullptr : &*it;
        }

        void validate_spec(const AlgorithmSpec &spec) {
            std::set<std::string_view> names;
            auto check = [&](const PortSpec &port) {
                if (port.name.empty()) {
                    throw_error<construction_contract_violation>("Algorithm '{}' declares a port without a name",
                                                                 spec.name);
                }
                if (!port.make || !port.make_seeded || !port.accepts) {
                    throw_error<construction_contract_violation>(
                        "Algorithm '{}' port '{}' is missing its factory or type predicate", spec.name, port.name);
                }
                if (!names.insert(port.name).second) {
                    throw_error<construction_contract_violation>("Algorithm '{}' declares port '{}' more than once",
                                                                 spec.name, port.name);
                }
            };
            std::for_each(spec.inputs.begin(), spec.inputs.end(), check);
            std::for_each(spec.outputs.begin(), spec.outputs.end(), check);
        }
    } // namespace

    void initialise_algorithm(Algorithm &algorithm) { algorithm.initialise(); }

    Algorithm::Algorithm(AlgorithmSpec spec, AlgorithmOptions options)
        : _spec{std::move(spec)}, _enabled{options.enabled.value_or(_spec.start_enabled)} {
        validate_spec(_spec);
        resolve_ports(_spec.inputs, _inputs, options);
        resolve_ports(_spec.outputs, _outputs, options);

        // Whatever is left over names a port that was never declared
        if (!options.seeds.empty()) {
            throw_error<construction_contract_violation>("Algorithm '{}' has no port named '{}'", _spec.name,
                                                         options.seeds.begin()->first);
        }
        if (!options.bindings.empty()) {
            throw_error<construction_contract_violation>("Algorithm '{}' has no port named '{}'", _spec.name,
                                                         options.bindings.begin()->first);
        }
    }

    Algorithm::~Algorithm() {
        // Inputs may be shared with other algorithms, so remove our hooks from them.
        for (std::size_t i = 0; i < _input_hooks.size(); ++i) {
            auto &variable = *_inputs[i].variable;
            try {
                variable.blocked().unobserve(_input_hooks[i].blocked_handle);
                variable.unobserve_change(_input_hooks[i].value_handle);
            } catch (const std::exception &e) {
                fmt::print(stderr, "Warning: exception while detaching algorithm '{}' from input '{}': {}\n",
                           _spec.name, _inputs[i].name, e.what());
            }
        }
    }

    void Algorithm::resolve_ports(const std::vector<PortSpec> &declared, std::vector<Port> &ports,
                                  AlgorithmOptions &options) {
        ports.reserve(declared.size());
        for (const auto &port_spec : declared) {
            auto binding = options.bindings.extract(port_spec.name);
            auto seed = options.seeds.extract(port_spec.name);
            if (binding && seed) {
                throw_error<construction_contract_violation>(
                    "Algorithm '{}' port '{}' is given both a Variable and a seed value", _spec.name, port_spec.name);
            }

            variable_base_s_ptr variable;
            if (binding) {
                variable = std::move(binding.mapped());
                if (!variable) {
                    throw_error<construction_contract_violation>("Algorithm '{}' port '{}' is bound to a null Variable",
                                                                 _spec.name, port_spec.name);
                }
                if (!port_spec.accepts(*variable)) {
                    throw_error<construction_contract_violation>(
                        "Algorithm '{}' port '{}' is bound to a Variable of element type {}", _spec.name,
                        port_spec.name, variable->element_type().name());
                }
            } else if (seed) {
                variable = port_spec.make_seeded(seed.mapped());
            } else {
                variable = port_spec.make();
            }
            ports.push_back(Port{port_spec.name, std::move(variable)});
        }
    }

    void Algorithm::initialise() {
        if (_initialised) { return; }
        _initialised = true;

        _enabled.observe([this](const std::optional<bool> &) { check_blocks_and_update(); });

        _input_hooks.reserve(_inputs.size());
        for (auto &input : _inputs) {
            InputHooks hooks;
            hooks.blocked_handle = input.variable->blocked().observe(
                [this](const std::optional<bool> &) { check_blocks_and_update(); });
            hooks.value_handle = input.variable->observe_change([this] { check_blocks_and_update(); });
            _input_hooks.push_back(std::move(hooks));
        }

        for (auto &output : _outputs) {
            _outputs_blocked.observe([variable = output.variable.get()](const std::optional<bool> &blocked) {
                variable->set_blocked(blocked.value_or(false));
            });
        }

        check_blocks_and_update();
    }

    VariableBase &Algorithm::input(std::string_view name) const {
        auto *port = find_port(_inputs, name);
        if (!port) { throw std::out_of_range(fmt::format("Algorithm '{}' has no input '{}'", _spec.name, name)); }
        return *port->variable;
    }

    VariableBase &Algorithm::output(std::string_view name) const {
        auto *port = find_port(_outputs, name);
        if (!port) { throw std::out_of_range(fmt::format("Algorithm '{}' has no output '{}'", _spec.name, name)); }
        return *port->variable;
    }

    bool Algorithm::any_input_absent() const {
        return std::any_of(_inputs.begin(), _inputs.end(), [](const Port &p) { return !p.variable->has_value(); });
    }

    void Algorithm::check_blocks_and_update() {
        // An update may drop the last owner of this algorithm.
        auto self = weak_from_this().lock();
        bool blocked = !is_enabled() ||
                       std::any_of(_inputs.begin(), _inputs.end(), [](const Port &p) { return p.variable->is_blocked(); });
        if (!blocked) { run_update(); }
        _outputs_blocked.set(blocked);
    }

    void Algorithm::retain(std::shared_ptr<const void> dependency) {
        if (dependency) { _retained.push_back(std::move(dependency)); }
    }

    void Algorithm::run_update() {
        UpdateGuard guard{_life_cycle_observer, *this};
        update();
    }
} // namespace cellgraph
