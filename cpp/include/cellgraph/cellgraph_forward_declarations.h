#ifndef CELLGRAPH_FORWARD_DECLARATIONS_H
#define CELLGRAPH_FORWARD_DECLARATIONS_H

#include <memory>

namespace cellgraph {
    // Equality policies
    struct ValueEquality;
    struct IdentityEquality;
    struct AlwaysDifferent;

    template<typename T>
    struct Observer;

    template<typename T>
    class ObserverList;

    template<typename T, typename Equality = ValueEquality>
    class Observable;

    // VariableBase - always owned through shared_ptr (by the caller or an Algorithm)
    class VariableBase;
    using variable_base_ptr = VariableBase*;
    using variable_base_s_ptr = std::shared_ptr<VariableBase>;

    template<typename T, typename Equality = ValueEquality>
    class Variable;

    template<typename T, typename Equality = ValueEquality>
    using variable_s_ptr = std::shared_ptr<Variable<T, Equality>>;

    class CoalescingScope;

    // Algorithm - shared_ptr so outputs can share ownership of the producing algorithm
    struct PortSpec;
    struct AlgorithmSpec;
    struct AlgorithmOptions;
    class Algorithm;
    using algorithm_ptr = Algorithm*;
    using algorithm_s_ptr = std::shared_ptr<Algorithm>;

    // Diagnostics - externally managed, held as raw pointers
    struct PropagationLifeCycleObserver;
    using propagation_observer_ptr = PropagationLifeCycleObserver*;

    struct TraceOptions;
    class PropagationTrace;
} // namespace cellgraph

#endif  // CELLGRAPH_FORWARD_DECLARATIONS_H
