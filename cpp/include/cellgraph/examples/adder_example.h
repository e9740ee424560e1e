#ifndef CELLGRAPH_EXAMPLES_ADDER_EXAMPLE_H
#define CELLGRAPH_EXAMPLES_ADDER_EXAMPLE_H

#include <cellgraph/runtime/propagation_trace.h>
#include <cellgraph/types/algorithm.h>

#include <cstdint>

namespace cellgraph {

    /**
     * Integer adder with inputs a, b and output c, all starting at 0. Starts enabled.
     */
    class CELLGRAPH_EXPORT Adder final : public Algorithm {
    public:
        explicit Adder(std::string label);

        [[nodiscard]] const std::string &label() const noexcept { return _label; }

        [[nodiscard]] Variable<int64_t> &a() const { return input<int64_t>("a"); }

        [[nodiscard]] Variable<int64_t> &b() const { return input<int64_t>("b"); }

        [[nodiscard]] Variable<int64_t> &c() const { return output<int64_t>("c"); }

        void update() override;

    private:
        std::string _label;
    };

    struct AdderExample {
        variable_s_ptr<int64_t> i1;
        variable_s_ptr<int64_t> i2;
        variable_s_ptr<int64_t> i3;
        std::shared_ptr<Adder> a1;
        std::shared_ptr<Adder> a2;
    };

    /**
     * Two cascaded adders fed by three inputs: a1 = i1 + i2, a2 = a1.c + i3. The value and blocked flag of
     * both outputs are printed through the trace.
     */
    CELLGRAPH_EXPORT AdderExample adder_example(PropagationTrace &trace);
} // namespace cellgraph

#endif  // CELLGRAPH_EXAMPLES_ADDER_EXAMPLE_H
