#include <cellgraph/examples/adder_example.h>

namespace cellgraph {

    namespace {
        AlgorithmSpec adder_spec() {
            return AlgorithmSpec{"Adder", {port<int64_t>("a"), port<int64_t>("b")}, {port<int64_t>("c")}};
        }

        AlgorithmOptions zero_seeds() {
            AlgorithmOptions options;
            options.enabled = true;
            options.seeds = {{"a", int64_t{0}}, {"b", int64_t{0}}, {"c", int64_t{0}}};
            return options;
        }
    } // namespace

    Adder::Adder(std::string label) : Algorithm(adder_spec(), zero_seeds()), _label{std::move(label)} {
    }

    void Adder::update() {
        c().set(*a().get() + *b().get());
    }

    AdderExample adder_example(PropagationTrace &trace) {
        AdderExample example{
            make_variable<int64_t>(0), make_variable<int64_t>(0), make_variable<int64_t>(0),
            make_algorithm<Adder>("a1"), make_algorithm<Adder>("a2")
        };
        auto &[i1, i2, i3, a1, a2] = example;

        a2->c().observe(pp(trace, "a2.c value"));
        a2->c().blocked().observe(pp(trace, "a2.c blocked"));
        a1->c().observe(pp(trace, "a1.c value"));
        a1->c().blocked().observe(pp(trace, "a1.c blocked"));

        a2->a().track(a1->c());
        a1->a().track(*i1);
        a1->b().track(*i2);
        a2->b().track(*i3);

        return example;
    }
} // namespace cellgraph
