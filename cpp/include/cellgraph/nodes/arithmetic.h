//
// Binary arithmetic algorithms and the operator sugar built on them.
//

#ifndef CELLGRAPH_NODES_ARITHMETIC_H
#define CELLGRAPH_NODES_ARITHMETIC_H

#include <cellgraph/types/algorithm.h>

#include <stdexcept>
#include <type_traits>

namespace cellgraph {

    namespace detail {
        struct add_op {
            static constexpr std::string_view name{"Add"};

            template<typename T>
            T operator()(const T &lhs, const T &rhs) const { return static_cast<T>(lhs + rhs); }
        };

        struct subtract_op {
            static constexpr std::string_view name{"Subtract"};

            template<typename T>
            T operator()(const T &lhs, const T &rhs) const { return static_cast<T>(lhs - rhs); }
        };

        struct multiply_op {
            static constexpr std::string_view name{"Multiply"};

            template<typename T>
            T operator()(const T &lhs, const T &rhs) const { return static_cast<T>(lhs * rhs); }
        };

        // Integral division by zero is reported, floating point follows IEEE
        struct divide_op {
            static constexpr std::string_view name{"Divide"};

            template<typename T>
            T operator()(const T &lhs, const T &rhs) const {
                if constexpr (std::is_integral_v<T>) {
                    if (rhs == T{}) { throw_error<std::domain_error>("Divide: integer division by zero"); }
                }
                return static_cast<T>(lhs / rhs);
            }
        };
    } // namespace detail

    /**
     * Two inputs a and b, one output c. If either input is absent c becomes absent, otherwise
     * c = Op(a, b).
     */
    template<typename T, typename Op>
    class BinaryOperation : public Algorithm {
    public:
        using element_type = T;

        explicit BinaryOperation(AlgorithmOptions options = {}) : Algorithm(binary_spec(), std::move(options)) {}

        [[nodiscard]] Variable<T> &a() const { return input<T>("a"); }

        [[nodiscard]] Variable<T> &b() const { return input<T>("b"); }

        [[nodiscard]] Variable<T> &c() const { return output<T>("c"); }

        void update() override {
            if (any_input_absent()) {
                c().set(std::nullopt);
            } else {
                c().set(Op{}(*a().get(), *b().get()));
            }
        }

        static AlgorithmSpec binary_spec() {
            return AlgorithmSpec{std::string{Op::name}, {port<T>("a"), port<T>("b")}, {port<T>("c")}};
        }
    };

    template<typename T>
    class Add final : public BinaryOperation<T, detail::add_op> {
    public:
        using BinaryOperation<T, detail::add_op>::BinaryOperation;
    };

    template<typename T>
    class Subtract final : public BinaryOperation<T, detail::subtract_op> {
    public:
        using BinaryOperation<T, detail::subtract_op>::BinaryOperation;
    };

    template<typename T>
    class Multiply final : public BinaryOperation<T, detail::multiply_op> {
    public:
        using BinaryOperation<T, detail::multiply_op>::BinaryOperation;
    };

    template<typename T>
    class Divide final : public BinaryOperation<T, detail::divide_op> {
    public:
        using BinaryOperation<T, detail::divide_op>::BinaryOperation;
    };

    namespace detail {
        template<typename T, typename Equality>
        void attach_operand(Algorithm &algorithm, Variable<T> &input, const std::shared_ptr<Variable<T, Equality>> &operand) {
            input.track(*operand);
            algorithm.retain(operand);
        }

        template<typename T>
        void attach_operand(Algorithm &, Variable<T> &input, std::optional<T> literal) {
            input.set(std::move(literal));
        }
    } // namespace detail

    /**
     * Build one Op<T> algorithm over two operands, each a Variable (tracked) or a literal (set once), and return
     * its output. The returned pointer shares ownership of the algorithm, and the algorithm keeps Variable
     * operands alive, so intermediate results of an expression stay connected.
     */
    template<template<typename> class Op, typename T, typename Lhs, typename Rhs>
    variable_s_ptr<T> variable_operation(const Lhs &lhs, const Rhs &rhs) {
        auto algorithm = make_algorithm<Op<T>>();
        detail::attach_operand<T>(*algorithm, algorithm->a(), lhs);
        detail::attach_operand<T>(*algorithm, algorithm->b(), rhs);
        return variable_s_ptr<T>{algorithm, &algorithm->c()};
    }

    // Operators over Variables and literals, each builds one algorithm through variable_operation.
    template<typename T, typename E1, typename E2>
    variable_s_ptr<T> operator+(const std::shared_ptr<Variable<T, E1>> &lhs, const std::shared_ptr<Variable<T, E2>> &rhs) {
        return variable_operation<Add, T>(lhs, rhs);
    }

    template<typename T, typename E>
    variable_s_ptr<T> operator+(const std::shared_ptr<Variable<T, E>> &lhs, const std::type_identity_t<T> &rhs) {
        return variable_operation<Add, T>(lhs, std::optional<T>{rhs});
    }

    template<typename T, typename E>
    variable_s_ptr<T> operator+(const std::type_identity_t<T> &lhs, const std::shared_ptr<Variable<T, E>> &rhs) {
        return variable_operation<Add, T>(std::optional<T>{lhs}, rhs);
    }

    template<typename T, typename E1, typename E2>
    variable_s_ptr<T> operator-(const std::shared_ptr<Variable<T, E1>> &lhs, const std::shared_ptr<Variable<T, E2>> &rhs) {
        return variable_operation<Subtract, T>(lhs, rhs);
    }

    template<typename T, typename E>
    variable_s_ptr<T> operator-(const std::shared_ptr<Variable<T, E>> &lhs, const std::type_identity_t<T> &rhs) {
        return variable_operation<Subtract, T>(lhs, std::optional<T>{rhs});
    }

    template<typename T, typename E>
    variable_s_ptr<T> operator-(const std::type_identity_t<T> &lhs, const std::shared_ptr<Variable<T, E>> &rhs) {
        return variable_operation<Subtract, T>(std::optional<T>{lhs}, rhs);
    }

    template<typename T, typename E1, typename E2>
    variable_s_ptr<T> operator*(const std::shared_ptr<Variable<T, E1>> &lhs, const std::shared_ptr<Variable<T, E2>> &rhs) {
        return variable_operation<Multiply, T>(lhs, rhs);
    }

    template<typename T, typename E>
    variable_s_ptr<T> operator*(const std::shared_ptr<Variable<T, E>> &lhs, const std::type_identity_t<T> &rhs) {
        return variable_operation<Multiply, T>(lhs, std::optional<T>{rhs});
    }

    template<typename T, typename E>
    variable_s_ptr<T> operator*(const std::type_identity_t<T> &lhs, const std::shared_ptr<Variable<T, E>> &rhs) {
        return variable_operation<Multiply, T>(std::optional<T>{lhs}, rhs);
    }

    template<typename T, typename E1, typename E2>
    variable_s_ptr<T> operator/(const std::shared_ptr<Variable<T, E1>> &lhs, const std::shared_ptr<Variable<T, E2>> &rhs) {
        return variable_operation<Divide, T>(lhs, rhs);
    }

    template<typename T, typename E>
    variable_s_ptr<T> operator/(const std::shared_ptr<Variable<T, E>> &lhs, const std::type_identity_t<T> &rhs) {
        return variable_operation<Divide, T>(lhs, std::optional<T>{rhs});
    }

    template<typename T, typename E>
    variable_s_ptr<T> operator/(const std::type_identity_t<T> &lhs, const std::shared_ptr<Variable<T, E>> &rhs) {
        return variable_operation<Divide, T>(std::optional<T>{lhs}, rhs);
    }
} // namespace cellgraph

#endif  // CELLGRAPH_NODES_ARITHMETIC_H
