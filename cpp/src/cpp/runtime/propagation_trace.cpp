#include <cellgraph/runtime/propagation_trace.h>
#include <cellgraph/types/algorithm.h>

#include <fmt/format.h>
#include <iostream>

namespace cellgraph {

    std::string format_trace_line(std::string_view name, std::string_view value, std::size_t depth) {
        return fmt::format("{}{}: {}", std::string(depth, '-'), name, value);
    }

    PropagationTrace::PropagationTrace(TraceOptions options) : _options{std::move(options)} {
    }

    void PropagationTrace::on_before_notify(std::string_view label) {
        ++_depth;
        if (_options.notifications && _should_log(label)) {
            _print(fmt::format("{}>> {}", std::string(_depth, '-'), label));
        }
    }

    void PropagationTrace::on_after_notify(std::string_view) noexcept {
        if (_depth > 0) { --_depth; }
    }

    void PropagationTrace::on_before_update(const Algorithm &algorithm) {
        if (_options.updates && _should_log(algorithm.name())) {
            _print(fmt::format("{}[UPDATE] {}", std::string(_depth, '-'), algorithm.name()));
        }
    }

    void PropagationTrace::on_after_update(const Algorithm &algorithm) noexcept {
        if (_options.updates && _should_log(algorithm.name())) {
            _print(fmt::format("{}[DONE] {}", std::string(_depth, '-'), algorithm.name()));
        }
    }

    void PropagationTrace::print(std::string_view name, std::string_view value) const {
        if (_should_log(name)) { _print(format_trace_line(name, value, _depth)); }
    }

    void PropagationTrace::attach(Algorithm &algorithm) { algorithm.set_life_cycle_observer(this); }

    bool PropagationTrace::_should_log(std::string_view name) const {
        if (!_options.filter.has_value()) { return true; }
        return name.find(_options.filter.value()) != std::string_view::npos;
    }

    void PropagationTrace::_print(const std::string &line) const {
        auto &out = _options.out ? *_options.out : std::cerr;
        out << line << '\n';
    }
} // namespace cellgraph
