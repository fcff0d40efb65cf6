// SPDX-License-Identifier: Apache-2.0
#include "Metrics.hpp"

#include <algorithm>
#include <format>

namespace callscribe::metrics
{

namespace
{

    auto formatNumber(double value) -> std::string
    {
        return std::format("{}", value);
    }

    auto escapeLabel(std::string_view value) -> std::string
    {
        auto out = std::string {};
        out.reserve(value.size());
        for (auto const c: value)
        {
            switch (c)
            {
                case '\\': out += "\\\\"; break;
                case '"': out += "\\\""; break;
                case '\n': out += "\\n"; break;
                default: out += c; break;
            }
        }
        return out;
    }

} // namespace

// {{{ Counter
Counter::Counter(std::string name, std::string help, std::string labelName):
    _name(std::move(name)), _help(std::move(help)), _labelName(std::move(labelName))
{
}

void Counter::increment(std::string_view labelValue, std::uint64_t amount)
{
    auto const lock = std::lock_guard { _mutex };
    auto it = _series.find(labelValue);
    if (it == _series.end())
        it = _series.emplace(std::string(labelValue), 0).first;
    it->second += amount;
}

auto Counter::value(std::string_view labelValue) const -> std::uint64_t
{
    auto const lock = std::lock_guard { _mutex };
    auto const it = _series.find(labelValue);
    return it != _series.end() ? it->second : 0;
}

void Counter::reset()
{
    auto const lock = std::lock_guard { _mutex };
    _series.clear();
}

void Counter::render(std::string& out) const
{
    auto const lock = std::lock_guard { _mutex };
    out += std::format("# HELP {} {}\n# TYPE {} counter\n", _name, _help, _name);
    for (auto const& [label, count]: _series)
        out += std::format("{}{{{}=\"{}\"}} {}\n", _name, _labelName, escapeLabel(label), count);
}
// }}}

// {{{ Histogram
Histogram::Histogram(std::string name, std::string help, std::vector<double> upperBounds):
    _name(std::move(name)), _help(std::move(help)), _upperBounds(std::move(upperBounds))
{
    std::ranges::sort(_upperBounds);
    _buckets.assign(_upperBounds.size(), 0);
}

void Histogram::observe(double value)
{
    auto const lock = std::lock_guard { _mutex };
    for (auto i = size_t { 0 }; i < _upperBounds.size(); ++i)
        if (value <= _upperBounds[i])
            ++_buckets[i];
    ++_count;
    _sum += value;
}

auto Histogram::count() const -> std::uint64_t
{
    auto const lock = std::lock_guard { _mutex };
    return _count;
}

auto Histogram::sum() const -> double
{
    auto const lock = std::lock_guard { _mutex };
    return _sum;
}

auto Histogram::bucketCount(double upperBound) const -> std::uint64_t
{
    auto const lock = std::lock_guard { _mutex };
    for (auto i = size_t { 0 }; i < _upperBounds.size(); ++i)
        if (_upperBounds[i] == upperBound)
            return _buckets[i];
    return upperBound >= _upperBounds.back() ? _count : 0;
}

void Histogram::reset()
{
    auto const lock = std::lock_guard { _mutex };
    std::ranges::fill(_buckets, 0);
    _count = 0;
    _sum = 0.0;
}

void Histogram::render(std::string& out) const
{
    auto const lock = std::lock_guard { _mutex };
    out += std::format("# HELP {} {}\n# TYPE {} histogram\n", _name, _help, _name);
    for (auto i = size_t { 0 }; i < _upperBounds.size(); ++i)
        out += std::format("{}_bucket{{le=\"{}\"}} {}\n", _name, formatNumber(_upperBounds[i]), _buckets[i]);
    out += std::format("{}_bucket{{le=\"+Inf\"}} {}\n", _name, _count);
    out += std::format("{}_sum {}\n", _name, formatNumber(_sum));
    out += std::format("{}_count {}\n", _name, _count);
}
// }}}

// {{{ Registry
auto Registry::addCounter(std::string name, std::string help, std::string labelName) -> Counter&
{
    auto const lock = std::lock_guard { _mutex };
    _counters.push_back(std::make_unique<Counter>(std::move(name), std::move(help), std::move(labelName)));
    return *_counters.back();
}

auto Registry::addHistogram(std::string name, std::string help, std::vector<double> upperBounds)
    -> Histogram&
{
    auto const lock = std::lock_guard { _mutex };
    _histograms.push_back(
        std::make_unique<Histogram>(std::move(name), std::move(help), std::move(upperBounds)));
    return *_histograms.back();
}

auto Registry::renderText() const -> std::string
{
    auto const lock = std::lock_guard { _mutex };
    auto out = std::string {};
    for (auto const& counter: _counters)
        counter->render(out);
    for (auto const& histogram: _histograms)
        histogram->render(out);
    return out;
}
// }}}

} // namespace callscribe::metrics
