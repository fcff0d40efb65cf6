// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace callscribe::metrics
{

/// @brief Monotonic counter partitioned by the value of a single label.
class Counter
{
  public:
    Counter(std::string name, std::string help, std::string labelName);

    /// @brief Adds @p amount to the series identified by @p labelValue.
    void increment(std::string_view labelValue, std::uint64_t amount = 1);

    /// @brief Returns the current value of a series (0 if never touched).
    [[nodiscard]] auto value(std::string_view labelValue) const -> std::uint64_t;

    void reset();

    /// @brief Appends the Prometheus text exposition of this counter to @p out.
    void render(std::string& out) const;

  private:
    std::string _name;
    std::string _help;
    std::string _labelName;
    mutable std::mutex _mutex;
    std::map<std::string, std::uint64_t, std::less<>> _series;
};

/// @brief Cumulative histogram with fixed upper bounds.
class Histogram
{
  public:
    Histogram(std::string name, std::string help, std::vector<double> upperBounds);

    void observe(double value);

    [[nodiscard]] auto count() const -> std::uint64_t;
    [[nodiscard]] auto sum() const -> double;

    /// @brief Returns the cumulative count of observations <= @p upperBound.
    [[nodiscard]] auto bucketCount(double upperBound) const -> std::uint64_t;

    void reset();

    void render(std::string& out) const;

  private:
    std::string _name;
    std::string _help;
    std::vector<double> _upperBounds;
    mutable std::mutex _mutex;
    std::vector<std::uint64_t> _buckets;
    std::uint64_t _count = 0;
    double _sum = 0.0;
};

/// @brief Owns the metrics of one process and renders them for scraping.
class Registry
{
  public:
    auto addCounter(std::string name, std::string help, std::string labelName) -> Counter&;
    auto addHistogram(std::string name, std::string help, std::vector<double> upperBounds) -> Histogram&;

    /// @brief Renders all metrics in the Prometheus text exposition format (version 0.0.4).
    [[nodiscard]] auto renderText() const -> std::string;

  private:
    mutable std::mutex _mutex;
    std::vector<std::unique_ptr<Counter>> _counters;
    std::vector<std::unique_ptr<Histogram>> _histograms;
};

} // namespace callscribe::metrics
