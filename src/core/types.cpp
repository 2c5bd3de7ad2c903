/**
 * @file types.cpp
 * @brief String conversions for core vocabulary types.
 */

#include "core/types.hpp"

#include <array>
#include <cstdio>
#include <ctime>

namespace taskgraph {

std::optional<NodeStatus> parse_node_status(std::string_view text) noexcept {
    static constexpr std::array kAll{
        NodeStatus::Pending, NodeStatus::Ready, NodeStatus::Running,
        NodeStatus::Completed, NodeStatus::Failed, NodeStatus::Cancelled,
        NodeStatus::Blocked
    };
    for (auto status : kAll) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

std::optional<EdgeType> parse_edge_type(std::string_view text) noexcept {
    static constexpr std::array kAll{
        EdgeType::Dependency, EdgeType::Constraint, EdgeType::DataFlow,
        EdgeType::Conditional, EdgeType::Weak
    };
    for (auto type : kAll) {
        if (to_string(type) == text) return type;
    }
    return std::nullopt;
}

std::optional<CyclePolicy> parse_cycle_policy(std::string_view text) noexcept {
    if (text == "significant") return CyclePolicy::SignificantEdges;
    if (text == "all") return CyclePolicy::AllEdges;
    return std::nullopt;
}

std::string format_timestamp(Timestamp ts) {
    auto secs = std::chrono::floor<std::chrono::seconds>(ts);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts - secs).count();
    auto time_t_secs = std::chrono::system_clock::to_time_t(secs);

    std::tm tm{};
    gmtime_r(&time_t_secs, &tm);

    std::array<char, 40> buf{};
    std::snprintf(buf.data(), buf.size(), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(micros));
    return std::string{buf.data()};
}

std::optional<Timestamp> parse_timestamp(std::string_view text) {
    std::string input{text};
    std::tm tm{};
    int consumed = 0;
    if (std::sscanf(input.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    int64_t micros = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < input.size() && input[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < input.size() && input[pos] >= '0' && input[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (input[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        for (; digits < 6; ++digits) micros *= 10;
    }
    if (pos < input.size() && input[pos] == 'Z') ++pos;
    if (pos != input.size()) return std::nullopt;

    auto secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) return std::nullopt;

    return std::chrono::system_clock::from_time_t(secs)
         + std::chrono::microseconds{micros};
}

}  // namespace taskgraph
