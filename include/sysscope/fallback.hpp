#pragma once

#include "sysscope/logging.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sysscope {

template <typename T>
struct QueryStrategy {
    std::string name;
    std::function<std::optional<T>()> query;
};

template <typename T>
using StrategyChain = std::vector<QueryStrategy<T>>;

// Evaluates strategies in order and returns the first value produced. A
// strategy that throws counts as one that found nothing. When `winner` is
// given it receives the name of the strategy that answered.
template <typename T>
std::optional<T> firstAvailable(const StrategyChain<T>& chain, std::string* winner = nullptr) {
    for (const auto& strategy : chain) {
        if (!strategy.query) {
            continue;
        }
        try {
            std::optional<T> value = strategy.query();
            if (value) {
                if (winner) {
                    *winner = strategy.name;
                }
                return value;
            }
        } catch (const std::exception& e) {
            qCDebug(lcCollect) << "strategy" << strategy.name.c_str() << "failed:" << e.what();
        }
    }
    return std::nullopt;
}

template <typename T>
T firstAvailableOr(const StrategyChain<T>& chain, T placeholder) {
    std::optional<T> value = firstAvailable(chain);
    return value ? std::move(*value) : std::move(placeholder);
}

} // namespace sysscope
