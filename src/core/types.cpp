/// @file src/core/types.cpp
/// @brief Out-of-line helpers for the shared value types.

#include "qsae/types.hpp"

namespace qsae {

std::string_view to_string(Action action) noexcept {
    switch (action) {
        case Action::Buy:  return "buy";
        case Action::Sell: return "sell";
        case Action::Hold: return "hold";
    }
    return "hold";
}

std::optional<double> Signal::find(std::string_view key) const {
    for (const auto& [name, value] : detail) {
        if (name == key) return value;
    }
    return std::nullopt;
}

} // namespace qsae
