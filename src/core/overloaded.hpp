#pragma once

namespace tether {

/**
 * overloaded - Builds a visitor from a set of lambdas. Used with std::visit
 * so that a missing alternative is a compile error rather than a fallback.
 */
template<typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template<typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace tether
