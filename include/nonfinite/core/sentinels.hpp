#ifndef NONFINITE_CORE_SENTINELS_HPP
#define NONFINITE_CORE_SENTINELS_HPP

#include <concepts>
#include <string_view>

namespace nonfinite {

// SentinelProvider concept: the three strings that stand in for the
// non-finite values on the wire. Providers are stateless policy types;
// the strings are read statically and never instantiated.
//
// The three strings are expected to be distinct and never valid numeric
// text. Neither is checked.
template <typename P>
concept SentinelProvider = requires {
  { P::positive_infinity() } -> std::convertible_to<std::string_view>;
  { P::negative_infinity() } -> std::convertible_to<std::string_view>;
  { P::nan() } -> std::convertible_to<std::string_view>;
};

namespace sentinels {

// ECMAScript String(x) spelling. Also what Python's json module, Jackson
// and Gson emit for non-finite numbers.
struct JavaScript {
  static constexpr std::string_view positive_infinity() { return "Infinity"; }
  static constexpr std::string_view negative_infinity() { return "-Infinity"; }
  static constexpr std::string_view nan() { return "NaN"; }
};

// printf("%g") spelling.
struct CStyle {
  static constexpr std::string_view positive_infinity() { return "inf"; }
  static constexpr std::string_view negative_infinity() { return "-inf"; }
  static constexpr std::string_view nan() { return "nan"; }
};

using Default = JavaScript;

static_assert(SentinelProvider<JavaScript>);
static_assert(SentinelProvider<CStyle>);

} // namespace sentinels
} // namespace nonfinite

#endif // NONFINITE_CORE_SENTINELS_HPP
