#ifndef NONFINITE_CORE_WIDTH_HPP
#define NONFINITE_CORE_WIDTH_HPP

#include <charconv>
#include <concepts>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>

namespace nonfinite {

namespace detail {

inline bool isRadixDigit(char C, bool Hex) {
  if (C >= '0' && C <= '9')
    return true;
  return Hex && ((C >= 'a' && C <= 'f') || (C >= 'A' && C <= 'F'));
}

// Which side of the representable range a well-formed, unsigned literal
// that from_chars reported as out of range falls on. Computes the power
// of the radix of its leading digit plus the explicit exponent; only the
// sign of that matters, since out-of-range literals sit dozens of
// decades away from 1.
inline bool literalOverflows(std::string_view Digits, bool Hex) {
  long long IntDigits = 0;
  long long LeadingFracZeros = 0;
  bool SeenNonZero = false;
  bool AfterPoint = false;
  std::size_t I = 0;

  for (; I < Digits.size(); ++I) {
    char C = Digits[I];
    if (C == '.') {
      AfterPoint = true;
      continue;
    }
    if (!isRadixDigit(C, Hex))
      break;
    if (C != '0')
      SeenNonZero = true;
    if (!AfterPoint && SeenNonZero)
      ++IntDigits;
    else if (AfterPoint && !SeenNonZero)
      ++LeadingFracZeros;
  }

  long long Exponent = 0;
  if (I < Digits.size()) {
    ++I; // 'e', 'E', 'p' or 'P'
    bool NegExp = false;
    if (I < Digits.size() && (Digits[I] == '-' || Digits[I] == '+'))
      NegExp = Digits[I++] == '-';
    constexpr long long Clamp = 1000000000;
    for (; I < Digits.size(); ++I) {
      if (Exponent < Clamp)
        Exponent = Exponent * 10 + (Digits[I] - '0');
    }
    if (NegExp)
      Exponent = -Exponent;
  }

  long long Scale = IntDigits > 0 ? IntDigits : -LeadingFracZeros;
  if (Hex)
    return Scale * 4 + Exponent > 0; // hex digits are 4 bits, p is binary
  return Scale + Exponent > 0;
}

// Textual-to-float conversion for one width. The whole of Text must be
// consumed. Accepts an optional leading '+' and C99 hex floats
// ("0x1.8p3"). Text too large for T rounds to a signed infinity and text
// too small rounds to a signed zero.
template <std::floating_point T>
std::optional<T> parseFloatText(std::string_view Text) {
  if (!Text.empty() && Text.front() == '+') {
    Text.remove_prefix(1);
    if (!Text.empty() && (Text.front() == '+' || Text.front() == '-'))
      return std::nullopt;
  }
  if (Text.empty())
    return std::nullopt;

  bool Negative = Text.front() == '-';
  std::string_view Body = Negative ? Text.substr(1) : Text;
  auto Format = std::chars_format::general;

  if (Body.size() > 2 && Body[0] == '0' && (Body[1] == 'x' || Body[1] == 'X')) {
    // from_chars wants hex digits without the prefix, and its own sign
    // handling would accept "0x-1".
    Body.remove_prefix(2);
    if (Body.front() == '-' || Body.front() == '+')
      return std::nullopt;
    Format = std::chars_format::hex;
  } else {
    Body = Text;
  }

  T Value{};
  const char *End = Body.data() + Body.size();
  auto [Ptr, Ec] = std::from_chars(Body.data(), End, Value, Format);
  if (Ptr != End)
    return std::nullopt;

  bool Hex = Format == std::chars_format::hex;
  if (Ec == std::errc::result_out_of_range) {
    std::string_view Digits = (!Hex && Negative) ? Body.substr(1) : Body;
    Value = literalOverflows(Digits, Hex) ? std::numeric_limits<T>::infinity()
                                          : T(0);
    return Negative ? -Value : Value;
  }
  if (Ec != std::errc{})
    return std::nullopt;

  if (Hex && Negative)
    Value = -Value;
  return Value;
}

} // namespace detail

// Width<T>: per-width capabilities the codec needs. Specialized for the
// two IEEE 754 widths a structured format carries; everything else is
// left empty so FloatWidth rejects it.
template <typename T> struct Width {};

template <> struct Width<float> {
  using value_type = float;

  static constexpr std::string_view name = "Float";

  static constexpr float infinity() noexcept {
    return std::numeric_limits<float>::infinity();
  }
  static constexpr float nan() noexcept {
    return std::numeric_limits<float>::quiet_NaN();
  }
  static std::optional<float> parse(std::string_view Text) {
    return detail::parseFloatText<float>(Text);
  }
};

template <> struct Width<double> {
  using value_type = double;

  static constexpr std::string_view name = "Double";

  static constexpr double infinity() noexcept {
    return std::numeric_limits<double>::infinity();
  }
  static constexpr double nan() noexcept {
    return std::numeric_limits<double>::quiet_NaN();
  }
  static std::optional<double> parse(std::string_view Text) {
    return detail::parseFloatText<double>(Text);
  }
};

template <typename T>
concept FloatWidth =
    std::floating_point<T> && std::numeric_limits<T>::is_iec559 &&
    requires(std::string_view Text) {
      { Width<T>::name } -> std::convertible_to<std::string_view>;
      { Width<T>::infinity() } -> std::same_as<T>;
      { Width<T>::nan() } -> std::same_as<T>;
      { Width<T>::parse(Text) } -> std::same_as<std::optional<T>>;
    };

static_assert(FloatWidth<float>);
static_assert(FloatWidth<double>);

} // namespace nonfinite

#endif // NONFINITE_CORE_WIDTH_HPP
