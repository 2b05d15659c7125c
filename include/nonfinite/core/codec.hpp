#ifndef NONFINITE_CORE_CODEC_HPP
#define NONFINITE_CORE_CODEC_HPP

// Non-conforming float strategies: static decode/encode functions a host
// binds to a single float or double field. Parameterized on the float
// width and on the SentinelProvider policy; nothing is ever
// instantiated.

#include <cmath>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include "nonfinite/core/errors.hpp"
#include "nonfinite/core/host.hpp"
#include "nonfinite/core/sentinels.hpp"
#include "nonfinite/core/width.hpp"

namespace nonfinite {

// Strategy shapes a host can bind one symbol per field against.
template <typename C, typename D>
concept StaticDecoder = requires(D &Dec) {
  typename C::value_type;
  { C::decode(Dec) } -> std::same_as<typename C::value_type>;
};

template <typename C, typename E>
concept StaticEncoder =
    requires(E &Enc, typename C::value_type Value) { C::encode(Value, Enc); };

template <typename C, typename D, typename E>
concept StaticCoder = StaticDecoder<C, D> && StaticEncoder<C, E>;

// Reads W, accepting either a native number or one of P's sentinel
// strings. A string that is not a sentinel must still be numeric text
// for W, or decode throws DecodingError::Kind::ValueNotFound.
template <FloatWidth W, SentinelProvider P = sentinels::Default>
struct NonConformingDecoder {
  using value_type = W;
  using provider = P;

  NonConformingDecoder() = delete;

  template <HostDecoder<W> D> static W decode(D &Decoder) {
    std::optional<std::string> Text = Decoder.tryDecodeString();
    if (!Text)
      return Decoder.template decodeNative<W>();

    // Sentinels first: none of them is numeric text.
    if (*Text == std::string_view(P::positive_infinity()))
      return Width<W>::infinity();
    if (*Text == std::string_view(P::negative_infinity()))
      return -Width<W>::infinity();
    if (*Text == std::string_view(P::nan()))
      return Width<W>::nan();

    if (std::optional<W> Value = Width<W>::parse(*Text))
      return *Value;

    std::string Name(Width<W>::name);
    throw DecodingError::valueNotFound(
        Decoder.codingPath(), "Expected " + Name + " but could not convert \"" +
                                  *Text + "\" to " + Name);
  }
};

// Writes W, substituting P's sentinel strings for NaN and the two
// infinities. Finite values, including -0.0, go to the host's native
// number writer.
template <FloatWidth W, SentinelProvider P = sentinels::Default>
struct NonConformingEncoder {
  using value_type = W;
  using provider = P;

  NonConformingEncoder() = delete;

  template <HostEncoder<W> E> static void encode(W Value, E &Encoder) {
    // NaN compares unequal to everything; classify it before the
    // equality tests.
    if (std::isnan(Value)) {
      Encoder.encodeString(std::string_view(P::nan()));
    } else if (Value == Width<W>::infinity()) {
      Encoder.encodeString(std::string_view(P::positive_infinity()));
    } else if (Value == -Width<W>::infinity()) {
      Encoder.encodeString(std::string_view(P::negative_infinity()));
    } else {
      Encoder.encodeNative(Value);
    }
  }
};

// Both directions behind one name.
template <FloatWidth W, SentinelProvider P = sentinels::Default>
struct NonConformingCoder {
  using value_type = W;
  using provider = P;
  using decoder = NonConformingDecoder<W, P>;
  using encoder = NonConformingEncoder<W, P>;

  NonConformingCoder() = delete;

  template <HostDecoder<W> D> static W decode(D &Decoder) {
    return decoder::decode(Decoder);
  }

  template <HostEncoder<W> E> static void encode(W Value, E &Encoder) {
    encoder::encode(Value, Encoder);
  }
};

// --- Per-width aliases ---

template <SentinelProvider P = sentinels::Default>
using NonConformingFloatDecoder = NonConformingDecoder<float, P>;
template <SentinelProvider P = sentinels::Default>
using NonConformingFloatEncoder = NonConformingEncoder<float, P>;
template <SentinelProvider P = sentinels::Default>
using NonConformingFloatCoder = NonConformingCoder<float, P>;

template <SentinelProvider P = sentinels::Default>
using NonConformingDoubleDecoder = NonConformingDecoder<double, P>;
template <SentinelProvider P = sentinels::Default>
using NonConformingDoubleEncoder = NonConformingEncoder<double, P>;
template <SentinelProvider P = sentinels::Default>
using NonConformingDoubleCoder = NonConformingCoder<double, P>;

} // namespace nonfinite

#endif // NONFINITE_CORE_CODEC_HPP
