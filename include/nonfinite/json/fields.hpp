#ifndef NONFINITE_JSON_FIELDS_HPP
#define NONFINITE_JSON_FIELDS_HPP

// Binding a strategy to one object member: the per-field counterpart of
// a declarative "encode this field with that coder" annotation.
//
//   struct Reading { double Value; float Gain; };
//
//   using Coder = NonConformingDoubleCoder<sentinels::JavaScript>;
//   R.Value = decodeField<Coder>(Dec, "value");
//   encodeField<Coder>(Enc, "value", R.Value);

#include <optional>
#include <string_view>

#include "nonfinite/core/codec.hpp"
#include "nonfinite/json/json_decoder.hpp"
#include "nonfinite/json/json_encoder.hpp"

namespace nonfinite::json {

template <StaticDecoder<JsonDecoder> Coder>
typename Coder::value_type decodeField(const JsonDecoder &Object,
                                       std::string_view Key) {
  JsonDecoder Field = Object.decoderForKey(Key);
  return Coder::decode(Field);
}

// Missing key or explicit null: no value.
template <StaticDecoder<JsonDecoder> Coder>
std::optional<typename Coder::value_type>
decodeFieldIfPresent(const JsonDecoder &Object, std::string_view Key) {
  if (!Object.contains(Key))
    return std::nullopt;
  JsonDecoder Field = Object.decoderForKey(Key);
  if (Field.isNull())
    return std::nullopt;
  return Coder::decode(Field);
}

template <StaticEncoder<JsonEncoder> Coder>
void encodeField(JsonEncoder &Object, std::string_view Key,
                 typename Coder::value_type Value) {
  JsonEncoder Field = Object.encoderForKey(Key);
  Coder::encode(Value, Field);
}

// Absent values are omitted.
template <StaticEncoder<JsonEncoder> Coder>
void encodeFieldIfPresent(
    JsonEncoder &Object, std::string_view Key,
    const std::optional<typename Coder::value_type> &Value) {
  if (!Value)
    return;
  encodeField<Coder>(Object, Key, *Value);
}

} // namespace nonfinite::json

#endif // NONFINITE_JSON_FIELDS_HPP
