#ifndef NONFINITE_CORE_HOST_HPP
#define NONFINITE_CORE_HOST_HPP

// The contract with the host serialization framework: whatever walks
// the document and owns the cursor. The codec only ever sees one value
// position at a time through these operations.

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nonfinite {

// One step of a path into a document: an object member or an array
// element.
struct CodingKey {
  std::string StringValue;
  std::optional<int> IntValue;

  static CodingKey member(std::string_view Name) {
    return {std::string(Name), std::nullopt};
  }
  static CodingKey index(int I) { return {std::to_string(I), I}; }

  friend bool operator==(const CodingKey &, const CodingKey &) = default;
};

using CodingPath = std::vector<CodingKey>;

// "readings[2].value"; an empty path is the document root.
inline std::string formatCodingPath(const CodingPath &Path) {
  if (Path.empty())
    return "<root>";
  std::string Out;
  for (const CodingKey &Key : Path) {
    if (Key.IntValue) {
      Out += '[';
      Out += std::to_string(*Key.IntValue);
      Out += ']';
    } else {
      if (!Out.empty())
        Out += '.';
      Out += Key.StringValue;
    }
  }
  return Out;
}

// HostDecoder: a cursor positioned on one value.
//   tryDecodeString()  -- the value as a string, or nothing when the
//                         token is not string-shaped. Never throws for a
//                         type mismatch.
//   decodeNative<W>()  -- the value as a native number of width W. May
//                         throw.
template <typename D, typename W>
concept HostDecoder = requires(D &Dec) {
  { Dec.tryDecodeString() } -> std::same_as<std::optional<std::string>>;
  { Dec.template decodeNative<W>() } -> std::same_as<W>;
  { Dec.codingPath() } -> std::convertible_to<const CodingPath &>;
};

// HostEncoder: a cursor positioned on one output slot. Both writes may
// throw.
template <typename E, typename W>
concept HostEncoder = requires(E &Enc, std::string_view Text, W Value) {
  Enc.encodeString(Text);
  Enc.encodeNative(Value);
  { Enc.codingPath() } -> std::convertible_to<const CodingPath &>;
};

} // namespace nonfinite

#endif // NONFINITE_CORE_HOST_HPP
