#include <string_view>
#include <type_traits>

#include "harness/format.hpp"
#include "harness/scripted_host.hpp"
#include "nonfinite/nonfinite.hpp"

using namespace nonfinite;
using nonfinite::testing::fp32_layout;
using nonfinite::testing::fp64_layout;
using nonfinite::testing::Geometry;
using nonfinite::testing::ScriptedDecoder;
using nonfinite::testing::ScriptedEncoder;

// --- Widths ---

static_assert(FloatWidth<float>);
static_assert(FloatWidth<double>);
static_assert(!FloatWidth<long double>); // no Width<> specialization
static_assert(!FloatWidth<int>);

static_assert(fp32_layout::total_bits == 32);
static_assert(fp32_layout::exponent_bias == 127);
static_assert(fp32_layout::sign_offset == 31);
static_assert(fp64_layout::total_bits == 64);
static_assert(fp64_layout::exponent_bias == 1023);
static_assert(fp64_layout::precision == 53);
static_assert(sizeof(Geometry<float>::storage_type) == sizeof(float));
static_assert(sizeof(Geometry<double>::storage_type) == sizeof(double));

static_assert(Width<float>::name == "Float");
static_assert(Width<double>::name == "Double");
static_assert(Width<float>::infinity() > 0);
static_assert(-Width<double>::infinity() < 0);
static_assert(Width<float>::nan() != Width<float>::nan());

// --- Sentinel providers ---

static_assert(SentinelProvider<sentinels::JavaScript>);
static_assert(SentinelProvider<sentinels::CStyle>);
static_assert(std::is_same_v<sentinels::Default, sentinels::JavaScript>);
static_assert(!SentinelProvider<int>);

static_assert(sentinels::JavaScript::positive_infinity() == "Infinity");
static_assert(sentinels::JavaScript::negative_infinity() == "-Infinity");
static_assert(sentinels::JavaScript::nan() == "NaN");
static_assert(sentinels::CStyle::negative_infinity() == "-inf");

// A provider may hand out plain C strings.
struct LegacyDotNet {
  static const char *positive_infinity() { return "Infinity"; }
  static const char *negative_infinity() { return "-Infinity"; }
  static const char *nan() { return "NaN"; }
};
static_assert(SentinelProvider<LegacyDotNet>);

// Missing one accessor.
struct NoNan {
  static std::string_view positive_infinity() { return "+inf"; }
  static std::string_view negative_infinity() { return "-inf"; }
};
static_assert(!SentinelProvider<NoNan>);

// --- Host contract ---

static_assert(HostDecoder<ScriptedDecoder<float>, float>);
static_assert(HostDecoder<ScriptedDecoder<double>, double>);
static_assert(HostEncoder<ScriptedEncoder<float>, float>);
static_assert(HostEncoder<ScriptedEncoder<double>, double>);

// Decoder without the string probe.
struct NumbersOnly {
  template <typename V> V decodeNative() { return V{}; }
  const CodingPath &codingPath() const { return Path; }
  CodingPath Path;
};
static_assert(!HostDecoder<NumbersOnly, float>);

// --- Strategies ---

using FloatCoder = NonConformingFloatCoder<sentinels::JavaScript>;
using DoubleCoder = NonConformingDoubleCoder<sentinels::CStyle>;

static_assert(std::is_same_v<FloatCoder::value_type, float>);
static_assert(std::is_same_v<DoubleCoder::value_type, double>);
static_assert(std::is_same_v<NonConformingFloatCoder<>::provider,
                             sentinels::Default>);
static_assert(std::is_same_v<FloatCoder::decoder,
                             NonConformingFloatDecoder<sentinels::JavaScript>>);
static_assert(std::is_same_v<DoubleCoder::encoder,
                             NonConformingDoubleEncoder<sentinels::CStyle>>);

static_assert(StaticCoder<FloatCoder, ScriptedDecoder<float>,
                          ScriptedEncoder<float>>);
static_assert(StaticCoder<DoubleCoder, ScriptedDecoder<double>,
                          ScriptedEncoder<double>>);
static_assert(StaticDecoder<NonConformingFloatDecoder<LegacyDotNet>,
                            ScriptedDecoder<float>>);
static_assert(StaticEncoder<NonConformingDoubleEncoder<LegacyDotNet>,
                            ScriptedEncoder<double>>);
static_assert(!StaticDecoder<FloatCoder, NumbersOnly>);

// Strategies are namespaces with a type parameter, never objects.
static_assert(!std::is_default_constructible_v<FloatCoder>);
static_assert(!std::is_default_constructible_v<
              NonConformingDecoder<double, sentinels::CStyle>>);
static_assert(!std::is_default_constructible_v<NonConformingFloatEncoder<>>);

int main() { return 0; }
