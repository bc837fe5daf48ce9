#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

#include <envconst/envconstexcept.hpp>
#include <envconst/read_envvar.hpp>
#include <envconst/resolve.hpp>

#include "common.hpp"

using namespace envconst;
using testing::failed_with;
using testing::resolved_to;
using testing::resolved_to_nothing;

using range32 = value_range<std::uint32_t>;
using std::nullopt;

TEST(value_range, basic) {
    auto r = range32::half_open(1, 32);
    EXPECT_FALSE(r.empty());
    EXPECT_TRUE(r.contains(1));
    EXPECT_TRUE(r.contains(31));
    EXPECT_FALSE(r.contains(0));
    EXPECT_FALSE(r.contains(32));
    EXPECT_EQ("[1, 32)", to_string(r));

    auto c = range32::closed(1, 32);
    EXPECT_TRUE(c.contains(32));
    EXPECT_FALSE(c.contains(33));
    EXPECT_EQ("[1, 32]", to_string(c));
    EXPECT_FALSE(c==r);

    EXPECT_TRUE(range32::half_open(5, 5).empty());
    EXPECT_FALSE(range32::closed(5, 5).empty());
    EXPECT_TRUE(range32::closed(6, 5).empty());

    auto d = value_range<std::int8_t>::domain();
    EXPECT_EQ("[-128, 127]", to_string(d));
    EXPECT_TRUE(d.contains(-128));
    EXPECT_TRUE(d.contains(127));

    EXPECT_EQ(d, effective_range<std::int8_t>(nullopt));
    EXPECT_EQ(r, effective_range<std::uint32_t>(r));

    std::stringstream s;
    s << value_range<std::uint8_t>::half_open(0, 200);
    EXPECT_EQ("[0, 200)", s.str());
}

// The worked examples: settings as a library or tool might declare them.

TEST(resolve, scenarios) {
    {
        // Absent, with default.
        auto r = resolve<std::uint32_t>("MYCRATE_MAX_THING_LEN", nullopt, nullopt, 64u, resolve_mode::required_with_default);
        EXPECT_TRUE(resolved_to(r, 64));
    }
    {
        // Absent and required.
        auto r = resolve<std::uint32_t>("MYCRATE_MAX_LEN_LOG2", nullopt, range32::half_open(0, 32), nullopt, resolve_mode::required);
        ASSERT_TRUE(failed_with(r, failure_kind::missing_required));
        EXPECT_EQ("MYCRATE_MAX_LEN_LOG2", r.error().setting);
        EXPECT_FALSE(r.error().raw);
    }
    {
        // Absent and optional.
        auto r = resolve<std::uint32_t>("OPTIONAL_MAX_LEN_LOG2", nullopt, range32::half_open(1, 32), nullopt, resolve_mode::optional);
        EXPECT_TRUE(resolved_to_nothing(r));
    }
    {
        // Present and optional, but out of range: still a failure.
        auto r = resolve<std::uint32_t>("OPTIONAL_MAX_LEN_LOG2", std::string("40"), range32::half_open(1, 32), nullopt, resolve_mode::optional);
        ASSERT_TRUE(failed_with(r, failure_kind::out_of_range));
        EXPECT_EQ("40", r.error().raw);
        EXPECT_EQ("[1, 32)", r.error().bound);
        EXPECT_EQ("OPTIONAL_MAX_LEN_LOG2", r.error().setting);
    }
    {
        // Malformed.
        auto r = resolve(required_setting<std::uint8_t>("X"), std::string("abc"));
        ASSERT_TRUE(failed_with(r, failure_kind::malformed_text));
        EXPECT_EQ("abc", r.error().raw);
        EXPECT_EQ(parse_error::invalid_digit, r.error().cause);
    }
    {
        // Overflow.
        auto r = resolve(required_setting<std::uint8_t>("X"), std::string("300"));
        ASSERT_TRUE(failed_with(r, failure_kind::numeric_overflow));
        EXPECT_EQ("300", r.error().raw);
        EXPECT_EQ("uint8_t", r.error().type_name);
    }
}

TEST(resolve, present_value_in_any_mode) {
    auto rng = range32::half_open(1, 32);

    EXPECT_TRUE(resolved_to(resolve(required_setting<std::uint32_t>("S", rng), std::string("5")), 5));
    EXPECT_TRUE(resolved_to(resolve(defaulted_setting<std::uint32_t>("S", 8, rng), std::string("5")), 5));
    EXPECT_TRUE(resolved_to(resolve(optional_setting<std::uint32_t>("S", rng), std::string("5")), 5));

    // The environment value wins over the default even when equal to a bound.
    EXPECT_TRUE(resolved_to(resolve(defaulted_setting<std::uint32_t>("S", 8, rng), std::string("1")), 1));
    EXPECT_TRUE(resolved_to(resolve(defaulted_setting<std::uint32_t>("S", 8, rng), std::string("31")), 31));
}

TEST(resolve, out_of_range_in_any_mode) {
    auto rng = range32::half_open(1, 32);

    for (const char* text: {"0", "32", "1000"}) {
        std::string raw = text;
        EXPECT_TRUE(failed_with(resolve(required_setting<std::uint32_t>("S", rng), raw), failure_kind::out_of_range)) << raw;
        EXPECT_TRUE(failed_with(resolve(defaulted_setting<std::uint32_t>("S", 8, rng), raw), failure_kind::out_of_range)) << raw;
        EXPECT_TRUE(failed_with(resolve(optional_setting<std::uint32_t>("S", rng), raw), failure_kind::out_of_range)) << raw;
    }

    // Inclusive upper bound.
    auto closed = range32::closed(1, 32);
    EXPECT_TRUE(resolved_to(resolve(required_setting<std::uint32_t>("S", closed), std::string("32")), 32));
    EXPECT_TRUE(failed_with(resolve(required_setting<std::uint32_t>("S", closed), std::string("33")), failure_kind::out_of_range));
}

TEST(resolve, malformed_in_any_mode) {
    // Invalid input never falls back to the default or to no value.
    for (const char* text: {"abc", "-1", " 4", "4 ", "0x4", "+", "4.0"}) {
        std::string raw = text;
        EXPECT_TRUE(failed_with(resolve(required_setting<std::uint32_t>("S"), raw), failure_kind::malformed_text)) << raw;
        EXPECT_TRUE(failed_with(resolve(defaulted_setting<std::uint32_t>("S", 8), raw), failure_kind::malformed_text)) << raw;
        EXPECT_TRUE(failed_with(resolve(optional_setting<std::uint32_t>("S"), raw), failure_kind::malformed_text)) << raw;
    }

    EXPECT_TRUE(failed_with(resolve(optional_setting<std::uint8_t>("S"), std::string("256")), failure_kind::numeric_overflow));
    EXPECT_TRUE(failed_with(resolve(defaulted_setting<std::uint8_t>("S", 1), std::string("256")), failure_kind::numeric_overflow));
}

TEST(resolve, signed_types) {
    auto rng = value_range<int>::closed(-10, 10);
    EXPECT_TRUE(resolved_to(resolve(required_setting<int>("S", rng), std::string("-10")), -10));
    EXPECT_TRUE(resolved_to(resolve(required_setting<int>("S", rng), std::string("+10")), 10));
    EXPECT_TRUE(failed_with(resolve(required_setting<int>("S", rng), std::string("-11")), failure_kind::out_of_range));

    EXPECT_TRUE(resolved_to(resolve(required_setting<std::int64_t>("S"), std::string("-9223372036854775808")),
        std::numeric_limits<std::int64_t>::min()));
    EXPECT_TRUE(failed_with(resolve(required_setting<std::int8_t>("S"), std::string("-129")), failure_kind::numeric_overflow));
}

TEST(resolve, idempotent) {
    auto s = optional_setting<std::uint32_t>("S", range32::half_open(1, 32));
    for (auto raw: {std::optional<std::string>(), std::optional<std::string>("7"), std::optional<std::string>("70"), std::optional<std::string>("x")}) {
        EXPECT_EQ(resolve(s, raw), resolve(s, raw));
    }
}

TEST(resolve, bad_setting) {
    // Empty name.
    EXPECT_THROW(resolve(required_setting<int>(""), std::string("1")), envconst::bad_setting);

    // Empty range.
    EXPECT_THROW(resolve(required_setting<int>("S", value_range<int>::half_open(3, 3)), std::string("3")), envconst::bad_setting);
    EXPECT_THROW(resolve(required_setting<int>("S", value_range<int>::closed(4, 3)), nullopt), envconst::bad_setting);

    // Default outside range, whether or not a value is present.
    auto bad_default = defaulted_setting<std::uint32_t>("S", 64, range32::half_open(1, 32));
    EXPECT_THROW(resolve(bad_default, nullopt), envconst::bad_setting);
    EXPECT_THROW(resolve(bad_default, std::string("5")), envconst::bad_setting);

    // Default with the wrong mode, or missing.
    EXPECT_THROW(resolve<int>("S", nullopt, nullopt, 3, resolve_mode::required), envconst::bad_setting);
    EXPECT_THROW(resolve<int>("S", nullopt, nullopt, 3, resolve_mode::optional), envconst::bad_setting);
    EXPECT_THROW(resolve<int>("S", nullopt, nullopt, nullopt, resolve_mode::required_with_default), envconst::bad_setting);

    try {
        resolve(bad_default, nullopt);
        FAIL() << "expected bad_setting";
    }
    catch (envconst::bad_setting& e) {
        EXPECT_EQ("S", e.setting_name);
        EXPECT_EQ("bad setting \"S\": default value 64 is outside of the range [1, 32)", std::string(e.what()));
    }
}

TEST(resolve, environment) {
    environment env = {
        {"MYCRATE_MAX_LEN_LOG2", "5"},
        {"EMPTY", ""}
    };

    auto log2 = required_setting<std::uint32_t>("MYCRATE_MAX_LEN_LOG2", range32::half_open(0, 32));
    EXPECT_TRUE(resolved_to(resolve(log2, env), 5));

    // An empty value is treated as unset.
    EXPECT_TRUE(failed_with(resolve(required_setting<int>("EMPTY"), env), failure_kind::missing_required));
    EXPECT_TRUE(resolved_to(resolve(defaulted_setting<int>("EMPTY", 3), env), 3));
    EXPECT_TRUE(resolved_to_nothing(resolve(optional_setting<int>("EMPTY"), env)));

    EXPECT_TRUE(resolved_to(resolve(defaulted_setting<int>("UNSET", -3), env), -3));
}

TEST(resolve, describe) {
    auto rng = range32::half_open(1, 32);

    auto missing = resolve(required_setting<std::uint32_t>("A"), nullopt);
    ASSERT_FALSE(missing);
    EXPECT_EQ("environment variable \"A\" is required but not set, and has no default", describe(missing.error()));

    auto malformed = resolve(required_setting<std::uint8_t>("X"), std::string("abc"));
    ASSERT_FALSE(malformed);
    EXPECT_EQ("environment variable \"X\" has value \"abc\" which is not a valid uint8_t (invalid decimal digit)", describe(malformed.error()));

    auto overflow = resolve(required_setting<std::uint8_t>("X"), std::string("300"));
    ASSERT_FALSE(overflow);
    EXPECT_EQ("environment variable \"X\" has value \"300\" which does not fit in uint8_t", describe(overflow.error()));

    auto range = resolve(optional_setting<std::uint32_t>("B", rng), std::string("40"));
    ASSERT_FALSE(range);
    std::stringstream s;
    s << range.error();
    EXPECT_EQ("environment variable \"B\" has value \"40\" outside of the range [1, 32)", s.str());
}

TEST(resolve, or_throw) {
    auto rng = range32::half_open(1, 32);

    EXPECT_EQ(std::optional<std::uint32_t>(4), resolve_or_throw(required_setting<std::uint32_t>("A", rng), std::string("4")));
    EXPECT_FALSE(resolve_or_throw(optional_setting<std::uint32_t>("A", rng), nullopt));

    EXPECT_THROW(resolve_or_throw(required_setting<std::uint32_t>("A", rng), nullopt), missing_env_value);
    EXPECT_THROW(resolve_or_throw(required_setting<std::uint32_t>("A", rng), std::string("a")), malformed_env_value);
    EXPECT_THROW(resolve_or_throw(required_setting<std::uint8_t>("A"), std::string("256")), env_value_overflow);
    EXPECT_THROW(resolve_or_throw(required_setting<std::uint32_t>("A", rng), std::string("32")), env_value_out_of_range);

    try {
        resolve_or_throw(optional_setting<std::uint32_t>("A", rng), std::string("40"));
        FAIL() << "expected env_value_out_of_range";
    }
    catch (env_value_out_of_range& e) {
        EXPECT_EQ("A", e.env_variable);
        EXPECT_EQ("40", e.env_value);
        EXPECT_EQ("[1, 32)", e.bound);
    }

    // All value failures share the invalid_env_value base.
    EXPECT_THROW(resolve_or_throw(required_setting<int>("A"), std::string("")), invalid_env_value);
    EXPECT_THROW(resolve_or_throw(required_setting<int>("A"), nullopt), envconst_exception);
}

TEST(resolve, exception_messages) {
    // Thrown messages are the same text as describe().
    auto rng = range32::half_open(1, 32);

    auto check = [](const resolution<std::uint32_t>& r) {
        ASSERT_FALSE(r);
        try {
            throw_resolve_error(r.error());
        }
        catch (invalid_env_value& e) {
            EXPECT_EQ(describe(r.error()), std::string(e.what()));
            EXPECT_EQ(r.error().setting, e.env_variable);
            EXPECT_EQ(r.error().raw.value_or(""), e.env_value);
            return;
        }
        FAIL() << "expected invalid_env_value";
    };

    check(resolve(required_setting<std::uint32_t>("A", rng), nullopt));
    check(resolve(required_setting<std::uint32_t>("A", rng), std::string("x1")));
    check(resolve(required_setting<std::uint32_t>("A", rng), std::string("99999999999")));
    check(resolve(required_setting<std::uint32_t>("A", rng), std::string("32")));

    try {
        resolve_or_throw(required_setting<std::uint32_t>("A", rng), std::string("-1"));
        FAIL() << "expected malformed_env_value";
    }
    catch (malformed_env_value& e) {
        EXPECT_EQ("environment variable \"A\" has value \"-1\" which is not a valid uint32_t (negative sign on unsigned value)", std::string(e.what()));
        EXPECT_EQ("uint32_t", e.type_name);
    }
}
