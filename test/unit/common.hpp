#pragma once

/*
 * Convenience functions, structs used across
 * more than one unit test.
 */

#include <ostream>

#include <gtest/gtest.h>

#include <envconst/resolve.hpp>

namespace testing {

// Google Test assertion-returning predicates:

// Resolution succeeded with the given value.

template <typename T, typename V>
::testing::AssertionResult resolved_to(const envconst::resolution<T>& r, V expected) {
    if (!r) {
        return ::testing::AssertionFailure() << "resolution failed: " << r.error();
    }
    if (!*r) {
        return ::testing::AssertionFailure() << "resolution gave no value, expected " << +expected;
    }
    if (**r!=static_cast<T>(expected)) {
        return ::testing::AssertionFailure() << "resolved to " << +**r << ", expected " << +expected;
    }
    return ::testing::AssertionSuccess();
}

// Resolution succeeded with "no value".

template <typename T>
::testing::AssertionResult resolved_to_nothing(const envconst::resolution<T>& r) {
    if (!r) {
        return ::testing::AssertionFailure() << "resolution failed: " << r.error();
    }
    if (*r) {
        return ::testing::AssertionFailure() << "resolved to " << +**r << ", expected no value";
    }
    return ::testing::AssertionSuccess();
}

// Resolution failed with the given kind.

template <typename T>
::testing::AssertionResult failed_with(const envconst::resolution<T>& r, envconst::failure_kind kind) {
    if (r) {
        auto result = ::testing::AssertionFailure() << "resolution succeeded";
        if (*r) result << " with " << +**r;
        return result;
    }
    if (r.error().kind!=kind) {
        return ::testing::AssertionFailure() << "failed with " << r.error().kind << ", expected " << kind;
    }
    return ::testing::AssertionSuccess();
}

} // namespace testing
