// Built as its own executable so the checks are live whatever the build type
#undef NDEBUG

#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>
#include "utils/Validation.h"

TEST(ValidationTest, RangeAcceptsBounds) {
    EXPECT_NO_THROW(validation::checkRange(0.0, 0.0, 0.2, "inflation"));
    EXPECT_NO_THROW(validation::checkRange(0.2, 0.0, 0.2, "inflation"));
    EXPECT_NO_THROW(validation::checkRange(0.1, 0.0, 0.2, "inflation"));
}

TEST(ValidationTest, RangeRejectsOutside) {
    EXPECT_THROW(validation::checkRange(0.2000001, 0.0, 0.2, "inflation"), std::logic_error);
    EXPECT_THROW(validation::checkRange(-0.01, 0.0, 0.2, "inflation"), std::logic_error);
}

TEST(ValidationTest, MessageNamesTheValue) {
    try {
        validation::checkRange(150.0, 0.0, 100.0, "citizen happiness");
        FAIL() << "expected std::logic_error";
    } catch (const std::logic_error& e) {
        EXPECT_NE(std::string(e.what()).find("citizen happiness"), std::string::npos);
    }
}

TEST(ValidationTest, NonFiniteRejected) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(validation::checkFinite(nan, "money_supply"), std::logic_error);
    EXPECT_THROW(validation::checkFinite(inf, "money_supply"), std::logic_error);
    EXPECT_THROW(validation::checkRange(nan, 0.0, 1.0, "money_velocity"), std::logic_error);
    EXPECT_THROW(validation::checkNonNegative(nan, "savings"), std::logic_error);
}

TEST(ValidationTest, NonNegative) {
    EXPECT_NO_THROW(validation::checkNonNegative(0.0, "savings"));
    EXPECT_THROW(validation::checkNonNegative(-1e-9, "savings"), std::logic_error);
}

TEST(ValidationTest, Capacity) {
    EXPECT_NO_THROW(validation::checkCapacity(10, 10, "business roster"));
    EXPECT_NO_THROW(validation::checkCapacity(0, 1, "business roster"));
    EXPECT_THROW(validation::checkCapacity(11, 10, "business roster"), std::logic_error);
}
