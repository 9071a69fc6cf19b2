#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "rigid2d/core/vars_list.hpp"

TEST(VarsListTest, StartsWithTimeOnly) {
    VarsList vars;
    EXPECT_EQ(vars.numVariables(), 1);
    EXPECT_EQ(vars.numBodies(), 0);
    EXPECT_DOUBLE_EQ(vars.getTime(), 0.0);
    EXPECT_EQ(vars.getName(VarsList::TimeIndex), "time");
}

TEST(VarsListTest, AddBodyReservesSixSlots) {
    VarsList vars;
    int const a = vars.addBody("ball");
    int const b = vars.addBody("block");
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 1 + VarsList::SlotsPerBody);
    EXPECT_EQ(vars.numBodies(), 2);
    EXPECT_EQ(vars.getName(a + VarsList::VX_), "ball vx");
    EXPECT_EQ(vars.getName(b + VarsList::W_), "block angle");
}

TEST(VarsListTest, SaveAndRestore) {
    VarsList vars;
    int const idx = vars.addBody("ball");
    vars.setValue(idx + VarsList::X_, 1.5);
    vars.setTime(2.0);
    vars.saveState();

    vars.setValue(idx + VarsList::X_, -3.0);
    vars.setTime(2.5);
    EXPECT_TRUE(vars.restoreState());
    EXPECT_DOUBLE_EQ(vars.getValue(idx + VarsList::X_), 1.5);
    EXPECT_DOUBLE_EQ(vars.getTime(), 2.0);
}

TEST(VarsListTest, RestoreFailsAfterLayoutChange) {
    VarsList vars;
    vars.addBody("ball");
    vars.saveState();
    vars.addBody("block");
    EXPECT_FALSE(vars.restoreState());
}

TEST(VarsListTest, SetValuesChecksSize) {
    VarsList vars;
    vars.addBody("ball");
    EXPECT_THROW(vars.setValues(std::vector<double>(3, 0.0)), std::invalid_argument);
    EXPECT_THROW(vars.getValue(100), std::out_of_range);
}

TEST(VarsListTest, AllFinite) {
    VarsList vars;
    int const idx = vars.addBody("ball");
    EXPECT_TRUE(vars.allFinite());
    vars.setValue(idx + VarsList::VY_, std::nan(""));
    EXPECT_FALSE(vars.allFinite());
}
