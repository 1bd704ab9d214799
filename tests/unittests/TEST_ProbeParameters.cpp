#include "modules/tools/probe/ProbeParameters.h"
#include "modules/communication/utils/Command.h"
#include "libs/StreamOutput.h"

#include <cmath>
#include <gtest/gtest.h>

static ProbeParameters defaults()
{
    ProbeParameters p;
    p.probe_speed = 5;
    p.lift_speed = 5;
    p.max_distance = 10;
    p.samples = 1;
    p.sample_retract_dist = 2;
    p.samples_tolerance = 0.1F;
    p.samples_tolerance_retries = 0;
    p.samples_result = SAMPLES_AVERAGE;
    return p;
}

TEST(ProbeParametersTest, NoOverridesKeepsDefaults)
{
    ProbeParameterOverrides o;
    ProbeParameters p = merge_probe_parameters(defaults(), o);
    EXPECT_FLOAT_EQ(5.0F, p.probe_speed);
    EXPECT_FLOAT_EQ(10.0F, p.max_distance);
    EXPECT_EQ(1, p.samples);
    EXPECT_EQ(SAMPLES_AVERAGE, p.samples_result);
    EXPECT_TRUE(p.validate().is_ok());
}

TEST(ProbeParametersTest, CommandOverridesAreMerged)
{
    Command c("PROBE PROBE_SPEED=2 LIFT_SPEED=8 MAX_DISTANCE=20 SAMPLES=3 SAMPLE_RETRACT_DIST=1.5 "
              "SAMPLES_TOLERANCE=0.05 SAMPLES_TOLERANCE_RETRIES=4 SAMPLES_RESULT=median", &StreamOutput::NullStream);
    ProbeParameterOverrides o;
    ASSERT_TRUE(parse_probe_overrides(c, o).is_ok());

    ProbeParameters p = merge_probe_parameters(defaults(), o);
    EXPECT_FLOAT_EQ(2.0F, p.probe_speed);
    EXPECT_FLOAT_EQ(8.0F, p.lift_speed);
    EXPECT_FLOAT_EQ(20.0F, p.max_distance);
    EXPECT_EQ(3, p.samples);
    EXPECT_FLOAT_EQ(1.5F, p.sample_retract_dist);
    EXPECT_FLOAT_EQ(0.05F, p.samples_tolerance);
    EXPECT_EQ(4, p.samples_tolerance_retries);
    EXPECT_EQ(SAMPLES_MEDIAN, p.samples_result);
    EXPECT_TRUE(p.validate().is_ok());
}

TEST(ProbeParametersTest, OnlyGivenOverridesChangeAnything)
{
    Command c("PROBE SAMPLES=2", &StreamOutput::NullStream);
    ProbeParameterOverrides o;
    ASSERT_TRUE(parse_probe_overrides(c, o).is_ok());
    EXPECT_TRUE(o.samples.is_set());
    EXPECT_FALSE(o.probe_speed.is_set());

    ProbeParameters p = merge_probe_parameters(defaults(), o);
    EXPECT_EQ(2, p.samples);
    EXPECT_FLOAT_EQ(5.0F, p.probe_speed);
}

TEST(ProbeParametersTest, UnparseableOverridesAreRejected)
{
    const char *bad[] = {
        "PROBE PROBE_SPEED=fast",
        "PROBE MAX_DISTANCE=",
        "PROBE SAMPLES=2.5",
        "PROBE SAMPLES_TOLERANCE_RETRIES=x",
        "PROBE SAMPLES_RESULT=mode",
    };
    for (auto b : bad) {
        Command c(b, &StreamOutput::NullStream);
        ProbeParameterOverrides o;
        EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, parse_probe_overrides(c, o).get_code()) << b;
    }
}

TEST(ProbeParametersTest, ValidationRejectsOutOfRangeValues)
{
    ProbeParameters p;

    p = defaults(); p.probe_speed = 0;
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, p.validate().get_code());
    p = defaults(); p.lift_speed = -1;
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, p.validate().get_code());
    p = defaults(); p.max_distance = NAN;
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, p.validate().get_code());
    p = defaults(); p.max_distance = INFINITY;
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, p.validate().get_code());
    p = defaults(); p.sample_retract_dist = 0;
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, p.validate().get_code());
    p = defaults(); p.samples = 0;
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, p.validate().get_code());
    p = defaults(); p.samples_tolerance = -0.01F;
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, p.validate().get_code());
    p = defaults(); p.samples_tolerance_retries = -1;
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, p.validate().get_code());

    // zero tolerance and zero retries are allowed
    p = defaults(); p.samples_tolerance = 0; p.samples_tolerance_retries = 0;
    EXPECT_TRUE(p.validate().is_ok());
}

TEST(ProbeParametersTest, SamplesResultNames)
{
    SamplesResult r;
    ASSERT_TRUE(parse_samples_result("median", r).is_ok());
    EXPECT_EQ(SAMPLES_MEDIAN, r);
    ASSERT_TRUE(parse_samples_result("AVERAGE", r).is_ok());
    EXPECT_EQ(SAMPLES_AVERAGE, r);
    r = SAMPLES_MEDIAN;
    ASSERT_TRUE(parse_samples_result("Mean", r).is_ok());
    EXPECT_EQ(SAMPLES_AVERAGE, r);
    EXPECT_FALSE(parse_samples_result("mode", r).is_ok());
    EXPECT_STREQ("median", samples_result_name(SAMPLES_MEDIAN));
    EXPECT_STREQ("average", samples_result_name(SAMPLES_AVERAGE));
}

TEST(ProbeParametersTest, HugeIntegerOverridesAreRejected)
{
    const char *lines[] = {
        "PROBE SAMPLES=1e10",
        "PROBE SAMPLES=-1e10",
        "PROBE SAMPLES=2147483648",
        "PROBE SAMPLES_TOLERANCE_RETRIES=1e10",
    };
    for (auto l : lines) {
        Command c(l, &StreamOutput::NullStream);
        ProbeParameterOverrides o;
        ProbeError e = parse_probe_overrides(c, o);
        EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, e.get_code()) << l;
        EXPECT_NE(std::string::npos, e.get_message().find("as an integer")) << l;
        EXPECT_FALSE(o.samples.is_set()) << l;
        EXPECT_FALSE(o.samples_tolerance_retries.is_set()) << l;
    }

    // the largest float below 2^31 still fits
    Command c("PROBE SAMPLES=2147483520", &StreamOutput::NullStream);
    ProbeParameterOverrides o;
    ASSERT_TRUE(parse_probe_overrides(c, o).is_ok());
    EXPECT_EQ(2147483520, o.samples.get());
}

TEST(ProbeParametersTest, WholeNumberConversion)
{
    int i = 7;
    EXPECT_TRUE(to_whole_number(-3.0F, i));
    EXPECT_EQ(-3, i);
    EXPECT_FALSE(to_whole_number(2.5F, i));
    EXPECT_FALSE(to_whole_number(NAN, i));
    EXPECT_FALSE(to_whole_number(INFINITY, i));
    EXPECT_FALSE(to_whole_number(3e9F, i));
    EXPECT_FALSE(to_whole_number(-3e9F, i));
    EXPECT_EQ(-3, i);
}
