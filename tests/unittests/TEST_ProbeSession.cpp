#include "modules/tools/probe/ProbeSession.h"
#include "modules/tools/probe/BouncingProbe.h"
#include "ProbeTestHelpers.h"

#include <gtest/gtest.h>

class ProbeSessionTest : public ::testing::Test {
    protected:
        ProbeSessionTest() : bouncing_probe(nullptr), session(nullptr)
        {
            detectors[0] = machine.probe(0);
            detectors[1] = machine.probe(1);
            detectors[2] = machine.probe(2);
            bouncing_probe = new BouncingProbe(&t.kernel, machine, machine, detectors);
            session = new ProbeSession(&t.kernel, machine, detectors, *bouncing_probe);

            params.probe_speed = 5;
            params.lift_speed = 7;
            params.max_distance = 10;
            params.samples = 1;
            params.sample_retract_dist = 2;
            params.samples_tolerance = 0.1F;
            params.samples_tolerance_retries = 0;
            params.samples_result = SAMPLES_AVERAGE;

            machine.position = Position(10, 20, 5);
        }
        ~ProbeSessionTest()
        {
            delete session;
            delete bouncing_probe;
        }

        TestKernel t;
        FakeMachine machine;
        ContactDetector *detectors[3];
        BouncingProbe *bouncing_probe;
        ProbeSession *session;
        ProbeParameters params;
};

TEST_F(ProbeSessionTest, BeginTwiceIsAnError)
{
    ASSERT_TRUE(session->begin("z-").is_ok());
    EXPECT_EQ(ProbeError::SESSION_STATE_ERROR, session->begin("z-").get_code());
    EXPECT_TRUE(session->is_pending());
    EXPECT_EQ(1, machine.probes[Z_AXIS]->begins);
}

TEST_F(ProbeSessionTest, RunAndEndNeedAnOpenSession)
{
    machine.add_sample(1.0F);
    EXPECT_EQ(ProbeError::SESSION_STATE_ERROR, session->run_probe("z-", params).get_code());
    EXPECT_EQ(ProbeError::SESSION_STATE_ERROR, session->end("z-").get_code());
    EXPECT_TRUE(machine.probe_speeds.empty());
    EXPECT_EQ(0, machine.probes[Z_AXIS]->ends);

    ASSERT_TRUE(session->begin("z-").is_ok());
    ASSERT_TRUE(session->end("z-").is_ok());
    EXPECT_EQ(ProbeError::SESSION_STATE_ERROR, session->end("z-").get_code());
}

TEST_F(ProbeSessionTest, HoldsTheProbeOfTheDirectionAxis)
{
    ASSERT_TRUE(session->begin("x+").is_ok());
    EXPECT_TRUE(machine.probes[X_AXIS]->held);
    EXPECT_FALSE(machine.probes[Z_AXIS]->held);
    EXPECT_EQ(X_AXIS, session->get_held_axis());

    // the probe taken in begin is the one given back
    ASSERT_TRUE(session->end("z-").is_ok());
    EXPECT_FALSE(machine.probes[X_AXIS]->held);
    EXPECT_EQ(1, machine.probes[X_AXIS]->ends);
    EXPECT_EQ(0, machine.probes[Z_AXIS]->ends);
    EXPECT_FALSE(session->is_pending());
}

TEST_F(ProbeSessionTest, BadDirectionDoesNotOpen)
{
    EXPECT_EQ(ProbeError::INVALID_DIRECTION, session->begin("up").get_code());
    EXPECT_FALSE(session->is_pending());
    ASSERT_TRUE(session->begin("z-").is_ok());
    EXPECT_EQ(ProbeError::INVALID_DIRECTION, session->run_probe("down", params).get_code());
}

TEST_F(ProbeSessionTest, SingleSampleIsAppended)
{
    machine.add_sample(1.25F);
    ASSERT_TRUE(session->begin("z-").is_ok());
    ASSERT_TRUE(session->run_probe("z-", params).is_ok());

    std::vector<Position> r = session->pull_probed_results();
    ASSERT_EQ(1u, r.size());
    EXPECT_EQ(Position(10, 20, 1.25F), r[0]);
    EXPECT_TRUE(t.output_has("Probing Z axis with negative sense"));

    // pulling empties the buffer
    EXPECT_TRUE(session->pull_probed_results().empty());
    ASSERT_TRUE(session->end("z-").is_ok());
}

TEST_F(ProbeSessionTest, ResultsAccumulateUntilPulled)
{
    machine.add_samples({ 1.0F, 2.0F, 3.0F });
    ASSERT_TRUE(session->begin("z-").is_ok());
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(session->run_probe("z-", params).is_ok());
    }
    std::vector<Position> r = session->pull_probed_results();
    ASSERT_EQ(3u, r.size());
    EXPECT_FLOAT_EQ(1.0F, r[0].z());
    EXPECT_FLOAT_EQ(2.0F, r[1].z());
    EXPECT_FLOAT_EQ(3.0F, r[2].z());
}

TEST_F(ProbeSessionTest, EndClearsResults)
{
    machine.add_sample(1.0F);
    ASSERT_TRUE(session->begin("z-").is_ok());
    ASSERT_TRUE(session->run_probe("z-", params).is_ok());
    ASSERT_TRUE(session->end("z-").is_ok());
    EXPECT_TRUE(session->pull_probed_results().empty());
}

TEST_F(ProbeSessionTest, SamplesAreRetractedBetweenButNotAfter)
{
    params.samples = 3;
    machine.add_samples({ 1.00F, 1.02F, 1.01F });
    ASSERT_TRUE(session->begin("z-").is_ok());
    ASSERT_TRUE(session->run_probe("z-", params).is_ok());

    // three bounces per sample, never more samples than asked for
    EXPECT_EQ(9u, machine.probe_speeds.size());
    EXPECT_EQ(2, machine.count_moves_at(7));
    EXPECT_TRUE(session->get_sample_positions().empty());

    // the retract goes up from the sample by sample_retract_dist
    int n = 0;
    for (auto& m : machine.moves) {
        if(m.speed != 7) continue;
        EXPECT_NEAR(n == 0 ? 3.00F : 3.02F, m.target.z(), 1e-5);
        EXPECT_FLOAT_EQ(10.0F, m.target.x());
        n++;
    }

    std::vector<Position> r = session->pull_probed_results();
    ASSERT_EQ(1u, r.size());
    EXPECT_NEAR(1.01F, r[0].z(), 1e-5);
}

TEST_F(ProbeSessionTest, MedianOfSamples)
{
    params.samples = 3;
    params.samples_result = SAMPLES_MEDIAN;
    machine.add_samples({ 1.00F, 1.08F, 1.02F });
    ASSERT_TRUE(session->begin("z-").is_ok());
    ASSERT_TRUE(session->run_probe("z-", params).is_ok());
    EXPECT_FLOAT_EQ(1.02F, session->pull_probed_results()[0].z());
}

TEST_F(ProbeSessionTest, ToleranceRetryStartsThePointOver)
{
    params.samples = 3;
    params.samples_tolerance = 0.1F;
    params.samples_tolerance_retries = 1;
    machine.add_samples({ 1.00F, 1.05F, 1.25F, 1.00F, 1.02F, 1.03F });

    ASSERT_TRUE(session->begin("z-").is_ok());
    ASSERT_TRUE(session->run_probe("z-", params).is_ok());

    EXPECT_TRUE(t.output_has("Probe samples exceed tolerance. Retrying..."));
    EXPECT_EQ(18u, machine.probe_speeds.size());
    // retracts after 1.00 and 1.05, none after the rejected 1.25, then after 1.00 and 1.02
    EXPECT_EQ(4, machine.count_moves_at(7));

    std::vector<Position> r = session->pull_probed_results();
    ASSERT_EQ(1u, r.size());
    // only the second set counts
    EXPECT_NEAR(1.0167F, r[0].z(), 1e-4);
    EXPECT_FLOAT_EQ(10.0F, r[0].x());
    EXPECT_FLOAT_EQ(20.0F, r[0].y());
}

TEST_F(ProbeSessionTest, NoRetriesLeftIsFatal)
{
    params.samples = 3;
    params.samples_tolerance_retries = 0;
    machine.add_samples({ 1.00F, 1.05F, 1.25F, 1.0F, 1.0F, 1.0F });

    ASSERT_TRUE(session->begin("z-").is_ok());
    EXPECT_EQ(ProbeError::TOLERANCE_EXCEEDED, session->run_probe("z-", params).get_code());
    EXPECT_EQ(9u, machine.probe_speeds.size());
    EXPECT_TRUE(session->pull_probed_results().empty());
    EXPECT_TRUE(session->get_sample_positions().empty());
    // still open, it is up to the caller to end it
    EXPECT_TRUE(session->is_pending());
}

TEST_F(ProbeSessionTest, RetriesRunOut)
{
    params.samples = 2;
    params.samples_tolerance_retries = 2;
    machine.add_samples({ 1.0F, 1.5F, 1.0F, 1.5F, 1.0F, 1.5F, 1.0F, 1.0F });

    ASSERT_TRUE(session->begin("z-").is_ok());
    EXPECT_EQ(ProbeError::TOLERANCE_EXCEEDED, session->run_probe("z-", params).get_code());
    // three tries of two samples
    EXPECT_EQ(18u, machine.probe_speeds.size());
}

TEST_F(ProbeSessionTest, NoContactLeavesTheSessionOpen)
{
    ASSERT_TRUE(session->begin("z-").is_ok());
    EXPECT_EQ(ProbeError::NO_CONTACT_TIMEOUT, session->run_probe("z-", params).get_code());
    EXPECT_TRUE(session->is_pending());
    EXPECT_TRUE(machine.probes[Z_AXIS]->held);

    session->force_end();
    EXPECT_FALSE(session->is_pending());
    EXPECT_FALSE(machine.probes[Z_AXIS]->held);

    // nothing to do when idle
    session->force_end();
    EXPECT_EQ(1, machine.probes[Z_AXIS]->ends);
}

TEST_F(ProbeSessionTest, OtherAxisCannotBeProbed)
{
    machine.add_sample(1.0F);
    ASSERT_TRUE(session->begin("z-").is_ok());
    EXPECT_EQ(ProbeError::SESSION_STATE_ERROR, session->run_probe("x+", params).get_code());
    EXPECT_TRUE(machine.probe_speeds.empty());
}

TEST_F(ProbeSessionTest, InvalidParametersAreRejected)
{
    params.probe_speed = 0;
    ASSERT_TRUE(session->begin("z-").is_ok());
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, session->run_probe("z-", params).get_code());
}

TEST_F(ProbeSessionTest, UnhomedMachine)
{
    machine.homed = "";
    machine.add_sample(1.0F);
    ASSERT_TRUE(session->begin("z-").is_ok());
    EXPECT_EQ(ProbeError::UNHOMED_AXIS, session->run_probe("z-", params).get_code());
    EXPECT_TRUE(session->pull_probed_results().empty());
}
