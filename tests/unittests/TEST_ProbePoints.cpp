#include "modules/tools/probe/ProbePoints.h"
#include "modules/tools/probe/ProbePointsHelper.h"
#include "modules/tools/probe/MultiAxisProbe.h"
#include "modules/communication/CommandDispatch.h"
#include "modules/communication/utils/Command.h"
#include "ProbeTestHelpers.h"

#include <gtest/gtest.h>

static const char *probe_config =
    "probe.speed 5\n"
    "probe.lift_speed 7\n"
    "probe.z_offset 1.5\n"
    "probe.x_offset 2\n"
    "probe.y_offset 3\n";

class ProbePointsTest : public ::testing::Test {
    protected:
        ProbePointsTest() : probe(nullptr), callbacks(0), retries_wanted(0) {}
        ~ProbePointsTest() { delete probe; }

        void load(const std::string& settings)
        {
            t.config.load_string(settings);
            probe = new MultiAxisProbe(machine, machine, machine.probe(0), machine.probe(1), machine.probe(2));
            t.kernel.add_module(probe);
            machine.position = Position(0, 0, 20);
        }

        ProbePointsCallback callback()
        {
            return [this](const ProbeOffsets& offsets, const std::vector<Position>& results) {
                callbacks++;
                last_offsets = offsets;
                last_results = results;
                if(retries_wanted > 0) {
                    retries_wanted--;
                    return POINTS_RETRY;
                }
                return POINTS_DONE;
            };
        }

        TestKernel t;
        FakeMachine machine;
        MultiAxisProbe *probe;
        int callbacks;
        int retries_wanted;
        ProbeOffsets last_offsets;
        std::vector<Position> last_results;
};

TEST(ProbePointsParseTest, ParsesPointList)
{
    std::vector<ProbePoint> points;
    ASSERT_TRUE(parse_probe_points("10,20; 30.5,40 ;50,60;", points).is_ok());
    ASSERT_EQ(3u, points.size());
    EXPECT_FLOAT_EQ(30.5F, points[1].x);
    EXPECT_FLOAT_EQ(60.0F, points[2].y);

    ASSERT_TRUE(parse_probe_points("", points).is_ok());
    EXPECT_TRUE(points.empty());

    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, parse_probe_points("10,20;30", points).get_code());
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, parse_probe_points("10,20,30", points).get_code());
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, parse_probe_points("a,b", points).get_code());
}

TEST_F(ProbePointsTest, ProbesEachPointInOrder)
{
    load(probe_config);
    ProbePointsHelper helper("test", *probe, machine, callback());
    ASSERT_TRUE(helper.update_probe_points({ { 10, 10 }, { 100, 10 }, { 100, 100 } }, 3).is_ok());
    helper.set_speed(50);
    machine.add_samples({ 0.5F, 0.6F, 0.7F });

    ProbeParameterOverrides none;
    ASSERT_TRUE(helper.start_probe(5, none).is_ok());

    EXPECT_EQ(1, callbacks);
    ASSERT_EQ(3u, last_results.size());
    EXPECT_EQ(Position(10, 10, 0.5F), last_results[0]);
    EXPECT_EQ(Position(100, 10, 0.6F), last_results[1]);
    EXPECT_EQ(Position(100, 100, 0.7F), last_results[2]);
    EXPECT_FLOAT_EQ(1.5F, last_offsets.z);

    // probe released at the end
    EXPECT_FALSE(probe->get_session()->is_pending());
    EXPECT_EQ(1, machine.probes[Z_AXIS]->begins);
    EXPECT_EQ(1, machine.probes[Z_AXIS]->ends);
}

TEST_F(ProbePointsTest, FirstRaiseAtTravelSpeedThenLiftSpeed)
{
    load(probe_config);
    ProbePointsHelper helper("test", *probe, machine, callback());
    ASSERT_TRUE(helper.update_probe_points({ { 10, 10 }, { 20, 20 } }, 1).is_ok());
    helper.set_speed(50);
    machine.add_samples({ 0.5F, 0.5F });

    ProbeParameterOverrides none;
    ASSERT_TRUE(helper.start_probe(5, none).is_ok());
    EXPECT_FLOAT_EQ(7.0F, helper.get_lift_speed());

    // the raises are the moves to horizontal_move_z that keep X and Y
    std::vector<FakeMachine::Move> raises;
    Position before(0, 0, 20);
    for (auto& m : machine.moves) {
        if(m.target.z() == 5 && m.target.x() == before.x() && m.target.y() == before.y()) raises.push_back(m);
        before = m.target;
    }
    ASSERT_EQ(3u, raises.size());
    EXPECT_FLOAT_EQ(50.0F, raises[0].speed);
    EXPECT_FLOAT_EQ(7.0F, raises[1].speed);
    EXPECT_FLOAT_EQ(7.0F, raises[2].speed);
}

TEST_F(ProbePointsTest, EachPointIsReachedAtTravelHeight)
{
    load(probe_config);
    ProbePointsHelper helper("test", *probe, machine, callback());
    ASSERT_TRUE(helper.update_probe_points({ { 10, 10 }, { 20, 30 } }, 1).is_ok());
    helper.set_speed(40);
    machine.add_samples({ 0.5F, 0.5F });

    ProbeParameterOverrides none;
    ASSERT_TRUE(helper.start_probe(6, none).is_ok());

    int xy_moves = 0;
    for (auto& m : machine.moves) {
        if(m.speed != 40 || m.target.z() != 6) continue;
        if(m.target.x() == 10 && m.target.y() == 10) xy_moves++;
        if(m.target.x() == 20 && m.target.y() == 30) xy_moves++;
    }
    EXPECT_EQ(2, xy_moves);
}

TEST_F(ProbePointsTest, RetryStartsFromTheFirstPoint)
{
    load(probe_config);
    ProbePointsHelper helper("test", *probe, machine, callback());
    ASSERT_TRUE(helper.update_probe_points({ { 10, 10 }, { 20, 20 } }, 1).is_ok());
    retries_wanted = 1;
    machine.add_samples({ 0.5F, 0.6F, 0.8F, 0.9F });

    ProbeParameterOverrides none;
    ASSERT_TRUE(helper.start_probe(5, none).is_ok());

    EXPECT_EQ(2, callbacks);
    ASSERT_EQ(2u, last_results.size());
    EXPECT_FLOAT_EQ(0.8F, last_results[0].z());
    EXPECT_FLOAT_EQ(0.9F, last_results[1].z());
    EXPECT_EQ(1, machine.probes[Z_AXIS]->begins);
    EXPECT_EQ(1, machine.probes[Z_AXIS]->ends);
}

TEST_F(ProbePointsTest, OffsetsCanBeApplied)
{
    load(probe_config);
    ProbePointsHelper helper("test", *probe, machine, callback());
    ASSERT_TRUE(helper.update_probe_points({ { 10, 10 } }, 1).is_ok());
    helper.use_xy_offsets(true);
    machine.add_sample(0.5F);

    ProbeParameterOverrides none;
    ASSERT_TRUE(helper.start_probe(5, none).is_ok());
    ASSERT_EQ(1u, last_results.size());
    EXPECT_FLOAT_EQ(8.0F, last_results[0].x());
    EXPECT_FLOAT_EQ(7.0F, last_results[0].y());
}

TEST_F(ProbePointsTest, TravelHeightBelowZOffsetIsRefused)
{
    load(probe_config);
    ProbePointsHelper helper("test", *probe, machine, callback());
    ASSERT_TRUE(helper.update_probe_points({ { 10, 10 } }, 1).is_ok());

    ProbeParameterOverrides none;
    ProbeError e = helper.start_probe(1.0F, none);
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, e.get_code());
    EXPECT_EQ("horizontal_move_z can't be less than probe's z_offset", e.get_message());
    EXPECT_EQ(0, machine.probes[Z_AXIS]->begins);
    EXPECT_TRUE(machine.moves.empty());
}

TEST_F(ProbePointsTest, MinimumPoints)
{
    load(probe_config);
    ProbePointsHelper helper("bed", *probe, machine, callback());
    ProbeError e = helper.update_probe_points({ { 10, 10 }, { 20, 20 } }, 3);
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, e.get_code());
    EXPECT_EQ("Need at least 3 probe points for bed", e.get_message());

    ASSERT_TRUE(helper.update_probe_points({}, 0).is_ok());
    ProbeParameterOverrides none;
    EXPECT_EQ(ProbeError::INVALID_CONFIGURATION, helper.start_probe(5, none).get_code());
}

TEST_F(ProbePointsTest, FailedPointLeavesSessionForCleanup)
{
    load(probe_config);
    ProbePointsHelper helper("test", *probe, machine, callback());
    ASSERT_TRUE(helper.update_probe_points({ { 10, 10 }, { 20, 20 } }, 1).is_ok());
    machine.add_sample(0.5F);

    ProbeParameterOverrides none;
    EXPECT_EQ(ProbeError::NO_CONTACT_TIMEOUT, helper.start_probe(5, none).get_code());
    EXPECT_EQ(0, callbacks);
    EXPECT_TRUE(probe->get_session()->is_pending());

    Command c("PROBE_POINTS", &StreamOutput::NullStream);
    t.kernel.call_event(ON_COMMAND_ERROR, &c);
    EXPECT_FALSE(probe->get_session()->is_pending());
    EXPECT_EQ(1, machine.probes[Z_AXIS]->ends);
}

TEST_F(ProbePointsTest, CommandProbesConfiguredPoints)
{
    load(std::string(probe_config) +
         "probe_points.enable true\n"
         "probe_points.points 10,10;20,20\n"
         "probe_points.horizontal_move_z 4\n");
    CommandDispatch dispatch;
    t.kernel.add_module(&dispatch);
    ProbePoints points(*probe, machine);
    t.kernel.add_module(&points);
    ASSERT_TRUE(points.is_enabled());
    machine.add_samples({ 0.25F, 0.75F });

    StringStream reply;
    EXPECT_TRUE(dispatch.dispatch("PROBE_POINTS", &reply));
    EXPECT_NE(std::string::npos, reply.getOutput().find("probe at 10.000,10.000 is z=0.250000"));
    EXPECT_NE(std::string::npos, reply.getOutput().find("probe at 20.000,20.000 is z=0.750000"));
    ASSERT_EQ(2u, points.get_last_results().size());

    // HORIZONTAL_MOVE_Z below the z offset
    reply.clear();
    EXPECT_FALSE(dispatch.dispatch("PROBE_POINTS HORIZONTAL_MOVE_Z=1", &reply));
    EXPECT_NE(std::string::npos, reply.getOutput().find("error:horizontal_move_z can't be less than probe's z_offset"));
}

TEST_F(ProbePointsTest, CommandErrorEndsTheSweep)
{
    load(std::string(probe_config) +
         "probe_points.enable true\n"
         "probe_points.points 10,10;20,20\n");
    CommandDispatch dispatch;
    t.kernel.add_module(&dispatch);
    ProbePoints points(*probe, machine);
    t.kernel.add_module(&points);
    machine.add_sample(0.25F);

    StringStream reply;
    EXPECT_FALSE(dispatch.dispatch("PROBE_POINTS", &reply));
    EXPECT_FALSE(probe->get_session()->is_pending());
    EXPECT_EQ(1, machine.probes[Z_AXIS]->ends);
}

TEST_F(ProbePointsTest, ModuleConfigErrors)
{
    load(std::string(probe_config) +
         "probe_points.enable true\n"
         "probe_points.points 10,10\n"
         "probe_points.min_points 3\n");
    ProbePoints points(*probe, machine);
    t.kernel.add_module(&points);
    EXPECT_FALSE(points.is_enabled());
    EXPECT_TRUE(t.output_has("error:probe_points disabled: Need at least 3 probe points for probe_points"));
}

TEST_F(ProbePointsTest, ModuleIsOffByDefault)
{
    load(probe_config);
    ProbePoints points(*probe, machine);
    t.kernel.add_module(&points);
    EXPECT_FALSE(points.is_enabled());
}
