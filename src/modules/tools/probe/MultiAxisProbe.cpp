/*
      This file is part of Smoothie (http://smoothieware.org/). The motion control part is heavily based on Grbl (https://github.com/simen/grbl).
      Smoothie is free software: you can redistribute it and/or modify it under the terms of the GNU General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
      Smoothie is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
      You should have received a copy of the GNU General Public License along with Smoothie. If not, see <http://www.gnu.org/licenses/>.
*/


#include "MultiAxisProbe.h"
#include "BouncingProbe.h"
#include "ProbeDirection.h"
#include "ProbeStatistics.h"
#include "libs/Kernel.h"
#include "libs/Config.h"
#include "libs/ConfigValue.h"
#include "libs/checksumm.h"
#include "libs/StreamOutput.h"
#include "libs/StreamOutputPool.h"
#include "modules/communication/utils/Command.h"
#include "modules/robot/MotionExecutor.h"
#include "modules/robot/Kinematics.h"
#include "modules/robot/ContactDetector.h"

#include <cmath>

#define enable_checksum                    CHECKSUM("enable")
#define name_checksum                      CHECKSUM("name")
#define speed_checksum                     CHECKSUM("speed")
#define lift_speed_checksum                CHECKSUM("lift_speed")
#define max_distance_checksum              CHECKSUM("max_distance")
#define samples_checksum                   CHECKSUM("samples")
#define sample_retract_dist_checksum       CHECKSUM("sample_retract_dist")
#define samples_result_checksum            CHECKSUM("samples_result")
#define samples_tolerance_checksum         CHECKSUM("samples_tolerance")
#define samples_tolerance_retries_checksum CHECKSUM("samples_tolerance_retries")
#define x_offset_checksum                  CHECKSUM("x_offset")
#define y_offset_checksum                  CHECKSUM("y_offset")
#define z_offset_checksum                  CHECKSUM("z_offset")

#define DEFAULT_ACCURACY_SAMPLES 10

MultiAxisProbe::MultiAxisProbe(MotionExecutor& motion, Kinematics& kinematics, ContactDetector *x, ContactDetector *y, ContactDetector *z)
    : motion(motion), kinematics(kinematics), bouncing_probe(nullptr), session(nullptr), name("probe"), last_z_result(0)
{
    detectors[X_AXIS] = x;
    detectors[Y_AXIS] = y;
    detectors[Z_AXIS] = z;
    offsets.x = offsets.y = offsets.z = 0;
    enabled = false;
    last_state = false;
}

MultiAxisProbe::~MultiAxisProbe()
{
    delete session;
    delete bouncing_probe;
}

void MultiAxisProbe::on_module_loaded()
{
    // if the module is disabled -> do nothing
    if(!kernel->config->value( probe_checksum, enable_checksum )->by_default(true)->as_bool()) {
        return;
    }

    // load settings
    ProbeError e = this->config_load();
    if(!e.is_ok()) {
        kernel->streams->printf("error:probe disabled: %s\n", e.get_message().c_str());
        return;
    }

    this->bouncing_probe = new BouncingProbe(kernel, motion, kinematics, detectors);
    this->session = new ProbeSession(kernel, motion, detectors, *bouncing_probe);
    this->enabled = true;

    // register event-handlers
    register_for_event(ON_COMMAND_RECEIVED);
    register_for_event(ON_COMMAND_ERROR);
}

// a setting that has to be a whole number
static ProbeError config_int(float value, const char *key, int& out)
{
    if(!to_whole_number(value, out)) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, std::string("probe.") + key + " must be a whole number");
    }
    return ProbeError::ok();
}

ProbeError MultiAxisProbe::config_load()
{
    Config *config = kernel->config;
    ProbeError e;

    this->name = config->value(probe_checksum, name_checksum)->by_default(std::string("probe"))->as_string();

    defaults.probe_speed = config->value(probe_checksum, speed_checksum)->by_default(5.0F)->as_number(); // mm/sec
    defaults.lift_speed = config->value(probe_checksum, lift_speed_checksum)->by_default(defaults.probe_speed)->as_number(); // mm/sec
    defaults.max_distance = config->value(probe_checksum, max_distance_checksum)->by_default(10.0F)->as_number();
    if(!(e = config_int(config->value(probe_checksum, samples_checksum)->by_default(1)->as_number(), "samples", defaults.samples)).is_ok()) return e;
    defaults.sample_retract_dist = config->value(probe_checksum, sample_retract_dist_checksum)->by_default(2.0F)->as_number();
    if(!(e = parse_samples_result(config->value(probe_checksum, samples_result_checksum)->by_default(std::string("average"))->as_string(), defaults.samples_result)).is_ok()) return e;
    defaults.samples_tolerance = config->value(probe_checksum, samples_tolerance_checksum)->by_default(0.1F)->as_number();
    if(!(e = config_int(config->value(probe_checksum, samples_tolerance_retries_checksum)->by_default(0)->as_number(), "samples_tolerance_retries", defaults.samples_tolerance_retries)).is_ok()) return e;

    e = defaults.validate();
    if(!e.is_ok()) return e;

    offsets.x = config->value(probe_checksum, x_offset_checksum)->by_default(0.0F)->as_number();
    offsets.y = config->value(probe_checksum, y_offset_checksum)->by_default(0.0F)->as_number();
    // there is no sensible default for the z offset
    ConfigValue *z = config->value(probe_checksum, z_offset_checksum);
    if(!z->is_found()) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, "probe.z_offset must be set");
    }
    offsets.z = z->as_number();

    if(!std::isfinite(offsets.x) || !std::isfinite(offsets.y) || !std::isfinite(offsets.z)) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, "probe offsets must be numbers");
    }
    return ProbeError::ok();
}

ProbeError MultiAxisProbe::get_probe_params(const ProbeParameterOverrides& overrides, ProbeParameters& params) const
{
    ProbeParameters merged = merge_probe_parameters(defaults, overrides);
    ProbeError e = merged.validate();
    if(!e.is_ok()) return e;
    params = merged;
    return ProbeError::ok();
}

ProbeStatus MultiAxisProbe::get_status() const
{
    ProbeStatus status;
    status.name = name;
    status.last_query = last_state;
    status.last_z_result = last_z_result;
    return status;
}

ProbeError MultiAxisProbe::start_probe_session(const std::string& direction, ProbeSession*& s)
{
    if(!enabled) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, "probe is not enabled");
    }
    ProbeError e = session->begin(direction);
    if(!e.is_ok()) return e;
    s = session;
    return ProbeError::ok();
}

// on failure the session is left open, the command error that follows ends it
ProbeError MultiAxisProbe::run_single_probe(const std::string& direction, const ProbeParameters& params, Position& result)
{
    ProbeSession *s;
    ProbeError e = start_probe_session(direction, s);
    if(!e.is_ok()) return e;

    e = s->run_probe(direction, params);
    if(!e.is_ok()) return e;

    std::vector<Position> results = s->pull_probed_results();
    e = s->end(direction);
    if(!e.is_ok()) return e;

    result = results[0];
    return ProbeError::ok();
}

void MultiAxisProbe::on_command_received(void *argument)
{
    Command *command = static_cast<Command *>(argument);
    ProbeError e;

    if(command->is("PROBE")) {
        command->is_handled = true;
        e = probe_command(command);

    } else if(command->is("PROBE_ACCURACY")) {
        command->is_handled = true;
        e = probe_accuracy_command(command);

    } else if(command->is("QUERY_PROBE")) {
        command->is_handled = true;
        e = query_probe_command(command);

    } else {
        return;
    }

    if(!e.is_ok()) {
        command->stream->printf("error:%s\n", e.get_message().c_str());
        command->is_error = true;
    }
}

// a command failed, so a session it had open will never be ended by it
void MultiAxisProbe::on_command_error(void *argument)
{
    if(session != nullptr && session->is_pending()) {
        session->force_end();
    }
}

// PROBE DIRECTION=z- and any of the probe parameter overrides
ProbeError MultiAxisProbe::probe_command(Command *command)
{
    std::string direction = command->get_string("DIRECTION", "z-");

    ProbeParameterOverrides overrides;
    ProbeError e = parse_probe_overrides(*command, overrides);
    if(!e.is_ok()) return e;

    ProbeParameters params;
    e = get_probe_params(overrides, params);
    if(!e.is_ok()) return e;

    Position pos;
    e = run_single_probe(direction, params, pos);
    if(!e.is_ok()) return e;

    command->stream->printf("Result is %1.4f, %1.4f, %1.4f\n", pos.x(), pos.y(), pos.z());
    this->last_z_result = pos.z();
    return ProbeError::ok();
}

// PROBE_ACCURACY DIRECTION=z- SAMPLES=10
// measures the same point over and over and reports the spread
ProbeError MultiAxisProbe::probe_accuracy_command(Command *command)
{
    std::string direction = command->get_string("DIRECTION", "z-");
    ProbeDirection d;
    ProbeError e = resolve_direction(direction, d);
    if(!e.is_ok()) return e;

    ProbeParameterOverrides overrides;
    e = parse_probe_overrides(*command, overrides);
    if(!e.is_ok()) return e;

    int sample_count = overrides.samples.or_default(DEFAULT_ACCURACY_SAMPLES);
    if(sample_count < 1) {
        return ProbeError(ProbeError::INVALID_CONFIGURATION, "SAMPLES must be at least 1");
    }

    ProbeParameters params;
    e = get_probe_params(overrides, params);
    if(!e.is_ok()) return e;

    Position pos = motion.get_position();
    command->stream->printf("PROBE_ACCURACY at X:%.3f Y:%.3f Z:%.3f (samples=%d retract=%.3f speed=%.1f lift_speed=%.1f)\n",
                            pos.x(), pos.y(), pos.z(), sample_count, params.sample_retract_dist, params.probe_speed, params.lift_speed);

    // each run_probe is a single sample, the retract between them is done here
    ProbeParameterOverrides one_sample = overrides;
    one_sample.samples.assign(1);
    ProbeParameters sample_params;
    e = get_probe_params(one_sample, sample_params);
    if(!e.is_ok()) return e;

    ProbeSession *s;
    e = start_probe_session(direction, s);
    if(!e.is_ok()) return e;

    for (int probe_num = 1; probe_num <= sample_count; ++probe_num) {
        e = s->run_probe(direction, sample_params);
        if(!e.is_ok()) return e;

        // retract
        Position p = motion.get_position();
        motion.move_to(p.with_axis(d.axis, p[d.axis] - d.sign * params.sample_retract_dist), params.lift_speed);
        command->stream->printf("finished sample %d of %d\n", probe_num, sample_count);
    }

    std::vector<Position> positions = s->pull_probed_results();
    e = s->end(direction);
    if(!e.is_ok()) return e;

    ProbeAccuracy a = calc_probe_accuracy(positions, d.axis);
    command->stream->printf("probe accuracy results: maximum %.6f, minimum %.6f, range %.6f, average %.6f, median %.6f, standard deviation %.6f\n",
                            a.maximum, a.minimum, a.range, a.average, a.median, a.sigma);
    return ProbeError::ok();
}

ProbeError MultiAxisProbe::query_probe_command(Command *command)
{
    double print_time = motion.get_last_move_time();
    bool res = detectors[Z_AXIS]->query_endstop(print_time);
    this->last_state = res;
    command->stream->printf("probe: %s\n", res ? "TRIGGERED" : "open");
    return ProbeError::ok();
}
