/*
 * Copyright 2013+ Evgeniy Polyakov <zbr@ioremap.net>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "glossa/config.hpp"
#include "glossa/error.hpp"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <fstream>
#include <limits>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <swarm/logger.hpp>

#ifndef GLOSSA_PROFILE_DIR
#define GLOSSA_PROFILE_DIR "/usr/share/glossa"
#endif

namespace ioremap { namespace glossa {

namespace {

double get_double(const rapidjson::Value &obj, const char *name, double def)
{
	if (!obj.HasMember(name))
		return def;

	const rapidjson::Value &v = obj[name];
	if (!v.IsNumber())
		throw_error(invalid_parameter, "config: field '%s' is not a number", name);

	return v.GetDouble();
}

int64_t get_int(const rapidjson::Value &obj, const char *name, int64_t def)
{
	if (!obj.HasMember(name))
		return def;

	const rapidjson::Value &v = obj[name];
	if (!v.IsInt64())
		throw_error(invalid_parameter, "config: field '%s' is not an integer", name);

	return v.GetInt64();
}

int get_int32(const rapidjson::Value &obj, const char *name, int def)
{
	int64_t value = get_int(obj, name, def);
	if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
		throw_error(invalid_parameter, "config: field '%s' is out of range: %lld", name, static_cast<long long>(value));

	return value;
}

std::string get_string(const rapidjson::Value &obj, const char *name, const std::string &def)
{
	if (!obj.HasMember(name))
		return def;

	const rapidjson::Value &v = obj[name];
	if (!v.IsString())
		throw_error(invalid_parameter, "config: field '%s' is not a string", name);

	return std::string(v.GetString(), v.GetStringLength());
}

int parse_log_level(const rapidjson::Value &v)
{
	if (v.IsInt())
		return v.GetInt();

	if (v.IsString()) {
		const std::string level(v.GetString(), v.GetStringLength());

		if (level == "data")
			return swarm::SWARM_LOG_DATA;
		if (level == "error")
			return swarm::SWARM_LOG_ERROR;
		if (level == "info")
			return swarm::SWARM_LOG_INFO;
		if (level == "notice")
			return swarm::SWARM_LOG_NOTICE;
		if (level == "debug")
			return swarm::SWARM_LOG_DEBUG;
	}

	throw_error(invalid_parameter, "config: invalid 'log-level', must be integer or one of "
			"'data', 'error', 'info', 'notice', 'debug'");
}

void parse_priority(const rapidjson::Value &v, priority_map &priority)
{
	if (!v.IsObject())
		throw_error(invalid_parameter, "config: 'priority' is not an object");

	const std::string mode = get_string(v, "mode", "additive");
	if (mode == "additive")
		priority.mode = priority_map::additive;
	else if (mode == "replace")
		priority.mode = priority_map::replace;
	else
		throw_error(invalid_parameter, "config: invalid priority mode '%s'", mode.c_str());

	if (!v.HasMember("weights"))
		return;

	const rapidjson::Value &weights = v["weights"];
	if (!weights.IsObject())
		throw_error(invalid_parameter, "config: priority 'weights' is not an object");

	for (auto it = weights.MemberBegin(); it != weights.MemberEnd(); ++it) {
		if (!it->value.IsNumber())
			throw_error(invalid_parameter, "config: priority weight of '%s' is not a number", it->name.GetString());

		priority.weights[std::string(it->name.GetString(), it->name.GetStringLength())] = it->value.GetDouble();
	}
}

void parse_detector(const rapidjson::Value &v, detector_options &opts)
{
	if (!v.IsObject())
		throw_error(invalid_parameter, "config: 'detector' is not an object");

	opts.alpha = get_double(v, "alpha", opts.alpha);

	int64_t max_text_length = get_int(v, "max-text-length", opts.max_text_length);
	if (max_text_length < 0)
		throw_error(invalid_parameter, "config: 'max-text-length' must be non-negative");
	opts.max_text_length = max_text_length;

	opts.prob_threshold = get_double(v, "prob-threshold", opts.prob_threshold);
	opts.min_confidence = get_double(v, "min-confidence", opts.min_confidence);
	opts.trials = get_int32(v, "trials", opts.trials);
	opts.iteration_limit = get_int32(v, "iteration-limit", opts.iteration_limit);

	int64_t time_budget = get_int(v, "time-budget", opts.time_budget);
	if (time_budget < std::numeric_limits<long>::min() || time_budget > std::numeric_limits<long>::max())
		throw_error(invalid_parameter, "config: 'time-budget' is out of range");
	opts.time_budget = time_budget;

	if (v.HasMember("seed")) {
		if (!v["seed"].IsUint64())
			throw_error(invalid_parameter, "config: 'seed' must be a non-negative integer");

		opts.seed = v["seed"].GetUint64();
	}

	if (v.HasMember("priority"))
		parse_priority(v["priority"], opts.priority);

	opts.check();
}

}

void detector_options::check(void) const
{
	if (!(alpha >= 0 && alpha <= 1))
		throw_error(invalid_parameter, "alpha must be in [0, 1] range, got %f", alpha);
	if (!(prob_threshold >= 0 && prob_threshold < 1))
		throw_error(invalid_parameter, "probability threshold must be in [0, 1) range, got %f", prob_threshold);
	if (!(min_confidence >= 0 && min_confidence < 1))
		throw_error(invalid_parameter, "minimum confidence must be in [0, 1) range, got %f", min_confidence);
	if (trials <= 0)
		throw_error(invalid_parameter, "number of trials must be positive, got %d", trials);
	if (iteration_limit <= 0)
		throw_error(invalid_parameter, "iteration limit must be positive, got %d", iteration_limit);
	if (time_budget < 0)
		throw_error(invalid_parameter, "time budget must be non-negative, got %ld", time_budget);

	for (auto it = priority.weights.begin(); it != priority.weights.end(); ++it) {
		if (!(it->second >= 0))
			throw_error(invalid_parameter, "priority of '%s' must be non-negative", it->first.c_str());
	}
}

std::string default_profile_dir(void)
{
	const char *env = getenv("GLOSSA_PROFILE_DIR");
	if (env && *env)
		return env;

	return GLOSSA_PROFILE_DIR;
}

config::config() : log_file("/dev/stderr"), log_level(swarm::SWARM_LOG_ERROR)
{
	const std::string dir = default_profile_dir();

	profiles = dir + "/profiles";
	short_profiles = dir + "/profiles.sm";
	cjk_clusters = dir + "/cjk-clusters.json";
}

config config::parse(const std::string &json)
{
	rapidjson::Document doc;
	doc.Parse<0>(json.c_str());

	if (doc.HasParseError()) {
		throw_error(invalid_parameter, "config: %s at offset %zu",
				rapidjson::GetParseError_En(doc.GetParseError()),
				static_cast<size_t>(doc.GetErrorOffset()));
	}

	if (!doc.IsObject())
		throw_error(invalid_parameter, "config: top level value is not an object");

	config cfg;

	cfg.profiles = get_string(doc, "profiles", cfg.profiles);
	cfg.short_profiles = get_string(doc, "short-profiles", cfg.short_profiles);
	cfg.cjk_clusters = get_string(doc, "cjk-clusters", cfg.cjk_clusters);
	cfg.log_file = get_string(doc, "log-file", cfg.log_file);

	if (doc.HasMember("log-level"))
		cfg.log_level = parse_log_level(doc["log-level"]);

	if (doc.HasMember("detector"))
		parse_detector(doc["detector"], cfg.detector);

	return cfg;
}

config config::load(const std::string &path)
{
	std::ifstream in(path.c_str(), std::ios::binary);
	if (!in) {
		int err = errno;
		throw_error(source_unavailable, "can't open config '%s': %s [%d]", path.c_str(), strerror(err), err);
	}

	std::ostringstream ss;
	ss << in.rdbuf();

	return parse(ss.str());
}

}} // namespace ioremap::glossa
