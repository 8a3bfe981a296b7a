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

#include "common.hpp"

#include "glossa/config.hpp"
#include "glossa/error.hpp"

#include <stdlib.h>

#include <gtest/gtest.h>

using namespace ioremap::glossa;

TEST(config, defaults)
{
	config cfg;

	const std::string dir = default_profile_dir();
	EXPECT_EQ(dir + "/profiles", cfg.profiles);
	EXPECT_EQ(dir + "/profiles.sm", cfg.short_profiles);
	EXPECT_EQ(dir + "/cjk-clusters.json", cfg.cjk_clusters);
	EXPECT_EQ("/dev/stderr", cfg.log_file);
	EXPECT_EQ(ioremap::swarm::SWARM_LOG_ERROR, cfg.log_level);

	const detector_options &opts = cfg.detector;
	EXPECT_DOUBLE_EQ(0.5, opts.alpha);
	EXPECT_EQ(10000u, opts.max_text_length);
	EXPECT_DOUBLE_EQ(0.1, opts.prob_threshold);
	EXPECT_DOUBLE_EQ(0.1, opts.min_confidence);
	EXPECT_EQ(7, opts.trials);
	EXPECT_EQ(1000, opts.iteration_limit);
	EXPECT_EQ(0, opts.time_budget);
	EXPECT_FALSE(!!opts.seed);
	EXPECT_TRUE(opts.priority.empty());
	EXPECT_EQ(priority_map::additive, opts.priority.mode);

	EXPECT_NO_THROW(opts.check());
}

TEST(config, parse)
{
	config cfg = config::parse(
		"{"
		"  \"profiles\": \"/data/profiles\","
		"  \"short-profiles\": \"/data/short\","
		"  \"cjk-clusters\": \"/data/clusters.json\","
		"  \"log-file\": \"/tmp/glossa.log\","
		"  \"log-level\": \"debug\","
		"  \"detector\": {"
		"    \"alpha\": 0.3,"
		"    \"max-text-length\": 500,"
		"    \"prob-threshold\": 0.2,"
		"    \"min-confidence\": 0.4,"
		"    \"trials\": 3,"
		"    \"iteration-limit\": 200,"
		"    \"time-budget\": 50,"
		"    \"seed\": 12345,"
		"    \"priority\": { \"mode\": \"replace\", \"weights\": { \"en\": 1, \"de\": 0.5 } }"
		"  }"
		"}");

	EXPECT_EQ("/data/profiles", cfg.profiles);
	EXPECT_EQ("/data/short", cfg.short_profiles);
	EXPECT_EQ("/data/clusters.json", cfg.cjk_clusters);
	EXPECT_EQ("/tmp/glossa.log", cfg.log_file);
	EXPECT_EQ(ioremap::swarm::SWARM_LOG_DEBUG, cfg.log_level);

	const detector_options &opts = cfg.detector;
	EXPECT_DOUBLE_EQ(0.3, opts.alpha);
	EXPECT_EQ(500u, opts.max_text_length);
	EXPECT_DOUBLE_EQ(0.2, opts.prob_threshold);
	EXPECT_DOUBLE_EQ(0.4, opts.min_confidence);
	EXPECT_EQ(3, opts.trials);
	EXPECT_EQ(200, opts.iteration_limit);
	EXPECT_EQ(50, opts.time_budget);
	ASSERT_TRUE(!!opts.seed);
	EXPECT_EQ(12345u, *opts.seed);

	EXPECT_EQ(priority_map::replace, opts.priority.mode);
	ASSERT_EQ(2u, opts.priority.weights.size());
	EXPECT_DOUBLE_EQ(1.0, opts.priority.weights.at("en"));
	EXPECT_DOUBLE_EQ(0.5, opts.priority.weights.at("de"));
}

TEST(config, partial)
{
	config cfg = config::parse("{ \"log-level\": 4, \"detector\": { \"alpha\": 1 } }");

	EXPECT_EQ(4, cfg.log_level);
	EXPECT_DOUBLE_EQ(1.0, cfg.detector.alpha);
	EXPECT_EQ(7, cfg.detector.trials);
	EXPECT_EQ(config().profiles, cfg.profiles);
}

TEST(config, invalid)
{
	const char *broken[] = {
		"",
		"[]",
		"{ \"profiles\": 1 }",
		"{ \"log-level\": \"verbose\" }",
		"{ \"detector\": [] }",
		"{ \"detector\": { \"alpha\": 2 } }",
		"{ \"detector\": { \"alpha\": \"high\" } }",
		"{ \"detector\": { \"trials\": 0 } }",
		"{ \"detector\": { \"trials\": 1.5 } }",
		"{ \"detector\": { \"trials\": 4294967297 } }",
		"{ \"detector\": { \"iteration-limit\": 2147483648 } }",
		"{ \"detector\": { \"iteration-limit\": -4294967295 } }",
		"{ \"detector\": { \"max-text-length\": -1 } }",
		"{ \"detector\": { \"time-budget\": -1 } }",
		"{ \"detector\": { \"prob-threshold\": 1 } }",
		"{ \"detector\": { \"seed\": -1 } }",
		"{ \"detector\": { \"priority\": { \"mode\": \"multiply\" } } }",
		"{ \"detector\": { \"priority\": { \"weights\": { \"en\": -0.5 } } } }",
		"{ \"detector\": { \"priority\": { \"weights\": { \"en\": \"a lot\" } } } }",
	};

	for (size_t i = 0; i < sizeof(broken) / sizeof(broken[0]); ++i) {
		try {
			config::parse(broken[i]);
			ADD_FAILURE() << "config accepted: " << broken[i];
		} catch (const error &e) {
			EXPECT_EQ(invalid_parameter, e.code()) << broken[i];
		}
	}
}

TEST(config, load)
{
	test::temp_dir tmp;
	const std::string path = tmp.write("glossa.conf", "{ \"profiles\": \"/srv/profiles\" }");

	EXPECT_EQ("/srv/profiles", config::load(path).profiles);
	EXPECT_THROW(config::load(tmp.path() + "/missing.conf"), source_unavailable_error);
}

TEST(config, profile_dir_from_environment)
{
	const char *old = getenv("GLOSSA_PROFILE_DIR");
	const std::string saved = old ? old : "";

	setenv("GLOSSA_PROFILE_DIR", "/opt/glossa", 1);

	config cfg;
	EXPECT_EQ("/opt/glossa", default_profile_dir());
	EXPECT_EQ("/opt/glossa/profiles", cfg.profiles);
	EXPECT_EQ("/opt/glossa/profiles.sm", cfg.short_profiles);
	EXPECT_EQ("/opt/glossa/cjk-clusters.json", cfg.cjk_clusters);

	if (old)
		setenv("GLOSSA_PROFILE_DIR", saved.c_str(), 1);
	else
		unsetenv("GLOSSA_PROFILE_DIR");
}
