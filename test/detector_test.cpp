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

#include "glossa/error.hpp"
#include "glossa/registry.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>

#include <gtest/gtest.h>

using namespace ioremap::glossa;

namespace {

class detector_test : public ::testing::Test {
	protected:
		detector_test() : m_registry("test", test::null_logger()) {
			m_registry.load_records(test::sample_profiles());
		}

		detector create(void) {
			return m_registry.create();
		}

		detector create(const detector_options &opts) {
			return m_registry.create(opts);
		}

		double probability(detector &d, const std::string &lang) {
			const std::vector<double> &prob = d.probabilities();
			size_t index = std::find(d.languages().begin(), d.languages().end(), lang) - d.languages().begin();
			if (index >= prob.size())
				return -1;

			return prob[index];
		}

		registry m_registry;
};

double sum(const std::vector<double> &prob)
{
	return std::accumulate(prob.begin(), prob.end(), 0.0);
}

}

TEST_F(detector_test, detects_sample_languages)
{
	const std::vector<std::pair<std::string, const char *>> samples = {
		{ "en", test::english },
		{ "de", test::german },
		{ "fr", test::french },
		{ "ru", test::russian },
	};

	for (auto it = samples.begin(); it != samples.end(); ++it) {
		detector d = create();
		d.append(it->second);
		EXPECT_EQ(it->first, d.detect()) << it->second;
	}
}

TEST_F(detector_test, detects_fragments)
{
	detector en = create();
	en.append("the children are playing in the park with their friends");
	EXPECT_EQ("en", en.detect());

	detector de = create();
	de.append("die Kinder spielen mit ihren Freunden im Park");
	EXPECT_EQ("de", de.detect());

	detector fr = create();
	fr.append("les enfants jouent dans le parc avec leurs amis");
	EXPECT_EQ("fr", fr.detect());
}

TEST_F(detector_test, latin_noise_in_cyrillic_text)
{
	detector d = create();
	d.append(std::string(test::russian) + " see http://example.com and the park");
	EXPECT_EQ("ru", d.detect());
}

TEST_F(detector_test, append_stream)
{
	std::istringstream in(test::german);

	detector d = create();
	d.append(in);
	EXPECT_EQ("de", d.detect());
}

TEST_F(detector_test, no_evidence)
{
	detector d = create();
	EXPECT_EQ(detector::unknown_language, d.detect());
	EXPECT_TRUE(d.probabilities().empty());
	EXPECT_TRUE(d.get_probabilities().empty());

	d.append("12345 !!! ... 2013-10-19");
	EXPECT_EQ(detector::unknown_language, d.detect());
	EXPECT_TRUE(d.get_probabilities().empty());

	// greek is not loaded, so none of its grams is known
	d.append("\xce\xb1\xce\xb2\xce\xb3\xce\xb4 \xce\xb5\xce\xb6\xce\xb7");
	EXPECT_EQ(detector::unknown_language, d.detect());
	EXPECT_EQ(0u, d.evidence_size());
}

TEST_F(detector_test, states)
{
	detector d = create();
	EXPECT_EQ(detector::state_fresh, d.state());

	d.set_alpha(0.4);
	EXPECT_EQ(detector::state_fresh, d.state());

	d.append(test::english);
	EXPECT_EQ(detector::state_accumulating, d.state());

	d.detect();
	EXPECT_EQ(detector::state_estimated, d.state());
	EXPECT_GT(d.evidence_size(), 0u);

	d.get_probabilities();
	EXPECT_EQ(detector::state_estimated, d.state());

	d.append(test::english);
	EXPECT_EQ(detector::state_accumulating, d.state());

	d.probabilities();
	EXPECT_EQ(detector::state_estimated, d.state());

	d.set_alpha(0.6);
	EXPECT_EQ(detector::state_accumulating, d.state());
}

TEST_F(detector_test, distribution)
{
	detector_options opts;
	opts.prob_threshold = 0;

	detector d = create(opts);
	d.append("Wir glauben, dass this is the best way");

	const std::vector<double> &prob = d.probabilities();
	ASSERT_EQ(4u, prob.size());
	EXPECT_NEAR(1.0, sum(prob), 1e-6);

	for (auto it = prob.begin(); it != prob.end(); ++it) {
		EXPECT_GE(*it, 0.0);
		EXPECT_LE(*it, 1.0);
	}

	std::vector<language> langs = d.get_probabilities();
	ASSERT_FALSE(langs.empty());

	double total = 0;
	for (size_t i = 0; i < langs.size(); ++i) {
		if (i > 0)
			EXPECT_GE(langs[i - 1].prob, langs[i].prob);

		EXPECT_GT(langs[i].prob, 0.0);
		total += langs[i].prob;
	}

	EXPECT_NEAR(1.0, total, 1e-6);
	EXPECT_EQ(langs[0].name, d.detect());
}

TEST_F(detector_test, threshold)
{
	detector d = create();
	d.append(test::french);

	std::vector<language> langs = d.get_probabilities();
	ASSERT_EQ(1u, langs.size());
	EXPECT_EQ("fr", langs[0].name);
	EXPECT_GT(langs[0].prob, 0.99);
}

TEST_F(detector_test, seeded_estimation_is_reproducible)
{
	detector_options opts;
	opts.seed = 42;
	opts.prob_threshold = 0;

	const std::string text = "Das Wetter ist heute nice and the children";

	detector d1 = create(opts);
	d1.append(text);
	const std::vector<double> first = d1.probabilities();

	// estimation restarts from the seed every time
	d1.set_seed(42);
	EXPECT_EQ(first, d1.probabilities());

	detector d2 = create(opts);
	d2.append(text);
	EXPECT_EQ(first, d2.probabilities());

	m_registry.set_seed(42);
	detector d3 = create();
	d3.append(text);
	EXPECT_EQ(first, d3.probabilities());
}

TEST_F(detector_test, truncation)
{
	detector_options opts;
	opts.max_text_length = 10;

	detector d = create(opts);
	d.append("the quick brown fox");
	EXPECT_TRUE(d.truncated());
	EXPECT_EQ("the quick ", d.text());

	d.append(test::german);
	EXPECT_EQ("the quick ", d.text());
	EXPECT_EQ("en", d.detect());

	detector full = create();
	full.append("the quick brown fox");
	EXPECT_FALSE(full.truncated());
	EXPECT_EQ("the quick brown fox", full.text());
}

TEST_F(detector_test, replace_priority)
{
	detector_options opts;
	opts.prob_threshold = 0;
	opts.priority.mode = priority_map::replace;
	opts.priority.weights["de"] = 1;
	opts.priority.weights["fr"] = 1;

	detector d = create(opts);
	d.append(test::english);

	EXPECT_EQ(0.0, probability(d, "en"));
	EXPECT_EQ(0.0, probability(d, "ru"));
	EXPECT_NEAR(1.0, probability(d, "de") + probability(d, "fr"), 1e-6);

	std::vector<language> langs = d.get_probabilities();
	for (auto it = langs.begin(); it != langs.end(); ++it)
		EXPECT_TRUE(it->name == "de" || it->name == "fr") << *it;

	const std::string lang = d.detect();
	EXPECT_TRUE(lang == "de" || lang == "fr") << lang;
}

TEST_F(detector_test, replace_priority_without_loaded_languages)
{
	detector_options opts;
	opts.seed = 1;

	detector plain = create(opts);
	plain.append("the the the");

	opts.priority.mode = priority_map::replace;
	opts.priority.weights["xx"] = 1;

	detector d = create(opts);
	d.append("the the the");
	EXPECT_EQ("en", d.detect());
	EXPECT_NEAR(1.0, sum(d.probabilities()), 1e-6);
	EXPECT_EQ(plain.probabilities(), d.probabilities());
}

TEST_F(detector_test, additive_priority)
{
	detector d = create();
	d.append(test::english);
	EXPECT_EQ("en", d.detect());

	priority_map priority;
	priority.weights["de"] = 10;
	d.set_priority(priority);

	EXPECT_EQ(detector::state_accumulating, d.state());
	EXPECT_EQ("de", d.detect());
	EXPECT_NEAR(1.0, sum(d.probabilities()), 1e-6);
	EXPECT_GT(probability(d, "de"), 0.9);
}

TEST_F(detector_test, equal_languages_keep_load_order)
{
	registry reg("twins", test::null_logger());

	std::vector<profile_record> profiles;
	profiles.push_back(test::make_profile("en-us", test::english));
	profiles.push_back(test::make_profile("en-gb", test::english));
	profiles.push_back(test::make_profile("ru", test::russian));
	reg.load_records(profiles);

	detector d = reg.create();
	d.append(test::english);

	std::vector<language> langs = d.get_probabilities();
	ASSERT_EQ(2u, langs.size());
	EXPECT_EQ("en-us", langs[0].name);
	EXPECT_EQ("en-gb", langs[1].name);
	EXPECT_EQ(langs[0].prob, langs[1].prob);
	EXPECT_EQ("en-us", d.detect());

	detector_options opts;
	opts.min_confidence = 0.6;

	detector unsure = reg.create(opts);
	unsure.append(test::english);
	EXPECT_EQ(detector::unknown_language, unsure.detect());
}

TEST_F(detector_test, invalid_parameters)
{
	detector d = create();

	EXPECT_THROW(d.set_alpha(-0.1), invalid_parameter_error);
	EXPECT_THROW(d.set_alpha(1.1), invalid_parameter_error);
	EXPECT_DOUBLE_EQ(0.5, d.options().alpha);

	d.set_alpha(0);
	d.set_alpha(1);
	EXPECT_DOUBLE_EQ(1.0, d.options().alpha);

	EXPECT_THROW(d.set_time_budget(-1), invalid_parameter_error);

	priority_map priority;
	priority.weights["en"] = -1;
	EXPECT_THROW(d.set_priority(priority), invalid_parameter_error);
	EXPECT_TRUE(d.options().priority.empty());

	detector_options opts;
	opts.trials = 0;
	EXPECT_THROW(create(opts), invalid_parameter_error);
}

TEST_F(detector_test, zero_alpha)
{
	detector_options opts;
	opts.alpha = 0;

	detector d = create(opts);
	d.append(test::german);
	EXPECT_EQ("de", d.detect());
	EXPECT_NEAR(1.0, sum(d.probabilities()), 1e-6);
}

TEST_F(detector_test, time_budget)
{
	detector_options opts;
	opts.trials = 100000;
	opts.time_budget = 1;

	detector d = create(opts);
	d.append(test::french);
	EXPECT_EQ("fr", d.detect());
	EXPECT_NEAR(1.0, sum(d.probabilities()), 1e-6);
}

TEST_F(detector_test, empty_table)
{
	std::shared_ptr<const probability_table> table = std::make_shared<probability_table>();
	EXPECT_THROW({
		detector d(table, detector_options(), test::null_logger());
	}, not_ready_error);
}

TEST(language, print)
{
	std::ostringstream ss;
	ss << language("en", 0.5);
	EXPECT_EQ("en:0.5", ss.str());
}
