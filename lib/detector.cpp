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

#include "glossa/detector.hpp"
#include "glossa/error.hpp"
#include "glossa/timer.hpp"
#include "glossa/unicode.hpp"

#include <math.h>

#include <algorithm>
#include <istream>
#include <ostream>
#include <sstream>

namespace ioremap { namespace glossa {

namespace {

const double alpha_width = 0.05;
const double conv_threshold = 0.99999;
const double sum_tolerance = 1e-9;

/*
 * Bayesian update of @prob with one gram whose per-language probabilities are @row,
 * every language also gets alpha/n of the uniform distribution.
 * Returns the highest probability after the update.
 */
double update_probability(std::vector<double> &prob, const std::vector<double> &row, double alpha)
{
	const size_t n = prob.size();
	const double uniform = alpha / n;

	double sum = 0;
	for (size_t i = 0; i < n; ++i)
		sum += prob[i] * ((1.0 - alpha) * row[i] + uniform);

	// zero alpha and a gram unknown to every language with non-zero probability
	if (!(sum > 0) || !isfinite(sum))
		return *std::max_element(prob.begin(), prob.end());

	double total = 0;
	for (size_t i = 0; i < n; ++i) {
		double p = prob[i] * ((1.0 - alpha) * row[i] + uniform) / sum;
		prob[i] = std::min(1.0, std::max(0.0, p));
		total += prob[i];
	}

	if (fabs(total - 1.0) > sum_tolerance) {
		for (size_t i = 0; i < n; ++i)
			prob[i] /= total;
	}

	return *std::max_element(prob.begin(), prob.end());
}

}

const char *const detector::unknown_language = "unknown";

detector::detector(const std::shared_ptr<const probability_table> &table, const detector_options &opts,
		const swarm::logger &logger) :
	m_table(table),
	m_opts(opts),
	m_logger(logger),
	m_normalizer(table ? table->clusters() : std::shared_ptr<const ngram::cluster_map>()),
	m_truncated(false),
	m_appended(false),
	m_state(state_fresh),
	m_evidence_size(0)
{
	if (!m_table || m_table->empty())
		throw_error(not_ready, "need to load profiles");

	m_opts.check();

	if (m_opts.seed) {
		m_rng.seed(*m_opts.seed);
	} else {
		std::random_device rd;
		m_rng.seed((static_cast<uint64_t>(rd()) << 32) | rd());
	}
}

void detector::set_alpha(double alpha)
{
	detector_options opts = m_opts;
	opts.alpha = alpha;
	opts.check();

	m_opts = opts;
	invalidate();
}

void detector::set_max_text_length(size_t max_text_length)
{
	m_opts.max_text_length = max_text_length;
}

void detector::set_priority(const priority_map &priority)
{
	detector_options opts = m_opts;
	opts.priority = priority;
	opts.check();

	m_opts = opts;
	invalidate();
}

void detector::set_seed(uint64_t seed)
{
	m_opts.seed = seed;
	m_rng.seed(seed);
	invalidate();
}

void detector::set_time_budget(long time_budget)
{
	detector_options opts = m_opts;
	opts.time_budget = time_budget;
	opts.check();

	m_opts = opts;
	invalidate();
}

void detector::append(const std::string &text)
{
	std::u32string normalized = m_normalizer.normalize(text);

	if (!m_normalizer.append(m_text, normalized, m_opts.max_text_length)) {
		if (!m_truncated) {
			m_logger.log(swarm::SWARM_LOG_DEBUG, "detector: text is truncated to %zu characters",
					m_opts.max_text_length);
		}

		m_truncated = true;
	}

	m_appended = true;
	invalidate();
}

void detector::append(std::istream &in)
{
	std::ostringstream ss;
	ss << in.rdbuf();

	append(ss.str());
}

std::string detector::text(void) const
{
	return unicode::encode(m_text);
}

void detector::invalidate(void)
{
	m_state = m_appended ? state_accumulating : state_fresh;
	m_result.clear();
}

std::vector<const std::vector<double> *> detector::collect_evidence(void) const
{
	ngram::evidence ev;
	ngram::extractor::feed(ngram::normalizer::clean(m_text), ev);

	std::vector<const std::vector<double> *> ret;
	ret.reserve(ev.total());

	for (auto it = ev.grams().begin(); it != ev.grams().end(); ++it) {
		// grams missing in the table do not move the distribution
		const std::vector<double> *row = m_table->find(it->first);
		if (!row)
			continue;

		ret.insert(ret.end(), it->second, row);
	}

	return ret;
}

void detector::run_trial(std::vector<const std::vector<double> *> &evidence, std::vector<double> &prob, double alpha)
{
	size_t pos = evidence.size();
	double max_prob = 0;
	int i;

	for (i = 0; i < m_opts.iteration_limit; ++i) {
		if (pos == evidence.size()) {
			std::shuffle(evidence.begin(), evidence.end(), m_rng);
			pos = 0;
		}

		max_prob = update_probability(prob, *evidence[pos++], alpha);
		if (max_prob > conv_threshold) {
			++i;
			break;
		}
	}

	m_logger.log(swarm::SWARM_LOG_DEBUG, "detector: trial: alpha: %f, iterations: %d, max-probability: %f",
			alpha, i, max_prob);
}

void detector::apply_priority(std::vector<double> &prob) const
{
	const priority_map &priority = m_opts.priority;
	if (priority.empty())
		return;

	const std::vector<std::string> &langs = languages();
	double total = 0;

	if (priority.mode == priority_map::replace) {
		size_t selected = 0;

		for (size_t i = 0; i < prob.size(); ++i) {
			if (priority.weights.find(langs[i]) != priority.weights.end()) {
				total += prob[i];
				++selected;
			}
		}

		// distribution is kept as is, when priority map does not name any loaded language
		if (selected == 0) {
			m_logger.log(swarm::SWARM_LOG_DEBUG, "detector: none of %zu priority languages is loaded",
					priority.weights.size());
			return;
		}

		for (size_t i = 0; i < prob.size(); ++i) {
			if (priority.weights.find(langs[i]) == priority.weights.end()) {
				prob[i] = 0;
				continue;
			}

			if (total > 0)
				prob[i] /= total;
			else
				prob[i] = 1.0 / selected;
		}

		return;
	}

	for (size_t i = 0; i < prob.size(); ++i) {
		auto it = priority.weights.find(langs[i]);
		if (it != priority.weights.end())
			prob[i] += it->second;

		total += prob[i];
	}

	if (total > 0) {
		for (size_t i = 0; i < prob.size(); ++i)
			prob[i] /= total;
	}
}

void detector::estimate(void)
{
	m_result.clear();
	m_state = state_estimated;

	std::vector<const std::vector<double> *> evidence = collect_evidence();
	m_evidence_size = evidence.size();

	if (evidence.empty())
		return;

	// the same seed must give the same result no matter how many times we estimated before
	if (m_opts.seed)
		m_rng.seed(*m_opts.seed);

	const size_t nlang = languages().size();
	std::vector<double> result(nlang, 0.0);
	std::uniform_real_distribution<double> jitter(-alpha_width, alpha_width);

	timer tm;
	int trials = 0;

	for (int t = 0; t < m_opts.trials; ++t) {
		if (m_opts.time_budget > 0 && trials > 0 && tm.elapsed() >= m_opts.time_budget) {
			m_logger.log(swarm::SWARM_LOG_DEBUG, "detector: time budget of %ld ms is exhausted after %d trials",
					m_opts.time_budget, trials);
			break;
		}

		double alpha = std::min(1.0, std::max(0.0, m_opts.alpha + jitter(m_rng)));

		std::vector<double> prob(nlang, 1.0 / nlang);
		run_trial(evidence, prob, alpha);

		for (size_t i = 0; i < nlang; ++i)
			result[i] += prob[i];

		++trials;
	}

	for (size_t i = 0; i < nlang; ++i)
		result[i] /= trials;

	apply_priority(result);
	m_result.swap(result);
}

const std::vector<double> &detector::probabilities(void)
{
	if (m_state != state_estimated)
		estimate();

	return m_result;
}

std::vector<language> detector::get_probabilities(void)
{
	const std::vector<double> &prob = probabilities();
	const std::vector<std::string> &langs = languages();

	std::vector<size_t> order;
	for (size_t i = 0; i < prob.size(); ++i) {
		if (prob[i] > m_opts.prob_threshold)
			order.push_back(i);
	}

	// stable sort keeps column order for equal probabilities
	std::stable_sort(order.begin(), order.end(), [&prob] (size_t a, size_t b) {
		return prob[a] > prob[b];
	});

	std::vector<language> ret;
	ret.reserve(order.size());
	for (auto it = order.begin(); it != order.end(); ++it)
		ret.emplace_back(langs[*it], prob[*it]);

	return ret;
}

std::string detector::detect(void)
{
	const std::vector<double> &prob = probabilities();
	if (prob.empty())
		return unknown_language;

	size_t best = 0;
	for (size_t i = 1; i < prob.size(); ++i) {
		if (prob[i] > prob[best])
			best = i;
	}

	if (prob[best] > m_opts.min_confidence)
		return languages()[best];

	return unknown_language;
}

std::ostream &operator <<(std::ostream &out, const language &lang)
{
	out << lang.name << ":" << lang.prob;
	return out;
}

}} // namespace ioremap::glossa
