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

#ifndef __GLOSSA_DETECTOR_HPP
#define __GLOSSA_DETECTOR_HPP

#include "glossa/config.hpp"
#include "glossa/ngram.hpp"
#include "glossa/table.hpp"

#include <iosfwd>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <swarm/logger.hpp>

namespace ioremap { namespace glossa {

struct language {
	std::string	name;
	double		prob;

	language() : prob(0) {}
	language(const std::string &name, double prob) : name(name), prob(prob) {}
};

/*!
 * \brief Language detection session
 *
 * Detector accumulates text with append() and estimates probability of every language
 * of the table it was created with. Table is shared and never changes, detector itself
 * must not be used from several threads at once.
 *
 * \code
 * ioremap::glossa::detector d = registry->create();
 * d.append(text);
 * std::string lang = d.detect();
 * \endcode
 */
class detector {
	public:
		enum state_type {
			state_fresh,
			state_accumulating,
			state_estimated,
		};

		/*!
		 * Returned by detect() when there is no evidence or no language is confident enough
		 */
		static const char *const unknown_language;

		detector(const std::shared_ptr<const probability_table> &table, const detector_options &opts,
				const swarm::logger &logger);

		void set_alpha(double alpha);
		void set_max_text_length(size_t max_text_length);
		void set_priority(const priority_map &priority);
		void set_seed(uint64_t seed);
		void set_time_budget(long time_budget);

		const detector_options &options(void) const {
			return m_opts;
		}

		/*!
		 * Normalizes \a text and appends it to the accumulated one.
		 * Text above max_text_length characters is dropped and truncated() becomes true.
		 */
		void append(const std::string &text);
		void append(std::istream &in);

		/*!
		 * Returns the most probable language or unknown_language
		 */
		std::string detect(void);

		/*!
		 * Languages with probability above threshold, most probable first
		 */
		std::vector<language> get_probabilities(void);

		/*!
		 * Probability of every language in table column order, empty if there is no evidence
		 */
		const std::vector<double> &probabilities(void);

		const std::vector<std::string> &languages(void) const {
			return m_table->languages();
		}

		state_type state(void) const {
			return m_state;
		}

		bool truncated(void) const {
			return m_truncated;
		}

		/*!
		 * Accumulated normalized text in UTF-8
		 */
		std::string text(void) const;

		/*!
		 * Number of grams used as evidence by the last estimation
		 */
		size_t evidence_size(void) const {
			return m_evidence_size;
		}

	private:
		std::shared_ptr<const probability_table> m_table;
		detector_options m_opts;
		swarm::logger m_logger;
		ngram::normalizer m_normalizer;

		std::u32string m_text;
		bool m_truncated;
		bool m_appended;
		state_type m_state;
		size_t m_evidence_size;

		std::vector<double> m_result;
		std::mt19937_64 m_rng;

		void invalidate(void);
		void estimate(void);
		std::vector<const std::vector<double> *> collect_evidence(void) const;
		void run_trial(std::vector<const std::vector<double> *> &evidence, std::vector<double> &prob, double alpha);
		void apply_priority(std::vector<double> &prob) const;
};

std::ostream &operator <<(std::ostream &out, const language &lang);

}} // namespace ioremap::glossa

#endif /* __GLOSSA_DETECTOR_HPP */
