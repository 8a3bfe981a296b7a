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

#ifndef __GLOSSA_CONFIG_HPP
#define __GLOSSA_CONFIG_HPP

#include <stdint.h>

#include <map>
#include <string>

#include <boost/optional.hpp>

namespace ioremap { namespace glossa {

/*!
 * \brief Per-language weights applied to the estimated distribution
 */
struct priority_map {
	enum mode_type {
		/*!
		 * Weight is added to the language probability, then the whole distribution is renormalized
		 */
		additive,
		/*!
		 * Result is restricted to the languages of the map and renormalized over them
		 */
		replace,
	};

	mode_type			mode;
	std::map<std::string, double>	weights;

	priority_map() : mode(additive) {}

	bool empty(void) const {
		return weights.empty();
	}
};

/*!
 * \brief Detector construction options
 */
struct detector_options {
	/*!
	 * Smoothing strength, interpolation weight of the uniform distribution
	 */
	double			alpha;
	/*!
	 * Maximum number of normalized characters kept by detector, the rest is silently dropped
	 */
	size_t			max_text_length;
	/*!
	 * Languages with lower probability are not reported
	 */
	double			prob_threshold;
	/*!
	 * detect() returns unknown language if the best probability is not higher than this
	 */
	double			min_confidence;
	int			trials;
	int			iteration_limit;
	/*!
	 * Milliseconds, 0 means no limit
	 */
	long			time_budget;
	boost::optional<uint64_t>	seed;
	priority_map		priority;

	detector_options() :
		alpha(0.5),
		max_text_length(10000),
		prob_threshold(0.1),
		min_confidence(0.1),
		trials(7),
		iteration_limit(1000),
		time_budget(0) {
	}

	/*!
	 * Throws invalid_parameter_error if any field is out of its range
	 */
	void check(void) const;
};

/*!
 * \brief Service configuration
 *
 * Read from JSON file:
 * {
 *   "profiles": "/usr/share/glossa/profiles",
 *   "short-profiles": "/usr/share/glossa/profiles.sm",
 *   "cjk-clusters": "/usr/share/glossa/cjk-clusters.json",
 *   "log-file": "/dev/stderr",
 *   "log-level": 1,
 *   "detector": {
 *     "alpha": 0.5, "max-text-length": 10000, "prob-threshold": 0.1, "min-confidence": 0.1,
 *     "trials": 7, "iteration-limit": 1000, "time-budget": 0, "seed": 42,
 *     "priority": { "mode": "additive", "weights": { "en": 0.3 } }
 *   }
 * }
 * Every field is optional.
 */
struct config {
	std::string		profiles;
	std::string		short_profiles;
	/*!
	 * CJK cluster map of both default profile sets, ideographs are not folded if the file does not exist
	 */
	std::string		cjk_clusters;
	std::string		log_file;
	int			log_level;
	detector_options	detector;

	/*!
	 * Profile directories and cluster map default to $GLOSSA_PROFILE_DIR or to the compiled-in data directory
	 */
	config();

	static config parse(const std::string &json);
	static config load(const std::string &path);
};

/*!
 * \brief Directory which holds default "profiles" and "profiles.sm" sets and "cjk-clusters.json"
 */
std::string default_profile_dir(void);

}} // namespace ioremap::glossa

#endif /* __GLOSSA_CONFIG_HPP */
