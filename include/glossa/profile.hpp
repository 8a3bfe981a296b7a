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

#ifndef __GLOSSA_PROFILE_HPP
#define __GLOSSA_PROFILE_HPP

#include "glossa/ngram.hpp"

#include <stdint.h>

#include <string>
#include <unordered_map>
#include <vector>

namespace ioremap { namespace glossa {

/*
 * Per-language n-gram statistics.
 *
 * @freq maps UTF-8 gram (1 to 3 code points) to the number of times it was seen in the corpus,
 * @n_words[n-1] is the total number of n-grams in the corpus and is used as a denominator
 * for every gram of length n.
 */
struct profile_record {
	std::string					name;
	std::unordered_map<std::string, uint64_t>	freq;
	uint64_t					n_words[3];

	profile_record() {
		n_words[0] = n_words[1] = n_words[2] = 0;
	}
};

/*
 * Parses JSON profile in the form
 * { "name": "en", "freq": { "a": 123, "th": 45 }, "n_words": [ 1000, 900, 800 ] }
 *
 * @source is only used in error messages.
 * Throws format_error.
 */
profile_record parse_profile(const std::string &json, const std::string &source = "<memory>");

/*
 * Throws source_unavailable_error if file can not be read and format_error if its content is broken
 */
profile_record read_profile(const std::string &path);

std::vector<profile_record> parse_profiles(const std::vector<std::string> &json);

/*
 * Parses CJK cluster map shipped with profile sets, an array of clusters where
 * every cluster is a string of ideographs and its first ideograph is the representative:
 * [ "\u4E00\u4E01\u4E03", "\u4E07\u4E08" ]
 *
 * Throws format_error if a character is not a CJK unified ideograph or belongs to several clusters.
 */
ngram::cluster_map parse_clusters(const std::string &json, const std::string &source = "<memory>");
ngram::cluster_map read_clusters(const std::string &path);

}} // namespace ioremap::glossa

#endif /* __GLOSSA_PROFILE_HPP */
