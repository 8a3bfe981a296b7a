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

#ifndef __GLOSSA_TABLE_HPP
#define __GLOSSA_TABLE_HPP

#include "glossa/ngram.hpp"
#include "glossa/profile.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace ioremap { namespace glossa {

/*
 * Gram to per-language probability map.
 *
 * Column i of every row belongs to languages[i], columns are assigned in load order and never move.
 * Rows may be wider than the number of languages while a batch is being loaded,
 * readers must only look at the first languages.size() cells.
 */
class probability_table {
	public:
		probability_table() : m_width(0) {}

		/*
		 * Writes freq/n_words[len-1] of every 1, 2 and 3-gram of @profile into column @index,
		 * missing rows are created zero-filled and at least @total cells wide.
		 *
		 * Throws duplicate_language_error if profile name is already loaded,
		 * invalid_parameter_error if @index is not the next free column or @total does not cover it,
		 * format_error if profile has grams of the length whose total counter is zero.
		 * Table is not modified if exception is thrown.
		 */
		void add_profile(const profile_record &profile, size_t index, size_t total);

		/*
		 * Returns NULL if gram has never been seen in any profile
		 */
		const std::vector<double> *find(const std::string &gram) const {
			auto it = m_probs.find(gram);
			if (it == m_probs.end())
				return NULL;

			return &it->second;
		}

		const std::vector<std::string> &languages(void) const {
			return m_languages;
		}

		/*
		 * Returns languages().size() if there is no such language
		 */
		size_t index_of(const std::string &lang) const;

		size_t size(void) const {
			return m_probs.size();
		}

		bool empty(void) const {
			return m_languages.empty();
		}

		size_t width(void) const {
			return m_width;
		}

		/*
		 * Drops cells reserved for languages which were never loaded
		 */
		void trim(void);

		/*
		 * Cluster map the profiles were generated with, NULL if ideographs were not folded
		 */
		const std::shared_ptr<const ngram::cluster_map> &clusters(void) const {
			return m_clusters;
		}

		void set_clusters(const std::shared_ptr<const ngram::cluster_map> &clusters) {
			m_clusters = clusters;
		}

	private:
		std::vector<std::string> m_languages;
		size_t m_width;
		std::unordered_map<std::string, std::vector<double>> m_probs;
		std::shared_ptr<const ngram::cluster_map> m_clusters;

		void widen(size_t width);
};

}} // namespace ioremap::glossa

#endif /* __GLOSSA_TABLE_HPP */
