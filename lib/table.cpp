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

#include "glossa/table.hpp"
#include "glossa/error.hpp"
#include "glossa/ngram.hpp"
#include "glossa/unicode.hpp"

#include <algorithm>

namespace ioremap { namespace glossa {

void probability_table::add_profile(const profile_record &profile, size_t index, size_t total)
{
	if (index_of(profile.name) != m_languages.size())
		throw_error(duplicate_language, "duplicate the same language profile '%s'", profile.name.c_str());

	if (index != m_languages.size())
		throw_error(invalid_parameter, "profile '%s': column %zu requested, next free column is %zu",
				profile.name.c_str(), index, m_languages.size());

	if (total <= index)
		throw_error(invalid_parameter, "profile '%s': column %zu is out of %zu languages",
				profile.name.c_str(), index, total);

	for (auto it = profile.freq.begin(); it != profile.freq.end(); ++it) {
		size_t len = unicode::length(it->first);
		if (len >= 1 && len <= ngram::max_length && profile.n_words[len - 1] == 0) {
			throw_error(format, "profile '%s': gram '%s' found, but total number of %zu-grams is zero",
					profile.name.c_str(), it->first.c_str(), len);
		}
	}

	widen(total);
	m_languages.push_back(profile.name);

	for (auto it = profile.freq.begin(); it != profile.freq.end(); ++it) {
		size_t len = unicode::length(it->first);
		if (len < 1 || len > ngram::max_length)
			continue;

		std::vector<double> &row = m_probs[it->first];
		if (row.empty())
			row.assign(m_width, 0.0);

		row[index] = static_cast<double>(it->second) / static_cast<double>(profile.n_words[len - 1]);
	}
}

size_t probability_table::index_of(const std::string &lang) const
{
	return std::find(m_languages.begin(), m_languages.end(), lang) - m_languages.begin();
}

void probability_table::trim(void)
{
	if (m_width == m_languages.size())
		return;

	m_width = m_languages.size();
	for (auto it = m_probs.begin(); it != m_probs.end(); ++it)
		it->second.resize(m_width);
}

void probability_table::widen(size_t width)
{
	if (width <= m_width)
		return;

	m_width = width;
	for (auto it = m_probs.begin(); it != m_probs.end(); ++it)
		it->second.resize(m_width, 0.0);
}

}} // namespace ioremap::glossa
