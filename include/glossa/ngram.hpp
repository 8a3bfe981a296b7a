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

#ifndef __GLOSSA_NGRAM_HPP
#define __GLOSSA_NGRAM_HPP

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/regex.hpp>

namespace ioremap { namespace glossa { namespace ngram {

enum {
	max_length = 3,
	max_repeat = 3,
};

/*
 * Maps single character to its canonical form within its block,
 * characters which carry no language information become space.
 */
char32_t normalize(char32_t ch);

/*
 * Folds CJK ideographs into the representative of their cluster.
 * Profile sets are generated from folded text, so detection must fold with the same map.
 */
class cluster_map {
	public:
		/*
		 * The first character of @cluster becomes its representative
		 */
		void add(const std::u32string &cluster) {
			if (cluster.empty())
				return;

			for (auto it = cluster.begin(); it != cluster.end(); ++it)
				m_map[*it] = cluster[0];
		}

		char32_t map(char32_t ch) const {
			auto it = m_map.find(ch);
			if (it == m_map.end())
				return ch;

			return it->second;
		}

		bool contains(char32_t ch) const {
			return m_map.find(ch) != m_map.end();
		}

		size_t size(void) const {
			return m_map.size();
		}

		bool empty(void) const {
			return m_map.empty();
		}

	private:
		std::unordered_map<char32_t, char32_t> m_map;
};

class normalizer {
	public:
		explicit normalizer(const std::shared_ptr<const cluster_map> &clusters = std::shared_ptr<const cluster_map>());

		/*
		 * Strips URLs and e-mails, composes text into NFC and normalizes every character,
		 * CJK ideographs are folded by the cluster map if there is one.
		 * Invalid UTF-8 sequences are dropped.
		 */
		std::u32string normalize(const std::string &text) const;

		/*
		 * Appends normalized @src to @dst collapsing runs of spaces and capping runs of
		 * identical characters to max_repeat.
		 * Returns false if @dst reached @limit characters and the rest of @src was dropped.
		 */
		bool append(std::u32string &dst, const std::u32string &src, size_t limit) const;

		/*
		 * If text is mostly written in non-Latin script, removes ASCII Latin letters from it
		 */
		static std::u32string clean(const std::u32string &text);

	private:
		boost::regex m_url;
		boost::regex m_mail;
		std::shared_ptr<const cluster_map> m_clusters;
};

/*
 * Sliding window over normalized text, it holds up to max_length last characters of the current word.
 * Words are padded with spaces, so that the first and the last letters produce " a" and "a " grams.
 */
class window {
	public:
		window() : m_grams(1, U' '), m_capital(false) {}

		void add(char32_t ch);

		/*
		 * Returns empty string if there is no gram of length @n ending at the last added character,
		 * or the current word is written in capitals.
		 */
		std::u32string get(size_t n) const;

	private:
		std::u32string m_grams;
		bool m_capital;
};

/*
 * Multiset of grams found in text
 */
class evidence {
	public:
		evidence() : m_total(0) {}

		void feed(const std::string &gram) {
			auto it = m_grams.find(gram);
			if (it == m_grams.end())
				m_grams[gram] = 1;
			else
				it->second++;

			++m_total;
		}

		size_t count(const std::string &gram) const {
			auto it = m_grams.find(gram);
			if (it == m_grams.end())
				return 0;

			return it->second;
		}

		const std::map<std::string, size_t> &grams(void) const {
			return m_grams;
		}

		size_t total(void) const {
			return m_total;
		}

		bool empty(void) const {
			return m_total == 0;
		}

	private:
		std::map<std::string, size_t> m_grams;
		size_t m_total;
};

class extractor {
	public:
		/*
		 * Returns every 1, 2 and 3-gram of normalized @text in text order.
		 * A script change inside a word splits it, so that no gram mixes scripts.
		 */
		static std::vector<std::string> split(const std::u32string &text);

		static void feed(const std::u32string &text, evidence &ev);
};

}}} // namespace ioremap::glossa::ngram

#endif /* __GLOSSA_NGRAM_HPP */
