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

#include "glossa/ngram.hpp"
#include "glossa/unicode.hpp"

#include <boost/locale.hpp>

namespace ioremap { namespace glossa { namespace ngram {

char32_t normalize(char32_t ch)
{
	switch (unicode::block_of(ch)) {
	case unicode::block_basic_latin:
		if (ch < 'A' || (ch < 'a' && ch > 'Z') || ch > 'z')
			return U' ';
		break;
	case unicode::block_latin_1_supplement:
		// no-break space, guillemets and degree sign, other symbols are kept since profiles carry them
		if (ch == 0xA0 || ch == 0xAB || ch == 0xB0 || ch == 0xBB)
			return U' ';
		break;
	case unicode::block_latin_extended_b:
		// Romanian comma-below letters
		if (ch == 0x0219)
			return 0x015F;
		if (ch == 0x021B)
			return 0x0163;
		break;
	case unicode::block_general_punctuation:
		return U' ';
	case unicode::block_arabic:
		// Farsi yeh
		if (ch == 0x06CC)
			return 0x064A;
		break;
	case unicode::block_latin_extended_additional:
		// Vietnamese letters with diacritics
		if (ch >= 0x1EA0)
			return 0x1EC3;
		break;
	case unicode::block_hiragana:
		return 0x3042;
	case unicode::block_katakana:
		return 0x30A2;
	case unicode::block_bopomofo:
	case unicode::block_bopomofo_extended:
		return 0x3105;
	case unicode::block_hangul_syllables:
		return 0xAC00;
	case unicode::block_halfwidth_and_fullwidth_forms:
		// fullwidth ASCII variants
		if (ch >= 0xFF01 && ch <= 0xFF5E)
			return normalize(ch - 0xFEE0);
		break;
	default:
		break;
	}

	return ch;
}

normalizer::normalizer(const std::shared_ptr<const cluster_map> &clusters) :
	m_url("https?://[-_.?&~;+=/#0-9A-Za-z]{1,2076}"),
	m_mail("[-_.0-9A-Za-z]{1,64}@[-_0-9A-Za-z]{1,255}[-_.0-9A-Za-z]{1,255}"),
	m_clusters(clusters)
{
}

std::u32string normalizer::normalize(const std::string &text) const
{
	std::string stripped = boost::regex_replace(text, m_url, " ");
	stripped = boost::regex_replace(stripped, m_mail, " ");

	// drop broken sequences before ICU sees them
	stripped = unicode::encode(unicode::decode(stripped));
	stripped = boost::locale::normalize(stripped, boost::locale::norm_nfc, unicode::locale());

	std::u32string ret = unicode::decode(stripped);
	for (auto it = ret.begin(); it != ret.end(); ++it) {
		*it = ngram::normalize(*it);

		if (m_clusters && unicode::block_of(*it) == unicode::block_cjk_unified_ideographs)
			*it = m_clusters->map(*it);
	}

	return ret;
}

bool normalizer::append(std::u32string &dst, const std::u32string &src, size_t limit) const
{
	for (auto it = src.begin(); it != src.end(); ++it) {
		const char32_t ch = *it;

		if (ch == U' ') {
			if (dst.empty() || dst[dst.size() - 1] == U' ')
				continue;
		} else {
			size_t repeat = 0;
			for (auto r = dst.rbegin(); r != dst.rend() && *r == ch && repeat < max_repeat; ++r)
				++repeat;

			if (repeat >= max_repeat)
				continue;
		}

		if (dst.size() >= limit)
			return false;

		dst.push_back(ch);
	}

	return true;
}

std::u32string normalizer::clean(const std::u32string &text)
{
	size_t latin = 0, non_latin = 0;

	for (auto it = text.begin(); it != text.end(); ++it) {
		const char32_t ch = *it;

		if (ch >= 'A' && ch <= 'z')
			++latin;
		else if (ch >= 0x0300 && unicode::block_of(ch) != unicode::block_latin_extended_additional)
			++non_latin;
	}

	if (latin * 2 >= non_latin)
		return text;

	std::u32string ret;
	ret.reserve(text.size());

	for (auto it = text.begin(); it != text.end(); ++it) {
		if (*it > 'z' || *it < 'A')
			ret.push_back(*it);
	}

	return ret;
}

void window::add(char32_t ch)
{
	const char32_t last = m_grams[m_grams.size() - 1];

	if (last == U' ') {
		m_grams.assign(1, U' ');
		m_capital = false;
		if (ch == U' ')
			return;
	} else if (m_grams.size() >= max_length) {
		m_grams.erase(0, 1);
	}

	m_grams.push_back(ch);

	if (unicode::is_upper(ch)) {
		if (unicode::is_upper(last))
			m_capital = true;
	} else {
		m_capital = false;
	}
}

std::u32string window::get(size_t n) const
{
	if (m_capital || n < 1 || n > max_length || m_grams.size() < n)
		return std::u32string();

	if (n == 1) {
		const char32_t ch = m_grams[m_grams.size() - 1];
		if (ch == U' ')
			return std::u32string();

		return std::u32string(1, ch);
	}

	return m_grams.substr(m_grams.size() - n, n);
}

std::vector<std::string> extractor::split(const std::u32string &text)
{
	std::vector<std::string> ret;
	ret.reserve(text.size() * max_length);

	window w;
	unicode::script prev = unicode::script_none;

	auto emit = [&] () {
		for (size_t n = 1; n <= max_length; ++n) {
			std::u32string gram = w.get(n);
			if (!gram.empty())
				ret.emplace_back(unicode::encode(gram));
		}
	};

	for (auto it = text.begin(); it != text.end(); ++it) {
		const char32_t ch = *it;

		if (ch == U' ') {
			prev = unicode::script_none;
		} else {
			unicode::script s = unicode::script_of(ch);
			if (s != unicode::script_none) {
				// script boundary terminates the word just like a space
				if (prev != unicode::script_none && prev != s) {
					w.add(U' ');
					emit();
				}

				prev = s;
			}
		}

		w.add(ch);
		emit();
	}

	w.add(U' ');
	emit();

	return ret;
}

void extractor::feed(const std::u32string &text, evidence &ev)
{
	std::vector<std::string> grams = split(text);
	for (auto it = grams.begin(); it != grams.end(); ++it)
		ev.feed(*it);
}

}}} // namespace ioremap::glossa::ngram
