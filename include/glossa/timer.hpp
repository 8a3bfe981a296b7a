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

#ifndef __GLOSSA_TIMER_HPP
#define __GLOSSA_TIMER_HPP

#include <chrono>

namespace ioremap { namespace glossa {

class timer {
	typedef std::chrono::steady_clock clock;
	public:
		timer() : m_start(clock::now()) {}

		// milliseconds since construction or the last restart
		long long elapsed(void) const {
			return std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - m_start).count();
		}

		long long restart(void) {
			clock::time_point now = clock::now();
			long long ret = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_start).count();
			m_start = now;
			return ret;
		}

	private:
		clock::time_point m_start;
};

}} // namespace ioremap::glossa

#endif /* __GLOSSA_TIMER_HPP */
