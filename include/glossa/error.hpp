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

#ifndef __GLOSSA_ERROR_HPP
#define __GLOSSA_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ioremap { namespace glossa {

enum error_code {
	not_ready = 1,
	duplicate_language,
	format,
	source_unavailable,
	reserved_name,
	insufficient_profiles,
	invalid_parameter,
};

const char *error_code_name(error_code code);

class error : public std::runtime_error {
	public:
		error(error_code code, const std::string &message) : std::runtime_error(message), m_code(code) {}

		error_code code(void) const {
			return m_code;
		}

	private:
		error_code m_code;
};

/*
 * Registry has no languages loaded, detector can not be created
 */
class not_ready_error : public error {
	public:
		explicit not_ready_error(const std::string &message) : error(not_ready, message) {}
};

class duplicate_language_error : public error {
	public:
		explicit duplicate_language_error(const std::string &message) : error(duplicate_language, message) {}
};

/*
 * Profile source can be read, but its content is not a valid profile
 */
class format_error : public error {
	public:
		explicit format_error(const std::string &message) : error(format, message) {}
};

class source_unavailable_error : public error {
	public:
		explicit source_unavailable_error(const std::string &message) : error(source_unavailable, message) {}
};

class reserved_name_error : public error {
	public:
		explicit reserved_name_error(const std::string &message) : error(reserved_name, message) {}
};

class insufficient_profiles_error : public error {
	public:
		explicit insufficient_profiles_error(const std::string &message) : error(insufficient_profiles, message) {}
};

class invalid_parameter_error : public error {
	public:
		explicit invalid_parameter_error(const std::string &message) : error(invalid_parameter, message) {}
};

/*
 * Formats message printf-style and throws exception class which matches @code
 */
void throw_error(error_code code, const char *fmt, ...) __attribute__ ((__format__ (__printf__, 2, 3), __noreturn__));

}} // namespace ioremap::glossa

#endif /* __GLOSSA_ERROR_HPP */
