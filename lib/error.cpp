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

#include "glossa/error.hpp"

#include <stdarg.h>
#include <stdio.h>

namespace ioremap { namespace glossa {

const char *error_code_name(error_code code)
{
	switch (code) {
	case not_ready:
		return "not ready";
	case duplicate_language:
		return "duplicate language";
	case format:
		return "format error";
	case source_unavailable:
		return "source unavailable";
	case reserved_name:
		return "reserved name";
	case insufficient_profiles:
		return "insufficient profiles";
	case invalid_parameter:
		return "invalid parameter";
	}

	return "unknown error";
}

void throw_error(error_code code, const char *fmt, ...)
{
	char buffer[1024];

	va_list args;
	va_start(args, fmt);
	vsnprintf(buffer, sizeof(buffer), fmt, args);
	va_end(args);

	const std::string message(buffer);

	switch (code) {
	case not_ready:
		throw not_ready_error(message);
	case duplicate_language:
		throw duplicate_language_error(message);
	case format:
		throw format_error(message);
	case source_unavailable:
		throw source_unavailable_error(message);
	case reserved_name:
		throw reserved_name_error(message);
	case insufficient_profiles:
		throw insufficient_profiles_error(message);
	case invalid_parameter:
		throw invalid_parameter_error(message);
	}

	throw error(code, message);
}

}} // namespace ioremap::glossa
