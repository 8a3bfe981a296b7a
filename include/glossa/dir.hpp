/*
 * Copyright 2014+ Evgeniy Polyakov <zbr@ioremap.net>
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

#ifndef __GLOSSA_DIR_HPP
#define __GLOSSA_DIR_HPP

#include "glossa/error.hpp"

#include <functional>
#include <string>

#include <sys/types.h>
#include <sys/stat.h>

#include <stdio.h>
#include <unistd.h>
#include <stdlib.h>
#include <errno.h>
#include <fcntl.h>
#include <dirent.h>
#include <string.h>

namespace ioremap { namespace glossa {

/*
 * Calls @fn for every regular non-hidden file in @base in directory iteration order,
 * iteration stops when @fn returns false.
 * Symlinks are followed.
 */
static inline void iterate_directory(const std::string &base, const std::function<bool (const char *, const char *)> &fn) {
	int fd;
	DIR *dir;
	struct dirent64 *d;

	if (base.size() == 0)
		throw_error(source_unavailable, "failed to open dir: empty path");

	fd = openat(AT_FDCWD, base.c_str(), O_RDONLY | O_DIRECTORY);
	if (fd == -1) {
		int err = errno;
		throw_error(source_unavailable, "failed to open dir '%s': %s [%d]", base.c_str(), strerror(err), err);
	}

	dir = fdopendir(fd);
	if (!dir) {
		int err = errno;
		close(fd);
		throw_error(source_unavailable, "failed to open dir '%s': %s [%d]", base.c_str(), strerror(err), err);
	}

	try {
		while ((d = readdir64(dir)) != NULL) {
			// hidden files, '.' and '..' included
			if (d->d_name[0] == '.')
				continue;

			const std::string path = base + "/" + d->d_name;

			bool regular = d->d_type == DT_REG;
			if (d->d_type == DT_UNKNOWN || d->d_type == DT_LNK) {
				struct stat st;
				regular = stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
			}

			if (!regular)
				continue;

			if (!fn(path.c_str(), d->d_name))
				break;
		}
	} catch (...) {
		closedir(dir);
		throw;
	}

	closedir(dir);
}

}} // namespace ioremap::glossa

#endif /* __GLOSSA_DIR_HPP */
