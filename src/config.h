/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The objreg project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

namespace objreg {

// Largest handle ever issued. 2^53 keeps handles exactly representable
// for peers that carry them as doubles.
#ifndef OBJREG_MAX_HANDLE
#define OBJREG_MAX_HANDLE 9007199254740992ULL
#endif

#ifndef OBJREG_PURGE_ON_RELOAD
#define OBJREG_PURGE_ON_RELOAD false
#endif

#ifndef OBJREG_MIGRATION_WARN_THRESHOLD
#define OBJREG_MIGRATION_WARN_THRESHOLD 64
#endif

#ifndef OBJREG_LOG_FILE_NAME
#define OBJREG_LOG_FILE_NAME "objreg.log"
#endif

}
