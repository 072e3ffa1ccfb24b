/*
   ltag -- BCP 47 language tag library and tools

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   platform detection and build configuration defaults
*/

#pragma once

#if (defined(_WIN32) || defined(WIN32) || defined(__MINGW32__)) && !defined(__CYGWIN__)
# define SYS_WINDOWS
# if !defined(__MINGW32__)
#  define NOMINMAX
# endif
#endif

// Both are normally passed in by the build system.
#if !defined(LTAG_VERSION)
# define LTAG_VERSION "1.0.0"
#endif

#if !defined(LTAG_LOCALE_DIR)
# define LTAG_LOCALE_DIR "/usr/share/locale"
#endif

#define LTAG_TEXT_DOMAIN "ltag"
#define LTAG_URL_ISSUES  "https://github.com/ltag/ltag/issues"
