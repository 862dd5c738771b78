#pragma once
///@file

/* Escape sequences for highlighting messages. Only emitted when built
   with PAPERCACHE_COLOR; log files and test output stay plain
   otherwise. */
#ifdef PAPERCACHE_COLOR
#  define ANSI_NORMAL "\e[0m"
#  define ANSI_RED "\e[31;1m"
#  define ANSI_GREEN "\e[32;1m"
#  define ANSI_MAGENTA "\e[35;1m"
#else
#  define ANSI_NORMAL ""
#  define ANSI_RED ""
#  define ANSI_GREEN ""
#  define ANSI_MAGENTA ""
#endif
