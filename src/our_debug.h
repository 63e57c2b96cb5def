// stderr tracing for the client and the local engine.
//   DBG("x=%d", x)          [dbg] file:line func: x=3      (compiled out by STARLANCE_NO_DBG)
//   ERROR("...")            [err] file:line func: ...      (always printed)
//   NOTE("ui", "...")       [ui] ...
//   CRASH(code, "...")      like ERROR, then exit(code)
#pragma once

#include <cstdio>
#include <cstdarg>
#include <cstdlib>
#include "errors.h"

inline void
starlance_vlogf (const char *prefix, const char *file, int line, const char *func,
                 const char *fmt, va_list ap)
{
  if (file)
    std::fprintf (stderr, "[%s] %s:%d %s: ", prefix, file, line, func);
  else
    std::fprintf (stderr, "[%s] ", prefix);
  std::vfprintf (stderr, fmt, ap);
  std::fputc ('\n', stderr);
  std::fflush (stderr);
}

inline void
dbg_logf (const char *prefix, const char *file, int line, const char *func, const char *fmt, ...)
{
  va_list ap; va_start (ap, fmt);
  starlance_vlogf (prefix, file, line, func, fmt, ap);
  va_end (ap);
}

inline void
note_logf (const char *tag, const char *fmt, ...)
{
  va_list ap; va_start (ap, fmt);
  starlance_vlogf (tag, nullptr, 0, nullptr, fmt, ap);
  va_end (ap);
}

#ifdef STARLANCE_NO_DBG
#define DBG(...) do { } while(0)
#else
#define DBG(...) dbg_logf ("dbg", __FILE__, __LINE__, __func__, __VA_ARGS__)
#endif

#define ERROR(...) dbg_logf ("err", __FILE__, __LINE__, __func__, __VA_ARGS__)

#define NOTE(tag, ...) note_logf (tag, __VA_ARGS__)

#define CRASH(code, ...) do { \
    dbg_logf ("err", __FILE__, __LINE__, __func__, __VA_ARGS__); \
    std::exit ((int)(code)); \
} while(0)
