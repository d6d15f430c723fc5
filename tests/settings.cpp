#include <cassert>
#include <chrono>
#include <cstdlib>
#include "llmtools/exceptions.hpp"
#include "llmtools/logging.hpp"
#include "llmtools/settings.hpp"

// Cross-platform setenv wrapper
static void set_env(const char* name, const char* value) {
#ifdef _WIN32
  _putenv_s(name, value);
#else
  setenv(name, value, 1);
#endif
}

int main() {
  using namespace llmtools;
  // Defaults
  Settings d;
  assert(d.max_iterations == 5);
  assert(d.tool_timeout_seconds == 180.0);
  assert(d.max_schema_depth == 20);

  // JSON parse
  auto s = Settings::from_json(Json{{"log_level","debug"},{"max_iterations",2},{"tool_timeout",0.5}});
  assert(s.log_level == "debug");
  assert(s.max_iterations == 2);
  auto opts = s.loop_options();
  assert(opts.max_iterations == 2);
  assert(opts.tool_timeout == std::chrono::milliseconds(500));
  s.apply_logging();
  assert(log::level() == log::Level::Debug);

  // Env parse (set locally)
  set_env("LLMTOOLS_LOG_LEVEL","warn");
  set_env("LLMTOOLS_MAX_ITERATIONS","7");
  set_env("LLMTOOLS_TOOL_TIMEOUT","2.5");
  set_env("LLMTOOLS_MAX_SCHEMA_DEPTH","8");
  auto e = Settings::from_env();
  assert(e.log_level == "WARN"); // uppercased
  assert(e.max_iterations == 7);
  assert(e.tool_timeout_seconds == 2.5);
  assert(e.max_schema_depth == 8);

  // Malformed numbers are rejected
  set_env("LLMTOOLS_MAX_ITERATIONS","seven");
  bool threw = false;
  try {
    Settings::from_env();
  } catch (const ValidationError&) {
    threw = true;
  }
  assert(threw);
  set_env("LLMTOOLS_MAX_ITERATIONS","7");

  // Timeouts outside [0, MAX_TOOL_TIMEOUT_SECONDS] are rejected
  for (const char* bad : {"1e300", "-1", "inf", "nan"}) {
    set_env("LLMTOOLS_TOOL_TIMEOUT", bad);
    threw = false;
    try {
      Settings::from_env();
    } catch (const ValidationError&) {
      threw = true;
    }
    assert(threw);
  }
  set_env("LLMTOOLS_TOOL_TIMEOUT","2.5");

  threw = false;
  try {
    Settings::from_json(Json{{"tool_timeout", 1e300}});
  } catch (const ValidationError&) {
    threw = true;
  }
  assert(threw);

  Settings huge;
  huge.tool_timeout_seconds = 1e300;
  threw = false;
  try {
    huge.loop_options();
  } catch (const ValidationError&) {
    threw = true;
  }
  assert(threw);

  // Non-ASCII bytes in the level name fall back to INFO
  assert(log::level_from_string("\xe9rror") == log::Level::Info);
  assert(log::level_from_string("Error") == log::Level::Error);
  return 0;
}
