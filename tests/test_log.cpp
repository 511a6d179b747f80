#include <iostream>

#include "tempest/util/log.h"

#define TEMPEST_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_log() {
  using tempest::log::Level;

  Level lvl = Level::Info;
  TEMPEST_ASSERT(tempest::log::parse_level("debug", lvl) && lvl == Level::Debug);
  TEMPEST_ASSERT(tempest::log::parse_level(" WARNING ", lvl) && lvl == Level::Warn);
  TEMPEST_ASSERT(tempest::log::parse_level("Error", lvl) && lvl == Level::Error);
  TEMPEST_ASSERT(tempest::log::parse_level("off", lvl) && lvl == Level::Off);

  lvl = Level::Info;
  TEMPEST_ASSERT(!tempest::log::parse_level("verbose", lvl));
  TEMPEST_ASSERT(lvl == Level::Info);

  const Level saved = tempest::log::level();
  tempest::log::set_level(Level::Error);
  TEMPEST_ASSERT(tempest::log::level() == Level::Error);
  tempest::log::set_level(saved);
  return 0;
}
