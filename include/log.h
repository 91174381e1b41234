/**
 * @file log.h
 * @brief Compile-time filtered logging with bracketed category tags
 * @version 2.0.0
 *
 * Messages are printed as "[TAG] text" (INFO/DEBUG), "[TAG] WARNING: text"
 * and "[TAG] ERROR: text". Disabled levels compile to ((void)0).
 *
 * Select verbosity with -DLOG_LEVEL=n:
 *   0 = NONE, 1 = ERROR, 2 = WARN, 3 = INFO (default), 4 = DEBUG
 *
 * Usage:
 *   LOG_INFO("SESSION", "Connected to %s", name);
 *   LOG_DEBUG_BYTES("SESSION", "RX: ", data, len);
 */

#ifndef LOG_H
#define LOG_H

#include "platform.h"

#ifndef LOG_LEVEL
#define LOG_LEVEL 3
#endif

#define LOG_LEVEL_NONE  0
#define LOG_LEVEL_ERROR 1
#define LOG_LEVEL_WARN  2
#define LOG_LEVEL_INFO  3
#define LOG_LEVEL_DEBUG 4

#if LOG_LEVEL >= LOG_LEVEL_ERROR
  #define LOG_ERROR(tag, fmt, ...) BRIDGE_PRINTF("[" tag "] ERROR: " fmt "\n" __VA_OPT__(,) __VA_ARGS__)
#else
  #define LOG_ERROR(tag, fmt, ...) ((void)0)
#endif

#if LOG_LEVEL >= LOG_LEVEL_WARN
  #define LOG_WARN(tag, fmt, ...) BRIDGE_PRINTF("[" tag "] WARNING: " fmt "\n" __VA_OPT__(,) __VA_ARGS__)
#else
  #define LOG_WARN(tag, fmt, ...) ((void)0)
#endif

#if LOG_LEVEL >= LOG_LEVEL_INFO
  #define LOG_INFO(tag, fmt, ...) BRIDGE_PRINTF("[" tag "] " fmt "\n" __VA_OPT__(,) __VA_ARGS__)
#else
  #define LOG_INFO(tag, fmt, ...) ((void)0)
#endif

#if LOG_LEVEL >= LOG_LEVEL_DEBUG
  #define LOG_DEBUG(tag, fmt, ...) BRIDGE_PRINTF("[" tag "] " fmt "\n" __VA_OPT__(,) __VA_ARGS__)
  #define LOG_DEBUG_BYTES(tag, prefix, data, size) do { \
    BRIDGE_PRINTF("[" tag "] %s", prefix); \
    for (size_t _i = 0; _i < (size_t)(size) && _i < 20; ++_i) { \
      BRIDGE_PRINTF("%02X ", ((const uint8_t*)(data))[_i]); \
    } \
    if ((size_t)(size) > 20) BRIDGE_PRINTF("..."); \
    BRIDGE_PRINTF("\n"); \
  } while (0)
#else
  #define LOG_DEBUG(tag, fmt, ...) ((void)0)
  #define LOG_DEBUG_BYTES(tag, prefix, data, size) ((void)0)
#endif

#endif // LOG_H
