#pragma once

#include "reasm/logging/logger_registry.h"

// Zero-configuration logging - works without any setup
#define LOG(level, ...)                                                  \
  do {                                                                   \
    auto logger =                                                        \
        ::reasm::logging::LoggerRegistry::instance().getDefaultLogger(); \
    if (logger->shouldLog(::reasm::logging::LogLevel::level)) {          \
      ::reasm::logging::LogContext ctx;                                  \
      ctx.setLocation(__FILE__, __LINE__, __FUNCTION__);                 \
      logger->logWithContext(::reasm::logging::LogLevel::level, ctx,     \
                             __VA_ARGS__);                               \
    }                                                                    \
  } while (0)

#define LOG_DEBUG(...) LOG(Debug, __VA_ARGS__)
#define LOG_INFO(...) LOG(Info, __VA_ARGS__)
#define LOG_WARNING(...) LOG(Warning, __VA_ARGS__)
#define LOG_ERROR(...) LOG(Error, __VA_ARGS__)

#ifdef REASM_LOG_DISABLE
#define REASM_LOG(level, ...) ((void)0)
#else
#define REASM_LOG(level, ...)                                           \
  do {                                                                  \
    auto reasm_logger_ =                                                \
        ::reasm::logging::LoggerRegistry::instance().getOrCreateLogger( \
            REASM_LOG_COMPONENT);                                       \
    if (reasm_logger_->shouldLog(::reasm::logging::LogLevel::level)) {  \
      reasm_logger_->log(::reasm::logging::LogLevel::level, __FILE__,   \
                         __LINE__, __FUNCTION__, __VA_ARGS__);          \
    }                                                                   \
  } while (0)
#endif

// Component must be defined before using REASM_LOG
#ifndef REASM_LOG_COMPONENT
#define REASM_LOG_COMPONENT "default"
#endif
