#pragma once
/**
 * @file sink.hpp
 * @brief Log record and the destination interface the Logger worker writes to.
 */
#include "walkie_utils_export.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace walkie::utils
{

/// One formatted log event. `level` mirrors `Logger::Level` as an int.
struct LogRecord
{
    std::chrono::system_clock::time_point stamp;
    uint64_t thread_id = 0;
    int level = 0;
    std::string text;
};

class WALKIE_UTILS_EXPORT Sink
{
  public:
    virtual ~Sink() = default;

    /// Writes one record. May throw; the Logger falls back to stderr.
    virtual void emit(const LogRecord &record) = 0;
    virtual void sync() {}
    [[nodiscard]] virtual std::string name() const = 0;

    /// `2026-10-16 09:41:07.123456 WARN  [tid] text\n`
    [[nodiscard]] static std::string render(const LogRecord &record);
};

} // namespace walkie::utils
