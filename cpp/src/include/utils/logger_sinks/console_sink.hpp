#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>

namespace walkie::utils
{

/// stderr; the default sink and the one `walkied --foreground` keeps.
class ConsoleSink final : public Sink
{
  public:
    void emit(const LogRecord &record) override
    {
        const std::string line = render(record);
        std::fwrite(line.data(), 1, line.size(), stderr);
    }
    void sync() override { std::fflush(stderr); }
    [[nodiscard]] std::string name() const override { return "stderr"; }
};

} // namespace walkie::utils
