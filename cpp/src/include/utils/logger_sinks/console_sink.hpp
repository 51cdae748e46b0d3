#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>
#include <fmt/core.h>

namespace zonechat::utils
{

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override
    {
        fmt::print(stderr, "{}", Sink::format_logmsg(msg));
    }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

} // namespace zonechat::utils
