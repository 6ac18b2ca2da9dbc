#pragma once

#include "sink.hpp"

#include <cstdio>

namespace ctxhub::utils
{

/// stderr sink; stdout is left to command output.
class ConsoleSink : public Sink
{
  public:
    void write(const LogRecord &rec) override { fmt::print(stderr, "{}", render_log_line(rec)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

} // namespace ctxhub::utils
