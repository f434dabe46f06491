#pragma once
#include "veil/sink/sink_interface.hpp"

namespace veil {

class NullSink : public ISink {
public:
    void write(const LogEntry&) override {}
};

} // namespace veil
