#pragma once
#include "hacklog/transport/transport_interface.hpp"

namespace hacklog {

class NullTransport : public ITransport {
public:
    void write(const std::string&) override {}
};

} // namespace hacklog
