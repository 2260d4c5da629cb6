// Default ExternDispatcher: backends registered by name, each offering capabilities.
#pragma once
#include "weft/extern.hpp"
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace weft::host {

using Capability = std::function<Value(const std::vector<Value>& args)>;

class CapabilityRegistry : public ExternDispatcher {
public:
    // Registering the same backend/capability pair twice is a configuration error.
    CapabilityRegistry& add(const std::string& backend, const std::string& capability, Capability fn);

    bool has_backend(const std::string& backend) const;
    bool provides(const std::string& backend, const std::string& capability) const;
    std::vector<std::string> backends() const { return order_; }

    InvokeResult invoke(std::string_view selector, const std::vector<Value>& args) override;

private:
    const Capability* find(const std::string& backend, const std::string& capability) const;
    std::map<std::string, std::map<std::string, Capability>> backends_;
    std::vector<std::string> order_; // registration order, for bare selectors
};

// io:print, io:println, io:eprint, io:eprintln
void install_io(CapabilityRegistry& reg, const ValueFactory& values, std::ostream& out, std::ostream& err);
// debug:inspect, debug:type, debug:equal
void install_debug(CapabilityRegistry& reg, const ValueFactory& values, std::ostream& err);
// core:str, core:len
void install_core(CapabilityRegistry& reg, const ValueFactory& values);

// All of the above, in that backend order.
std::shared_ptr<CapabilityRegistry> default_registry(const ValueFactory& values, std::ostream& out, std::ostream& err);

} // namespace weft::host
