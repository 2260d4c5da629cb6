#include "weft/host/capabilities.hpp"
#include "weft/config.hpp"
#include "weft/error.hpp"
#include <algorithm>
#include <ostream>

namespace weft::host {

CapabilityRegistry& CapabilityRegistry::add(const std::string& backend, const std::string& capability, Capability fn){
    if(!parse_selector(backend + ":" + capability))
        throw config_error("C311", "invalid backend/capability name '" + backend + ":" + capability + "'");
    auto& caps = backends_[backend];
    if(caps.empty() && std::find(order_.begin(), order_.end(), backend) == order_.end()) order_.push_back(backend);
    if(!caps.emplace(capability, std::move(fn)).second)
        throw config_error("C312", "capability '" + backend + ":" + capability + "' registered twice");
    return *this;
}

bool CapabilityRegistry::has_backend(const std::string& backend) const { return backends_.count(backend) != 0; }

bool CapabilityRegistry::provides(const std::string& backend, const std::string& capability) const {
    return find(backend, capability) != nullptr;
}

const Capability* CapabilityRegistry::find(const std::string& backend, const std::string& capability) const {
    auto b = backends_.find(backend);
    if(b == backends_.end()) return nullptr;
    auto c = b->second.find(capability);
    return c == b->second.end() ? nullptr : &c->second;
}

InvokeResult CapabilityRegistry::invoke(std::string_view selector, const std::vector<Value>& args){
    auto sel = parse_selector(selector);
    if(!sel) return InvokeResult::fail("malformed extern selector '" + std::string(selector) + "'");

    auto call = [&](const std::string& backend, const Capability& fn) -> InvokeResult {
        trace("extern", "'%s' resolved to backend '%s'", std::string(selector).c_str(), backend.c_str());
        try {
            return InvokeResult::ok(fn(args));
        } catch(const std::exception& e) {
            return InvokeResult::fail(backend + ":" + sel->capability + " failed: " + e.what());
        }
    };

    if(sel->backends.empty()){
        for(auto& b : order_) if(auto* fn = find(b, sel->capability)) return call(b, *fn);
        return InvokeResult::fail("no implementation found for capability '" + sel->capability + "' in any registered backend");
    }

    std::string tried;
    for(auto& b : sel->backends){
        if(auto* fn = find(b, sel->capability)) return call(b, *fn);
        if(!tried.empty()) tried += ", ";
        tried += b + (has_backend(b) ? "" : " (not registered)");
    }
    return InvokeResult::fail("no implementation found for capability '" + sel->capability + "' with backends [" + tried +
                              "] (selector '" + std::string(selector) + "')");
}

static std::string join_display(const std::vector<Value>& args){
    std::string out;
    for(size_t i = 0; i < args.size(); ++i){ if(i) out += ' '; out += args[i].display(); }
    return out;
}

static Value first_or_nil(const std::vector<Value>& args, const ValueFactory& values){
    return args.empty() ? values.nil() : args.front();
}

void install_io(CapabilityRegistry& reg, const ValueFactory& values, std::ostream& out, std::ostream& err){
    reg.add("io", "print", [&values, &out](const std::vector<Value>& args){ out << join_display(args); out.flush(); return first_or_nil(args, values); });
    reg.add("io", "println", [&values, &out](const std::vector<Value>& args){ out << join_display(args) << '\n'; return first_or_nil(args, values); });
    reg.add("io", "eprint", [&values, &err](const std::vector<Value>& args){ err << join_display(args); err.flush(); return first_or_nil(args, values); });
    reg.add("io", "eprintln", [&values, &err](const std::vector<Value>& args){ err << join_display(args) << '\n'; return first_or_nil(args, values); });
}

void install_debug(CapabilityRegistry& reg, const ValueFactory& values, std::ostream& err){
    reg.add("debug", "inspect", [&values, &err](const std::vector<Value>& args){
        for(auto& a : args) err << "[debug] " << a.debug_display() << " : " << a.type_name() << '\n';
        return first_or_nil(args, values);
    });
    reg.add("debug", "type", [&values](const std::vector<Value>& args){
        if(args.size() != 1) throw runtime_error("R711", "debug:type expects 1 argument");
        return values.text(args.front().type_name());
    });
    reg.add("debug", "equal", [&values](const std::vector<Value>& args){
        if(args.size() != 2) throw runtime_error("R711", "debug:equal expects 2 arguments");
        return values.boolean(args[0].equals(args[1]));
    });
}

void install_core(CapabilityRegistry& reg, const ValueFactory& values){
    reg.add("core", "str", [&values](const std::vector<Value>& args){ return values.text(join_display(args)); });
    reg.add("core", "len", [&values](const std::vector<Value>& args){
        if(args.size() != 1) throw runtime_error("R711", "core:len expects 1 argument");
        return values.integer(static_cast<int64_t>(args.front().display().size()));
    });
}

std::shared_ptr<CapabilityRegistry> default_registry(const ValueFactory& values, std::ostream& out, std::ostream& err){
    auto reg = std::make_shared<CapabilityRegistry>();
    install_io(*reg, values, out, err);
    install_debug(*reg, values, err);
    install_core(*reg, values);
    return reg;
}

} // namespace weft::host
