// Printed canonical form:
//   (seq i...)  (scope i)  (scope :repeat i)  (branch c t e?)
//   (assign :set|:bind name e)  (invoke name a...)  (invoke "selector" a...)
//   (operate op a...)  (operate const :role "text")  (operate load name)
//   (operate lambda [params] body)  (transfer return|break|continue e?)
#pragma once
#include "weft/canon/instruction.hpp"
#include "weft/edn.hpp"

namespace weft::canon {

edn::node_ptr to_edn(const InstrPtr& instr);

// Rebuilds the instruction tree. Node metadata "start"/"end" become spans.
// Throws parse_error (P221) for anything that is not a canonical form.
InstrPtr from_edn(const edn::node_ptr& form);

// Operator/name spelling used by the printer: a symbol when it reads back as
// one, otherwise a string.
edn::node_ptr name_form(const std::string& text);

// Span recorded on a surface node by the reducer, or an empty span.
Span span_of(const edn::node& n);
void set_span(edn::node& n, Span span);

} // namespace weft::canon
