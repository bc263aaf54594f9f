#pragma once
#include <cellflow/style/computed_style.h>
#include <string>

namespace cellflow::core { class DiagnosticEmitter; }

namespace cellflow::style {

// Resolves inline + default style maps into a ComputedStyle. Inline
// values win. Unknown keywords and out-of-range numbers are replaced by
// the property default; nothing here throws.
class StyleResolver {
public:
    ComputedStyle resolve(const StyleMap& inline_style, const StyleMap& defaults = {}) const;

    // Receives a warning for every value that had to be normalized.
    void set_diagnostics(core::DiagnosticEmitter* diagnostics) { diagnostics_ = diagnostics; }

private:
    void apply_property(ComputedStyle& style, const std::string& name,
                        const StyleValue& value) const;
    void report_malformed(const std::string& name, const std::string& detail) const;

    core::DiagnosticEmitter* diagnostics_ = nullptr;
};

std::string style_value_to_string(const StyleValue& value);

} // namespace cellflow::style
