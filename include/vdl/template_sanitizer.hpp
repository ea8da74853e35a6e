#pragma once

#include <string>

namespace vdl {

// Sanitize an output filename template for the extraction engine.
//
// Recognized placeholders pass through untouched:
//   %(field)[flags][width][.precision]type   field in [A-Za-z0-9_.,:+-]
//   %%                                       literal percent
// Everything else is literal text and is restricted to ASCII letters,
// digits, space and . - _ ( ) [ ]. Other characters become '_' (one per
// UTF-8 sequence), control characters are dropped and leading dots are
// stripped so the result can never name a hidden file or a "." / ".."
// entry. The result may be empty; callers substitute their default.
//
// Extension and length limits are not applied here: the final name is only
// known once the engine has expanded the placeholders.
std::string sanitize_template(const std::string& tmpl);

// True when the template contains at least one recognized placeholder
bool has_placeholders(const std::string& tmpl);

} // namespace vdl
