#pragma once

#include <string>

namespace typokit
{

// Upper-case words of two letters or more ("ACRONYM") and dotted acronyms
// ("A.W.D") become \textsc{...} with their letters lowered. A trailing dot
// stays outside. Single capitals and mixed-case words are kept.
[[nodiscard]] std::string caps_latex(const std::string& text);

} // namespace typokit
