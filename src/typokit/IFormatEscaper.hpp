#pragma once

#include "FrenchFormatter.hpp"

#include <string>
#include <string_view>

namespace typokit
{

/**
 * @brief Escapes text for a target output format.
 *
 * Implementations are stateless; one instance may be shared between threads.
 */
class IFormatEscaper
{
public:
    virtual ~IFormatEscaper() = default;

    /// Replaces the characters reserved by the format.
    [[nodiscard]] virtual std::string escape(const std::string& text) const = 0;

    /// Representation of a space class introduced by the French formatter.
    [[nodiscard]] virtual std::string escapeSpace(SpaceKind kind) const = 0;

    /// Rewrites no-break space code points already present in @p text.
    [[nodiscard]] virtual std::string escapeNbSpaces(const std::string& text) const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace typokit
