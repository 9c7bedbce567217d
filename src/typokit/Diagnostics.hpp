#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace typokit
{

/// Switches and helpers for the per-stage trace written by TextPipeline.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    /// Log-friendly excerpt of @p text: at most MaxPreview() bytes, never cut
    /// inside a UTF-8 sequence, control characters escaped.
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace typokit
