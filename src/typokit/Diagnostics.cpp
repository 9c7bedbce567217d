#include "Diagnostics.hpp"

#include <algorithm>

namespace typokit
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

namespace
{

bool isContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }

} // anonymous namespace

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    if (bytes == 0)
        bytes = 1;
    max_preview_.store(bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::size_t cut = std::min(text.size(), MaxPreview());
    while (cut > 0 && cut < text.size() && isContinuationByte(static_cast<unsigned char>(text[cut])))
        --cut;

    std::string out;
    out.reserve(cut + 16);
    for (char ch : text.substr(0, cut))
    {
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(static_cast<unsigned char>(ch) < 0x20 ? '?' : ch);
            break;
        }
    }

    if (cut < text.size())
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }
    return out;
}

} // namespace typokit
