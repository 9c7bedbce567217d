#pragma once

#include "StageResult.hpp"
#include "TypographyConfig.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace typokit
{

/// Transformations that can be chained on the command line.
enum class Transformation
{
    CleanWhitespaces,
    CleanEllipsis,
    CleanQuotes,
    CleanDashes,
    CleanGuillemets,
    FormatFrench,
    FormatFrenchTex,
    FormatFrenchHtml,
    EscapeHtml,
    EscapeTex,
    EscapeNbSpaces,
    EscapeNbSpacesTex,
    EscapeQuotes,
    CapsLatex
};

struct TransformationInfo
{
    Transformation id;
    std::string_view name;
    std::string_view description;
};

/// Every transformation, in the order they are listed by the CLI.
[[nodiscard]] const std::vector<TransformationInfo>& transformation_catalog();

[[nodiscard]] std::optional<Transformation> parse_transformation(std::string_view name);
[[nodiscard]] std::string_view transformation_name(Transformation t);

/// Applies a single transformation. Throws InvalidUtf8Error on malformed input.
[[nodiscard]] std::string apply_transformation(Transformation t, const std::string& text,
                                               const TypographyConfig& config);

/**
 * @brief Runs a fixed sequence of transformations.
 *
 * Every step goes through run_stage, so a failing step is logged and
 * reported. process() never returns partial output: if any step fails the
 * result is empty and carries the failing step's error.
 *
 * process() is const and keeps no per-call state; one pipeline can serve
 * several threads.
 */
class TextPipeline
{
public:
    TextPipeline(TypographyConfig config, std::vector<Transformation> steps);
    ~TextPipeline();

    TextPipeline(const TextPipeline&) = delete;
    TextPipeline& operator=(const TextPipeline&) = delete;

    [[nodiscard]] StageResult<std::string> process(const std::string& input) const;

    [[nodiscard]] const TypographyConfig& config() const noexcept;
    [[nodiscard]] const std::vector<Transformation>& steps() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace typokit
